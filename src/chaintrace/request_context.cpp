// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/request_context.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace chaintrace {

namespace {

constexpr const char* kTransactionPrefix = "WebTransaction/WebFrameworkUri/";

}  // namespace

const char* ToString(RequestState state) {
    switch (state) {
        case RequestState::kCreated:
            return "created";
        case RequestState::kActive:
            return "active";
        case RequestState::kFinalizing:
            return "finalizing";
        case RequestState::kDone:
            return "done";
    }
    return "unknown";
}

RequestContext::RequestContext(RequestId id, RequestDescriptor request, TracerConfig config)
    : id_(id),
      request_(std::move(request)),
      config_(std::move(config)),
      started_at_(Clock::now()),
      tree_(std::make_shared<SegmentTree>(kTransactionPrefix + config_.framework + "/" +
                                              request_.method + "/" + request_.url,
                                          config_.budget)),
      root_(tree_->root()) {}

RequestState RequestContext::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool RequestContext::IsFinalizing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == RequestState::kFinalizing || state_ == RequestState::kDone;
}

void RequestContext::MarkActive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == RequestState::kCreated) {
        state_ = RequestState::kActive;
    }
}

Segment* RequestContext::OpenSegment(Segment* parent, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == RequestState::kFinalizing || state_ == RequestState::kDone) {
        return nullptr;
    }
    return tree_->Open(parent, name);
}

bool RequestContext::CloseSegment(Segment* segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == RequestState::kFinalizing || state_ == RequestState::kDone) {
        return false;
    }
    return tree_->Close(segment);
}

void RequestContext::AppendPath(std::string component) {
    std::lock_guard<std::mutex> lock(mutex_);
    name_state_.AppendPath(std::move(component));
}

void RequestContext::PopPath() {
    std::lock_guard<std::mutex> lock(mutex_);
    name_state_.PopPath();
}

std::vector<std::string> RequestContext::PathStack() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_state_.stack();
}

std::string RequestContext::CurrentPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_state_.GetPath();
}

void RequestContext::OnResponseMutation(MutationKind kind, int status_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (name_state_.IsFrozen()) {
        return;
    }
    status_code_ = status_code;
    if (kind == MutationKind::kBody) {
        body_set_ = true;
        name_state_.MarkPath();
    } else if (!body_set_) {
        name_state_.MarkPath();
    }
}

void RequestContext::SetFinalStatus(int status_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == RequestState::kFinalizing || state_ == RequestState::kDone) {
        return;
    }
    status_code_ = status_code;
}

int RequestContext::status_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_code_;
}

void RequestContext::NoticeError(std::exception_ptr error, Segment* segment) {
    if (!error) {
        return;
    }
    std::string message = DescribeError(error);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == RequestState::kFinalizing || state_ == RequestState::kDone) {
        return;
    }
    // An error rethrown through several middleware keeps its innermost segment
    if (FindNoticedLocked(error)) {
        return;
    }
    tree_->RecordError(segment, message);
    noticed_.push_back(ObservedError{error, std::move(message), segment ? segment->name() : "",
                                     segment ? segment->id() : 0u});
}

bool RequestContext::RecordUnhandledError(std::exception_ptr error) {
    if (!error) {
        return false;
    }
    std::string message = DescribeError(error);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == RequestState::kFinalizing || state_ == RequestState::kDone) {
        return false;
    }
    const bool duplicate =
        std::any_of(unhandled_.begin(), unhandled_.end(),
                    [&error](const ObservedError& seen) { return seen.error == error; });
    if (duplicate) {
        return false;
    }

    std::string segment;
    std::uint32_t segment_id = 0;
    if (const ObservedError* noticed = FindNoticedLocked(error)) {
        segment = noticed->segment;
        segment_id = noticed->segment_id;
    }
    unhandled_.push_back(ObservedError{error, std::move(message), std::move(segment), segment_id});
    return true;
}

const RequestContext::ObservedError* RequestContext::FindNoticedLocked(
    const std::exception_ptr& error) const {
    for (const auto& noticed : noticed_) {
        if (noticed.error == error) {
            return &noticed;
        }
    }
    return nullptr;
}

std::string RequestContext::TransactionName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return TransactionNameLocked();
}

std::string RequestContext::TransactionNameLocked() const {
    return kTransactionPrefix + config_.framework + "/" + request_.method + "/" +
           name_state_.GetPath();
}

std::vector<TracedError> RequestContext::ReportedErrorsLocked() const {
    std::vector<TracedError> errors;
    if (!unhandled_.empty()) {
        for (const auto& error : unhandled_) {
            errors.push_back(TracedError{error.message, error.segment, error.segment_id});
        }
        return errors;
    }

    if (!config_.IsErrorStatus(status_code_)) {
        return errors;
    }
    if (!noticed_.empty()) {
        const auto& last = noticed_.back();
        errors.push_back(TracedError{last.message, last.segment, last.segment_id});
    } else {
        errors.push_back(TracedError{"HttpError " + std::to_string(status_code_), ""});
    }
    return errors;
}

std::optional<FinishedTrace> RequestContext::BeginFinalize(FinalizeReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == RequestState::kFinalizing || state_ == RequestState::kDone) {
        return std::nullopt;
    }
    state_ = RequestState::kFinalizing;

    name_state_.Freeze();

    FinishedTrace trace;
    trace.request_id = id_;
    trace.name = TransactionNameLocked();
    trace.path = name_state_.GetPath();
    trace.path_components = name_state_.Components();
    trace.request = request_;
    trace.status_code = status_code_;
    trace.reason = reason;

    tree_->SetRootName(trace.name);
    const std::size_t dangling = tree_->CloseAll();
    if (dangling > 0) {
        spdlog::debug("Request {} finalized with {} open segments marked truncated", id_, dangling);
    }

    trace.duration = root_->Duration();
    trace.errors = ReportedErrorsLocked();
    trace.tree = tree_;
    return trace;
}

void RequestContext::MarkDone() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = RequestState::kDone;
}

}  // namespace chaintrace
