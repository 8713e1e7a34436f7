// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/chain_tracer.h"

#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chaintrace/context_scope.h"

namespace chaintrace {

ChainTracer::ChainTracer(TracerConfig config, std::shared_ptr<RequestRegistry> registry)
    : config_(std::move(config)),
      registry_(registry ? std::move(registry) : std::make_shared<RequestRegistry>()) {}

void ChainTracer::AddReporter(std::shared_ptr<TraceReporter> reporter) {
    if (!reporter) {
        throw std::invalid_argument("reporter must not be null");
    }
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    reporters_.push_back(std::move(reporter));
}

std::shared_ptr<RequestContext> ChainTracer::OnRequestStart(RequestDescriptor request) {
    auto context = registry_->Create(std::move(request), config_);
    spdlog::debug("Request {} started: {} {}", context->id(), context->request().method,
                  context->request().url);
    return context;
}

Completion ChainTracer::OnMiddlewareInvoke(RequestId id, const MiddlewareOptions& options,
                                           NextFn next, const InvokeReal& invoke_real) {
    auto request = registry_->Find(id);
    if (!request || request->IsFinalizing()) {
        return invoke_real(std::move(next));
    }
    return MiddlewareWrapper::Invoke(request, MiddlewareSegmentName(options.name), options.path,
                                     std::move(next), invoke_real);
}

void ChainTracer::OnResponseMutation(RequestId id, MutationKind kind, int status_code) {
    if (auto request = registry_->Find(id)) {
        request->OnResponseMutation(kind, status_code);
    }
}

void ChainTracer::OnResponseStatus(RequestId id, int status_code) {
    if (auto request = registry_->Find(id)) {
        request->SetFinalStatus(status_code);
    }
}

void ChainTracer::AppendPath(RequestId id, std::string component) {
    if (auto request = registry_->Find(id)) {
        request->AppendPath(std::move(component));
    }
}

bool ChainTracer::OnUnhandledError(RequestId id, std::exception_ptr error) {
    auto request = registry_->Find(id);
    if (!request) {
        return false;
    }
    const bool recorded = request->RecordUnhandledError(error);
    if (recorded) {
        spdlog::debug("Request {} unhandled error: {}", id, DescribeError(error));
    }
    return recorded;
}

bool ChainTracer::OnRequestEnd(RequestId id) {
    auto request = registry_->Find(id);
    return request && Finalize(request, FinalizeReason::kResponseEnd);
}

bool ChainTracer::OnRequestAborted(RequestId id) {
    auto request = registry_->Find(id);
    return request && Finalize(request, FinalizeReason::kAborted);
}

std::size_t ChainTracer::FinalizeExpired(Clock::time_point now) {
    std::size_t finalized = 0;
    for (const auto& request : registry_->StartedBefore(now - config_.request_timeout)) {
        if (Finalize(request, FinalizeReason::kTimeout)) {
            spdlog::warn("Request {} exceeded {}ms, finalized as timed out", request->id(),
                         config_.request_timeout.count());
            ++finalized;
        }
    }
    return finalized;
}

bool ChainTracer::Finalize(const std::shared_ptr<RequestContext>& request, FinalizeReason reason) {
    std::optional<FinishedTrace> trace = request->BeginFinalize(reason);
    if (!trace) {
        return false;
    }
    registry_->Remove(request->id());

    std::vector<std::shared_ptr<TraceReporter>> reporters;
    {
        std::lock_guard<std::mutex> lock(reporters_mutex_);
        reporters = reporters_;
    }

    spdlog::debug("Request {} finished as '{}' ({}, {} errors, {:.3f}ms)", trace->request_id,
                  trace->name, ToString(reason), trace->errors.size(), trace->DurationMs());
    for (const auto& reporter : reporters) {
        try {
            reporter->Report(*trace);
        } catch (const std::exception& e) {
            spdlog::error("Trace reporter failed for request {}: {}", trace->request_id, e.what());
        }
    }

    request->MarkDone();
    return true;
}

std::shared_ptr<RequestContext> ChainTracer::CurrentRequest() {
    return CurrentBinding().request;
}

SegmentHandle ChainTracer::CreateSegment(const std::string& name) {
    const ContextBinding binding = CurrentBinding();
    if (!binding) {
        return {};
    }
    Segment* segment = binding.request->OpenSegment(binding.segment, name);
    if (!segment) {
        return {};
    }
    return SegmentHandle{binding.request, segment};
}

bool ChainTracer::CloseSegment(const SegmentHandle& handle) {
    if (!handle) {
        return false;
    }
    return handle.request->CloseSegment(handle.segment);
}

std::string ChainTracer::MiddlewareSegmentName(const std::string& name) const {
    return "Middleware/" + config_.framework + "/" + name;
}

std::string ChainTracer::NextAnonymousName() {
    return "anonymous#" + std::to_string(++anonymous_ordinal_);
}

}  // namespace chaintrace
