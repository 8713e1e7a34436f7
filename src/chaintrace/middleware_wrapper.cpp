// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/middleware_wrapper.h"

#include <atomic>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chaintrace/context_scope.h"

namespace chaintrace {

namespace {

// Shared by the synchronous and the deferred exit paths of one invocation
class MiddlewareInvocation {
public:
    MiddlewareInvocation(std::shared_ptr<RequestContext> request, Segment* segment)
        : request_(std::move(request)), segment_(segment) {}

    void Finish(std::exception_ptr error) {
        if (finished_.exchange(true)) {
            return;
        }
        if (error) {
            request_->NoticeError(error, segment_);
        }
        request_->CloseSegment(segment_);
    }

private:
    std::shared_ptr<RequestContext> request_;
    Segment* segment_;
    std::atomic<bool> finished_{false};
};

Segment* ActiveSegmentFor(const std::shared_ptr<RequestContext>& request) {
    const ContextBinding binding = CurrentBinding();
    if (binding.request == request && binding.segment) {
        return binding.segment;
    }
    return request->root();
}

}  // namespace

Completion MiddlewareWrapper::Invoke(const std::shared_ptr<RequestContext>& request,
                                     const std::string& segment_name,
                                     const std::string& path_component,
                                     NextFn next,
                                     const InvokeReal& invoke_real) {
    if (!invoke_real) {
        throw std::invalid_argument("middleware invocation requires a callable");
    }

    request->MarkActive();
    Segment* segment = request->OpenSegment(ActiveSegmentFor(request), segment_name);
    if (!segment) {
        // Finalization already started, nothing left to record
        return invoke_real(std::move(next));
    }
    spdlog::debug("Request {} entered '{}' (segment {})", request->id(), segment_name, segment->id());

    if (!path_component.empty()) {
        request->AppendPath(path_component);
    }

    auto invocation = std::make_shared<MiddlewareInvocation>(request, segment);
    const ContextBinding binding{request, segment};

    NextFn wrapped_next = [binding, next = std::move(next)]() -> Completion {
        ContextScope scope(binding);
        if (!next) {
            return Completion::Resolved();
        }
        return next();
    };

    ContextScope scope(binding);
    Completion result = [&]() -> Completion {
        try {
            return invoke_real(std::move(wrapped_next));
        } catch (...) {
            invocation->Finish(std::current_exception());
            throw;
        }
    }();
    result.OnSettled([invocation](std::exception_ptr error) { invocation->Finish(error); });
    return result;
}

}  // namespace chaintrace
