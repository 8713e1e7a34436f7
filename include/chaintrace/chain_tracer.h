// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "chaintrace/completion.h"
#include "chaintrace/finished_trace.h"
#include "chaintrace/middleware_wrapper.h"
#include "chaintrace/request_context.h"
#include "chaintrace/request_registry.h"
#include "chaintrace/tracer_config.h"

namespace chaintrace {

/// Custom segment together with the request whose tree holds it
struct SegmentHandle {
    std::shared_ptr<RequestContext> request;
    Segment* segment = nullptr;

    explicit operator bool() const { return request && segment; }
};

/**
 * @brief Entry point used by framework adapters
 *
 * Turns request lifecycle signals into per-request segment trees and
 * transaction names, and hands every finished trace to the registered
 * reporters exactly once. Signals for unknown or finalized requests are
 * ignored.
 *
 * Thread Safety: all methods are thread-safe.
 */
class ChainTracer {
public:
    explicit ChainTracer(TracerConfig config = TracerConfig{},
                         std::shared_ptr<RequestRegistry> registry = nullptr);

    ChainTracer(const ChainTracer&) = delete;
    ChainTracer& operator=(const ChainTracer&) = delete;

    const TracerConfig& config() const { return config_; }
    RequestRegistry& registry() { return *registry_; }

    void AddReporter(std::shared_ptr<TraceReporter> reporter);

    /// Register a new request and open its root segment
    std::shared_ptr<RequestContext> OnRequestStart(RequestDescriptor request);

    /**
     * @brief Run one middleware of a request's chain
     *
     * invoke_real is called exactly once, with a next that keeps the
     * middleware's segment active. Unknown or finalizing requests pass
     * straight through without recording.
     */
    Completion OnMiddlewareInvoke(RequestId id, const MiddlewareOptions& options, NextFn next,
                                  const InvokeReal& invoke_real);

    /// Response body or status assigned
    void OnResponseMutation(RequestId id, MutationKind kind, int status_code);

    /// Final transport status; records the code without naming the transaction
    void OnResponseStatus(RequestId id, int status_code);

    /// Append a naming path component for the request
    void AppendPath(RequestId id, std::string component);

    /**
     * @brief Error that escaped the chain or reached an error listener
     * @return true if recorded; duplicates of the same error return false
     */
    bool OnUnhandledError(RequestId id, std::exception_ptr error);

    /// Response finished; finalize and report
    bool OnRequestEnd(RequestId id);

    /// Connection dropped before the response finished
    bool OnRequestAborted(RequestId id);

    /**
     * @brief Finalize every request older than the configured timeout
     * @return Number of requests finalized
     */
    std::size_t FinalizeExpired(Clock::time_point now);

    /// Request bound to the running continuation, nullptr outside any request
    static std::shared_ptr<RequestContext> CurrentRequest();

    /**
     * @brief Open a custom segment under the active segment of the current request
     *
     * The segment does not become active. Segments left open when the request
     * finalizes are reported as truncated.
     *
     * @return An empty handle outside a request or once it is finalizing
     */
    SegmentHandle CreateSegment(const std::string& name);

    /**
     * @brief Close a segment returned by CreateSegment()
     *
     * Closes through the owning request, whatever request the caller is
     * currently bound to.
     */
    bool CloseSegment(const SegmentHandle& handle);

    /// "Middleware/<framework>/<name>"
    std::string MiddlewareSegmentName(const std::string& name) const;

    /// "anonymous#<n>", unique per tracer
    std::string NextAnonymousName();

private:
    bool Finalize(const std::shared_ptr<RequestContext>& request, FinalizeReason reason);

    const TracerConfig config_;
    std::shared_ptr<RequestRegistry> registry_;

    std::mutex reporters_mutex_;
    std::vector<std::shared_ptr<TraceReporter>> reporters_;

    std::atomic<std::uint64_t> anonymous_ordinal_{0};
};

/**
 * @brief Adapt a middleware callable so every invocation is traced
 *
 * The view must expose request_id(). Anonymous middleware get their ordinal
 * here, at registration time.
 *
 * @param tracer Tracer outliving the returned callable
 * @param options Name and optional route path of the middleware
 * @param fn Callable of signature Completion(View&, NextFn)
 */
template <class View, class Fn>
std::function<Completion(View&, NextFn)> WrapMiddleware(ChainTracer& tracer,
                                                        MiddlewareOptions options, Fn fn) {
    if (options.name.empty()) {
        options.name = tracer.NextAnonymousName();
    }
    return [&tracer, options = std::move(options), fn = std::move(fn)](View& view,
                                                                       NextFn next) -> Completion {
        return tracer.OnMiddlewareInvoke(view.request_id(), options, std::move(next),
                                         [&view, &fn](NextFn wrapped) -> Completion {
                                             return std::invoke(fn, view, std::move(wrapped));
                                         });
    };
}

}  // namespace chaintrace
