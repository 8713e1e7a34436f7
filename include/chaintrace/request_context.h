// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "chaintrace/finished_trace.h"
#include "chaintrace/name_state.h"
#include "chaintrace/segment_tree.h"
#include "chaintrace/tracer_config.h"

namespace chaintrace {

enum class RequestState {
    kCreated,     // root segment open, nothing invoked yet
    kActive,      // at least one middleware invoked
    kFinalizing,  // trace captured, waiting for reporters
    kDone,        // handed off and detached
};

const char* ToString(RequestState state);

enum class MutationKind {
    kBody,
    kStatus,
};

/**
 * @brief Everything the engine knows about one inbound request
 *
 * Owns the request's segment tree and name state. Every mutator is a silent
 * no-op once finalization has started, so late callbacks (slow timers,
 * duplicate completions) can never touch a handed-off trace.
 *
 * Thread Safety: all public methods are thread-safe; one mutex per context
 * guards the tree, the name state and the error lists.
 */
class RequestContext {
public:
    RequestContext(RequestId id, RequestDescriptor request, TracerConfig config);

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    RequestId id() const { return id_; }
    const RequestDescriptor& request() const { return request_; }
    Clock::time_point started_at() const { return started_at_; }

    RequestState state() const;
    bool IsFinalizing() const;

    /// Root segment; the pointer stays valid for the context's lifetime
    Segment* root() { return root_; }

    /// Enter ACTIVE on the first middleware invocation
    void MarkActive();

    /**
     * @brief Open a segment under parent (the root when null)
     * @return nullptr once finalization has started
     */
    Segment* OpenSegment(Segment* parent, const std::string& name);

    /// @return false if already closed or finalization has started
    bool CloseSegment(Segment* segment);

    void AppendPath(std::string component);
    void PopPath();

    /// Live path stack, for inspection
    std::vector<std::string> PathStack() const;

    /// Path that would name the transaction if it finished now
    std::string CurrentPath() const;

    /**
     * @brief Name trigger fired by the response view
     *
     * A body assignment always snapshots the path stack. A status assignment
     * snapshots only while no body has been assigned.
     */
    void OnResponseMutation(MutationKind kind, int status_code);

    /// Status written by the transport after the chain; never a name trigger
    void SetFinalStatus(int status_code);
    int status_code() const;

    /// Error seen escaping a middleware; attached to its segment
    void NoticeError(std::exception_ptr error, Segment* segment);

    /**
     * @brief Error that escaped the whole chain
     * @return false for a duplicate or once finalization has started
     */
    bool RecordUnhandledError(std::exception_ptr error);

    /**
     * @brief Enter FINALIZING and capture the trace
     *
     * Freezes the name state, force-closes dangling segments as truncated and
     * resolves which errors are reported.
     *
     * @return The trace on the first call, std::nullopt afterwards
     */
    std::optional<FinishedTrace> BeginFinalize(FinalizeReason reason);

    /// Enter DONE once the trace has been handed off
    void MarkDone();

    std::string TransactionName() const;

private:
    struct ObservedError {
        std::exception_ptr error;
        std::string message;
        std::string segment;
        std::uint32_t segment_id = 0;
    };

    std::string TransactionNameLocked() const;
    std::vector<TracedError> ReportedErrorsLocked() const;
    const ObservedError* FindNoticedLocked(const std::exception_ptr& error) const;

    const RequestId id_;
    const RequestDescriptor request_;
    const TracerConfig config_;
    const Clock::time_point started_at_;

    mutable std::mutex mutex_;
    RequestState state_ = RequestState::kCreated;
    std::shared_ptr<SegmentTree> tree_;
    Segment* root_;
    NameState name_state_;
    bool body_set_ = false;
    int status_code_ = 0;
    std::vector<ObservedError> noticed_;
    std::vector<ObservedError> unhandled_;
};

}  // namespace chaintrace
