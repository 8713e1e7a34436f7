// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <vector>

#include "chaintrace/segment_tree.h"

namespace chaintrace {

using RequestId = std::uint64_t;

/**
 * @brief Request/response view handed over by the framework adapter
 */
struct RequestDescriptor {
    std::string method = "GET";
    std::string url = "/";
};

enum class FinalizeReason {
    kResponseEnd,  // response fully sent
    kAborted,      // connection dropped before the response finished
    kTimeout,      // reclaimed by FinalizeExpired()
};

const char* ToString(FinalizeReason reason);

/**
 * @brief Error reported as an end-user visible failure of a request
 */
struct TracedError {
    std::string message;
    // Segment the error escaped from, empty when it never crossed a middleware
    std::string segment;
    // Segment::id() of that segment; 0 (the root) when it never crossed one
    std::uint32_t segment_id = 0;
};

/**
 * @brief Immutable result of a finalized request
 */
struct FinishedTrace {
    RequestId request_id = 0;

    /// Transaction name, e.g. "WebTransaction/WebFrameworkUri/Chain/GET//users/list"
    std::string name;

    /// Naming path, e.g. "/users/list"
    std::string path;
    std::vector<std::string> path_components;

    RequestDescriptor request;
    int status_code = 0;
    FinalizeReason reason = FinalizeReason::kResponseEnd;

    std::shared_ptr<const SegmentTree> tree;
    Clock::duration duration{};
    std::vector<TracedError> errors;

    const Segment& root() const { return *tree->root(); }
    double DurationMs() const;
};

/**
 * @brief Receives every finished trace exactly once
 *
 * Implementations must not assume a particular thread. Exceptions thrown by
 * Report() are logged and dropped by the engine.
 */
class TraceReporter {
public:
    virtual ~TraceReporter() = default;

    virtual void Report(const FinishedTrace& trace) = 0;
};

/// what() of the error, or a placeholder for non-standard exceptions
std::string DescribeError(std::exception_ptr error);

}  // namespace chaintrace
