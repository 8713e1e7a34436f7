// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "chaintrace/completion.h"
#include "chaintrace/request_context.h"

namespace chaintrace {

/// Continues the chain past the current middleware
using NextFn = std::function<Completion()>;

/// Runs the real middleware with the (wrapped) continuation
using InvokeReal = std::function<Completion(NextFn)>;

/**
 * @brief Registration-time description of a middleware
 */
struct MiddlewareOptions {
    /// Empty for anonymous middleware
    std::string name;

    /// Route component appended to the naming path on entry, if any
    std::string path;
};

/**
 * @brief Records one middleware invocation as a segment
 *
 * The segment opens as a child of the segment active for the request (the
 * root when nothing is active), stays active for everything reached through
 * the wrapped next, and closes exactly once when the middleware's completion
 * settles or the middleware throws. Results and errors pass through
 * unchanged.
 */
class MiddlewareWrapper {
public:
    /**
     * @brief Invoke a middleware under a new segment
     *
     * @param request Request the invocation belongs to
     * @param segment_name Full segment name, e.g. "Middleware/Chain/auth"
     * @param path_component Naming path component to append, empty for none
     * @param next Continuation of the chain
     * @param invoke_real Calls the real middleware exactly once
     * @return The completion returned by the middleware
     * @throws Whatever the middleware throws synchronously
     */
    static Completion Invoke(const std::shared_ptr<RequestContext>& request,
                             const std::string& segment_name,
                             const std::string& path_component,
                             NextFn next,
                             const InvokeReal& invoke_real);
};

}  // namespace chaintrace
