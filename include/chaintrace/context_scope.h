// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <utility>

namespace chaintrace {

class RequestContext;
class Segment;

/**
 * @brief The request and active segment a continuation runs inside
 *
 * A binding is captured whenever work is deferred (completion continuations,
 * event loop tasks, offloaded jobs) and reinstalled when that work resumes, so
 * the association follows the continuation chain rather than whichever thread
 * or callback happens to run next.
 */
struct ContextBinding {
    std::shared_ptr<RequestContext> request;
    Segment* segment = nullptr;

    explicit operator bool() const { return request != nullptr; }
};

/// Binding of the continuation currently executing on this thread
ContextBinding CurrentBinding();

/**
 * @brief Installs a binding for the synchronous extent of a scope
 *
 * The previous binding is restored on destruction, so scopes nest.
 */
class ContextScope {
public:
    explicit ContextScope(ContextBinding binding);
    ~ContextScope();

    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;

private:
    ContextBinding previous_;
};

/**
 * @brief Wrap a callable so it runs inside the binding current right now
 */
template <class F>
auto BindToCurrent(F&& fn) {
    return [binding = CurrentBinding(), fn = std::forward<F>(fn)](auto&&... args) mutable -> decltype(auto) {
        ContextScope scope(binding);
        return fn(std::forward<decltype(args)>(args)...);
    };
}

}  // namespace chaintrace
