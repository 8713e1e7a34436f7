// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace chaintrace {

class Deferred;

/**
 * @brief Completion signal of a unit of work that may finish later
 *
 * A completion is either pending, resolved, or rejected with the exception
 * that ended the work. Copies share the same underlying state.
 *
 * Continuations registered through OnSettled(), Then() or Catch() capture the
 * ContextBinding current at registration and run inside it, no matter which
 * thread or callback settles the completion. Continuations run synchronously
 * when the completion settles, or immediately if it already has.
 *
 * Thread Safety: settling and registering continuations may happen on
 * different threads.
 */
class Completion {
public:
    using Callback = std::function<void(std::exception_ptr)>;

    static Completion Resolved();

    /// @throws std::invalid_argument if error is null
    static Completion Rejected(std::exception_ptr error);

    /// Run fn now, turning a thrown exception into a rejected completion
    template <class F>
    static Completion FromCall(F&& fn);

    bool is_pending() const;
    bool is_resolved() const;
    bool is_rejected() const;

    /// The rejection error, null unless rejected
    std::exception_ptr error() const;

    /// Register a callback receiving null on success or the rejection error
    void OnSettled(Callback callback) const;

    /**
     * @brief Chain work after successful completion
     *
     * on_resolved returns void or Completion; a returned completion is adopted.
     * A rejection skips on_resolved and propagates unchanged.
     */
    template <class F>
    Completion Then(F&& on_resolved) const;

    /**
     * @brief Handle a rejection
     *
     * on_rejected receives the std::exception_ptr and returns void or
     * Completion. Returning normally recovers the chain; rethrowing keeps it
     * rejected.
     */
    template <class F>
    Completion Catch(F&& on_rejected) const;

private:
    friend class Deferred;
    struct State;

    explicit Completion(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

/**
 * @brief Producer side of a pending Completion
 */
class Deferred {
public:
    Deferred();

    Completion completion() const { return Completion(state_); }

    /// @return false if already settled
    bool Resolve() const;

    /// @return false if already settled
    /// @throws std::invalid_argument if error is null
    bool Reject(std::exception_ptr error) const;

private:
    static bool Settle(Completion::State& state, std::exception_ptr error);

    std::shared_ptr<Completion::State> state_;
};

namespace detail {

// Invoke a continuation and settle `next` with its outcome
template <class F, class... Args>
void SettleWith(const Deferred& next, F& fn, Args&&... args) {
    using Result = std::invoke_result_t<F&, Args...>;
    try {
        if constexpr (std::is_same_v<Result, Completion>) {
            Completion inner = std::invoke(fn, std::forward<Args>(args)...);
            inner.OnSettled([next](std::exception_ptr error) {
                if (error) {
                    next.Reject(error);
                } else {
                    next.Resolve();
                }
            });
        } else {
            static_assert(std::is_void_v<Result>, "continuations must return void or Completion");
            std::invoke(fn, std::forward<Args>(args)...);
            next.Resolve();
        }
    } catch (...) {
        next.Reject(std::current_exception());
    }
}

}  // namespace detail

template <class F>
Completion Completion::FromCall(F&& fn) {
    Deferred result;
    detail::SettleWith(result, fn);
    return result.completion();
}

template <class F>
Completion Completion::Then(F&& on_resolved) const {
    Deferred next;
    OnSettled([next, fn = std::forward<F>(on_resolved)](std::exception_ptr error) mutable {
        if (error) {
            next.Reject(error);
            return;
        }
        detail::SettleWith(next, fn);
    });
    return next.completion();
}

template <class F>
Completion Completion::Catch(F&& on_rejected) const {
    Deferred next;
    OnSettled([next, fn = std::forward<F>(on_rejected)](std::exception_ptr error) mutable {
        if (!error) {
            next.Resolve();
            return;
        }
        detail::SettleWith(next, fn, error);
    });
    return next.completion();
}

}  // namespace chaintrace
