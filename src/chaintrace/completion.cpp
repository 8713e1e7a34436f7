// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/completion.h"

#include <mutex>
#include <stdexcept>
#include <vector>

#include "chaintrace/context_scope.h"

namespace chaintrace {

struct Completion::State {
    enum class Status { kPending, kResolved, kRejected };

    std::mutex mutex;
    Status status = Status::kPending;
    std::exception_ptr error;
    std::vector<Callback> callbacks;
};

bool Deferred::Settle(Completion::State& state, std::exception_ptr error) {
    std::vector<Completion::Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.status != Completion::State::Status::kPending) {
            return false;
        }
        state.status = error ? Completion::State::Status::kRejected
                             : Completion::State::Status::kResolved;
        state.error = error;
        callbacks.swap(state.callbacks);
    }

    for (auto& callback : callbacks) {
        callback(error);
    }
    return true;
}

Completion Completion::Resolved() {
    Deferred deferred;
    deferred.Resolve();
    return deferred.completion();
}

Completion Completion::Rejected(std::exception_ptr error) {
    Deferred deferred;
    deferred.Reject(error);
    return deferred.completion();
}

bool Completion::is_pending() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->status == State::Status::kPending;
}

bool Completion::is_resolved() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->status == State::Status::kResolved;
}

bool Completion::is_rejected() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->status == State::Status::kRejected;
}

std::exception_ptr Completion::error() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->error;
}

void Completion::OnSettled(Callback callback) const {
    Callback bound = [binding = CurrentBinding(), callback = std::move(callback)](std::exception_ptr error) {
        ContextScope scope(binding);
        callback(error);
    };

    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->status == State::Status::kPending) {
        state_->callbacks.push_back(std::move(bound));
        return;
    }
    std::exception_ptr error = state_->error;
    lock.unlock();

    bound(error);
}

Deferred::Deferred() : state_(std::make_shared<Completion::State>()) {}

bool Deferred::Resolve() const {
    return Settle(*state_, nullptr);
}

bool Deferred::Reject(std::exception_ptr error) const {
    if (!error) {
        throw std::invalid_argument("Deferred::Reject requires an error");
    }
    return Settle(*state_, std::move(error));
}

}  // namespace chaintrace
