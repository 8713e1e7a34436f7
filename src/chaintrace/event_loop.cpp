// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#include "chaintrace/event_loop.h"

#include <atomic>
#include <exception>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "chaintrace/context_scope.h"
#include "chaintrace/request_context.h"
#include "chaintrace/worker_pool.h"

namespace chaintrace {

void EventLoop::Post(Task task) {
    if (!task) {
        throw std::invalid_argument("EventLoop::Post requires a task");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(BindToCurrent(std::move(task)));
    }
    wakeup_.notify_one();
}

void EventLoop::SetTimeout(Task task, std::chrono::milliseconds delay) {
    if (!task) {
        throw std::invalid_argument("EventLoop::SetTimeout requires a task");
    }

    ContextBinding binding = CurrentBinding();
    Segment* timer = nullptr;
    if (binding) {
        timer = binding.request->OpenSegment(binding.segment, kTimerSegmentName);
        if (timer) {
            binding.segment = timer;
        }
    }

    Task timed = [binding, timer, task = std::move(task)]() {
        ContextScope scope(binding);
        try {
            task();
        } catch (...) {
            if (timer) {
                binding.request->CloseSegment(timer);
            }
            throw;
        }
        if (timer) {
            binding.request->CloseSegment(timer);
        }
    };

    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.emplace(TimerKey{Clock::now() + delay, next_seq_++}, std::move(timed));
    }
    wakeup_.notify_one();
}

Completion EventLoop::Delay(std::chrono::milliseconds delay) {
    Deferred deferred;
    // Settle on the following turn so the timer segment is closed before
    // any continuation runs
    SetTimeout([this, deferred]() { Post([deferred]() { deferred.Resolve(); }); }, delay);
    return deferred.completion();
}

// Settles one offloaded call exactly once. A task the pool discards without
// running destroys its ticket, which rejects the completion.
class EventLoop::OffloadTicket {
public:
    OffloadTicket(EventLoop& loop, Deferred deferred) : loop_(loop), deferred_(std::move(deferred)) {}

    OffloadTicket(const OffloadTicket&) = delete;
    OffloadTicket& operator=(const OffloadTicket&) = delete;

    ~OffloadTicket() {
        Settle(std::make_exception_ptr(std::runtime_error("worker pool dropped task")));
    }

    void Settle(std::exception_ptr error) {
        if (settled_.exchange(true)) {
            return;
        }
        loop_.PostFromWorker([deferred = deferred_, error]() {
            if (error) {
                deferred.Reject(error);
            } else {
                deferred.Resolve();
            }
        });
    }

    /// The pool refused the task; the caller settles instead
    void Disarm() { settled_.store(true); }

private:
    EventLoop& loop_;
    Deferred deferred_;
    std::atomic<bool> settled_{false};
};

Completion EventLoop::Offload(WorkerPool& pool, std::function<void()> work) {
    if (!work) {
        throw std::invalid_argument("EventLoop::Offload requires work");
    }

    Deferred deferred;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++offloaded_;
    }

    auto ticket = std::make_shared<OffloadTicket>(*this, deferred);
    const bool accepted = pool.post([ticket, work = std::move(work)]() {
        std::exception_ptr error;
        try {
            work();
        } catch (...) {
            error = std::current_exception();
        }
        ticket->Settle(error);
    });

    if (!accepted) {
        ticket->Disarm();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --offloaded_;
        }
        deferred.Reject(std::make_exception_ptr(std::runtime_error("worker pool is stopping")));
    }
    return deferred.completion();
}

void EventLoop::PostFromWorker(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(BindToCurrent(std::move(task)));
        --offloaded_;
    }
    wakeup_.notify_one();
}

std::size_t EventLoop::Run() {
    std::size_t executed = 0;
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            for (;;) {
                if (!ready_.empty()) {
                    task = std::move(ready_.front());
                    ready_.pop_front();
                    break;
                }
                if (!timers_.empty()) {
                    auto first = timers_.begin();
                    const Clock::time_point due = first->first.due;
                    if (due <= Clock::now()) {
                        task = std::move(first->second);
                        timers_.erase(first);
                        break;
                    }
                    wakeup_.wait_until(lock, due);
                    continue;
                }
                if (offloaded_ == 0) {
                    return executed;
                }
                wakeup_.wait(lock);
            }
        }
        RunTask(task);
        ++executed;
    }
}

void EventLoop::RunTask(Task& task) noexcept {
    try {
        task();
    } catch (const std::exception& e) {
        spdlog::error("Event loop task failed: {}", e.what());
    } catch (...) {
        spdlog::error("Event loop task failed with a non-standard exception");
    }
}

std::size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size() + timers_.size() + offloaded_;
}

}  // namespace chaintrace
