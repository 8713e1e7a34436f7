// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

#include "chaintrace/completion.h"
#include "chaintrace/segment_tree.h"

namespace chaintrace {

class WorkerPool;

/**
 * @brief Cooperative single-threaded event loop
 *
 * Tasks run one at a time on the thread calling Run(), each inside the
 * request binding that was current when it was scheduled. Post() may be
 * called from any thread; everything else is meant for the loop thread.
 */
class EventLoop {
public:
    using Task = std::function<void()>;

    static constexpr const char* kTimerSegmentName = "EventLoop/SetTimeout";

    EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Queue a task behind everything already ready
    void Post(Task task);

    /**
     * @brief Run a task once delay has elapsed
     *
     * Inside a request, an "EventLoop/SetTimeout" segment is opened under the
     * active segment now and closed once the task has run. The task runs with
     * that segment active.
     */
    void SetTimeout(Task task, std::chrono::milliseconds delay);

    /// Completion resolved on the loop, on the turn after the delay's timer fires
    Completion Delay(std::chrono::milliseconds delay);

    /**
     * @brief Run work on a worker pool and settle the result back on the loop
     *
     * The returned completion rejects with whatever work throws, or with
     * "worker pool dropped task" when the pool discards the task unrun. Run()
     * keeps waiting while offloaded work is outstanding.
     */
    Completion Offload(WorkerPool& pool, std::function<void()> work);

    /**
     * @brief Run until no ready task, timer or offloaded work remains
     * @return Number of tasks executed
     */
    std::size_t Run();

    /// Ready tasks, timers and offloaded work not yet settled
    std::size_t pending() const;

private:
    struct TimerKey {
        Clock::time_point due;
        std::uint64_t seq;

        bool operator<(const TimerKey& other) const {
            return due != other.due ? due < other.due : seq < other.seq;
        }
    };

    class OffloadTicket;

    void RunTask(Task& task) noexcept;
    void PostFromWorker(Task task);

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::deque<Task> ready_;
    std::map<TimerKey, Task> timers_;
    std::uint64_t next_seq_ = 0;
    std::size_t offloaded_ = 0;
};

}  // namespace chaintrace
