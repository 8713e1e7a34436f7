// Copyright 2025 ChainTrace Project
// SPDX-License-Identifier: Apache-2.0

// worker_pool.h
// Fixed-size thread pool for work offloaded from request handlers.
// Every task runs inside the request binding current when it was posted.

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <semaphore>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>
#if defined(__linux__)
#include <pthread.h>
#endif

#include <spdlog/spdlog.h>

#include "chaintrace/context_scope.h"

namespace chaintrace {

class WorkerPool {
public:
    struct Options {
        std::size_t thread_count = std::thread::hardware_concurrency() ?
                                   std::thread::hardware_concurrency() : 1;
        // Max tasks running at once across the pool; 0 => thread_count
        std::size_t parallelism = 0;

        // 0 => unbounded queue
        std::size_t max_queue = 0;

        // Run the remaining queued tasks on shutdown() instead of dropping them
        bool drain_on_shutdown = true;

        // Thread name prefix
        std::string name;
    };

    using Task = std::function<void()>;

    explicit WorkerPool(Options options)
        : options_{normalize(std::move(options))}
        , permits_{static_cast<std::ptrdiff_t>(options_.parallelism)}
    {
        start_threads();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    ~WorkerPool() { shutdown(options_.drain_on_shutdown); }

    // Non-blocking enqueue. Returns false if stopping or the queue is full.
    template <class F>
    bool try_post(F&& f) {
        if (is_stopping_.load(std::memory_order_acquire)) return false;
        return try_enqueue(make_task(std::forward<F>(f)));
    }

    // Blocks while a bounded queue is full. Returns false if stopping.
    template <class F>
    bool post(F&& f) {
        if (is_stopping_.load(std::memory_order_acquire)) return false;
        return enqueue_blocking(make_task(std::forward<F>(f)));
    }

    // Submit a callable and get a future to its result.
    // Throws std::runtime_error if the pool is stopping.
    template <class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
        using R = std::invoke_result_t<std::decay_t<F>&>;
        auto ptask = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> fut = ptask->get_future();

        if (!post([ptask] { (*ptask)(); })) {
            throw std::runtime_error("WorkerPool '" + options_.name + "' is stopping");
        }
        return fut;
    }

    // drain == false discards queued tasks. Idempotent.
    void shutdown(bool drain) noexcept {
        bool expected = false;
        if (!is_stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!drain) {
                queue_.clear();
            }
        }

        space_cv_.notify_all();
        task_cv_.notify_all();

        for (auto& t : threads_) {
            t.request_stop();
        }
        // ~jthread joins
        threads_.clear();
    }

    std::size_t thread_count() const noexcept { return options_.thread_count; }
    std::size_t parallelism() const noexcept { return options_.parallelism; }
    std::size_t queued_estimate() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
    std::size_t active() const noexcept { return active_.load(std::memory_order_relaxed); }
    std::size_t failed() const noexcept { return failed_.load(std::memory_order_relaxed); }

private:
    static Options normalize(Options opts) {
        if (opts.thread_count == 0) opts.thread_count = 1;
        if (opts.parallelism == 0) opts.parallelism = opts.thread_count;
        if (opts.name.empty()) opts.name = "worker";
        return opts;
    }

    // Captures the poster's request binding
    template <class F>
    static Task make_task(F&& f) {
        auto sp = std::make_shared<std::decay_t<F>>(std::forward<F>(f));
        return [binding = CurrentBinding(), sp]() mutable {
            ContextScope scope(binding);
            (*sp)();
        };
    }

    bool try_enqueue(Task&& t) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (is_stopping_.load(std::memory_order_acquire)) return false;
        if (options_.max_queue != 0 && queue_.size() >= options_.max_queue) {
            return false;
        }
        queue_.emplace_back(std::move(t));
        task_cv_.notify_one();
        return true;
    }

    bool enqueue_blocking(Task&& t) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (is_stopping_.load(std::memory_order_acquire)) return false;
        if (options_.max_queue != 0) {
            space_cv_.wait(lock, [&]{
                return is_stopping_.load(std::memory_order_acquire) || queue_.size() < options_.max_queue;
            });
            if (is_stopping_.load(std::memory_order_acquire)) return false;
        }
        queue_.emplace_back(std::move(t));
        task_cv_.notify_one();
        return true;
    }

    void start_threads() {
        threads_.reserve(options_.thread_count);
        for (std::size_t i = 0; i < options_.thread_count; ++i) {
            threads_.emplace_back([this, i](std::stop_token st) {
#if defined(__linux__)
                std::string nm = options_.name + "-" + std::to_string(i);
                if (nm.size() > 15) nm.resize(15);  // pthread name limit
                pthread_setname_np(pthread_self(), nm.c_str());
#endif
                worker_loop(std::move(st));
            });
        }
    }

    void worker_loop(std::stop_token st) noexcept {
        std::stop_callback on_stop{st, [this] {
            task_cv_.notify_all();
            space_cv_.notify_all();
        }};
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                task_cv_.wait(lock, [&] {
                    return !queue_.empty() || is_stopping_.load(std::memory_order_acquire);
                });

                if (queue_.empty()) {
                    break;
                }

                task = std::move(queue_.front());
                queue_.pop_front();
                if (options_.max_queue != 0) {
                    space_cv_.notify_one();
                }
            }

            permits_.acquire();
            active_.fetch_add(1, std::memory_order_relaxed);
            run_task(task);
            active_.fetch_sub(1, std::memory_order_relaxed);
            permits_.release();
        }
    }

    // A failing task must not take its worker thread down
    void run_task(Task& task) noexcept {
        try {
            task();
        } catch (const std::exception& e) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("WorkerPool '{}' task failed: {}", options_.name, e.what());
        } catch (...) {
            failed_.fetch_add(1, std::memory_order_relaxed);
            spdlog::error("WorkerPool '{}' task failed with a non-standard exception", options_.name);
        }
    }

    Options options_{};
    std::vector<std::jthread> threads_;

    std::counting_semaphore<> permits_;

    mutable std::mutex mutex_;
    std::condition_variable task_cv_;
    std::condition_variable space_cv_;
    std::deque<Task> queue_;

    std::atomic<bool> is_stopping_{false};
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> failed_{0};
};

}  // namespace chaintrace
