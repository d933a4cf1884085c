/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Fixed-width thread pool.
 *
 * @details
 * Two pools exist in the server: one runs TCP sessions, the other runs range
 * generation tasks. A generation request that arrives while every generation worker
 * is busy waits in the pool's FIFO queue, which is what keeps a task `queued`.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace chronoid::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns `threads` workers (at least one).
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Stops accepting work, drains the queue, and joins every worker.
     *
     * @note Blocking. Tasks still queued at destruction time are executed, so owners
     * that want a fast shutdown must make those tasks return early (e.g. by cancelling).
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     * @return false if the pool is shutting down and the task was rejected.
     */
    bool enqueue(std::function<void()> task);

    /// @brief Number of worker threads.
    size_t size() const
    {
        return workers_.size();
    }

    /// @brief Number of tasks waiting for a worker.
    size_t pending();

  private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace chronoid::infra
