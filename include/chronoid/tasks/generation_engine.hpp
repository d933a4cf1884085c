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
 * @file generation_engine.hpp
 * @brief Background execution of range generation tasks.
 *
 * @details
 * `start_range_generation` validates the bounds synchronously, registers a `queued`
 * task and starts a worker thread owned by the engine for it, so no accepted task ever
 * waits behind another. Each running task is a two-stage pipeline:
 *
 * 1. **Producer** (a dedicated thread): walks the range with a `RangeCursor` and
 *    pushes batches of newline-terminated UUIDs into a `BoundedChannel`.
 * 2. **Writer** (the task's worker thread): pops batches, appends them to the task's
 *    `UuidSink`, then publishes `count` and `progress`.
 *
 * Both stages poll the task's cancellation token once per batch. A cancelled or
 * failed task discards its staging file; only a completed task leaves a file behind.
 */

#pragma once

#include "chronoid/core/range_enumerator.hpp"
#include "chronoid/infra/cancellation.hpp"
#include "chronoid/tasks/task_registry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chronoid::tasks {

enum class CancelOutcome {
    Cancelled,       ///< Cancellation recorded (or already requested).
    AlreadyFinished, ///< The task had reached a terminal state; nothing changed.
    NotFound
};

const char* to_string(CancelOutcome outcome);

struct EngineOptions {
    std::string output_dir = "./chronoid_output";
    std::size_t batch_size = 1000;
    std::size_t channel_capacity = 8;
};

class GenerationEngine {
  public:
    GenerationEngine(TaskRegistry& registry, EngineOptions options);

    /// @brief Cancels every unfinished task and joins every worker thread.
    ~GenerationEngine();

    GenerationEngine(const GenerationEngine&) = delete;
    GenerationEngine& operator=(const GenerationEngine&) = delete;

    /**
     * @brief Accepts a range generation request.
     *
     * @return The new task id. The task is `queued` (or already running) on return.
     *         If the engine is shutting down the task is recorded as `error`.
     * @throws core::Error `InvalidFormat` if either bound is not a UUID.
     */
    std::string start_range_generation(const std::string& start_uuid,
                                       const std::string& end_uuid);

    std::optional<GenerationTask> get_status(const std::string& task_id) const;

    /**
     * @brief Requests cancellation.
     *
     * A task whose worker has not started yet becomes `cancelled` immediately. A generating task is flagged and
     * its worker finalizes `cancelled` at its next batch boundary.
     */
    CancelOutcome cancel(const std::string& task_id);

    /**
     * @brief Drops the bookkeeping record. A task still running is cancelled first.
     * @return false if the id is unknown.
     */
    bool delete_task(const std::string& task_id);

    std::vector<GenerationTask> list_tasks() const;

    /// @throws core::Error `InvalidFormat` if either bound is not a UUID.
    static core::RangeEstimate estimate(const std::string& start_uuid,
                                        const std::string& end_uuid);

    /**
     * @brief Blocks until the task is terminal or `timeout` elapses.
     * @return true if the task is terminal (or was deleted meanwhile).
     */
    bool wait(const std::string& task_id, std::chrono::milliseconds timeout) const;

    const EngineOptions& options() const
    {
        return options_;
    }

  private:
    void run(const std::string& task_id, const core::RangeSpec& spec,
             const infra::CancellationToken& token);

    /**
     * @brief Applies a terminal transition and wakes `wait()` callers.
     * @return false if the record was deleted in the meantime.
     */
    bool finish(const std::string& task_id, const TaskRegistry::Mutator& mutator);

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    /// @brief Joins workers whose task has returned. Caller holds `workers_mutex_`.
    void reap_finished_workers();

    TaskRegistry& registry_;
    EngineOptions options_;

    mutable std::mutex done_mutex_;
    mutable std::condition_variable done_cv_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    bool stopping_ = false;
};

} // namespace chronoid::tasks
