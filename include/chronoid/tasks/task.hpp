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
 * @file task.hpp
 * @brief The bookkeeping record of one range generation request.
 *
 * @details
 * Lifecycle: `queued -> generating -> {completed | cancelled | error}`. A queued task
 * may also go straight to `cancelled`. Terminal states never change again.
 */

#pragma once

#include "chronoid/infra/cancellation.hpp"

#include <cstdint>
#include <string>

namespace chronoid::tasks {

enum class TaskStatus { Queued, Generating, Completed, Cancelled, Error };

/// @brief Lowercase wire name: `queued`, `generating`, `completed`, `cancelled`, `error`.
const char* to_string(TaskStatus status);

inline bool is_terminal(TaskStatus status)
{
    return status == TaskStatus::Completed || status == TaskStatus::Cancelled ||
           status == TaskStatus::Error;
}

/**
 * @struct GenerationTask
 * @brief Snapshot-able task state.
 *
 * Copies share the same `cancellation` signal, so a snapshot handed to a reader can
 * never be used to un-cancel the canonical record.
 */
struct GenerationTask {
    std::string task_id;
    TaskStatus status = TaskStatus::Queued;
    double progress = 0.0;            ///< 0-100, non-decreasing while generating.
    std::uint64_t count = 0;          ///< UUIDs written so far.
    std::uint64_t total_possible = 0; ///< Range size, fixed at creation.
    std::string output_path;          ///< Set on completion.
    bool cancelled = false;
    std::string error_message;

    std::string start_uuid; ///< Normalized (smaller) bound.
    std::string end_uuid;
    double created_at = 0.0; ///< Unix seconds.
    std::string message;

    infra::CancellationSource cancellation;
};

} // namespace chronoid::tasks
