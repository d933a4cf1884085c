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
 * @file task_registry.hpp
 * @brief Thread-safe store of generation task records.
 *
 * @details
 * The registry is the only state shared between request sessions and generation
 * workers. A single `std::shared_mutex` guards the map: lookups take a shared lock,
 * and every mutation, including a caller-supplied read-modify-write, runs under the
 * exclusive lock. Readers therefore always observe a whole record, never a half-applied
 * update.
 */

#pragma once

#include "chronoid/tasks/task.hpp"

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chronoid::tasks {

class TaskRegistry {
  public:
    using Mutator = std::function<void(GenerationTask&)>;

    /**
     * @brief Inserts a new record.
     * @return The record's `task_id`.
     * @throws core::Error `InvalidArgument` if the id is empty or already present.
     */
    std::string create(GenerationTask task);

    /// @brief Snapshot of the record, or `std::nullopt` if unknown.
    std::optional<GenerationTask> get(const std::string& task_id) const;

    /**
     * @brief Applies `mutator` to the record under the exclusive lock.
     *
     * The mutator must not call back into the registry.
     *
     * @return false if the id is unknown; the mutator is not invoked.
     */
    bool update(const std::string& task_id, const Mutator& mutator);

    /// @return false if the id is unknown.
    bool remove(const std::string& task_id);

    /// @brief Snapshots of every record, oldest first.
    std::vector<GenerationTask> list() const;

    size_t size() const;

  private:
    std::unordered_map<std::string, GenerationTask> tasks_;
    mutable std::shared_mutex rw_lock_;
};

} // namespace chronoid::tasks
