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
 * @file task_registry.cpp
 * @brief Implementation of the task registry and task status names.
 */

#include "chronoid/tasks/task_registry.hpp"

#include "chronoid/core/error.hpp"

#include <algorithm>
#include <mutex>

namespace chronoid::tasks {

const char* to_string(TaskStatus status)
{
    switch (status) {
    case TaskStatus::Queued:
        return "queued";
    case TaskStatus::Generating:
        return "generating";
    case TaskStatus::Completed:
        return "completed";
    case TaskStatus::Cancelled:
        return "cancelled";
    case TaskStatus::Error:
        return "error";
    }
    return "unknown";
}

std::string TaskRegistry::create(GenerationTask task)
{
    if (task.task_id.empty()) {
        throw core::Error(core::ErrorKind::InvalidArgument, "Task id must not be empty");
    }

    std::unique_lock lock(rw_lock_);
    std::string id = task.task_id;
    if (!tasks_.emplace(id, std::move(task)).second) {
        throw core::Error(core::ErrorKind::InvalidArgument, "Duplicate task id: " + id);
    }
    return id;
}

std::optional<GenerationTask> TaskRegistry::get(const std::string& task_id) const
{
    std::shared_lock lock(rw_lock_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TaskRegistry::update(const std::string& task_id, const Mutator& mutator)
{
    std::unique_lock lock(rw_lock_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return false;
    }
    mutator(it->second);
    return true;
}

bool TaskRegistry::remove(const std::string& task_id)
{
    std::unique_lock lock(rw_lock_);
    return tasks_.erase(task_id) > 0;
}

std::vector<GenerationTask> TaskRegistry::list() const
{
    std::vector<GenerationTask> out;
    {
        std::shared_lock lock(rw_lock_);
        out.reserve(tasks_.size());
        for (const auto& entry : tasks_) {
            out.push_back(entry.second);
        }
    }

    std::sort(out.begin(), out.end(), [](const GenerationTask& a, const GenerationTask& b) {
        if (a.created_at != b.created_at) {
            return a.created_at < b.created_at;
        }
        return a.task_id < b.task_id;
    });
    return out;
}

size_t TaskRegistry::size() const
{
    std::shared_lock lock(rw_lock_);
    return tasks_.size();
}

} // namespace chronoid::tasks
