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
 * @file generation_engine.cpp
 * @brief Implementation of the background generation pipeline.
 */

#include "chronoid/tasks/generation_engine.hpp"

#include "chronoid/core/error.hpp"
#include "chronoid/infra/bounded_channel.hpp"
#include "chronoid/infra/id_generator.hpp"
#include "chronoid/infra/logger.hpp"
#include "chronoid/infra/string.hpp"
#include "chronoid/storage/sink.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <memory>
#include <system_error>
#include <thread>

namespace chronoid::tasks {

namespace {

using infra::Logger;
using infra::LogLevel;

double unix_now()
{
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

double percent(std::uint64_t count, std::uint64_t total)
{
    if (total == 0) {
        return 100.0;
    }
    return std::min(100.0, static_cast<double>(count) / static_cast<double>(total) * 100.0);
}

/**
 * Owns the producer thread of one task. Destruction closes the channel, which
 * unblocks a producer waiting on a full channel, and joins the thread.
 */
class Producer {
  public:
    Producer(infra::BoundedChannel<std::string>& channel, core::RangeCursor& cursor,
             const infra::CancellationToken& token, std::size_t batch_size)
        : channel_(channel)
    {
        thread_ = std::thread([this, &cursor, token, batch_size] {
            try {
                while (!cursor.done() && !token.is_cancelled()) {
                    std::string batch;
                    batch.reserve(batch_size * (core::Uuid::kTextLength + 1));
                    cursor.next_batch(batch, batch_size);
                    if (!channel_.push(std::move(batch))) {
                        break;
                    }
                }
            } catch (...) {
                error_ = std::current_exception();
            }
            channel_.close();
        });
    }

    ~Producer()
    {
        join();
    }

    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    void join()
    {
        channel_.close();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    /// Rethrows whatever the producer raised. Call after `join()`.
    void rethrow_if_failed() const
    {
        if (error_) {
            std::rethrow_exception(error_);
        }
    }

  private:
    infra::BoundedChannel<std::string>& channel_;
    std::thread thread_;
    std::exception_ptr error_;
};

} // namespace

const char* to_string(CancelOutcome outcome)
{
    switch (outcome) {
    case CancelOutcome::Cancelled:
        return "cancelled";
    case CancelOutcome::AlreadyFinished:
        return "already_finished";
    case CancelOutcome::NotFound:
        return "not_found";
    }
    return "unknown";
}

GenerationEngine::GenerationEngine(TaskRegistry& registry, EngineOptions options)
    : registry_(registry), options_(std::move(options))
{
    options_.batch_size = std::max<std::size_t>(1, options_.batch_size);
    options_.channel_capacity = std::max<std::size_t>(1, options_.channel_capacity);

    Logger::log(LogLevel::INFO, "Engine: One worker per task, batch size " +
                                    std::to_string(options_.batch_size) + ", output '" +
                                    options_.output_dir + "'");
}

GenerationEngine::~GenerationEngine()
{
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        stopping_ = true;
        workers.swap(workers_);
    }

    for (const auto& task : registry_.list()) {
        if (!is_terminal(task.status)) {
            cancel(task.task_id);
        }
    }

    if (!workers.empty()) {
        Logger::log(LogLevel::INFO,
                    "Engine: Joining " + std::to_string(workers.size()) + " worker(s)");
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void GenerationEngine::reap_finished_workers()
{
    auto finished = std::partition(workers_.begin(), workers_.end(),
                                   [](const Worker& w) { return !w.done->load(); });
    for (auto it = finished; it != workers_.end(); ++it) {
        if (it->thread.joinable()) {
            it->thread.join();
        }
    }
    workers_.erase(finished, workers_.end());
}

std::string GenerationEngine::start_range_generation(const std::string& start_uuid,
                                                     const std::string& end_uuid)
{
    core::RangeSpec spec = core::RangeEnumerator::compute(start_uuid, end_uuid);

    GenerationTask task;
    task.task_id = infra::IdGenerator::generate();
    task.total_possible = spec.total_possible;
    task.start_uuid = spec.start_uuid;
    task.end_uuid = spec.end_uuid;
    task.created_at = unix_now();
    infra::CancellationToken token = task.cancellation.token();

    std::string id = registry_.create(std::move(task));
    Logger::log(LogLevel::INFO, "Engine: Task " + id + " queued (" +
                                    infra::String::with_thousands(spec.total_possible) +
                                    " UUIDs)");

    std::unique_lock<std::mutex> lock(workers_mutex_);
    if (stopping_) {
        lock.unlock();
        finish(id, [](GenerationTask& t) {
            t.status = TaskStatus::Error;
            t.error_message = "Engine is shutting down";
        });
        return id;
    }

    reap_finished_workers();

    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::thread thread([this, id, spec, token, done] {
            run(id, spec, token);
            done->store(true);
        });
        workers_.push_back(Worker{std::move(thread), std::move(done)});
    } catch (const std::system_error& e) {
        lock.unlock();
        std::string message = std::string("Cannot start worker: ") + e.what();
        finish(id, [&](GenerationTask& t) {
            t.status = TaskStatus::Error;
            t.error_message = message;
        });
        Logger::log(LogLevel::ERROR, "Engine: Task " + id + " failed: " + message);
        return id;
    }
    Logger::log(LogLevel::DEBUG,
                "Engine: " + std::to_string(workers_.size()) + " worker(s) alive");
    return id;
}

std::optional<GenerationTask> GenerationEngine::get_status(const std::string& task_id) const
{
    return registry_.get(task_id);
}

CancelOutcome GenerationEngine::cancel(const std::string& task_id)
{
    CancelOutcome outcome = CancelOutcome::NotFound;
    bool now_terminal = false;

    std::unique_lock<std::mutex> lock(done_mutex_);
    registry_.update(task_id, [&](GenerationTask& t) {
        if (is_terminal(t.status)) {
            outcome = CancelOutcome::AlreadyFinished;
            return;
        }
        t.cancelled = true;
        t.cancellation.cancel();
        if (t.status == TaskStatus::Queued) {
            t.status = TaskStatus::Cancelled;
            t.message = "Cancelled before generation started";
            now_terminal = true;
        }
        outcome = CancelOutcome::Cancelled;
    });
    lock.unlock();

    if (now_terminal) {
        done_cv_.notify_all();
    }
    if (outcome == CancelOutcome::Cancelled) {
        Logger::log(LogLevel::INFO, "Engine: Cancellation requested for task " + task_id);
    }
    return outcome;
}

bool GenerationEngine::delete_task(const std::string& task_id)
{
    // Stop a running worker before its record disappears.
    registry_.update(task_id, [](GenerationTask& t) {
        if (!is_terminal(t.status)) {
            t.cancelled = true;
            t.cancellation.cancel();
        }
    });

    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        removed = registry_.remove(task_id);
    }
    if (removed) {
        done_cv_.notify_all();
        Logger::log(LogLevel::DEBUG, "Registry: Task " + task_id + " removed");
    }
    return removed;
}

std::vector<GenerationTask> GenerationEngine::list_tasks() const
{
    return registry_.list();
}

core::RangeEstimate GenerationEngine::estimate(const std::string& start_uuid,
                                               const std::string& end_uuid)
{
    return core::RangeEnumerator::estimate(start_uuid, end_uuid);
}

bool GenerationEngine::wait(const std::string& task_id, std::chrono::milliseconds timeout) const
{
    auto terminal = [&] {
        auto task = registry_.get(task_id);
        return !task || is_terminal(task->status);
    };

    std::unique_lock<std::mutex> lock(done_mutex_);
    return done_cv_.wait_for(lock, timeout, terminal);
}

bool GenerationEngine::finish(const std::string& task_id, const TaskRegistry::Mutator& mutator)
{
    bool found = false;
    {
        // Holding done_mutex_ orders the update before any waiter's predicate check.
        std::lock_guard<std::mutex> lock(done_mutex_);
        found = registry_.update(task_id, mutator);
    }
    done_cv_.notify_all();
    return found;
}

void GenerationEngine::run(const std::string& task_id, const core::RangeSpec& spec,
                           const infra::CancellationToken& token)
{
    bool started = false;
    registry_.update(task_id, [&](GenerationTask& t) {
        if (t.status == TaskStatus::Queued && !t.cancelled) {
            t.status = TaskStatus::Generating;
            started = true;
        }
    });
    if (!started) {
        // Cancelled or deleted while queued.
        return;
    }

    Logger::log(LogLevel::INFO, "Engine: Task " + task_id + " generating " + spec.start_uuid +
                                    " .. " + spec.end_uuid);

    std::unique_ptr<storage::UuidSink> sink;
    try {
        sink = std::make_unique<storage::UuidSink>(options_.output_dir, "uuids_" + task_id);
        core::RangeCursor cursor(spec);

        bool interrupted = false;
        {
            infra::BoundedChannel<std::string> channel(options_.channel_capacity);
            Producer producer(channel, cursor, token, options_.batch_size);

            std::uint64_t written = 0;
            while (auto batch = channel.pop()) {
                if (token.is_cancelled()) {
                    interrupted = true;
                    break;
                }

                sink->write(*batch);
                written += batch->size() / (core::Uuid::kTextLength + 1);

                registry_.update(task_id, [&](GenerationTask& t) {
                    t.count = written;
                    t.progress = std::max(t.progress, percent(written, t.total_possible));
                });
                Logger::log(LogLevel::TRACE, "Engine: Task " + task_id + " wrote " +
                                                 std::to_string(written) + " UUIDs");
            }

            producer.join();
            producer.rethrow_if_failed();
        }

        if (interrupted || token.is_cancelled()) {
            sink->discard();
            finish(task_id, [](GenerationTask& t) {
                t.status = TaskStatus::Cancelled;
                t.message = "Generation cancelled at " + infra::String::with_thousands(t.count) +
                            " UUIDs";
            });
            Logger::log(LogLevel::INFO, "Engine: Task " + task_id + " cancelled");
            return;
        }

        std::string path = sink->commit();

        // A cancel that lands between the last check and here still wins.
        bool cancelled_late = false;
        bool still_registered = finish(task_id, [&](GenerationTask& t) {
            if (t.cancelled) {
                t.status = TaskStatus::Cancelled;
                t.message = "Generation cancelled";
                cancelled_late = true;
                return;
            }
            t.status = TaskStatus::Completed;
            t.progress = 100.0;
            t.count = t.total_possible;
            t.output_path = path;
            t.message =
                "Generated " + infra::String::with_thousands(t.total_possible) + " UUIDs in range";
        });

        if (cancelled_late || !still_registered) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            Logger::log(LogLevel::INFO, "Engine: Task " + task_id + " cancelled");
            return;
        }

        Logger::log(LogLevel::INFO, "Engine: Task " + task_id + " completed. Count: " +
                                        infra::String::with_thousands(spec.total_possible));
    } catch (const std::exception& e) {
        if (sink) {
            sink->discard();
        }
        std::string message = e.what();
        finish(task_id, [&](GenerationTask& t) {
            t.status = TaskStatus::Error;
            t.error_message = message;
        });
        Logger::log(LogLevel::ERROR, "Engine: Task " + task_id + " failed: " + message);
    }
}

} // namespace chronoid::tasks
