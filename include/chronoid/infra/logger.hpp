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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for chronoid.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface of the
 * service. Output to `stdout`/`stderr` is serialized so lines written by generation
 * workers and session threads never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace chronoid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., per-batch progress).
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events (e.g., startup, task completion).
    WARN,  ///< Non-blocking anomalies or rejected requests.
    ERROR, ///< Recoverable runtime errors (e.g., a task that failed on I/O).
    FATAL  ///< Critical failures requiring process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * An internal mutex serializes writes. Messages below the configured minimum level
 * are dropped before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @code
     * chronoid::infra::Logger::log(LogLevel::INFO, "Engine: Task " + id + " completed.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the process-wide minimum level. Defaults to `INFO`.
    static void set_level(LogLevel level);

    static LogLevel level();

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     * @return The level, or `std::nullopt` for an unknown name. Case-insensitive.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    static std::atomic<LogLevel> min_level_;
};

} // namespace chronoid::infra
