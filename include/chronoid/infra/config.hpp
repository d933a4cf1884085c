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
 * @file config.hpp
 * @brief Process configuration: defaults, environment, then positional arguments.
 *
 * @details
 * | Setting            | Default              | Environment            | Argument |
 * |--------------------|----------------------|------------------------|----------|
 * | `output_dir`       | `./chronoid_output`  | `CHRONOID_OUTPUT_DIR`  | 1st      |
 * | `port`             | 5001                 | `CHRONOID_PORT`        | 2nd      |
 * | `session_threads`  | 4                    | `CHRONOID_SESSIONS`    |          |
 * | `batch_size`       | 1000                 | `CHRONOID_BATCH_SIZE`  |          |
 * | `log_level`        | `INFO`               | `CHRONOID_LOG_LEVEL`   |          |
 *
 * Generation needs no width setting: every accepted range task gets its own worker.
 */

#pragma once

#include "chronoid/infra/logger.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace chronoid::infra {

struct Config {
    static constexpr std::size_t kMinBatchSize = 100;
    static constexpr std::size_t kMaxBatchSize = 100000;

    int port = 5001;
    std::string output_dir = "./chronoid_output";
    std::size_t session_threads = 4; ///< Concurrent client connections served.
    std::size_t batch_size = 1000;    ///< Cancellation and progress cadence.
    std::size_t channel_capacity = 8; ///< Batches buffered between producer and writer.
    LogLevel log_level = LogLevel::INFO;

    /// @brief Environment lookup; returns nullptr for unset variables.
    using EnvLookup = std::function<const char*(const char*)>;

    /**
     * @brief Builds the configuration from the process environment and arguments.
     *
     * `argv[1]` is the output directory and `argv[2]` the port, as positional
     * arguments override environment variables.
     *
     * @throws core::Error `InvalidArgument` for a malformed number or log level.
     */
    static Config load(int argc, const char* const* argv);

    /// @overload Uses `env` instead of `std::getenv`.
    static Config load(int argc, const char* const* argv, const EnvLookup& env);
};

} // namespace chronoid::infra
