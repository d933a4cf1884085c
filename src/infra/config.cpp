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
 * @file config.cpp
 * @brief Implementation of configuration loading.
 */

#include "chronoid/infra/config.hpp"

#include "chronoid/core/error.hpp"
#include "chronoid/infra/string.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace chronoid::infra {

namespace {

long long parse_number(const std::string& what, const std::string& raw, long long min,
                       long long max)
{
    std::string text = String::trim(raw);
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }

    if (text.empty() || consumed != text.size()) {
        throw core::Error(core::ErrorKind::InvalidArgument,
                          "Invalid " + what + ": '" + raw + "' is not a number");
    }
    if (value < min || value > max) {
        throw core::Error(core::ErrorKind::InvalidArgument,
                          "Invalid " + what + ": " + text + " is outside [" + std::to_string(min) +
                              ", " + std::to_string(max) + "]");
    }
    return value;
}

} // namespace

Config Config::load(int argc, const char* const* argv)
{
    return load(argc, argv, [](const char* name) { return std::getenv(name); });
}

Config Config::load(int argc, const char* const* argv, const EnvLookup& env)
{
    Config cfg;

    if (const char* v = env("CHRONOID_OUTPUT_DIR")) {
        cfg.output_dir = v;
    }
    if (const char* v = env("CHRONOID_PORT")) {
        cfg.port = static_cast<int>(parse_number("port", v, 1, 65535));
    }
    if (const char* v = env("CHRONOID_SESSIONS")) {
        cfg.session_threads = static_cast<std::size_t>(parse_number("session count", v, 1, 1024));
    }
    if (const char* v = env("CHRONOID_BATCH_SIZE")) {
        // Out-of-range batch sizes are clamped, not rejected.
        long long raw = parse_number("batch size", v, 1, 1LL << 40);
        cfg.batch_size = std::clamp<std::size_t>(static_cast<std::size_t>(raw), kMinBatchSize,
                                                 kMaxBatchSize);
    }
    if (const char* v = env("CHRONOID_LOG_LEVEL")) {
        auto level = Logger::parse_level(v);
        if (!level) {
            throw core::Error(core::ErrorKind::InvalidArgument,
                              std::string("Invalid log level: '") + v + "'");
        }
        cfg.log_level = *level;
    }

    if (argc > 1 && argv[1] != nullptr) {
        cfg.output_dir = argv[1];
    }
    if (argc > 2 && argv[2] != nullptr) {
        cfg.port = static_cast<int>(parse_number("port", argv[2], 1, 65535));
    }

    if (String::trim(cfg.output_dir).empty()) {
        throw core::Error(core::ErrorKind::InvalidArgument, "Output directory must not be empty");
    }
    return cfg;
}

} // namespace chronoid::infra
