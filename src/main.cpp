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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * 1. Configuration (defaults, environment, positional arguments).
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Subsystem Initialization (Registry, Engine, Network).
 * 4. Main Event Loop Execution.
 */

#include "chronoid/infra/config.hpp"
#include "chronoid/infra/logger.hpp"
#include "chronoid/network/server.hpp"
#include "chronoid/tasks/generation_engine.hpp"
#include "chronoid/tasks/task_registry.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

using chronoid::infra::Logger;
using chronoid::infra::LogLevel;

/// @brief Active server instance, used by the signal handler.
static chronoid::network::Server* g_server = nullptr;

void signal_handler(int signum)
{
    Logger::log(LogLevel::WARN, "System: Interrupt received (Signal " + std::to_string(signum) +
                                    "). Initiating graceful shutdown...");

    if (g_server) {
        g_server->stop();
    }
}

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OUTPUT_DIR] [PORT]\n"
              << "Options:\n"
              << "  OUTPUT_DIR  Directory for generated UUID files (Default: ./chronoid_output)\n"
              << "  PORT        TCP port to listen on (Default: 5001)\n"
              << "  --help      Show this help message\n"
              << "Environment:\n"
              << "  CHRONOID_OUTPUT_DIR, CHRONOID_PORT, CHRONOID_SESSIONS,\n"
              << "  CHRONOID_BATCH_SIZE, CHRONOID_LOG_LEVEL\n";
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        chronoid::infra::Config cfg = chronoid::infra::Config::load(argc, argv);
        Logger::set_level(cfg.log_level);

        Logger::log(LogLevel::INFO, "System: Booting chronoid...");
        Logger::log(LogLevel::INFO, "Config: Output directory set to '" + cfg.output_dir + "'");
        Logger::log(LogLevel::INFO,
                    "Config: Network Interface binding to port " + std::to_string(cfg.port));

        chronoid::tasks::TaskRegistry registry;

        chronoid::tasks::EngineOptions options;
        options.output_dir = cfg.output_dir;
        options.batch_size = cfg.batch_size;
        options.channel_capacity = cfg.channel_capacity;
        chronoid::tasks::GenerationEngine engine(registry, options);

        chronoid::network::Server server(engine, cfg.port, cfg.session_threads);
        g_server = &server;

        server.run();
        g_server = nullptr;

    } catch (const std::exception& e) {
        g_server = nullptr;
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    Logger::log(LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
