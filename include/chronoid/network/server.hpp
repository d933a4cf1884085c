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
 * @file server.hpp
 * @brief TCP front end of the service.
 *
 * @details
 * Each accepted connection is a session handled on the session pool: the session
 * reads one JSON request per `recv`, passes it to `Handler::process`, and writes the
 * response back, until the peer disconnects or sends `{"action":"exit"}`.
 */

#pragma once

#include "chronoid/infra/scheduler.hpp"
#include "chronoid/tasks/generation_engine.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace chronoid::network {

/**
 * @class Server
 * @brief A multi-session TCP server over a fixed thread pool.
 */
class Server {
  public:
    /**
     * @param engine Generation engine shared by every session.
     * @param port The TCP port number to bind to.
     * @param session_threads Width of the session pool.
     */
    Server(tasks::GenerationEngine& engine, int port, std::size_t session_threads);

    /// @brief Calls `stop()`.
    ~Server();

    /**
     * @brief Binds, listens, and runs the accept loop.
     *
     * @note Blocking. Returns once `stop()` is called.
     * @throws core::Error `IOFailure` if the socket cannot be created, bound or listened on.
     */
    void run();

    /**
     * @brief Signals the server to shut down.
     *
     * Closes the listening socket (unblocking `accept`) and every session socket.
     */
    void stop();

  private:
    tasks::GenerationEngine& engine_;
    int port_;
    int server_fd_;
    std::atomic<bool> running_;

    /// @brief Registry of connected session sockets, closed on shutdown.
    std::vector<int> client_sockets_;
    std::mutex client_mutex_;

    infra::Scheduler scheduler_;

    void handle_client(int socket);
    void add_client(int socket);
    void remove_client(int socket);
};

} // namespace chronoid::network
