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
 * @file server.cpp
 * @brief Implementation of the multi-session TCP server.
 *
 * @details
 * Raw BSD socket API: IPv4, `SO_REUSEADDR`, one `recv` per request.
 */

#include "chronoid/network/server.hpp"

#include "chronoid/core/error.hpp"
#include "chronoid/infra/logger.hpp"
#include "chronoid/network/handler.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace chronoid::network {

Server::Server(tasks::GenerationEngine& engine, int port, std::size_t session_threads)
    : engine_(engine), port_(port), server_fd_(-1), running_(false), scheduler_(session_threads)
{
}

Server::~Server()
{
    stop();
}

void Server::stop()
{
    if (!running_.exchange(false))
        return;

    infra::Logger::log(infra::LogLevel::INFO,
                       "Network: Shutdown signal received. Stopping server...");

    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    // Closing the session sockets unblocks workers waiting in recv().
    std::lock_guard<std::mutex> lock(client_mutex_);
    for (int sock : client_sockets_) {
        shutdown(sock, SHUT_RDWR);
        close(sock);
    }
    client_sockets_.clear();
}

void Server::run()
{
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw core::Error(core::ErrorKind::IOFailure,
                          std::string("Network: Failed to create socket: ") + std::strerror(errno));
    }

    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        infra::Logger::log(infra::LogLevel::WARN, "Network: setsockopt(SO_REUSEADDR) failed.");
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(static_cast<uint16_t>(port_));

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0 ||
        listen(server_fd_, 128) < 0) {
        std::string reason = std::strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        throw core::Error(core::ErrorKind::IOFailure,
                          "Network: Failed to bind/listen on port " + std::to_string(port_) +
                              ": " + reason);
    }

    running_ = true;
    infra::Logger::log(infra::LogLevel::INFO,
                       "Network: chronoid listening on port " + std::to_string(port_));

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);

        int sock = accept(server_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &len);

        if (sock >= 0) {
            if (!running_) {
                close(sock);
                break;
            }

            char ip[INET_ADDRSTRLEN] = "unknown";
            inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
            infra::Logger::log(infra::LogLevel::INFO,
                               "Network: New connection from " + std::string(ip));

            add_client(sock);
            if (!scheduler_.enqueue([this, sock]() { this->handle_client(sock); })) {
                remove_client(sock);
            }
        } else if (running_) {
            if (errno == EINTR) {
                continue;
            }
            infra::Logger::log(infra::LogLevel::ERROR, "Network: Accept failed (Error code: " +
                                                           std::to_string(errno) + ")");
        } else {
            break;
        }
    }

    infra::Logger::log(infra::LogLevel::INFO, "Network: Server event loop terminated.");
}

void Server::handle_client(int sock)
{
    // One request per recv(); requests are small JSON objects.
    char buffer[8192];

    while (running_) {
        ssize_t read_len = recv(sock, buffer, sizeof(buffer), 0);

        if (read_len > 0) {
            std::string request_str(buffer, static_cast<size_t>(read_len));
            std::string resp = Handler::process(engine_, request_str);
            resp.push_back('\n');

            if (send(sock, resp.c_str(), resp.length(), MSG_NOSIGNAL) < 0) {
                infra::Logger::log(infra::LogLevel::DEBUG, "Network: Send failed, dropping session.");
                break;
            }

            if (resp.find("\"status\":\"goodbye\"") != std::string::npos) {
                infra::Logger::log(infra::LogLevel::INFO,
                                   "Network: Client requested disconnect via protocol.");
                break;
            }
        } else if (read_len == 0) {
            infra::Logger::log(infra::LogLevel::INFO, "Network: Client disconnected cleanly.");
            break;
        } else {
            infra::Logger::log(infra::LogLevel::DEBUG, "Network: Socket read error or timeout.");
            break;
        }
    }

    remove_client(sock);
}

void Server::add_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_sockets_.push_back(sock);
}

void Server::remove_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    auto it = std::find(client_sockets_.begin(), client_sockets_.end(), sock);
    if (it != client_sockets_.end()) {
        // Only close if still registered; stop() may have closed it already.
        close(sock);
        client_sockets_.erase(it);
    }
}

} // namespace chronoid::network
