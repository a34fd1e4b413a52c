/*
 * Copyright 2025 Authbridge Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Authbridge Server - Header
// Listener accepting client connections; one thread serves each connection

#pragma once

#include <quill/Logger.h>

#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>

#include "../control/config.hpp"
#include "../gateway/forwarder.hpp"
#include "../gateway/pipeline.hpp"
#include "../gateway/upstream.hpp"
#include "connection.hpp"

namespace authbridge::core {

// Process-wide run flag (defined by the executable, cleared by signal handlers)
extern std::atomic<bool> g_server_running;

/// HTTP/1.1 listener and per-connection request loop
class Server {
public:
    /// 'config' must have passed ConfigLoader::validate()
    explicit Server(control::Config config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Start server (bind and listen)
    [[nodiscard]] std::error_code start();

    /// Accept connections until stop() or g_server_running is cleared,
    /// then drain in-flight requests (bounded by shutdown_timeout)
    void run();

    /// Request run() to return (thread-safe)
    void stop() noexcept { running_ = false; }

    [[nodiscard]] int listen_fd() const noexcept { return listen_fd_; }

    /// Bound port (differs from the configured one when binding port 0)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] size_t active_connections() const noexcept { return active_connections_; }

    [[nodiscard]] gateway::Upstream& upstream() noexcept { return upstream_; }

private:
    /// Connection thread bookkeeping (list nodes are never moved)
    struct Worker {
        std::thread thread;
        int fd = -1;  // Guarded by workers_mutex_; -1 once the thread closed it
        std::atomic<bool> busy{false};
        std::atomic<bool> done{false};
    };

    void accept_connections();
    void reject_connection(int client_fd);
    void handle_connection(Worker* worker, std::string client_ip);
    void handle_head_failure(ClientConnection& conn, ReadHeadStatus status,
                             const std::string& client_ip);

    /// Serve one request; returns true if the connection may carry another
    [[nodiscard]] bool handle_request(ClientConnection& conn, const std::string& client_ip);

    /// Send a locally generated response; returns false if the write failed
    bool send_response(ClientConnection& conn, const http::Response& response, bool keep_alive);

    void reap_workers();
    void shutdown_connections();

    control::Config config_;
    gateway::Upstream upstream_;
    gateway::Pipeline pipeline_;
    gateway::Forwarder forwarder_;
    quill::Logger* logger_ = nullptr;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<size_t> active_connections_{0};

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

}  // namespace authbridge::core
