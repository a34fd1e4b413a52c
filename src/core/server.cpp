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

// Authbridge Server - Implementation

#include "server.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <utility>

#include "logging.hpp"
#include "socket.hpp"

namespace authbridge::core {

namespace {

constexpr int kAcceptPollIntervalMs = 100;
constexpr auto kDrainPollInterval = std::chrono::milliseconds(10);

}  // namespace

Server::Server(control::Config config)
    : config_(std::move(config)),
      upstream_(config_.upstream),
      pipeline_(gateway::build_auth_pipeline(config_)),
      forwarder_(upstream_),
      logger_(logging::get_current_logger()) {}

Server::~Server() {
    close_fd(listen_fd_);
    listen_fd_ = -1;
    shutdown_connections();
}

std::error_code Server::start() {
    listen_fd_ = create_listening_socket(config_.server.listen_address, config_.server.listen_port,
                                         static_cast<int>(config_.server.backlog));
    if (listen_fd_ < 0) {
        return std::error_code(errno, std::system_category());
    }

    port_ = get_bound_port(listen_fd_);
    running_ = true;

    if (logger_) {
        LOG_INFO(logger_, "Listening on {}:{}, upstream={}", config_.server.listen_address, port_,
                 upstream_.authority());
    }
    return {};
}

void Server::run() {
    while (running_ && g_server_running) {
        pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;

        int ready = poll(&pfd, 1, kAcceptPollIntervalMs);
        if (ready < 0 && errno != EINTR) {
            if (logger_) {
                LOG_ERROR(logger_, "poll() on listen socket failed: {}", std::strerror(errno));
            }
            break;
        }
        if (ready > 0) {
            accept_connections();
        }

        reap_workers();
        upstream_.pool().cleanup_stale();
    }

    running_ = false;
    if (logger_) {
        LOG_INFO(logger_, "Shutting down: active_connections={}", active_connections_.load());
    }

    close_fd(listen_fd_);
    listen_fd_ = -1;
    shutdown_connections();
    upstream_.pool().log_stats();
}

void Server::accept_connections() {
    for (;;) {
        int client_fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK && logger_) {
                LOG_WARNING(logger_, "accept() failed: {}", std::strerror(errno));
            }
            return;
        }

        if (active_connections_ >= config_.server.max_connections) {
            reject_connection(client_fd);
            continue;
        }

        (void)set_tcp_nodelay(client_fd);
        if (config_.server.read_timeout > 0) {
            if (auto ec = set_io_timeout(client_fd, config_.server.read_timeout); ec && logger_) {
                LOG_WARNING(logger_, "Failed to set client read timeout: {}", ec.message());
            }
        }

        std::string client_ip = get_peer_ip(client_fd);

        std::lock_guard<std::mutex> lock(workers_mutex_);
        Worker& worker = workers_.emplace_back();
        worker.fd = client_fd;
        ++active_connections_;
        try {
            worker.thread =
                std::thread(&Server::handle_connection, this, &worker, std::move(client_ip));
        } catch (const std::system_error& e) {
            // Thread limit reached
            --active_connections_;
            workers_.pop_back();
            if (logger_) {
                LOG_ERROR(logger_, "Failed to start connection thread: {}", e.what());
            }
            reject_connection(client_fd);
        }
    }
}

void Server::reject_connection(int client_fd) {
    if (logger_) {
        LOG_WARNING(logger_, "Connection limit reached ({}), rejecting client",
                    config_.server.max_connections);
    }
    auto response = http::make_text_response(http::StatusCode::ServiceUnavailable,
                                             "Too many connections");
    (void)send_all(client_fd, http::serialize_response(response, false));
    close_fd(client_fd);
}

void Server::handle_connection(Worker* worker, std::string client_ip) {
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        fd = worker->fd;
    }

    try {
        ClientConnection conn(fd, config_.server.max_header_size);

        while (running_) {
            ReadHeadStatus status = conn.read_head();
            if (status != ReadHeadStatus::Ready) {
                handle_head_failure(conn, status, client_ip);
                break;
            }

            worker->busy = true;
            bool keep_alive = handle_request(conn, client_ip);
            worker->busy = false;

            if (!keep_alive) {
                break;
            }
        }
    } catch (const std::exception& e) {
        if (logger_) {
            LOG_ERROR(logger_, "Connection from {} failed: {}", client_ip, e.what());
        }
    }
    worker->busy = false;

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        worker->fd = -1;
    }
    close_fd(fd);
    --active_connections_;
    worker->done = true;
}

void Server::handle_head_failure(ClientConnection& conn, ReadHeadStatus status,
                                 const std::string& client_ip) {
    switch (status) {
        case ReadHeadStatus::Malformed:
            if (logger_) {
                LOG_DEBUG(logger_, "Malformed request from {}: {}", client_ip, conn.parse_error());
            }
            (void)send_response(
                conn, http::make_text_response(http::StatusCode::BadRequest, "Malformed request"),
                false);
            break;
        case ReadHeadStatus::HeadTooLarge:
            (void)send_response(conn,
                                http::make_text_response(http::StatusCode::RequestHeaderFieldsTooLarge,
                                                         "Request header fields too large"),
                                false);
            break;
        case ReadHeadStatus::TimedOut:
            (void)send_response(
                conn, http::make_text_response(http::StatusCode::RequestTimeout, "Request timeout"),
                false);
            break;
        default:
            break;
    }
}

bool Server::send_response(ClientConnection& conn, const http::Response& response,
                           bool keep_alive) {
    if (auto ec = conn.write(http::serialize_response(response, keep_alive)); ec) {
        if (logger_) {
            LOG_DEBUG(logger_, "Failed to write response to client: {}", ec.message());
        }
        return false;
    }
    return true;
}

bool Server::handle_request(ClientConnection& conn, const std::string& client_ip) {
    http::Request& request = conn.request();

    gateway::RequestContext ctx;
    ctx.request = &request;
    ctx.body = std::make_unique<SocketBody>(conn);
    ctx.correlation_id = logging::generate_correlation_id();
    ctx.client_ip = client_ip;
    ctx.start_time = std::chrono::steady_clock::now();

    uint16_t status = 0;
    bool keep_alive = false;
    uint64_t bytes_relayed = 0;

    try {
        gateway::MiddlewareResult result = pipeline_.execute_request(ctx);

        if (result != gateway::MiddlewareResult::Continue) {
            http::Response response =
                ctx.error_response.value_or(http::make_text_response(
                    http::StatusCode::InternalServerError, "Internal proxy error"));
            // Unread body bytes would be parsed as the next request
            keep_alive = request.keep_alive && conn.body_complete();
            status = static_cast<uint16_t>(response.status);
            keep_alive = send_response(conn, response, keep_alive) && keep_alive;
        } else {
            gateway::ForwardResult forwarded =
                forwarder_.forward(request, ctx.outgoing_headers, *ctx.body, conn);
            bytes_relayed = forwarded.bytes_relayed;

            switch (forwarded.outcome) {
                case gateway::ForwardOutcome::Relayed:
                    status = forwarded.status_code;
                    keep_alive = request.keep_alive && forwarded.keep_alive && conn.body_complete();
                    break;

                case gateway::ForwardOutcome::UpstreamFailed:
                    if (logger_) {
                        LOG_UPSTREAM(logger_, "request failed", upstream_.host(), upstream_.port(),
                                     ctx.correlation_id);
                        LOG_ERROR_CTX(logger_, "Upstream exchange failed", ctx.correlation_id,
                                      forwarded.reason);
                    }
                    status = static_cast<uint16_t>(http::StatusCode::BadGateway);
                    if (forwarded.bytes_relayed == 0) {
                        keep_alive = request.keep_alive && conn.body_complete();
                        keep_alive =
                            send_response(conn,
                                          http::make_text_response(
                                              http::StatusCode::BadGateway,
                                              gateway::upstream_failure_message(forwarded.reason)),
                                          keep_alive) &&
                            keep_alive;
                    }
                    break;

                case gateway::ForwardOutcome::ClientBodyFailed:
                    if (logger_) {
                        LOG_WARNING(logger_, "Failed to read request body: correlation_id={}, error={}",
                                    ctx.correlation_id, forwarded.reason);
                    }
                    status = static_cast<uint16_t>(http::StatusCode::BadRequest);
                    (void)send_response(conn,
                                        http::make_text_response(
                                            http::StatusCode::BadRequest,
                                            std::string(gateway::kBodyReadFailedMessage)),
                                        false);
                    break;

                case gateway::ForwardOutcome::ClientWriteFailed:
                    status = forwarded.status_code;
                    break;
            }
        }
    } catch (const std::exception& e) {
        if (logger_) {
            LOG_ERROR_CTX(logger_, "Request handling failed", ctx.correlation_id, e.what());
        }
        status = static_cast<uint16_t>(http::StatusCode::InternalServerError);
        keep_alive = false;
        if (bytes_relayed == 0) {
            (void)send_response(conn,
                                http::make_text_response(http::StatusCode::InternalServerError,
                                                         "Internal proxy error"),
                                false);
        }
    }

    if (config_.logging.log_requests && logger_) {
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - ctx.start_time);
        LOG_REQUEST(logger_, request.method, request.path, status, duration.count(), client_ip,
                    ctx.correlation_id);
    }

    return keep_alive && running_;
}

void Server::reap_workers() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }

    for (auto& worker : finished) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void Server::shutdown_connections() {
    running_ = false;

    // Idle keep-alive connections are closed right away; in-flight requests get
    // up to shutdown_timeout to finish
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.server.shutdown_timeout);
    for (;;) {
        bool any_busy = false;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            for (auto& worker : workers_) {
                if (worker.fd < 0) {
                    continue;
                }
                if (worker.busy && std::chrono::steady_clock::now() < deadline) {
                    any_busy = true;
                } else {
                    shutdown(worker.fd, SHUT_RDWR);
                }
            }
        }
        if (!any_busy) {
            break;
        }
        std::this_thread::sleep_for(kDrainPollInterval);
    }

    std::list<Worker> remaining;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        remaining.splice(remaining.end(), workers_);
    }
    for (auto& worker : remaining) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

}  // namespace authbridge::core
