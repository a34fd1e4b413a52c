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

// Authbridge Upstream - Implementation

#include "upstream.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fmt/format.h>

#include "../core/logging.hpp"
#include "../core/socket.hpp"

namespace authbridge::gateway {

using core::close_fd;

Upstream::Upstream(const control::UpstreamConfig& config)
    : authority_(config.address),
      connect_timeout_ms_(config.connect_timeout),
      read_timeout_ms_(config.read_timeout),
      pool_(config.pool_size, std::chrono::seconds(config.pool_idle_timeout)) {
    if (auto parsed = control::parse_upstream_address(config.address)) {
        host_ = std::move(parsed->host);
        port_ = parsed->port;
    }
}

UpstreamConnection Upstream::connect(std::string& error) {
    UpstreamConnection conn;

    size_t request_count = 0;
    int fd = pool_.acquire(&request_count);
    if (fd >= 0) {
        conn.fd = fd;
        conn.reused = true;
        conn.request_count = request_count;
        return conn;
    }

    conn.fd = open_connection(error);
    return conn;
}

void Upstream::release(UpstreamConnection& conn, bool reusable) {
    if (conn.fd < 0) {
        return;
    }
    if (reusable) {
        pool_.release(conn.fd, conn.request_count + 1);
    } else {
        close_fd(conn.fd);
    }
    conn.fd = -1;
}

bool Upstream::resolve(std::vector<ResolvedAddress>& out, std::string& error) {
    // IP literals skip DNS entirely
    ResolvedAddress literal;
    auto* in4 = reinterpret_cast<sockaddr_in*>(&literal.addr);
    if (inet_pton(AF_INET, host_.c_str(), &in4->sin_addr) == 1) {
        in4->sin_family = AF_INET;
        in4->sin_port = htons(port_);
        literal.length = sizeof(sockaddr_in);
        literal.family = AF_INET;
        out.push_back(literal);
        return true;
    }
    auto* in6 = reinterpret_cast<sockaddr_in6*>(&literal.addr);
    if (inet_pton(AF_INET6, host_.c_str(), &in6->sin6_addr) == 1) {
        in6->sin6_family = AF_INET6;
        in6->sin6_port = htons(port_);
        literal.length = sizeof(sockaddr_in6);
        literal.family = AF_INET6;
        out.push_back(literal);
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(dns_mutex_);
        auto cache_it = dns_cache_.find(host_);
        if (cache_it != dns_cache_.end()) {
            out = cache_it->second;
            return true;
        }
    }

    // Cache miss - perform DNS resolution (outside the lock)
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string service = std::to_string(port_);
    int rc = getaddrinfo(host_.c_str(), service.c_str(), &hints, &result);
    if (rc != 0 || !result) {
        error = fmt::format("dns error: failed to resolve '{}': {}", host_, gai_strerror(rc));
        if (result) {
            freeaddrinfo(result);
        }
        return false;
    }

    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_addrlen > sizeof(sockaddr_storage)) {
            continue;
        }
        ResolvedAddress resolved;
        std::memcpy(&resolved.addr, ai->ai_addr, ai->ai_addrlen);
        resolved.length = static_cast<socklen_t>(ai->ai_addrlen);
        resolved.family = ai->ai_family;
        out.push_back(resolved);
    }
    freeaddrinfo(result);

    if (out.empty()) {
        error = fmt::format("dns error: no usable address for '{}'", host_);
        return false;
    }

    std::lock_guard<std::mutex> lock(dns_mutex_);
    dns_cache_[host_] = out;
    return true;
}

void Upstream::invalidate_dns_cache() {
    std::lock_guard<std::mutex> lock(dns_mutex_);
    dns_cache_.erase(host_);
}

namespace {

/// connect() bounded by timeout_ms (0 = blocking connect with the kernel's timeout)
std::error_code connect_with_timeout(int fd, const ResolvedAddress& address,
                                     uint32_t timeout_ms) {
    const auto* sa = reinterpret_cast<const sockaddr*>(&address.addr);

    if (timeout_ms == 0) {
        for (;;) {
            if (::connect(fd, sa, address.length) == 0) {
                return {};
            }
            if (errno != EINTR) {
                return std::error_code(errno, std::system_category());
            }
        }
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::error_code(errno, std::system_category());
    }

    if (::connect(fd, sa, address.length) < 0) {
        if (errno != EINPROGRESS) {
            return std::error_code(errno, std::system_category());
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ready = poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready == 0) {
            return std::make_error_code(std::errc::timed_out);
        }
        if (ready < 0) {
            return std::error_code(errno, std::system_category());
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            return std::error_code(errno, std::system_category());
        }
        if (so_error != 0) {
            return std::error_code(so_error, std::system_category());
        }
    }

    // Back to blocking I/O for the exchange
    if (fcntl(fd, F_SETFL, flags) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

}  // namespace

int Upstream::open_connection(std::string& error) {
    std::vector<ResolvedAddress> addresses;
    if (!resolve(addresses, error)) {
        return -1;
    }

    std::error_code last_error;
    for (const auto& address : addresses) {
        int sockfd = socket(address.family, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (sockfd < 0) {
            last_error = std::error_code(errno, std::system_category());
            continue;
        }

        if (auto ec = connect_with_timeout(sockfd, address, connect_timeout_ms_); ec) {
            last_error = ec;
            close_fd(sockfd);
            continue;
        }

        (void)core::set_tcp_nodelay(sockfd);

        if (read_timeout_ms_ > 0) {
            if (auto ec = core::set_io_timeout(sockfd, read_timeout_ms_); ec) {
                last_error = ec;
                close_fd(sockfd);
                continue;
            }
        }

        return sockfd;
    }

    // Addresses may be outdated (e.g. a restarted container); resolve again next time
    invalidate_dns_cache();

    error = fmt::format("tcp connect error: {} ({}:{})", last_error.message(), host_, port_);
    return -1;
}

}  // namespace authbridge::gateway
