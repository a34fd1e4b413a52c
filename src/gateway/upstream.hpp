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

// Authbridge Upstream - Header
// The single backend: address resolution (DNS cache), connect, and connection reuse

#pragma once

#include <sys/socket.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "../control/config.hpp"
#include "../core/containers.hpp"
#include "connection_pool.hpp"

namespace authbridge::gateway {

/// Connection handed to the forwarder for one exchange
struct UpstreamConnection {
    int fd = -1;
    bool reused = false;       // Came from the pool
    size_t request_count = 0;  // Exchanges completed on this connection before this one
};

/// Resolved socket address (cached per host)
struct ResolvedAddress {
    sockaddr_storage addr{};
    socklen_t length = 0;
    int family = AF_INET;
};

/// Upstream target shared by all connection threads (thread-safe)
class Upstream {
public:
    /// 'address' must already be valid (see control::parse_upstream_address)
    explicit Upstream(const control::UpstreamConfig& config);

    Upstream(const Upstream&) = delete;
    Upstream& operator=(const Upstream&) = delete;

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    /// "host:port" as configured (used for a missing Host header)
    [[nodiscard]] const std::string& authority() const noexcept { return authority_; }

    /// Take a pooled connection or open a new one
    /// On failure fd is -1 and 'error' describes the transport failure
    [[nodiscard]] UpstreamConnection connect(std::string& error);

    /// Finish with a connection: pooled when 'reusable', closed otherwise
    void release(UpstreamConnection& conn, bool reusable);

    [[nodiscard]] ConnectionPool& pool() noexcept { return pool_; }

private:
    [[nodiscard]] int open_connection(std::string& error);
    [[nodiscard]] bool resolve(std::vector<ResolvedAddress>& out, std::string& error);
    void invalidate_dns_cache();

    std::string host_;
    uint16_t port_ = 80;
    std::string authority_;
    uint32_t connect_timeout_ms_ = 0;
    uint32_t read_timeout_ms_ = 0;

    ConnectionPool pool_;

    std::mutex dns_mutex_;
    core::fast_map<std::string, std::vector<ResolvedAddress>> dns_cache_;
};

}  // namespace authbridge::gateway
