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

// Authbridge Gateway - Upstream Connection Pool Implementation

#include "connection_pool.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>

#include "../core/logging.hpp"
#include "../core/socket.hpp"

using authbridge::core::close_fd;

namespace authbridge::gateway {

bool PooledConnection::is_healthy() const noexcept {
    if (fd < 0)
        return false;

    // recv() with MSG_PEEK|MSG_DONTWAIT returns:
    // - 0: remote end closed (FIN received), connection is dead
    // - <0 with EAGAIN/EWOULDBLOCK: idle and healthy
    // - >0: unsolicited bytes on an idle HTTP/1.1 connection, not reusable
    char buf[1];
    ssize_t result = recv(fd, buf, 1, MSG_PEEK | MSG_DONTWAIT);

    if (result < 0) {
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
    return false;
}

ConnectionPool::ConnectionPool(size_t max_size, std::chrono::seconds max_idle)
    : max_size_(max_size), max_idle_(max_idle) {
    pool_.reserve(max_size);
}

ConnectionPool::~ConnectionPool() {
    clear();
}

int ConnectionPool::acquire(size_t* request_count) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Most recently used first
    while (!pool_.empty()) {
        PooledConnection conn = pool_.back();
        pool_.pop_back();

        if (conn.is_stale(max_idle_) || !conn.is_healthy()) {
            close_fd(conn.fd);
            ++health_fails_;
            continue;
        }

        ++hits_;
        if (request_count) {
            *request_count = conn.request_count;
        }
        return conn.fd;
    }

    ++misses_;
    return -1;
}

void ConnectionPool::release(int fd, size_t request_count) {
    if (fd < 0)
        return;

    PooledConnection conn;
    conn.fd = fd;
    conn.last_used = std::chrono::steady_clock::now();
    conn.request_count = request_count;

    std::lock_guard<std::mutex> lock(mutex_);

    if (pool_.size() >= max_size_) {
        close_fd(fd);
        ++pool_full_closes_;
        return;
    }

    if (!conn.is_healthy()) {
        close_fd(fd);
        ++health_fails_;
        return;
    }

    pool_.push_back(conn);
}

void ConnectionPool::cleanup_stale() {
    std::lock_guard<std::mutex> lock(mutex_);

    pool_.erase(std::remove_if(pool_.begin(), pool_.end(),
                               [this](const PooledConnection& conn) {
                                   if (conn.is_stale(max_idle_)) {
                                       close_fd(conn.fd);
                                       return true;
                                   }
                                   return false;
                               }),
                pool_.end());
}

void ConnectionPool::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& conn : pool_) {
        close_fd(conn.fd);
    }
    pool_.clear();
}

size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.size();
}

size_t ConnectionPool::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t ConnectionPool::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

size_t ConnectionPool::health_fails() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return health_fails_;
}

size_t ConnectionPool::pool_full_closes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_full_closes_;
}

double ConnectionPool::hit_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto total = hits_ + misses_;
    return total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
}

void ConnectionPool::log_stats() const {
    auto* logger = logging::get_current_logger();
    if (!logger) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto total_requests = hits_ + misses_;
    if (total_requests == 0) {
        LOG_INFO(logger, "[POOL] No upstream requests yet");
        return;
    }

    double rate = static_cast<double>(hits_) / static_cast<double>(total_requests);
    LOG_INFO(logger,
             "[POOL] Stats: size={}/{}, hits={}, misses={}, hit_rate={:.2f}%, "
             "health_fails={}, pool_full_closes={}",
             pool_.size(), max_size_, hits_, misses_, rate * 100.0, health_fails_,
             pool_full_closes_);
}

}  // namespace authbridge::gateway
