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

// Authbridge Gateway - Upstream Connection Pool
// Process-wide pool of idle keep-alive connections to the upstream

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <vector>

namespace authbridge::gateway {

/// Pooled upstream connection with metadata
struct PooledConnection {
    int fd = -1;
    std::chrono::steady_clock::time_point last_used;
    size_t request_count = 0;  // Requests served by this connection so far

    /// Check if connection has been idle too long
    [[nodiscard]] bool is_stale(std::chrono::seconds max_idle) const noexcept {
        auto now = std::chrono::steady_clock::now();
        return (now - last_used) > max_idle;
    }

    /// Non-blocking MSG_PEEK probe: false once the upstream has closed its end
    [[nodiscard]] bool is_healthy() const noexcept;
};

/// Upstream connection pool (LIFO stack, mutex-protected, shared by all connection threads)
///
/// LIFO keeps the most recently used (least likely to be closed by the upstream's
/// idle timer) connection on top.
class ConnectionPool {
public:
    /// @param max_size Maximum number of idle connections kept (0 disables pooling)
    /// @param max_idle Maximum idle time before a connection is evicted
    explicit ConnectionPool(size_t max_size = 100,
                            std::chrono::seconds max_idle = std::chrono::seconds(60));

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    ~ConnectionPool();

    /// Pop a healthy idle connection
    /// Returns -1 if the pool holds none; 'request_count' receives its usage count
    [[nodiscard]] int acquire(size_t* request_count = nullptr);

    /// Return a connection after a complete, keep-alive exchange
    /// Closes it instead if the pool is full or the connection is unhealthy
    void release(int fd, size_t request_count);

    /// Remove connections idle longer than max_idle
    void cleanup_stale();

    /// Close all pooled connections
    void clear();

    // Statistics
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t max_size() const noexcept { return max_size_; }
    [[nodiscard]] size_t hits() const;
    [[nodiscard]] size_t misses() const;
    [[nodiscard]] size_t health_fails() const;
    [[nodiscard]] size_t pool_full_closes() const;
    [[nodiscard]] double hit_rate() const;

    /// Log pool statistics
    void log_stats() const;

private:
    mutable std::mutex mutex_;
    std::vector<PooledConnection> pool_;  // LIFO stack (back = top)
    size_t max_size_;
    std::chrono::seconds max_idle_;

    // Statistics (guarded by mutex_)
    size_t hits_ = 0;              // Pool hit (reused connection)
    size_t misses_ = 0;            // Pool miss (caller opens a new connection)
    size_t health_fails_ = 0;      // Health check failures
    size_t pool_full_closes_ = 0;  // Closes due to pool being full
};

}  // namespace authbridge::gateway
