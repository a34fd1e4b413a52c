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

// Authbridge Socket Utilities - Header

#pragma once

#include <sys/types.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace authbridge::core {

/// Create non-blocking IPv4 listening socket
/// Returns -1 on failure (errno is preserved)
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog = 128);

/// Port a socket is bound to (useful when binding port 0)
[[nodiscard]] uint16_t get_bound_port(int fd);

/// Peer address of a connected socket as "ip" (empty on failure)
[[nodiscard]] std::string get_peer_ip(int fd);

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_tcp_nodelay(int fd);

/// SO_RCVTIMEO / SO_SNDTIMEO in milliseconds (0 disables the timeout)
[[nodiscard]] std::error_code set_io_timeout(int fd, uint32_t timeout_ms);

/// Write all bytes (retries on EINTR and short writes, never raises SIGPIPE)
[[nodiscard]] std::error_code send_all(int fd, std::string_view data);

/// Read up to 'size' bytes (retries on EINTR)
/// Returns bytes read, 0 on orderly shutdown, -1 on error (errno is preserved)
[[nodiscard]] ssize_t recv_some(int fd, void* buffer, size_t size);

void close_fd(int fd);

} // namespace authbridge::core
