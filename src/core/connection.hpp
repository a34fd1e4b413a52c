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

// Authbridge Client Connection - Header
// Buffered client socket: request heads and bodies through the llhttp parser,
// response bytes written straight back

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "../gateway/body.hpp"
#include "../gateway/forwarder.hpp"
#include "../http/parser.hpp"

namespace authbridge::core {

/// Outcome of waiting for the next request head
enum class ReadHeadStatus : uint8_t {
    Ready,         // Request head parsed, body (if any) not yet read
    Closed,        // Peer closed (or went idle past the read timeout) between requests
    Malformed,     // Invalid HTTP
    HeadTooLarge,  // Head exceeded max_header_size before completing
    TimedOut,      // Read timeout with a partial head received
    Failed         // Transport error or truncated head
};

/// One accepted client socket (the socket itself is owned by the server)
///
/// Single-threaded: used only by the thread serving this connection.
class ClientConnection : public gateway::ResponseSink {
public:
    ClientConnection(int fd, size_t max_header_size);

    ClientConnection(const ClientConnection&) = delete;
    ClientConnection& operator=(const ClientConnection&) = delete;

    [[nodiscard]] int fd() const noexcept { return fd_; }

    /// Read until the next request head is complete
    [[nodiscard]] ReadHeadStatus read_head();

    /// Current request (valid after read_head() returned Ready)
    [[nodiscard]] http::Request& request() noexcept { return parser_.request(); }

    /// Next chunk of the current request body (chunk framing removed)
    /// Answers "Expect: 100-continue" before the first wait for body bytes
    [[nodiscard]] gateway::BodyRead read_body(std::string& chunk, std::string& error);

    /// Whether the current request has been read to its end
    [[nodiscard]] bool body_complete() const noexcept { return parser_.message_complete(); }

    /// Parser diagnostics for the last Malformed status
    [[nodiscard]] std::string_view parse_error() const noexcept { return parser_.error_message(); }

    [[nodiscard]] std::error_code write(std::string_view data) override;

private:
    /// Receive more bytes into buffer_; returns recv() result (errno preserved)
    [[nodiscard]] ssize_t fill();

    /// Parse buffered bytes; returns false on a parse error
    [[nodiscard]] bool parse_buffered();

    int fd_;
    size_t max_header_size_;
    http::Parser parser_{HTTP_REQUEST};
    std::string buffer_;  // Received bytes not yet parsed
    size_t cursor_ = 0;   // Parse position in buffer_
    bool continue_pending_ = false;  // 100 Continue owed before reading the body
};

/// Request body stream reading through a ClientConnection
class SocketBody : public gateway::Body {
public:
    explicit SocketBody(ClientConnection& conn) : conn_(conn) {}

    [[nodiscard]] gateway::BodyRead read(std::string& chunk) override {
        return conn_.read_body(chunk, error_);
    }

    [[nodiscard]] std::string_view error() const noexcept override { return error_; }

private:
    ClientConnection& conn_;
    std::string error_;
};

}  // namespace authbridge::core
