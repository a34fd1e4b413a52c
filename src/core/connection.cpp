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

// Authbridge Client Connection - Implementation

#include "connection.hpp"

#include <cerrno>
#include <cstring>
#include <span>
#include <string_view>

#include "socket.hpp"

namespace authbridge::core {

namespace {

constexpr size_t kReadChunkSize = 16384;
constexpr std::string_view kContinueResponse = "HTTP/1.1 100 Continue\r\n\r\n";

}  // namespace

ClientConnection::ClientConnection(int fd, size_t max_header_size)
    : fd_(fd), max_header_size_(max_header_size) {
    buffer_.reserve(kReadChunkSize);
}

ssize_t ClientConnection::fill() {
    // Drop parsed bytes before growing the buffer
    if (cursor_ == buffer_.size()) {
        buffer_.clear();
        cursor_ = 0;
    } else if (cursor_ > 0) {
        buffer_.erase(0, cursor_);
        cursor_ = 0;
    }

    size_t old_size = buffer_.size();
    buffer_.resize(old_size + kReadChunkSize);
    ssize_t n = recv_some(fd_, buffer_.data() + old_size, kReadChunkSize);
    int saved_errno = errno;
    buffer_.resize(old_size + (n > 0 ? static_cast<size_t>(n) : 0));
    errno = saved_errno;
    return n;
}

bool ClientConnection::parse_buffered() {
    if (cursor_ >= buffer_.size()) {
        return true;
    }

    auto data = std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(buffer_.data()) + cursor_, buffer_.size() - cursor_);
    auto [result, consumed] = parser_.execute(data);
    cursor_ += consumed;
    return result != http::ParseResult::Error;
}

ReadHeadStatus ClientConnection::read_head() {
    continue_pending_ = false;

    // Previous request fully read: the parser is paused at its end
    if (parser_.message_complete()) {
        parser_.next_message();
    }

    for (;;) {
        if (!parse_buffered()) {
            return ReadHeadStatus::Malformed;
        }
        if (parser_.head_bytes() > max_header_size_) {
            return ReadHeadStatus::HeadTooLarge;
        }
        if (parser_.headers_complete()) {
            continue_pending_ = http::expects_continue(parser_.request());
            return ReadHeadStatus::Ready;
        }

        bool idle = parser_.head_bytes() == 0 && cursor_ == buffer_.size();

        ssize_t n = fill();
        if (n == 0) {
            return idle ? ReadHeadStatus::Closed : ReadHeadStatus::Failed;
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return idle ? ReadHeadStatus::Closed : ReadHeadStatus::TimedOut;
            }
            return idle ? ReadHeadStatus::Closed : ReadHeadStatus::Failed;
        }
    }
}

gateway::BodyRead ClientConnection::read_body(std::string& chunk, std::string& error) {
    chunk.clear();

    for (;;) {
        std::string decoded = parser_.take_body();
        if (!decoded.empty()) {
            // Body bytes arrived without waiting for 100 Continue
            continue_pending_ = false;
            chunk = std::move(decoded);
            return gateway::BodyRead::Data;
        }
        if (parser_.message_complete()) {
            return gateway::BodyRead::End;
        }

        if (cursor_ < buffer_.size()) {
            if (!parse_buffered()) {
                error = "malformed request body: ";
                error += parser_.error_message();
                return gateway::BodyRead::Error;
            }
            continue;
        }

        if (continue_pending_) {
            continue_pending_ = false;
            if (auto ec = send_all(fd_, kContinueResponse); ec) {
                error = "error sending 100 Continue: " + ec.message();
                return gateway::BodyRead::Error;
            }
        }

        ssize_t n = fill();
        if (n == 0) {
            error = "connection closed before message completed";
            return gateway::BodyRead::Error;
        }
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                error = "timed out reading request body";
            } else {
                error = std::strerror(errno);
            }
            return gateway::BodyRead::Error;
        }
    }
}

std::error_code ClientConnection::write(std::string_view data) {
    return send_all(fd_, data);
}

}  // namespace authbridge::core
