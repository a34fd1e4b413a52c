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

// Authbridge Gateway - Request Body Streams
// A request body is a byte stream consumed at most once. Reading it for inspection
// requires replacing it with a replaying stream over the same bytes.

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace authbridge::gateway {

/// Outcome of a single body read
enum class BodyRead : uint8_t {
    Data,   // 'chunk' holds one or more bytes
    End,    // Body exhausted
    Error   // Transport failure (connection error, truncation, timeout)
};

/// Request body stream (single pass)
class Body {
public:
    virtual ~Body() = default;

    /// Read the next chunk of decoded body bytes into 'chunk' (replacing its contents)
    [[nodiscard]] virtual BodyRead read(std::string& chunk) = 0;

    /// Description of the last Error (empty otherwise)
    [[nodiscard]] virtual std::string_view error() const noexcept { return {}; }
};

/// Body held in memory, replayed exactly once
class BufferedBody : public Body {
public:
    BufferedBody() = default;
    explicit BufferedBody(std::string bytes) : bytes_(std::move(bytes)) {}

    [[nodiscard]] BodyRead read(std::string& chunk) override;

    /// Bytes not yet replayed
    [[nodiscard]] std::string_view bytes() const noexcept {
        return drained_ ? std::string_view{} : std::string_view(bytes_);
    }

private:
    std::string bytes_;
    bool drained_ = false;
};

/// Already-read prefix followed by the unread remainder of another stream
class PrefixedBody : public Body {
public:
    PrefixedBody(std::string prefix, std::unique_ptr<Body> rest)
        : prefix_(std::move(prefix)), rest_(std::move(rest)) {}

    [[nodiscard]] BodyRead read(std::string& chunk) override;
    [[nodiscard]] std::string_view error() const noexcept override;

private:
    std::string prefix_;
    bool prefix_sent_ = false;
    std::unique_ptr<Body> rest_;
};

/// Result of draining a body into memory
enum class ReadAllStatus : uint8_t {
    Complete,       // Entire body is in 'out'
    LimitExceeded,  // Stopped after more than max_size bytes; 'out' holds what was read
    Failed          // Transport failure; 'out' holds what was read
};

/// Drain 'body' into 'out' (max_size 0 = unlimited)
[[nodiscard]] ReadAllStatus read_all(Body& body, std::string& out, uint64_t max_size = 0);

}  // namespace authbridge::gateway
