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

// Authbridge HTTP Parser - Header
// Incremental wrapper around llhttp for requests (client side) and responses (upstream side)

#pragma once

#include <llhttp.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "http.hpp"

namespace authbridge::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,    // Message fully parsed (parser paused at the message boundary)
    Incomplete,  // Need more data
    Error        // Parse error
};

/// Incremental HTTP/1.1 parser (wraps llhttp)
///
/// Bytes may be fed in arbitrary fragments. The parser pauses at the end of each
/// message so pipelined bytes are never consumed on behalf of the next message;
/// call next_message() before feeding them.
class Parser {
public:
    explicit Parser(llhttp_type_t type);
    ~Parser() = default;

    // Non-copyable, non-movable (llhttp keeps a pointer back to this object)
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;
    Parser(Parser&&) = delete;
    Parser& operator=(Parser&&) = delete;

    /// Feed bytes to the parser
    /// Returns ParseResult and number of bytes consumed
    [[nodiscard]] std::pair<ParseResult, size_t> execute(std::span<const uint8_t> data);

    /// Signal end of input (peer closed the connection)
    /// Completes messages delimited by EOF; anything else unfinished is an Error
    [[nodiscard]] ParseResult finish();

    /// Prepare for the next message on the same connection
    void next_message();

    /// Response parsing: the matching request was HEAD (response carries no body)
    void set_head_response(bool head) noexcept { ctx_.head_response = head; }

    [[nodiscard]] bool headers_complete() const noexcept { return ctx_.headers_complete; }
    [[nodiscard]] bool message_complete() const noexcept { return ctx_.message_complete; }

    /// Parsed request head (request parsers only, valid once headers_complete())
    [[nodiscard]] Request& request() noexcept { return ctx_.request; }

    /// Response status code (response parsers only, valid once headers_complete())
    [[nodiscard]] uint16_t status_code() const noexcept { return ctx_.status_code; }

    /// Whether the connection may carry another message after this one
    [[nodiscard]] bool should_keep_alive() const noexcept;

    /// Move out the request body bytes decoded so far (chunk framing already removed)
    [[nodiscard]] std::string take_body();

    /// Bytes of the current message head (request line and header block)
    [[nodiscard]] size_t head_bytes() const noexcept { return ctx_.head_bytes; }

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

    /// Get last error code
    [[nodiscard]] llhttp_errno_t error_code() const noexcept { return ctx_.error; }

private:
    // llhttp callbacks
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    // Parser state
    llhttp_t parser_;
    llhttp_settings_t settings_;
    llhttp_type_t type_;

    // Parsing context (used by callbacks)
    struct Context {
        Request request;
        uint16_t status_code = 0;
        std::string body;

        bool last_was_field = false;
        bool headers_complete = false;
        bool message_complete = false;
        bool head_response = false;
        size_t head_bytes = 0;
        llhttp_errno_t error = HPE_OK;
    };

    Context ctx_;
};

}  // namespace authbridge::http
