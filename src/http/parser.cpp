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

// Authbridge HTTP Parser - Implementation

#include "parser.hpp"

#include <algorithm>

namespace authbridge::http {

Parser::Parser(llhttp_type_t type) : type_(type) {
    // Initialize llhttp settings
    llhttp_settings_init(&settings_);

    // Register callbacks
    settings_.on_message_begin = on_message_begin;
    settings_.on_url = on_url;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    // Initialize parser
    llhttp_init(&parser_, type_, &settings_);
    parser_.data = &ctx_;
}

std::pair<ParseResult, size_t> Parser::execute(std::span<const uint8_t> data) {
    if (ctx_.error != HPE_OK) {
        return {ParseResult::Error, 0};
    }
    if (ctx_.message_complete) {
        // Caller must call next_message() first
        return {ParseResult::Complete, 0};
    }

    bool head_was_complete = ctx_.headers_complete;
    size_t body_before = ctx_.body.size();

    llhttp_errno_t err =
        llhttp_execute(&parser_, reinterpret_cast<const char*>(data.data()), data.size());

    size_t consumed = data.size();

    if (err == HPE_PAUSED || err == HPE_PAUSED_UPGRADE) {
        // Paused by on_message_complete: stop exactly at the message boundary
        const char* pause_pos = llhttp_get_error_pos(&parser_);
        if (pause_pos) {
            consumed = static_cast<size_t>(reinterpret_cast<const uint8_t*>(pause_pos) -
                                           data.data());
        }
    } else if (err != HPE_OK) {
        const char* error_pos = llhttp_get_error_pos(&parser_);
        if (error_pos) {
            consumed = static_cast<size_t>(reinterpret_cast<const uint8_t*>(error_pos) -
                                           data.data());
        }
        ctx_.error = err;
        return {ParseResult::Error, consumed};
    }

    if (!head_was_complete) {
        // Body bytes decoded in the same call are not part of the head
        size_t body_added = ctx_.body.size() - body_before;
        ctx_.head_bytes += ctx_.headers_complete ? consumed - std::min(consumed, body_added)
                                                 : consumed;
    }

    if (ctx_.message_complete) {
        return {ParseResult::Complete, consumed};
    }

    // Need more data
    return {ParseResult::Incomplete, consumed};
}

ParseResult Parser::finish() {
    if (ctx_.error != HPE_OK) {
        return ParseResult::Error;
    }
    if (ctx_.message_complete) {
        return ParseResult::Complete;
    }

    llhttp_errno_t err = llhttp_finish(&parser_);
    if (err != HPE_OK && err != HPE_PAUSED) {
        ctx_.error = err;
        return ParseResult::Error;
    }

    if (ctx_.message_complete) {
        return ParseResult::Complete;
    }

    // EOF in the middle of a message (or before any byte of it)
    ctx_.error = HPE_INVALID_EOF_STATE;
    return ParseResult::Error;
}

void Parser::next_message() {
    llhttp_errno_t state = llhttp_get_errno(&parser_);
    if (state == HPE_PAUSED) {
        llhttp_resume(&parser_);
    } else if (state == HPE_PAUSED_UPGRADE) {
        llhttp_resume_after_upgrade(&parser_);
    }

    bool head_response = ctx_.head_response;
    ctx_ = Context{};
    ctx_.head_response = head_response;
}

bool Parser::should_keep_alive() const noexcept {
    return llhttp_should_keep_alive(&parser_) != 0;
}

std::string Parser::take_body() {
    std::string out;
    out.swap(ctx_.body);
    return out;
}

std::string_view Parser::error_message() const noexcept {
    if (ctx_.error == HPE_OK) {
        return "";
    }
    if (ctx_.error == HPE_INVALID_EOF_STATE) {
        return "connection closed before message completed";
    }
    const char* reason = llhttp_get_error_reason(&parser_);
    if (reason && *reason) {
        return reason;
    }
    return llhttp_errno_name(ctx_.error);
}

// Callbacks

int Parser::on_message_begin(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->last_was_field = false;
    ctx->headers_complete = false;
    ctx->message_complete = false;
    return 0;
}

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    // The target may arrive in several fragments
    ctx->request.uri.append(at, length);
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (parser->type == HTTP_RESPONSE) {
        // Response headers are relayed as raw bytes
        return 0;
    }

    if (!ctx->last_was_field) {
        // Previous callback was a value (or nothing): a new header starts
        ctx->request.headers.push_back(Header{std::string(at, length), std::string()});
    } else {
        // Continuation of a field name split across reads
        ctx->request.headers.back().name.append(at, length);
    }

    ctx->last_was_field = true;
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (parser->type == HTTP_RESPONSE) {
        return 0;
    }
    if (ctx->request.headers.empty()) {
        return -1;
    }

    ctx->request.headers.back().value.append(at, length);
    ctx->last_was_field = false;
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->headers_complete = true;

    Request& request = ctx->request;

    uint8_t major = parser->http_major;
    uint8_t minor = parser->http_minor;
    if (major == 1 && minor == 0) {
        request.version = Version::HTTP_1_0;
    } else if (major == 1 && minor == 1) {
        request.version = Version::HTTP_1_1;
    } else {
        request.version = Version::UNKNOWN;
    }

    if (parser->type == HTTP_RESPONSE) {
        ctx->status_code = parser->status_code;

        // Response to HEAD: Content-Length describes a body that is never sent
        return ctx->head_response ? 1 : 0;
    }

    request.method = llhttp_method_name(static_cast<llhttp_method_t>(parser->method));

    // Split path and query
    size_t query_pos = request.uri.find('?');
    if (query_pos != std::string::npos) {
        request.path = request.uri.substr(0, query_pos);
        request.query = request.uri.substr(query_pos + 1);
    } else {
        request.path = request.uri;
        request.query.clear();
    }

    request.chunked = (parser->flags & F_CHUNKED) != 0;
    if (!request.chunked && (parser->flags & F_CONTENT_LENGTH) != 0) {
        request.content_length = parser->content_length;
    }
    request.has_body = request.chunked || request.content_length > 0;
    request.upgrade = parser->upgrade != 0;
    request.keep_alive = llhttp_should_keep_alive(parser) != 0 && !request.upgrade;

    return 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    if (parser->type == HTTP_RESPONSE) {
        return 0;
    }
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->body.append(at, length);
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = true;

    // Pause so the bytes of a pipelined message stay in the caller's buffer
    return HPE_PAUSED;
}

}  // namespace authbridge::http
