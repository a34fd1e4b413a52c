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

// Authbridge Forwarder - Implementation

#include "forwarder.hpp"

#include <cerrno>
#include <cstring>
#include <span>

#include <fmt/format.h>

#include "../core/socket.hpp"
#include "../http/parser.hpp"

namespace authbridge::gateway {

namespace {

constexpr size_t kRequestLineBaseSize = 16;  // " HTTP/1.x\r\n" + margin
constexpr size_t kHeaderSeparatorSize = 4;   // ": \r\n"
constexpr size_t kRequestHeaderMargin = 64;  // Host header + final CRLF
constexpr size_t kRelayBufferSize = 16384;

/// Chunk framing for a re-chunked request body
std::string chunk_header(size_t size) {
    return fmt::format("{:x}\r\n", size);
}

std::string errno_reason(int err) {
    if (err == EAGAIN || err == EWOULDBLOCK) {
        return "timed out waiting for response";
    }
    return std::strerror(err);
}

/// Send the request body; returns false with 'result' filled on failure
bool send_body(int fd, const http::Request& request, Body& body, ForwardResult& result) {
    std::string chunk;
    for (;;) {
        BodyRead status = body.read(chunk);

        if (status == BodyRead::Error) {
            result.outcome = ForwardOutcome::ClientBodyFailed;
            result.reason = std::string(body.error());
            return false;
        }

        std::error_code ec;
        if (status == BodyRead::End) {
            if (request.chunked) {
                // Trailers of the original message are not forwarded
                ec = core::send_all(fd, "0\r\n\r\n");
            }
        } else if (request.chunked) {
            ec = core::send_all(fd, chunk_header(chunk.size()));
            if (!ec) {
                ec = core::send_all(fd, chunk);
            }
            if (!ec) {
                ec = core::send_all(fd, "\r\n");
            }
        } else {
            ec = core::send_all(fd, chunk);
        }

        if (ec) {
            result.outcome = ForwardOutcome::UpstreamFailed;
            result.reason = fmt::format("error sending request body: {}", ec.message());
            return false;
        }

        if (status == BodyRead::End) {
            return true;
        }
    }
}

}  // namespace

std::string upstream_failure_message(std::string_view reason) {
    std::string message;
    message.reserve(kUpstreamFailedPrefix.size() + reason.size());
    message += kUpstreamFailedPrefix;
    message += reason;
    return message;
}

std::string Forwarder::build_request_head(const http::Request& request,
                                          const http::HeaderList& headers,
                                          std::string_view default_host) {
    size_t estimated_size = kRequestLineBaseSize + request.method.size() + request.uri.size();
    for (const auto& header : headers) {
        estimated_size += header.name.size() + header.value.size() + kHeaderSeparatorSize;
    }
    estimated_size += kRequestHeaderMargin + default_host.size();

    std::string req;
    req.reserve(estimated_size);

    // Request line: METHOD uri VERSION (uri keeps the original query string)
    req += request.method;
    req += ' ';
    req += request.uri;
    req += ' ';
    req += http::to_string(request.version);
    req += "\r\n";

    bool has_host = false;
    for (const auto& header : headers) {
        if (http::header_name_equals(header.name, "Host")) {
            has_host = true;
        }
        req += header.name;
        req += ": ";
        req += header.value;
        req += "\r\n";
    }

    // Host is mandatory in HTTP/1.1 (HTTP/1.0 clients may omit it)
    if (!has_host) {
        req += "Host: ";
        req += default_host;
        req += "\r\n";
    }

    req += "\r\n";
    return req;
}

ForwardResult Forwarder::forward(const http::Request& request, const http::HeaderList& headers,
                                 Body& body, ResponseSink& sink) {
    ForwardResult result;

    std::string connect_error;
    UpstreamConnection conn = upstream_.connect(connect_error);
    if (conn.fd < 0) {
        result.outcome = ForwardOutcome::UpstreamFailed;
        result.reason = std::move(connect_error);
        return result;
    }

    std::string head = build_request_head(request, headers, upstream_.authority());
    if (auto ec = core::send_all(conn.fd, head); ec) {
        upstream_.release(conn, false);
        result.outcome = ForwardOutcome::UpstreamFailed;
        result.reason = fmt::format("error sending request: {}", ec.message());
        return result;
    }

    if (!send_body(conn.fd, request, body, result)) {
        upstream_.release(conn, false);
        return result;
    }

    // Relay the response as it arrives; the parser only finds where it ends
    http::Parser parser(HTTP_RESPONSE);
    parser.set_head_response(request.method == "HEAD");

    // The client connection already answered the expectation itself
    const bool drop_continue = http::expects_continue(request);
    std::string held;  // Head bytes of the current response until its status is known

    std::string buffer(kRelayBufferSize, '\0');
    bool complete = false;
    bool leftover = false;

    while (!complete) {
        ssize_t n = core::recv_some(conn.fd, buffer.data(), buffer.size());

        if (n < 0) {
            int err = errno;
            upstream_.release(conn, false);
            result.outcome = ForwardOutcome::UpstreamFailed;
            result.reason = fmt::format("error reading response: {}", errno_reason(err));
            return result;
        }

        if (n == 0) {
            // Upstream closed: completes an EOF-delimited body, fails anything else
            http::ParseResult finished = parser.finish();
            upstream_.release(conn, false);
            if (finished != http::ParseResult::Complete) {
                result.outcome = ForwardOutcome::UpstreamFailed;
                result.reason = std::string(parser.error_message());
                return result;
            }
            result.status_code = parser.status_code();
            result.keep_alive = false;
            return result;
        }

        auto data = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(buffer.data()),
                                             static_cast<size_t>(n));
        size_t offset = 0;

        while (offset < data.size() && !complete) {
            auto [parse_result, consumed] = parser.execute(data.subspan(offset));

            if (parse_result == http::ParseResult::Error) {
                upstream_.release(conn, false);
                result.outcome = ForwardOutcome::UpstreamFailed;
                result.reason = fmt::format("invalid HTTP response: {}", parser.error_message());
                return result;
            }

            if (consumed > 0) {
                held.append(buffer.data() + offset, consumed);
                offset += consumed;
            }

            if (!held.empty() && parser.headers_complete()) {
                bool dropped = drop_continue && parser.status_code() == 100;
                if (!dropped) {
                    if (auto ec = sink.write(held); ec) {
                        upstream_.release(conn, false);
                        result.outcome = ForwardOutcome::ClientWriteFailed;
                        result.reason = ec.message();
                        return result;
                    }
                    result.bytes_relayed += held.size();
                }
                held.clear();
            }

            if (parse_result == http::ParseResult::Complete) {
                uint16_t status = parser.status_code();
                if (status >= 100 && status < 200 && status != 101) {
                    // Interim response: relayed, the final one follows
                    parser.next_message();
                    continue;
                }
                complete = true;
            } else if (consumed == 0) {
                break;
            }
        }

        leftover = complete && offset < data.size();
    }

    result.status_code = parser.status_code();
    result.keep_alive = parser.should_keep_alive() && result.status_code != 101;

    // Bytes after the final response mean the connection is out of sync
    upstream_.release(conn, result.keep_alive && !leftover);
    return result;
}

}  // namespace authbridge::gateway
