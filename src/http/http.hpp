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

// Authbridge HTTP Protocol - Header
// Owned HTTP value types shared by the parser, the auth pipeline and the forwarder

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace authbridge::http {

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// HTTP status codes (only the ones the proxy synthesizes itself)
enum class StatusCode : uint16_t {
    OK = 200,

    // 4xx Client Error
    BadRequest = 400,
    RequestTimeout = 408,
    RequestHeaderFieldsTooLarge = 431,

    // 5xx Server Error
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
};

/// HTTP header (name-value pair, owned)
struct Header {
    std::string name;
    std::string value;

    bool operator==(const Header&) const = default;
};

/// Ordered header list. Duplicates are kept and wire order is preserved.
using HeaderList = std::vector<Header>;

/// HTTP request head
///
/// The body is not part of the request value; it is streamed separately
/// (see gateway::Body) so it can be consumed at most once.
struct Request {
    std::string method;  // Verbatim token from the request line
    Version version = Version::HTTP_1_1;

    std::string uri;    // Request target as received (path + optional query)
    std::string path;   // URI without query string
    std::string query;  // Query string without '?' (empty if absent)

    HeaderList headers;

    // Body framing (filled by the parser from llhttp state)
    bool chunked = false;         // Transfer-Encoding: chunked
    bool has_body = false;        // Chunked or non-zero Content-Length
    uint64_t content_length = 0;  // Valid when !chunked

    bool keep_alive = true;  // llhttp_should_keep_alive() after headers
    bool upgrade = false;    // Connection: upgrade / CONNECT

    // Helper: Find header by name (case-insensitive, first match)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    // Helper: Get header value or default
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;
};

/// Synthesized response (error responses produced by the proxy itself)
///
/// Upstream responses are never materialized; they are relayed as raw bytes.
struct Response {
    StatusCode status = StatusCode::OK;
    std::string content_type = "text/plain; charset=utf-8";
    std::string body;
};

/// Build a plain-text response with the given status and message
[[nodiscard]] Response make_text_response(StatusCode status, std::string message);

/// Serialize a synthesized response to HTTP/1.1 wire format
/// Always emits Content-Length and a Connection header matching keep_alive
[[nodiscard]] std::string serialize_response(const Response& response, bool keep_alive);

// Header list helpers

/// Find first header with the given name (case-insensitive)
[[nodiscard]] const Header* find_header(const HeaderList& headers, std::string_view name) noexcept;

/// Check if any header with the given name exists (case-insensitive)
[[nodiscard]] bool has_header(const HeaderList& headers, std::string_view name) noexcept;

/// HTTP/1.1 request carrying "Expect: 100-continue" (client waits before sending its body)
[[nodiscard]] bool expects_continue(const Request& request) noexcept;

// Conversion functions

/// Convert Version to string
[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

namespace url {

/// Decode one application/x-www-form-urlencoded component
/// '+' becomes a space and %XX is decoded. Malformed escapes are kept verbatim.
[[nodiscard]] std::string decode_form_component(std::string_view str);

/// Parse a query string (without '?') into ordered name/value pairs
/// Empty pairs are skipped; a pair without '=' has an empty value
[[nodiscard]] std::vector<std::pair<std::string, std::string>> parse_query(std::string_view query);

/// Return the value of the first pair whose decoded name equals 'name'
[[nodiscard]] std::optional<std::string> find_query_param(std::string_view query,
                                                          std::string_view name);

}  // namespace url

}  // namespace authbridge::http
