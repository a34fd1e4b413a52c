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

// Authbridge Gateway - Legacy Auth Token Extraction
// Finds a legacy token in the query string or a JSON body, in strict precedence:
//   1. Authorization header present -> passthrough, nothing inspected
//   2. first "auth" query parameter
//   3. top-level "auth" string of a JSON object body (Content-Type application/json)

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../http/http.hpp"
#include "body.hpp"

namespace authbridge::gateway {

/// Where the token was found
enum class TokenSource : uint8_t {
    None,
    Query,
    JsonBody
};

/// Text body of the 400 response for an unreadable request body
inline constexpr std::string_view kBodyReadFailedMessage = "Failed to receive request body";

/// Extraction outcome
///
/// 'body' is always set unless 'error' is set; it is either the original stream
/// (untouched) or a replay of the exact bytes that were read.
struct ExtractResult {
    std::unique_ptr<Body> body;
    std::optional<std::string> token;
    TokenSource source = TokenSource::None;
    std::optional<http::Response> error;  // Terminal: send and stop the pipeline
};

class AuthExtractor {
public:
    /// @param max_json_body_size Stop inspecting JSON bodies larger than this (0 = unlimited)
    explicit AuthExtractor(uint64_t max_json_body_size = 0)
        : max_json_body_size_(max_json_body_size) {}

    [[nodiscard]] ExtractResult extract(const http::Request& request,
                                        std::unique_ptr<Body> body) const;

private:
    uint64_t max_json_body_size_;
};

/// First "auth" parameter of a form-urlencoded query string
[[nodiscard]] std::optional<std::string> extract_auth_from_query(std::string_view query);

/// "auth" string property of a JSON object; nullopt for invalid UTF-8, invalid JSON or other shapes
[[nodiscard]] std::optional<std::string> extract_auth_from_json(std::string_view bytes);

/// Content-Type header contains "application/json"
[[nodiscard]] bool is_json_content_type(const http::HeaderList& headers) noexcept;

}  // namespace authbridge::gateway
