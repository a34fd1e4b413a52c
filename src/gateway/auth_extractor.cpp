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

// Authbridge Gateway - Legacy Auth Token Extraction Implementation

#include "auth_extractor.hpp"

#include <nlohmann/json.hpp>

#include "../core/logging.hpp"

namespace authbridge::gateway {

ExtractResult AuthExtractor::extract(const http::Request& request,
                                     std::unique_ptr<Body> body) const {
    ExtractResult result;

    // Already authenticated: never touch the body
    if (request.has_header("Authorization")) {
        result.body = std::move(body);
        return result;
    }

    if (auto token = extract_auth_from_query(request.query)) {
        result.body = std::move(body);
        result.token = std::move(token);
        result.source = TokenSource::Query;
        return result;
    }

    if (!is_json_content_type(request.headers) || !body) {
        result.body = std::move(body);
        return result;
    }

    std::string bytes;
    switch (read_all(*body, bytes, max_json_body_size_)) {
        case ReadAllStatus::Failed: {
            auto* logger = logging::get_current_logger();
            if (logger) {
                LOG_WARNING(logger, "JSON body read failed: {}, bytes_read={}", body->error(),
                            bytes.size());
            }
            result.error = http::make_text_response(http::StatusCode::BadRequest,
                                                    std::string(kBodyReadFailedMessage));
            return result;
        }
        case ReadAllStatus::LimitExceeded: {
            // Too large to inspect: forward what was read, then the rest of the stream
            auto* logger = logging::get_current_logger();
            if (logger) {
                LOG_DEBUG(logger, "JSON body exceeds inspection limit of {} bytes",
                          max_json_body_size_);
            }
            result.body = std::make_unique<PrefixedBody>(std::move(bytes), std::move(body));
            return result;
        }
        case ReadAllStatus::Complete:
            break;
    }

    result.token = extract_auth_from_json(bytes);
    if (result.token.has_value()) {
        result.source = TokenSource::JsonBody;
    }
    result.body = std::make_unique<BufferedBody>(std::move(bytes));
    return result;
}

std::optional<std::string> extract_auth_from_query(std::string_view query) {
    if (query.empty()) {
        return std::nullopt;
    }
    return http::url::find_query_param(query, "auth");
}

std::optional<std::string> extract_auth_from_json(std::string_view bytes) {
    // allow_exceptions = false: malformed input (ill-formed UTF-8 included) yields a
    // discarded value
    auto document = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return std::nullopt;
    }

    auto it = document.find("auth");
    if (it == document.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool is_json_content_type(const http::HeaderList& headers) noexcept {
    const http::Header* content_type = http::find_header(headers, "Content-Type");
    return content_type != nullptr &&
           content_type->value.find("application/json") != std::string::npos;
}

}  // namespace authbridge::gateway
