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

#include "header_rewriter.hpp"

#include "../core/logging.hpp"

namespace authbridge::gateway {

RewriteResult HeaderRewriter::rewrite(const http::HeaderList& original,
                                      const std::optional<std::string>& token) const {
    RewriteResult result;

    if (!token.has_value()) {
        result.headers = original;
        return result;
    }

    std::string value = "Bearer " + *token;

    // Header injection guard: CR/LF in a token would split the request
    if (!is_valid_header_value(value)) {
        auto* logger = logging::get_current_logger();
        if (logger) {
            LOG_WARNING(logger, "Rejected legacy auth token: not a valid header value (length={})",
                        token->size());
        }
        result.error = http::make_text_response(http::StatusCode::BadRequest,
                                                std::string(kInvalidTokenMessage));
        return result;
    }

    result.headers.reserve(original.size() + 1);
    result.headers.assign(original.begin(), original.end());
    result.headers.push_back(http::Header{"Authorization", std::move(value)});
    return result;
}

bool is_valid_header_value(std::string_view value) noexcept {
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if ((c < 0x20 && c != '\t') || c == 0x7F) {
            return false;
        }
    }
    return true;
}

}  // namespace authbridge::gateway
