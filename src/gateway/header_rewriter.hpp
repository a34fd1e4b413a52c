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

// Authbridge Gateway - Outgoing Header Construction

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "../http/http.hpp"

namespace authbridge::gateway {

/// Text body of the 400 response for a token that cannot be sent as a header value
inline constexpr std::string_view kInvalidTokenMessage = "Invalid authorization token";

struct RewriteResult {
    http::HeaderList headers;
    std::optional<http::Response> error;  // Terminal: send and stop the pipeline
};

class HeaderRewriter {
public:
    /// Copy 'original' and append "Authorization: Bearer <token>" when a token is given
    /// Existing headers (including any Authorization) are never modified or reordered
    [[nodiscard]] RewriteResult rewrite(const http::HeaderList& original,
                                        const std::optional<std::string>& token) const;
};

/// Whether 'value' is a legal HTTP field value (no CTL characters other than HTAB)
[[nodiscard]] bool is_valid_header_value(std::string_view value) noexcept;

}  // namespace authbridge::gateway
