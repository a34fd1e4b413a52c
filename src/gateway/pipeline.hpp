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

// Authbridge Pipeline - Header
// Middleware chain run on every request before it is forwarded

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../http/http.hpp"
#include "auth_extractor.hpp"
#include "body.hpp"
#include "header_rewriter.hpp"

namespace authbridge::gateway {

/// Request context (passed through middleware chain)
struct RequestContext {
    http::Request* request = nullptr;
    std::unique_ptr<Body> body;  // Replaced when a middleware reads it

    std::string correlation_id;
    std::string client_ip;
    std::chrono::steady_clock::time_point start_time;

    // Auth state (token is never logged)
    std::optional<std::string> token;
    TokenSource token_source = TokenSource::None;

    // Headers to send upstream (set by HeaderRewriteMiddleware)
    http::HeaderList outgoing_headers;

    // Error handling: synthesized response that ends the request
    std::optional<http::Response> error_response;

    /// Helper: Set error response
    void set_error(http::Response response) { error_response = std::move(response); }

    [[nodiscard]] bool has_error() const noexcept { return error_response.has_value(); }
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Stop pipeline execution (error_response is sent)
    Error      // Error occurred
};

/// Middleware base class
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase (before forwarding upstream)
    [[nodiscard]] virtual MiddlewareResult process_request(RequestContext& ctx) = 0;

    /// Get middleware name (for debugging)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Extracts the legacy auth token (may buffer and replace the body)
class AuthExtractMiddleware : public Middleware {
public:
    explicit AuthExtractMiddleware(AuthExtractor extractor) : extractor_(extractor) {}

    MiddlewareResult process_request(RequestContext& ctx) override;
    std::string_view name() const override { return "AuthExtractMiddleware"; }

private:
    AuthExtractor extractor_;
};

/// Builds the outgoing header set (appends the bearer header)
class HeaderRewriteMiddleware : public Middleware {
public:
    MiddlewareResult process_request(RequestContext& ctx) override;
    std::string_view name() const override { return "HeaderRewriteMiddleware"; }

private:
    HeaderRewriter rewriter_;
};

/// Middleware pipeline
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Execute request phase
    /// Stops at the first middleware that does not return Continue; on Error a
    /// 500 response is set if the middleware did not provide one
    [[nodiscard]] MiddlewareResult execute_request(RequestContext& ctx);

    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

private:
    std::vector<std::unique_ptr<Middleware>> middleware_;
};

/// Standard request pipeline: AuthExtractMiddleware -> HeaderRewriteMiddleware
[[nodiscard]] Pipeline build_auth_pipeline(const control::Config& config);

}  // namespace authbridge::gateway
