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

// Authbridge Pipeline - Implementation

#include "pipeline.hpp"

#include "../core/logging.hpp"

namespace authbridge::gateway {

namespace {

std::string_view to_string(TokenSource source) noexcept {
    switch (source) {
        case TokenSource::Query:
            return "query";
        case TokenSource::JsonBody:
            return "json_body";
        default:
            return "none";
    }
}

}  // namespace

// AuthExtractMiddleware implementation

MiddlewareResult AuthExtractMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request) {
        return MiddlewareResult::Error;
    }

    ExtractResult result = extractor_.extract(*ctx.request, std::move(ctx.body));
    if (result.error.has_value()) {
        ctx.set_error(std::move(*result.error));
        return MiddlewareResult::Stop;
    }

    ctx.body = std::move(result.body);
    ctx.token = std::move(result.token);
    ctx.token_source = result.source;

    if (ctx.token_source != TokenSource::None) {
        auto* logger = logging::get_current_logger();
        if (logger) {
            LOG_DEBUG(logger, "Legacy auth token found: source={}, correlation_id={}",
                      to_string(ctx.token_source), ctx.correlation_id);
        }
    }

    return MiddlewareResult::Continue;
}

// HeaderRewriteMiddleware implementation

MiddlewareResult HeaderRewriteMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request) {
        return MiddlewareResult::Error;
    }

    RewriteResult result = rewriter_.rewrite(ctx.request->headers, ctx.token);
    if (result.error.has_value()) {
        ctx.set_error(std::move(*result.error));
        return MiddlewareResult::Stop;
    }

    ctx.outgoing_headers = std::move(result.headers);
    return MiddlewareResult::Continue;
}

// Pipeline implementation

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_request(ctx);

        if (result == MiddlewareResult::Continue) {
            continue;
        }

        if (result == MiddlewareResult::Error && !ctx.has_error()) {
            auto* logger = logging::get_current_logger();
            if (logger) {
                LOG_ERROR(logger, "Middleware {} failed: correlation_id={}", middleware->name(),
                          ctx.correlation_id);
            }
            ctx.set_error(http::make_text_response(http::StatusCode::InternalServerError,
                                                   "Internal proxy error"));
        }
        return result;
    }

    return MiddlewareResult::Continue;
}

Pipeline build_auth_pipeline(const control::Config& config) {
    Pipeline pipeline;
    pipeline.use(std::make_unique<AuthExtractMiddleware>(
        AuthExtractor(config.upstream.max_json_body_size)));
    pipeline.use(std::make_unique<HeaderRewriteMiddleware>());
    return pipeline;
}

}  // namespace authbridge::gateway
