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

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include <string>
#include <string_view>

namespace authbridge::control {
struct LogConfig;
}

namespace authbridge::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the process logger from config (file sink, JSON file sink or console)
// Connection threads share this logger; Quill loggers are thread-safe
quill::Logger* init_logger(const authbridge::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 generation for correlation IDs
std::string generate_correlation_id();

// Validate correlation ID format ({uuid}#{counter})
bool is_valid_uuid(std::string_view uuid);

// Get the process logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Logging macros for structured logging

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_detail)                 \
    LOG_ERROR(logger, "{}: correlation_id={}, error_detail={}", message, correlation_id, \
              error_detail)

// Upstream connection event logging
#define LOG_UPSTREAM(logger, event, upstream_host, upstream_port, correlation_id)          \
    LOG_INFO(logger, "Upstream {}: upstream={}:{}, correlation_id={}", event, upstream_host, \
             upstream_port, correlation_id)

}  // namespace authbridge::logging
