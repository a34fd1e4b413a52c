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

// Authbridge - Main Entry Point
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/server.hpp"

namespace authbridge::core {
std::atomic<bool> g_server_running{true};
}  // namespace authbridge::core

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        authbridge::core::g_server_running = false;
    }
}

int main(int argc, char* argv[]) {
    std::optional<std::string_view> config_path;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            fprintf(stderr, "Usage: %s [--config <config.json>]\n", argv[0]);
            return EXIT_FAILURE;
        }
    }

    authbridge::control::ValidationResult validation;
    auto config = authbridge::control::ConfigLoader::load(config_path, validation);

    if (!validation.warnings.empty()) {
        fprintf(stderr, "Configuration warnings:\n");
        for (const auto& warning : validation.warnings) {
            fprintf(stderr, "  - %s\n", warning.c_str());
        }
    }

    if (!config.has_value()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "%s\n", error.c_str());
        }
        return EXIT_FAILURE;
    }

    authbridge::logging::init_logging_system();
    quill::Logger* logger = nullptr;
    try {
        logger = authbridge::logging::init_logger(config->logging);
    } catch (const std::exception& e) {
        fprintf(stderr, "Failed to initialize logging: %s\n", e.what());
        authbridge::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    // Client and upstream disconnects surface as EPIPE instead
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, signal_handler);   // Ctrl+C
    std::signal(SIGTERM, signal_handler);  // Kill signal

    int exit_code = EXIT_SUCCESS;
    {
        authbridge::core::Server server(std::move(*config));

        if (auto ec = server.start(); ec) {
            LOG_ERROR(logger, "Failed to listen on {}:{}: {}", authbridge::control::kListenAddress,
                      authbridge::control::kListenPort, ec.message());
            exit_code = EXIT_FAILURE;
        } else {
            server.run();
            LOG_INFO(logger, "Authbridge stopped");
        }
    }

    authbridge::logging::shutdown_logging();
    return exit_code;
}
