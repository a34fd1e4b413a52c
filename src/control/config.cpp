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

// Authbridge Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace authbridge::control {

std::optional<UpstreamAddress> parse_upstream_address(std::string_view address) {
    if (address.empty()) {
        return std::nullopt;
    }

    UpstreamAddress result;
    std::string_view port_part;

    if (address.front() == '[') {
        // IPv6 literal: [addr] or [addr]:port
        size_t close = address.find(']');
        if (close == std::string_view::npos || close == 1) {
            return std::nullopt;
        }
        result.host = std::string(address.substr(1, close - 1));

        std::string_view rest = address.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return std::nullopt;
            }
            port_part = rest.substr(1);
            if (port_part.empty()) {
                return std::nullopt;
            }
        }
    } else {
        size_t colon = address.rfind(':');
        if (colon != std::string_view::npos) {
            if (address.find(':') != colon) {
                // Bare IPv6 without brackets is ambiguous
                return std::nullopt;
            }
            port_part = address.substr(colon + 1);
            address = address.substr(0, colon);
            if (port_part.empty()) {
                return std::nullopt;
            }
        }
        if (address.empty()) {
            return std::nullopt;
        }
        result.host = std::string(address);
    }

    // Authority only: no path, userinfo or whitespace
    for (char c : result.host) {
        if (c == '/' || c == '@' || c == '?' || c == '#' || c == ' ' || c == '\t') {
            return std::nullopt;
        }
    }

    if (!port_part.empty()) {
        uint32_t port = 0;
        auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), port);
        if (ec != std::errc() || ptr != port_part.data() + port_part.size() || port == 0 ||
            port > 65535) {
            return std::nullopt;
        }
        result.port = static_cast<uint16_t>(port);
    }

    return result;
}

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        fprintf(stderr, "Cannot open configuration file: %s\n", path_str.c_str());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    return config;
}

void ConfigLoader::apply_environment(Config& config) {
    const char* upstream = std::getenv(kUpstreamEnvVar);
    if (upstream != nullptr) {
        config.upstream.address = upstream;
    }
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Upstream is the only required setting
    if (config.upstream.address.empty()) {
        result.add_error(fmt::format("Missing {} value", kUpstreamEnvVar));
    } else if (!parse_upstream_address(config.upstream.address)) {
        result.add_error(fmt::format("Invalid upstream address '{}': expected host:port",
                                     config.upstream.address));
    }

    if (config.upstream.pool_size == 0) {
        result.add_warning("upstream.pool_size is 0: connections will not be reused");
    }

    // Server limits
    if (config.server.max_connections == 0) {
        result.add_error("server.max_connections must be > 0");
    }
    if (config.server.max_header_size < 1024) {
        result.add_error("server.max_header_size must be >= 1024");
    }
    if (config.server.backlog == 0) {
        result.add_error("server.backlog must be > 0");
    }

    // Logging
    const auto& level = config.logging.level;
    if (level != "debug" && level != "info" && level != "warning" && level != "warn" &&
        level != "error") {
        result.add_warning(
            fmt::format("Unknown logging.level '{}', falling back to 'info'", level));
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error(
            fmt::format("logging.format must be 'json' or 'text', got '{}'", config.logging.format));
    }
    if (config.logging.output.empty()) {
        result.add_error("logging.output must be 'stdout' or a directory path");
    }

    return result;
}

std::optional<Config> ConfigLoader::load(std::optional<std::string_view> path,
                                         ValidationResult& result) {
    Config config;

    if (path.has_value()) {
        auto maybe_config = load_from_file(*path);
        if (!maybe_config.has_value()) {
            result.add_error(fmt::format("Failed to load configuration file '{}'", *path));
            return std::nullopt;
        }
        config = std::move(*maybe_config);
    }

    // Environment always wins over the file
    apply_environment(config);

    result = validate(config);
    if (result.has_errors()) {
        return std::nullopt;
    }

    return config;
}

std::string ConfigLoader::to_json(const Config& config) {
    nlohmann::json j = config;
    return j.dump(2);
}

}  // namespace authbridge::control
