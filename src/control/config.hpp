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

// Authbridge Configuration - Header
// Process configuration: upstream from the environment, ambient settings from optional JSON

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace authbridge::control {

/// Fixed loopback listen address
inline constexpr const char* kListenAddress = "127.0.0.1";
inline constexpr uint16_t kListenPort = 8536;

/// Environment variable carrying the upstream "host:port" (required)
inline constexpr const char* kUpstreamEnvVar = "LEMMY_UPSTREAM";

/// Listener configuration
struct ServerConfig {
    // Not loaded from JSON: the listen address is fixed
    std::string listen_address = kListenAddress;
    uint16_t listen_port = kListenPort;

    uint32_t backlog = 128;
    uint32_t max_connections = 10000;
    uint32_t max_header_size = 16384;  // 16KB request head limit

    // Timeouts (milliseconds, 0 = disabled)
    uint32_t read_timeout = 60000;      // Client idle / slow body
    uint32_t shutdown_timeout = 30000;  // Drain in-flight requests
};

/// Upstream (backend) configuration
struct UpstreamConfig {
    std::string address;  // "host:port" as configured

    // Connection pool settings
    uint32_t pool_size = 100;
    uint32_t pool_idle_timeout = 60;  // seconds

    // Timeouts (milliseconds, 0 = disabled)
    uint32_t connect_timeout = 0;
    uint32_t read_timeout = 0;

    // JSON body inspection limit in bytes (0 = unlimited)
    uint64_t max_json_body_size = 0;
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";     // debug, info, warning, error
    std::string format = "json";    // json, text (file output only)
    std::string output = "stdout";  // "stdout" or log directory (authbridge.log appended)
    bool log_requests = true;

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Authbridge configuration
struct Config {
    std::string version = "1.0";
    ServerConfig server;
    UpstreamConfig upstream;
    LogConfig logging;
};

/// Parsed upstream authority
struct UpstreamAddress {
    std::string host;   // Hostname or IP literal (brackets stripped for IPv6)
    uint16_t port = 80;

    bool operator==(const UpstreamAddress&) const = default;
};

/// Parse "host:port", "host" (port 80) or "[v6]:port"
/// Returns std::nullopt for an empty host or a port outside 1-65535
[[nodiscard]] std::optional<UpstreamAddress> parse_upstream_address(std::string_view address);

// JSON serialization

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    // listen_address / listen_port are intentionally not read
    s.backlog = j.value("backlog", 128u);
    s.max_connections = j.value("max_connections", 10000u);
    s.max_header_size = j.value("max_header_size", 16384u);
    s.read_timeout = j.value("read_timeout", 60000u);
    s.shutdown_timeout = j.value("shutdown_timeout", 30000u);
}

inline void from_json(const nlohmann::json& j, UpstreamConfig& u) {
    u.address = j.value("address", std::string());
    u.pool_size = j.value("pool_size", 100u);
    u.pool_idle_timeout = j.value("pool_idle_timeout", 60u);
    u.connect_timeout = j.value("connect_timeout", 0u);
    u.read_timeout = j.value("read_timeout", 0u);
    u.max_json_body_size = j.value("max_json_body_size", uint64_t(0));
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("stdout"));
    l.log_requests = j.value("log_requests", true);
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    c.version = j.value("version", std::string("1.0"));
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("upstream")) {
        j.at("upstream").get_to(c.upstream);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"backlog", s.backlog},
                       {"max_connections", s.max_connections},
                       {"max_header_size", s.max_header_size},
                       {"read_timeout", s.read_timeout},
                       {"shutdown_timeout", s.shutdown_timeout}};
}

inline void to_json(nlohmann::json& j, const UpstreamConfig& u) {
    j = nlohmann::json{{"address", u.address},
                       {"pool_size", u.pool_size},
                       {"pool_idle_timeout", u.pool_idle_timeout},
                       {"connect_timeout", u.connect_timeout},
                       {"read_timeout", u.read_timeout},
                       {"max_json_body_size", u.max_json_body_size}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level},
                       {"format", l.format},
                       {"output", l.output},
                       {"log_requests", l.log_requests},
                       {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{{"version", c.version},
                       {"server", c.server},
                       {"upstream", c.upstream},
                       {"logging", c.logging}};
}

/// Validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (no validation)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string (no validation)
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Override the upstream address from the environment, if the variable is set
    static void apply_environment(Config& config);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Full startup sequence: optional file, environment override, validation
    /// Returns std::nullopt when loading or validation fails (details in 'result')
    [[nodiscard]] static std::optional<Config> load(std::optional<std::string_view> path,
                                                    ValidationResult& result);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace authbridge::control
