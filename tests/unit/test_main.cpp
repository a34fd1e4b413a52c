// Authbridge Unit Tests - Global Setup
#include <catch2/catch_test_macros.hpp>

#include <atomic>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

namespace authbridge::core {
std::atomic<bool> g_server_running{true};
}  // namespace authbridge::core

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        authbridge::logging::init_logging_system();

        // Keep test output readable: log to a scratch directory
        authbridge::control::LogConfig log_config;
        log_config.output = "/tmp/authbridge_tests";
        log_config.level = "debug";
        authbridge::logging::init_logger(log_config);
    }

    ~GlobalSetup() { authbridge::logging::shutdown_logging(); }
};

static GlobalSetup g_setup;
