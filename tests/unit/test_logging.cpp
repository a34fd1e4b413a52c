// Authbridge Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../../src/core/logging.hpp"

using namespace authbridge::logging;

TEST_CASE("Correlation ID - Format and uniqueness", "[logging][correlation_id]") {
    SECTION("generated IDs validate") {
        for (int i = 0; i < 50; ++i) {
            REQUIRE(is_valid_uuid(generate_correlation_id()));
        }
    }

    SECTION("same thread shares the base, counter advances") {
        std::string first = generate_correlation_id();
        std::string second = generate_correlation_id();

        size_t pos1 = first.find('#');
        size_t pos2 = second.find('#');
        REQUIRE(pos1 == 36);
        REQUIRE(pos2 == 36);
        REQUIRE(first.substr(0, pos1) == second.substr(0, pos2));
        REQUIRE(std::stoull(second.substr(pos2 + 1)) == std::stoull(first.substr(pos1 + 1)) + 1);
    }

    SECTION("connection threads never collide") {
        std::mutex mutex;
        std::set<std::string> ids;
        std::vector<std::thread> threads;

        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&] {
                std::vector<std::string> local;
                for (int i = 0; i < 100; ++i) {
                    local.push_back(generate_correlation_id());
                }
                std::lock_guard<std::mutex> lock(mutex);
                ids.insert(local.begin(), local.end());
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(ids.size() == 400);
    }
}

TEST_CASE("Correlation ID - Validation", "[logging][correlation_id]") {
    REQUIRE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#7"));
    REQUIRE(is_valid_uuid("ABCDEF12-3456-4789-ABCD-EF0123456789#0"));

    REQUIRE_FALSE(is_valid_uuid(""));
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000"));
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#"));
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-a716-446655440000#x1"));
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-31d4-a716-446655440000#1"));  // version 3
    REQUIRE_FALSE(is_valid_uuid("550e8400-e29b-41d4-c716-446655440000#1"));  // variant c
    REQUIRE_FALSE(is_valid_uuid("550e8400e29b41d4a716446655440000#1"));
}

TEST_CASE("Logger - Process logger is available after setup", "[logging][logger]") {
    quill::Logger* logger = get_current_logger();
    REQUIRE(logger != nullptr);

    // File output was requested by the test setup
    REQUIRE(std::filesystem::exists("/tmp/authbridge_tests"));

    LOG_REQUEST(logger, "GET", "/api/v3/site", 200, 1234, "127.0.0.1", generate_correlation_id());
    LOG_UPSTREAM(logger, "connected", "localhost", 8536, generate_correlation_id());
}
