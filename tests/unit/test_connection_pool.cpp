// Authbridge Upstream Connection Pool Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "../../src/gateway/connection_pool.hpp"

using namespace authbridge::gateway;

namespace {

/// Connected socket pair: first goes to the pool, second plays the upstream
struct SocketPair {
    int local = -1;
    int remote = -1;

    SocketPair() {
        int fds[2];
        if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0) {
            local = fds[0];
            remote = fds[1];
        }
    }

    ~SocketPair() {
        if (remote >= 0) {
            close(remote);
        }
    }

    void close_remote() {
        close(remote);
        remote = -1;
    }
};

}  // namespace

TEST_CASE("ConnectionPool - Reuse", "[pool]") {
    ConnectionPool pool(4, std::chrono::seconds(60));

    SECTION("empty pool is a miss") {
        REQUIRE(pool.acquire() == -1);
        REQUIRE(pool.misses() == 1);
        REQUIRE(pool.hits() == 0);
    }

    SECTION("released connection is handed out again") {
        SocketPair pair;
        REQUIRE(pair.local >= 0);

        pool.release(pair.local, 3);
        REQUIRE(pool.size() == 1);

        size_t request_count = 0;
        int fd = pool.acquire(&request_count);
        REQUIRE(fd == pair.local);
        REQUIRE(request_count == 3);
        REQUIRE(pool.hits() == 1);
        REQUIRE(pool.size() == 0);

        close(fd);
    }

    SECTION("most recently released first") {
        SocketPair first;
        SocketPair second;

        pool.release(first.local, 1);
        pool.release(second.local, 1);

        int fd = pool.acquire();
        REQUIRE(fd == second.local);
        close(fd);
    }
}

TEST_CASE("ConnectionPool - Health checks", "[pool]") {
    ConnectionPool pool(4, std::chrono::seconds(60));

    SECTION("connection closed by the upstream is discarded on acquire") {
        SocketPair pair;
        pool.release(pair.local, 1);
        pair.close_remote();

        REQUIRE(pool.acquire() == -1);
        REQUIRE(pool.health_fails() == 1);
        REQUIRE(pool.size() == 0);
    }

    SECTION("connection closed before release is not pooled") {
        SocketPair pair;
        pair.close_remote();

        pool.release(pair.local, 1);
        REQUIRE(pool.size() == 0);
        REQUIRE(pool.health_fails() == 1);
    }

    SECTION("unsolicited bytes make a connection unusable") {
        SocketPair pair;
        pool.release(pair.local, 1);
        REQUIRE(write(pair.remote, "x", 1) == 1);

        REQUIRE(pool.acquire() == -1);
        REQUIRE(pool.health_fails() == 1);
    }
}

TEST_CASE("ConnectionPool - Limits", "[pool]") {
    SECTION("full pool closes extra connections") {
        ConnectionPool pool(1, std::chrono::seconds(60));
        SocketPair first;
        SocketPair second;

        pool.release(first.local, 1);
        pool.release(second.local, 1);

        REQUIRE(pool.size() == 1);
        REQUIRE(pool.pool_full_closes() == 1);
    }

    SECTION("idle connections expire") {
        ConnectionPool pool(4, std::chrono::seconds(0));
        SocketPair pair;

        pool.release(pair.local, 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

        pool.cleanup_stale();
        REQUIRE(pool.size() == 0);
    }

    SECTION("hit rate") {
        ConnectionPool pool(4, std::chrono::seconds(60));
        SocketPair pair;

        REQUIRE(pool.acquire() == -1);
        pool.release(pair.local, 1);
        int fd = pool.acquire();
        REQUIRE(fd == pair.local);
        close(fd);

        REQUIRE(pool.hit_rate() == 0.5);
        pool.log_stats();
    }
}
