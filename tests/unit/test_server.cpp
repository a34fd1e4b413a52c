// Authbridge Server Integration Tests (client -> proxy -> loopback upstream)

#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "../../src/core/server.hpp"
#include "test_helpers.hpp"

using namespace authbridge;
using authbridge::testing::MockUpstream;
using authbridge::testing::TestClient;
using authbridge::testing::response_body;

namespace {

const std::string kUpstreamResponse =
    "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 11\r\n\r\n{\"ok\":true}";

/// Proxy on an ephemeral port in front of a scripted upstream
class ProxyFixture {
public:
    explicit ProxyFixture(std::function<void(control::Config&)> customize = {},
                          MockUpstream::Handler handler = {})
        : mock_(handler ? std::move(handler)
                        : MockUpstream::Handler([](const std::string&) { return kUpstreamResponse; })) {
        control::Config config;
        config.server.listen_port = 0;
        config.server.read_timeout = 5000;
        config.server.shutdown_timeout = 1000;
        config.upstream.address = mock_.address();
        config.upstream.read_timeout = 5000;
        if (customize) {
            customize(config);
        }

        server_ = std::make_unique<core::Server>(std::move(config));
        started_ = !server_->start();
        if (started_) {
            thread_ = std::thread([this] { server_->run(); });
        }
    }

    ~ProxyFixture() {
        server_->stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] uint16_t port() const noexcept { return server_->port(); }
    [[nodiscard]] MockUpstream& upstream() noexcept { return mock_; }

private:
    MockUpstream mock_;
    std::unique_ptr<core::Server> server_;
    std::thread thread_;
    bool started_ = false;
};

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

}  // namespace

TEST_CASE("Server - Token rewriting end to end", "[server][integration]") {
    ProxyFixture proxy;
    REQUIRE(proxy.started());
    REQUIRE(proxy.port() != 0);

    TestClient client(proxy.port());
    REQUIRE(client.connected());

    SECTION("query token") {
        REQUIRE(client.send("GET /api/v3/user?auth=abc%2Bdef&limit=5 HTTP/1.1\r\n"
                            "Host: localhost\r\n\r\n"));
        std::string response = client.read_response();
        REQUIRE(response == kUpstreamResponse);

        auto requests = proxy.upstream().requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].starts_with("GET /api/v3/user?auth=abc%2Bdef&limit=5 HTTP/1.1\r\n"));
        REQUIRE(requests[0].find("\r\nAuthorization: Bearer abc+def\r\n") != std::string::npos);
    }

    SECTION("JSON body token with exact body replay") {
        std::string json = R"({"post_id": 7, "auth": "jwt-token", "score": 1})";
        REQUIRE(client.send("POST /api/v3/post/like HTTP/1.1\r\nHost: localhost\r\n"
                            "Content-Type: application/json\r\n"
                            "Content-Length: " + std::to_string(json.size()) + "\r\n\r\n" + json));
        REQUIRE(client.read_response() == kUpstreamResponse);

        auto requests = proxy.upstream().requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].find("\r\nAuthorization: Bearer jwt-token\r\n") != std::string::npos);
        REQUIRE(requests[0].ends_with("\r\n\r\n" + json));
    }

    SECTION("chunked JSON body") {
        REQUIRE(client.send("POST /api/v3/comment HTTP/1.1\r\nHost: localhost\r\n"
                            "Content-Type: application/json\r\n"
                            "Transfer-Encoding: chunked\r\n\r\n"
                            "8\r\n{\"auth\":\r\n6\r\n\"tok\"}\r\n0\r\n\r\n"));
        REQUIRE(client.read_response() == kUpstreamResponse);

        auto requests = proxy.upstream().requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].find("\r\nAuthorization: Bearer tok\r\n") != std::string::npos);
        REQUIRE(requests[0].ends_with("e\r\n{\"auth\":\"tok\"}\r\n0\r\n\r\n"));
    }

    SECTION("existing Authorization header is never duplicated") {
        REQUIRE(client.send("GET /api/v3/site?auth=legacy HTTP/1.1\r\nHost: localhost\r\n"
                            "Authorization: Bearer modern\r\n\r\n"));
        REQUIRE(client.read_response() == kUpstreamResponse);

        auto requests = proxy.upstream().requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(count_occurrences(requests[0], "Authorization:") == 1);
        REQUIRE(requests[0].find("Bearer modern") != std::string::npos);
    }

    SECTION("no token: request forwarded unchanged") {
        REQUIRE(client.send("GET /api/v3/site HTTP/1.1\r\nHost: localhost\r\nX-A: 1\r\n\r\n"));
        REQUIRE(client.read_response() == kUpstreamResponse);

        auto requests = proxy.upstream().requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0] == "GET /api/v3/site HTTP/1.1\r\nHost: localhost\r\nX-A: 1\r\n\r\n");
    }

    SECTION("keep-alive and pipelining") {
        REQUIRE(client.send("GET /a HTTP/1.1\r\nHost: localhost\r\n\r\n"
                            "GET /b?auth=x HTTP/1.1\r\nHost: localhost\r\n\r\n"));
        REQUIRE(client.read_response() == kUpstreamResponse);
        REQUIRE(client.read_response() == kUpstreamResponse);

        REQUIRE(client.send("GET /c HTTP/1.1\r\nHost: localhost\r\n\r\n"));
        REQUIRE(client.read_response() == kUpstreamResponse);

        auto requests = proxy.upstream().requests();
        REQUIRE(requests.size() == 3);
        REQUIRE(requests[1].find("Authorization: Bearer x") != std::string::npos);
        REQUIRE(requests[2].starts_with("GET /c "));
    }
}

TEST_CASE("Server - Error responses", "[server][integration]") {
    SECTION("upstream unreachable gives 502") {
        ProxyFixture proxy([](control::Config& config) {
            config.upstream.address = "127.0.0.1:" + std::to_string(testing::closed_port());
        });
        REQUIRE(proxy.started());

        TestClient client(proxy.port());
        REQUIRE(client.send("GET / HTTP/1.1\r\nHost: localhost\r\n\r\n"));
        std::string response = client.read_response();

        REQUIRE(response.starts_with("HTTP/1.1 502 Bad Gateway\r\n"));
        REQUIRE(response_body(response).starts_with("Upstream failed to respond: "));
    }

    SECTION("truncated JSON body gives 400") {
        ProxyFixture proxy;
        REQUIRE(proxy.started());

        TestClient client(proxy.port());
        REQUIRE(client.send("POST /api/v3/post HTTP/1.1\r\nHost: localhost\r\n"
                            "Content-Type: application/json\r\nContent-Length: 100\r\n\r\n"
                            "{\"auth\":"));
        client.shutdown_write();
        std::string response = client.read_response();

        REQUIRE(response.starts_with("HTTP/1.1 400 Bad Request\r\n"));
        REQUIRE(response_body(response) == "Failed to receive request body");
        REQUIRE(proxy.upstream().requests().empty());
    }

    SECTION("malformed request gives 400 and closes") {
        ProxyFixture proxy;
        REQUIRE(proxy.started());

        TestClient client(proxy.port());
        REQUIRE(client.send("THIS IS NOT HTTP\r\n\r\n"));
        std::string response = client.read_response();

        REQUIRE(response.starts_with("HTTP/1.1 400 Bad Request\r\n"));
        REQUIRE(response.find("Connection: close\r\n") != std::string::npos);
        REQUIRE(client.closed_by_peer());
    }

    SECTION("oversized head gives 431") {
        ProxyFixture proxy([](control::Config& config) { config.server.max_header_size = 1024; });
        REQUIRE(proxy.started());

        TestClient client(proxy.port());
        REQUIRE(client.send("GET / HTTP/1.1\r\nX-Big: " + std::string(4096, 'a') + "\r\n\r\n"));
        std::string response = client.read_response();

        REQUIRE(response.starts_with("HTTP/1.1 431 "));
    }

    SECTION("connection limit gives 503") {
        ProxyFixture proxy([](control::Config& config) { config.server.max_connections = 1; });
        REQUIRE(proxy.started());

        TestClient first(proxy.port());
        REQUIRE(first.send("GET / HTTP/1.1\r\nHost: localhost\r\n\r\n"));
        REQUIRE(first.read_response() == kUpstreamResponse);

        TestClient second(proxy.port());
        std::string response = second.read_response();
        REQUIRE(response.starts_with("HTTP/1.1 503 Service Unavailable\r\n"));
    }
}

TEST_CASE("Server - Connection close handling", "[server][integration]") {
    ProxyFixture proxy;
    REQUIRE(proxy.started());

    SECTION("client Connection: close") {
        TestClient client(proxy.port());
        REQUIRE(client.send("GET / HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n"));
        REQUIRE(client.read_response() == kUpstreamResponse);
        REQUIRE(client.closed_by_peer());
    }

    SECTION("HTTP/1.0 request") {
        TestClient client(proxy.port());
        REQUIRE(client.send("GET /?auth=t HTTP/1.0\r\n\r\n"));
        REQUIRE(client.read_response() == kUpstreamResponse);
        REQUIRE(client.closed_by_peer());

        auto requests = proxy.upstream().requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].starts_with("GET /?auth=t HTTP/1.0\r\n"));
        REQUIRE(requests[0].find("\r\nHost: " + proxy.upstream().address() + "\r\n") !=
                std::string::npos);
    }
}

TEST_CASE("Server - Expect: 100-continue", "[server][integration]") {
    ProxyFixture proxy;
    REQUIRE(proxy.started());

    TestClient client(proxy.port());
    REQUIRE(client.connected());

    SECTION("JSON body is requested before it is read") {
        std::string json = R"({"auth":"late"})";
        REQUIRE(client.send("POST /api/v3/post HTTP/1.1\r\nHost: localhost\r\n"
                            "Content-Type: application/json\r\nExpect: 100-continue\r\n"
                            "Content-Length: " + std::to_string(json.size()) + "\r\n\r\n"));
        REQUIRE(client.read_response() == "HTTP/1.1 100 Continue\r\n\r\n");

        REQUIRE(client.send(json));
        REQUIRE(client.read_response() == kUpstreamResponse);

        auto requests = proxy.upstream().requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].find("\r\nAuthorization: Bearer late\r\n") != std::string::npos);
        REQUIRE(requests[0].ends_with("\r\n\r\n" + json));
    }

    SECTION("streamed body is requested once the upstream exchange starts") {
        REQUIRE(client.send("PUT /upload?auth=q HTTP/1.1\r\nHost: localhost\r\n"
                            "Expect: 100-continue\r\nContent-Length: 5\r\n\r\n"));
        REQUIRE(client.read_response() == "HTTP/1.1 100 Continue\r\n\r\n");

        REQUIRE(client.send("hello"));
        REQUIRE(client.read_response() == kUpstreamResponse);

        auto requests = proxy.upstream().requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].find("\r\nExpect: 100-continue\r\n") != std::string::npos);
        REQUIRE(requests[0].ends_with("\r\n\r\nhello"));
    }
}
