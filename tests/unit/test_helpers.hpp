// Authbridge Unit Tests - Loopback HTTP helpers
// A scripted upstream server and a minimal blocking client, both on 127.0.0.1

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <functional>
#include <list>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../../src/core/socket.hpp"
#include "../../src/http/parser.hpp"

namespace authbridge::testing {

inline std::span<const uint8_t> as_bytes(std::string_view data) {
    return {reinterpret_cast<const uint8_t*>(data.data()), data.size()};
}

/// Upstream stand-in: records each raw request and answers with handler(raw)
/// An empty handler result closes the connection without answering.
class MockUpstream {
public:
    using Handler = std::function<std::string(const std::string& raw_request)>;

    explicit MockUpstream(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = core::create_listening_socket("127.0.0.1", 0, 64);
        port_ = core::get_bound_port(listen_fd_);
        running_ = true;
        accept_thread_ = std::thread([this] { accept_loop(); });
    }

    ~MockUpstream() {
        running_ = false;
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int fd : connection_fds_) {
                shutdown(fd, SHUT_RDWR);
            }
        }
        for (auto& thread : connection_threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        core::close_fd(listen_fd_);
    }

    MockUpstream(const MockUpstream&) = delete;
    MockUpstream& operator=(const MockUpstream&) = delete;

    [[nodiscard]] bool listening() const noexcept { return listen_fd_ >= 0; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] std::string address() const { return "127.0.0.1:" + std::to_string(port_); }

    [[nodiscard]] std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] size_t connections_accepted() const noexcept { return accepted_; }

private:
    void accept_loop() {
        while (running_) {
            pollfd pfd{};
            pfd.fd = listen_fd_;
            pfd.events = POLLIN;
            if (poll(&pfd, 1, 20) <= 0) {
                continue;
            }

            int fd = accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (fd < 0) {
                continue;
            }
            ++accepted_;

            std::lock_guard<std::mutex> lock(mutex_);
            connection_fds_.push_back(fd);
            connection_threads_.emplace_back([this, fd] { serve(fd); });
        }
    }

    void serve(int fd) {
        http::Parser parser(HTTP_REQUEST);
        std::string pending;  // Unparsed bytes
        std::string raw;      // Bytes of the current request
        char buffer[8192];

        bool open = true;
        while (open) {
            ssize_t n = core::recv_some(fd, buffer, sizeof(buffer));
            if (n <= 0) {
                break;
            }
            pending.append(buffer, static_cast<size_t>(n));

            while (!pending.empty()) {
                auto [result, consumed] = parser.execute(as_bytes(pending));
                raw.append(pending, 0, consumed);
                pending.erase(0, consumed);

                if (result == http::ParseResult::Error) {
                    open = false;
                    break;
                }
                if (result != http::ParseResult::Complete) {
                    break;
                }

                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    requests_.push_back(raw);
                }
                std::string response = handler_(raw);
                raw.clear();
                parser.next_message();

                if (response.empty() || core::send_all(fd, response) ||
                    response.find("Connection: close") != std::string::npos) {
                    open = false;
                    break;
                }
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::erase(connection_fds_, fd);
        }
        core::close_fd(fd);
    }

    Handler handler_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<size_t> accepted_{0};
    std::thread accept_thread_;

    mutable std::mutex mutex_;
    std::vector<std::string> requests_;
    std::vector<int> connection_fds_;
    std::list<std::thread> connection_threads_;
};

/// Port on 127.0.0.1 that refuses connections (bound once, then released)
inline uint16_t closed_port() {
    int fd = core::create_listening_socket("127.0.0.1", 0, 1);
    uint16_t port = core::get_bound_port(fd);
    core::close_fd(fd);
    return port;
}

/// Blocking loopback client
class TestClient {
public:
    explicit TestClient(uint16_t port) {
        fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        connected_ = ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
        (void)core::set_io_timeout(fd_, 5000);
    }

    ~TestClient() { core::close_fd(fd_); }

    TestClient(const TestClient&) = delete;
    TestClient& operator=(const TestClient&) = delete;

    [[nodiscard]] bool connected() const noexcept { return connected_; }

    [[nodiscard]] bool send(std::string_view data) { return !core::send_all(fd_, data); }

    /// Read one complete response ("" if the connection closed or timed out first)
    [[nodiscard]] std::string read_response(bool head_request = false) {
        http::Parser parser(HTTP_RESPONSE);
        parser.set_head_response(head_request);

        std::string raw;
        for (;;) {
            if (!pending_.empty()) {
                auto [result, consumed] = parser.execute(as_bytes(pending_));
                raw.append(pending_, 0, consumed);
                pending_.erase(0, consumed);
                if (result == http::ParseResult::Complete) {
                    return raw;
                }
                if (result == http::ParseResult::Error) {
                    return "";
                }
            }

            char buffer[8192];
            ssize_t n = core::recv_some(fd_, buffer, sizeof(buffer));
            if (n == 0) {
                return parser.finish() == http::ParseResult::Complete ? raw : "";
            }
            if (n < 0) {
                return "";
            }
            pending_.append(buffer, static_cast<size_t>(n));
        }
    }

    /// Half-close: the server sees EOF on its read side
    void shutdown_write() { shutdown(fd_, SHUT_WR); }

    /// True once the server closed the connection (no further bytes)
    [[nodiscard]] bool closed_by_peer() {
        char byte;
        ssize_t n = core::recv_some(fd_, &byte, 1);
        return n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK);
    }

private:
    int fd_ = -1;
    bool connected_ = false;
    std::string pending_;
};

/// Body of a raw HTTP response (bytes after the blank line)
inline std::string response_body(const std::string& raw) {
    size_t pos = raw.find("\r\n\r\n");
    return pos == std::string::npos ? std::string() : raw.substr(pos + 4);
}

}  // namespace authbridge::testing
