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

// Authbridge Forwarder - Header
// One request/response exchange with the upstream: serialize the (rewritten) request,
// stream its body, relay the response bytes to the client verbatim

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include "../http/http.hpp"
#include "body.hpp"
#include "upstream.hpp"

namespace authbridge::gateway {

/// Prefix of the 502 body sent when the upstream exchange fails
inline constexpr std::string_view kUpstreamFailedPrefix = "Upstream failed to respond: ";

/// Build the 502 text for a transport failure reason
[[nodiscard]] std::string upstream_failure_message(std::string_view reason);

/// Destination of relayed response bytes (the client connection)
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    /// Write all bytes or fail
    [[nodiscard]] virtual std::error_code write(std::string_view data) = 0;
};

/// How an exchange ended
enum class ForwardOutcome : uint8_t {
    Relayed,            // Complete response relayed
    UpstreamFailed,     // Connect, send, read or response parse failure
    ClientBodyFailed,   // Reading the client's request body failed
    ClientWriteFailed   // Writing the response to the client failed
};

struct ForwardResult {
    ForwardOutcome outcome = ForwardOutcome::Relayed;
    std::string reason;           // Failure description (empty when Relayed)
    uint64_t bytes_relayed = 0;   // Response bytes already written to the sink
    uint16_t status_code = 0;     // Final response status (0 if none was parsed)
    bool keep_alive = false;      // Response permits another exchange on the client connection

    [[nodiscard]] bool ok() const noexcept { return outcome == ForwardOutcome::Relayed; }
};

/// Request forwarder (one instance per process, thread-safe through Upstream)
class Forwarder {
public:
    explicit Forwarder(Upstream& upstream) : upstream_(upstream) {}

    /// Forward one request with 'headers' replacing the request's own header list
    /// Never throws for transport failures; they are reported through ForwardResult
    [[nodiscard]] ForwardResult forward(const http::Request& request,
                                        const http::HeaderList& headers, Body& body,
                                        ResponseSink& sink);

    /// Serialize the request line and header block sent upstream
    /// Header order and values are preserved; Host is added only if absent
    [[nodiscard]] static std::string build_request_head(const http::Request& request,
                                                        const http::HeaderList& headers,
                                                        std::string_view default_host);

private:
    Upstream& upstream_;
};

}  // namespace authbridge::gateway
