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

// Authbridge HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace authbridge::http {

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    return http::find_header(headers, name);
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const Header* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

// Header list helpers

const Header* find_header(const HeaderList& headers, std::string_view name) noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

bool has_header(const HeaderList& headers, std::string_view name) noexcept {
    return find_header(headers, name) != nullptr;
}

bool expects_continue(const Request& request) noexcept {
    if (request.version != Version::HTTP_1_1) {
        return false;
    }
    const Header* expect = request.find_header("Expect");
    return expect && header_name_equals(expect->value, "100-continue");
}

// Synthesized responses

Response make_text_response(StatusCode status, std::string message) {
    Response response;
    response.status = status;
    response.body = std::move(message);
    return response;
}

std::string serialize_response(const Response& response, bool keep_alive) {
    std::string out;
    out.reserve(128 + response.content_type.size() + response.body.size());

    // Status line with reason phrase
    out += "HTTP/1.1 ";
    out += std::to_string(static_cast<int>(response.status));
    out += " ";
    out += to_reason_phrase(response.status);
    out += "\r\n";

    if (!response.content_type.empty()) {
        out += "Content-Type: ";
        out += response.content_type;
        out += "\r\n";
    }

    out += "Content-Length: ";
    out += std::to_string(response.body.size());
    out += "\r\n";

    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += "\r\n";

    out += response.body;
    return out;
}

// Conversion functions

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
            return "HTTP/1.1";
        default:
            return "HTTP/1.1";
    }
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::RequestHeaderFieldsTooLarge:
            return "Request Header Fields Too Large";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

namespace url {

namespace {

int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string decode_form_component(std::string_view str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '+') {
            decoded += ' ';
        } else if (c == '%' && i + 2 < str.size()) {
            int high = hex_digit_value(str[i + 1]);
            int low = hex_digit_value(str[i + 2]);
            if (high < 0 || low < 0) {
                // Not an escape, keep the '%' as-is
                decoded += c;
                continue;
            }
            decoded += static_cast<char>((high << 4) | low);
            i += 2;
        } else {
            decoded += c;
        }
    }

    return decoded;
}

std::vector<std::pair<std::string, std::string>> parse_query(std::string_view query) {
    std::vector<std::pair<std::string, std::string>> params;

    size_t start = 0;
    while (start <= query.size()) {
        size_t amp_pos = query.find('&', start);
        std::string_view pair = (amp_pos == std::string_view::npos)
                                    ? query.substr(start)
                                    : query.substr(start, amp_pos - start);

        if (!pair.empty()) {
            size_t eq_pos = pair.find('=');
            if (eq_pos != std::string_view::npos) {
                params.emplace_back(decode_form_component(pair.substr(0, eq_pos)),
                                    decode_form_component(pair.substr(eq_pos + 1)));
            } else {
                // No value (e.g., "?flag")
                params.emplace_back(decode_form_component(pair), std::string());
            }
        }

        if (amp_pos == std::string_view::npos) {
            break;
        }
        start = amp_pos + 1;
    }

    return params;
}

std::optional<std::string> find_query_param(std::string_view query, std::string_view name) {
    for (auto& [key, value] : parse_query(query)) {
        if (key == name) {
            return std::move(value);
        }
    }
    return std::nullopt;
}

}  // namespace url

}  // namespace authbridge::http
