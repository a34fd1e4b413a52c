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

// Authbridge Gateway - Request Body Streams Implementation

#include "body.hpp"

namespace authbridge::gateway {

BodyRead BufferedBody::read(std::string& chunk) {
    chunk.clear();
    if (drained_) {
        return BodyRead::End;
    }
    drained_ = true;
    if (bytes_.empty()) {
        return BodyRead::End;
    }
    chunk = std::move(bytes_);
    bytes_.clear();
    return BodyRead::Data;
}

BodyRead PrefixedBody::read(std::string& chunk) {
    if (!prefix_sent_) {
        prefix_sent_ = true;
        if (!prefix_.empty()) {
            chunk = std::move(prefix_);
            prefix_.clear();
            return BodyRead::Data;
        }
    }

    if (!rest_) {
        chunk.clear();
        return BodyRead::End;
    }
    return rest_->read(chunk);
}

std::string_view PrefixedBody::error() const noexcept {
    return rest_ ? rest_->error() : std::string_view{};
}

ReadAllStatus read_all(Body& body, std::string& out, uint64_t max_size) {
    std::string chunk;
    for (;;) {
        switch (body.read(chunk)) {
            case BodyRead::Data:
                out += chunk;
                if (max_size > 0 && out.size() > max_size) {
                    return ReadAllStatus::LimitExceeded;
                }
                break;
            case BodyRead::End:
                return ReadAllStatus::Complete;
            case BodyRead::Error:
                return ReadAllStatus::Failed;
        }
    }
}

}  // namespace authbridge::gateway
