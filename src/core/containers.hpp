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

// Authbridge Core - Container Aliases

#pragma once

#include <ankerl/unordered_dense.h>

namespace authbridge::core {

// Hash containers backed by ankerl::unordered_dense (dense storage, vector-like
// iterator invalidation on insertion)
//
// Usage:
//   authbridge::core::fast_map<std::string, std::vector<ResolvedAddress>> dns_cache;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace authbridge::core
