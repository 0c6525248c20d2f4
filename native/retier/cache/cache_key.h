/*
 * Copyright 2025 AxonOps
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

#pragma once

#include "cache/murmur_hash3.h"
#include "config.h"
#include "engine_tier.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace retier {
namespace cache {

/**
 * Identity of a compiled artifact: (pattern, config, override).
 *
 * The override is part of the key so a forced tier never aliases the
 * auto-selected entry for the same pattern and config.
 */
struct CacheKey {
    std::string pattern;
    Config config;
    std::optional<EngineTier> override_tier;

    uint64_t hash() const {
        uint64_t h = hash::hashString(pattern) ^ config.hash();
        if (override_tier) {
            h ^= (static_cast<uint64_t>(tierIndex(*override_tier)) + 1) * 0x9e3779b97f4a7c15ULL;
        }
        return h;
    }

    bool operator==(const CacheKey& other) const = default;
};

/**
 * std::unordered_map hasher.
 */
struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const {
        return static_cast<size_t>(key.hash());
    }
};

/**
 * tbb::concurrent_hash_map HashCompare.
 */
struct CacheKeyHashCompare {
    static size_t hash(const CacheKey& key) {
        return static_cast<size_t>(key.hash());
    }
    static bool equal(const CacheKey& a, const CacheKey& b) {
        return a == b;
    }
};

}  // namespace cache
}  // namespace retier
