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

#include <cstddef>
#include <string>

namespace retier {
namespace cache {

/**
 * Configuration for pattern compilation caching.
 *
 * All parameters configurable via JSON.
 */
struct CacheConfig {
    // Global - false compiles on every request without storing
    bool cache_enabled = true;

    // Pattern Compilation Cache
    size_t pattern_cache_max_entries = 0;       // 0 = unbounded
    bool pattern_cache_use_tbb = false;         // Use TBB concurrent_hash_map
    size_t pattern_cache_lru_batch_size = 100;  // Entries evicted per LRU pass

    // Logging
    std::string log_level = "warn";

    static CacheConfig defaults();

    /**
     * Parse configuration from JSON string. Missing fields take defaults;
     * empty string returns defaults().
     *
     * @param json JSON configuration string
     * @return parsed configuration with defaults applied
     * @throws std::runtime_error if JSON invalid
     * @throws std::invalid_argument if validation fails
     */
    static CacheConfig fromJson(const std::string& json);

    /**
     * Validate configuration parameters.
     *
     * @throws std::invalid_argument if configuration invalid
     */
    void validate() const;

    /**
     * Serialize configuration to JSON (for debugging).
     *
     * @return JSON string
     */
    std::string toJson() const;
};

}  // namespace cache
}  // namespace retier
