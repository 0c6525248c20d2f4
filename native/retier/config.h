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
#include <cstdint>
#include <optional>
#include <string>

namespace retier {

/**
 * Pattern compilation and execution options, shared by all engine tiers.
 *
 * Used for:
 * 1. Configuring whichever engine tier compiles the pattern
 * 2. Cache key generation (different options = different cache entry)
 * 3. JSON serialization
 *
 * Treated as an immutable value: two Configs with equal fields are
 * interchangeable for caching.
 */
struct Config {
    // ========== MATCHING MODES ==========
    bool case_insensitive = false;   // (?i)
    bool ignore_whitespace = false;  // (?x) - not available on the linear tier
    bool multiline = false;          // ^ and $ match at line boundaries
    bool unicode_mode = true;        // UTF-8 code points; false = byte semantics

    // ========== LIMITS ==========
    std::optional<size_t> size_limit;      // compiled program size bound (bytes)
    size_t dfa_size_limit = 10000000;      // automaton cache budget (linear tier)
    std::optional<size_t> backtrack_limit; // backtracking step bound (backtracking tiers)

    /**
     * Default options (equivalent to a default-constructed Config).
     */
    static Config defaults();

    /**
     * Parse options from JSON string.
     *
     * JSON format (all fields optional, null = not set for optional limits):
     * {
     *   "case_insensitive": false,
     *   "ignore_whitespace": false,
     *   "multiline": false,
     *   "unicode_mode": true,
     *   "size_limit": null,
     *   "dfa_size_limit": 10000000,
     *   "backtrack_limit": null
     * }
     *
     * Empty string returns defaults().
     *
     * @param json JSON string with options
     * @return validated Config
     * @throws std::runtime_error if JSON invalid
     * @throws std::invalid_argument if a limit is invalid
     */
    static Config fromJson(const std::string& json);

    /**
     * Serialize to JSON (compact).
     */
    std::string toJson() const;

    /**
     * Validate limits.
     *
     * @throws std::invalid_argument if dfa_size_limit is 0, or an optional
     *         limit is set to 0
     */
    void validate() const;

    /**
     * Hash of all fields, for cache keys. Equal Configs hash equal.
     */
    uint64_t hash() const;

    bool operator==(const Config& other) const = default;
};

}  // namespace retier
