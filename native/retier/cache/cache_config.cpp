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

#include "cache/cache_config.h"
#include "logging.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <sstream>

using json = nlohmann::json;

namespace retier {
namespace cache {

CacheConfig CacheConfig::defaults() {
    return CacheConfig{};
}

CacheConfig CacheConfig::fromJson(const std::string& json_str) {
    CacheConfig config;

    if (json_str.empty()) {
        return config;
    }

    try {
        json j = json::parse(json_str);

        // Global caching
        config.cache_enabled = j.value("cache_enabled", config.cache_enabled);

        // Pattern Compilation Cache
        config.pattern_cache_max_entries =
            j.value("pattern_cache_max_entries", config.pattern_cache_max_entries);
        config.pattern_cache_use_tbb = j.value("pattern_cache_use_tbb", config.pattern_cache_use_tbb);
        config.pattern_cache_lru_batch_size =
            j.value("pattern_cache_lru_batch_size", config.pattern_cache_lru_batch_size);

        // Logging
        config.log_level = j.value("log_level", config.log_level);

    } catch (const json::parse_error& e) {
        std::ostringstream msg;
        msg << "Failed to parse cache configuration JSON: " << e.what();
        throw std::runtime_error(msg.str());
    } catch (const json::type_error& e) {
        std::ostringstream msg;
        msg << "Invalid type in cache configuration JSON: " << e.what();
        throw std::runtime_error(msg.str());
    }

    config.validate();
    return config;
}

void CacheConfig::validate() const {
    if (!log::isValidLevel(log_level)) {
        throw std::invalid_argument("log_level must be one of trace, debug, info, warn, error, critical, off");
    }

    // If cache disabled, skip cache checks
    if (!cache_enabled) {
        return;
    }

    if (pattern_cache_lru_batch_size == 0) {
        throw std::invalid_argument(
            "pattern_cache_lru_batch_size must be > 0");
    }
}

std::string CacheConfig::toJson() const {
    json j;

    // Global
    j["cache_enabled"] = cache_enabled;

    // Pattern Compilation Cache
    j["pattern_cache_max_entries"] = pattern_cache_max_entries;
    j["pattern_cache_use_tbb"] = pattern_cache_use_tbb;
    j["pattern_cache_lru_batch_size"] = pattern_cache_lru_batch_size;

    // Logging
    j["log_level"] = log_level;

    return j.dump(2);  // Pretty-print with 2-space indent
}

}  // namespace cache
}  // namespace retier
