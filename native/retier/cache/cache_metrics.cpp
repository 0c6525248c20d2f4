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

#include "cache/cache_metrics.h"
#include <nlohmann/json.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace retier {
namespace cache {

// Helper to format ISO 8601 timestamp
static std::string formatISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

//============================================================================
// Pattern Compilation Cache Metrics
//============================================================================

double PatternCacheMetrics::hit_rate() const {
    uint64_t h = hits.load();
    uint64_t m = misses.load();
    return (h + m) > 0 ? (100.0 * h) / (h + m) : 0.0;
}

std::string PatternCacheMetrics::toJson() const {
    json j;

    // Hit/Miss
    j["hits"] = hits.load();
    j["waits"] = waits.load();
    j["misses"] = misses.load();
    j["hit_rate"] = hit_rate();

    // Errors
    j["compilation_errors"] = compilation_errors.load();

    // Evictions
    json evictions;
    evictions["lru"] = lru_evictions.load();
    evictions["lru_bytes_freed"] = lru_evictions_bytes_freed.load();
    j["evictions"] = evictions;

    // Capacity (snapshot)
    json capacity;
    capacity["entry_count"] = current_entry_count;
    capacity["actual_bytes"] = actual_size_bytes;
    capacity["max_entries"] = max_entries;
    j["capacity"] = capacity;

    // Implementation info
    j["using_tbb"] = using_tbb;

    return j.dump();
}

//============================================================================
// Compiler Metrics
//============================================================================

void CompilerMetrics::recordAttempt(EngineTier tier) {
    attempts[tierIndex(tier)].fetch_add(1, std::memory_order_relaxed);
}

void CompilerMetrics::recordSuccess(EngineTier tier) {
    successes[tierIndex(tier)].fetch_add(1, std::memory_order_relaxed);
}

void CompilerMetrics::recordFailure(EngineTier tier, EngineErrorKind kind) {
    failures[tierIndex(tier)].fetch_add(1, std::memory_order_relaxed);
    failures_by_kind[static_cast<size_t>(kind)].fetch_add(1, std::memory_order_relaxed);
}

std::string CompilerMetrics::toJson() const {
    json j;

    json tiers;
    for (EngineTier tier : kTierPriority) {
        size_t i = tierIndex(tier);
        json t;
        t["attempts"] = attempts[i].load();
        t["successes"] = successes[i].load();
        t["failures"] = failures[i].load();
        tiers[std::string(tierName(tier))] = t;
    }
    j["tiers"] = tiers;

    json kinds;
    for (EngineErrorKind kind : {EngineErrorKind::Syntax, EngineErrorKind::Unsupported,
                                 EngineErrorKind::ResourceLimit, EngineErrorKind::Unavailable}) {
        kinds[std::string(errorKindName(kind))] = failures_by_kind[static_cast<size_t>(kind)].load();
    }
    j["failures_by_kind"] = kinds;

    j["exhausted"] = exhausted.load();

    return j.dump();
}

//============================================================================
// Combined Metrics
//============================================================================

std::string CacheMetrics::toJson() const {
    json j;

    // Parse each component's JSON and insert into main object
    j["pattern_cache"] = json::parse(pattern_cache.toJson());
    j["compiler"] = json::parse(compiler.toJson());

    // Timestamp
    j["generated_at"] = formatISO8601(generated_at);

    return j.dump(2);  // Pretty-print with 2-space indent
}

}  // namespace cache
}  // namespace retier
