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

#include "engine_tier.h"
#include "errors.h"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace retier {
namespace cache {

/**
 * Metrics for Pattern Compilation Cache.
 */
struct PatternCacheMetrics {
    // Hit/Miss (reuse efficiency)
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> waits{0};   // hits that blocked on an in-flight compile
    std::atomic<uint64_t> misses{0};

    // Errors (failed compilations, never cached)
    std::atomic<uint64_t> compilation_errors{0};

    // Evictions
    std::atomic<uint64_t> lru_evictions{0};
    std::atomic<uint64_t> lru_evictions_bytes_freed{0};

    // Capacity (snapshot)
    uint64_t current_entry_count = 0;
    uint64_t actual_size_bytes = 0;
    uint64_t max_entries = 0;  // 0 = unbounded

    // Implementation info (snapshot)
    bool using_tbb = false;

    double hit_rate() const;
    std::string toJson() const;
};

/**
 * Metrics for the tiered compiler, per tier.
 */
struct CompilerMetrics {
    std::array<std::atomic<uint64_t>, kTierCount> attempts{};
    std::array<std::atomic<uint64_t>, kTierCount> successes{};
    std::array<std::atomic<uint64_t>, kTierCount> failures{};

    // Failure causes across all tiers, indexed by EngineErrorKind
    std::array<std::atomic<uint64_t>, 4> failures_by_kind{};

    // Compilations where no tier succeeded
    std::atomic<uint64_t> exhausted{0};

    void recordAttempt(EngineTier tier);
    void recordSuccess(EngineTier tier);
    void recordFailure(EngineTier tier, EngineErrorKind kind);

    std::string toJson() const;
};

/**
 * Combined metrics for the compilation cache and the compiler.
 */
struct CacheMetrics {
    PatternCacheMetrics pattern_cache;
    CompilerMetrics compiler;

    std::chrono::system_clock::time_point generated_at;

    /**
     * Serialize all metrics to JSON.
     *
     * @return JSON string with all metrics
     */
    std::string toJson() const;
};

}  // namespace cache
}  // namespace retier
