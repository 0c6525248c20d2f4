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

#include "cache/cache_config.h"
#include "cache/cache_key.h"
#include "cache/cache_metrics.h"
#include "compiled_pattern.h"
#include "errors.h"
#include "tiered_compiler.h"
#include <oneapi/tbb/concurrent_hash_map.h>
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace retier {
namespace cache {

/**
 * Pattern Compilation Cache - compiles each distinct key at most once.
 *
 * Dual implementation:
 * - std::unordered_map + shared_mutex (default, simpler)
 * - TBB concurrent_hash_map (optional, high-concurrency)
 *
 * COMPILE-ONCE INVARIANT:
 * - The first requester inserts a pending entry under the map lock, then
 *   compiles with no lock held
 * - Later requesters for the same key find the pending entry and block on
 *   its shared future
 * - A failed compile is erased from the map BEFORE waiters are released, so
 *   waiters see that failure and later requests retry
 *
 * Optional LRU bound (pattern_cache_max_entries > 0): oldest completed
 * entries are evicted; pending entries are never evicted. Evicted patterns
 * stay valid for anyone still holding them.
 */
class PatternCache {
public:
    PatternCache(const CacheConfig& config, const TieredCompiler& compiler);
    ~PatternCache();

    PatternCache(const PatternCache&) = delete;
    PatternCache& operator=(const PatternCache&) = delete;

    /**
     * Get or compile pattern.
     *
     * Flow:
     * 1. Check cache (hit -> wait for entry if still compiling, return)
     * 2. Insert pending entry, compile outside the lock, publish outcome
     *
     * @param key pattern, config and optional tier override
     * @param metrics cache metrics to update
     * @param compiler_metrics per-tier compiler metrics to update
     * @param failure output parameter describing a failed compilation
     * @return compiled pattern, or nullptr on compile failure
     * @throws anything an engine throws (propagated to owner and waiters)
     */
    std::shared_ptr<const CompiledPattern> getOrCompile(
        const CacheKey& key,
        PatternCacheMetrics& metrics,
        CompilerMetrics& compiler_metrics,
        CompileFailure& failure);

    /**
     * Clear all entries. In-flight compilations still complete for their
     * requesters but are not re-added.
     */
    void clear();

    /**
     * Update snapshot metrics.
     */
    void snapshotMetrics(PatternCacheMetrics& metrics) const;

    /**
     * Get current entry count (including pending entries).
     */
    size_t size() const;

private:
    struct CompileOutcome {
        std::shared_ptr<const CompiledPattern> pattern;
        CompileFailure failure;
    };

    struct PatternCacheEntry {
        std::promise<CompileOutcome> promise;
        std::shared_future<CompileOutcome> outcome;
        std::atomic<bool> ready{false};
        std::atomic<int64_t> last_access;
        size_t size_bytes = 0;  // set once ready

        PatternCacheEntry();
        void touch();
    };

    using EntryPtr = std::shared_ptr<PatternCacheEntry>;

    const CacheConfig& config_;
    const TieredCompiler& compiler_;
    const bool using_tbb_;

    // ========== std::unordered_map Implementation ==========
    std::unordered_map<CacheKey, EntryPtr, CacheKeyHash> std_cache_;
    mutable std::shared_mutex std_mutex_;
    size_t std_total_size_bytes_ = 0;

    // ========== TBB concurrent_hash_map Implementation ==========
    using TBBMap = tbb::concurrent_hash_map<CacheKey, EntryPtr, CacheKeyHashCompare>;
    TBBMap tbb_cache_;
    // Shared for accessor operations, exclusive for iteration (eviction, clear)
    mutable std::shared_mutex tbb_iteration_mutex_;
    std::atomic<size_t> tbb_total_size_bytes_{0};

    // ========== Implementation Methods ==========

    // Find or insert the entry for key; owner = true if this call inserted it
    EntryPtr findOrInsertStd(const CacheKey& key, bool& owner);
    EntryPtr findOrInsertTBB(const CacheKey& key, bool& owner);

    // Erase key only if it still maps to entry
    void eraseIfSame(const CacheKey& key, const EntryPtr& entry);

    // Account size of a completed entry if it is still cached
    void commitSize(const CacheKey& key, const EntryPtr& entry);

    size_t evictStd(PatternCacheMetrics& metrics);
    size_t evictTBB(PatternCacheMetrics& metrics);

    std::shared_ptr<const CompiledPattern> compileAsOwner(
        const CacheKey& key,
        const EntryPtr& entry,
        PatternCacheMetrics& metrics,
        CompilerMetrics& compiler_metrics,
        CompileFailure& failure);

    static std::shared_ptr<const CompiledPattern> awaitEntry(
        const EntryPtr& entry,
        CompileFailure& failure);
};

}  // namespace cache
}  // namespace retier
