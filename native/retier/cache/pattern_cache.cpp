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

#include "cache/pattern_cache.h"
#include "logging.h"
#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <vector>

namespace retier {
namespace cache {

namespace {

int64_t nowTicks() {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

}  // namespace

//============================================================================
// Entry
//============================================================================

PatternCache::PatternCacheEntry::PatternCacheEntry()
    : outcome(promise.get_future().share()),
      last_access(nowTicks()) {}

void PatternCache::PatternCacheEntry::touch() {
    last_access.store(nowTicks(), std::memory_order_relaxed);
}

//============================================================================
// Constructor / Destructor
//============================================================================

PatternCache::PatternCache(const CacheConfig& config, const TieredCompiler& compiler)
    : config_(config),
      compiler_(compiler),
      using_tbb_(config.pattern_cache_use_tbb) {
    // Both implementations always present (zero overhead when not used)
}

PatternCache::~PatternCache() {
    clear();
}

//============================================================================
// Public API (Dispatches to std or TBB implementation)
//============================================================================

std::shared_ptr<const CompiledPattern> PatternCache::getOrCompile(
    const CacheKey& key,
    PatternCacheMetrics& metrics,
    CompilerMetrics& compiler_metrics,
    CompileFailure& failure) {

    bool owner = false;
    EntryPtr entry = using_tbb_ ? findOrInsertTBB(key, owner) : findOrInsertStd(key, owner);

    if (owner) {
        return compileAsOwner(key, entry, metrics, compiler_metrics, failure);
    }

    // CACHE HIT (possibly still compiling)
    metrics.hits.fetch_add(1);
    if (!entry->ready.load(std::memory_order_acquire)) {
        metrics.waits.fetch_add(1);
    }
    entry->touch();
    return awaitEntry(entry, failure);
}

void PatternCache::clear() {
    if (using_tbb_) {
        std::unique_lock lock(tbb_iteration_mutex_);
        tbb_cache_.clear();
        tbb_total_size_bytes_.store(0);
    } else {
        std::unique_lock lock(std_mutex_);
        std_cache_.clear();
        std_total_size_bytes_ = 0;
    }
}

void PatternCache::snapshotMetrics(PatternCacheMetrics& metrics) const {
    if (using_tbb_) {
        metrics.current_entry_count = tbb_cache_.size();
        metrics.actual_size_bytes = tbb_total_size_bytes_.load();
    } else {
        std::shared_lock lock(std_mutex_);
        metrics.current_entry_count = std_cache_.size();
        metrics.actual_size_bytes = std_total_size_bytes_;
    }

    metrics.max_entries = config_.pattern_cache_max_entries;
    metrics.using_tbb = using_tbb_;
}

size_t PatternCache::size() const {
    if (using_tbb_) {
        return tbb_cache_.size();
    } else {
        std::shared_lock lock(std_mutex_);
        return std_cache_.size();
    }
}

//============================================================================
// Compile / Wait
//============================================================================

std::shared_ptr<const CompiledPattern> PatternCache::compileAsOwner(
    const CacheKey& key,
    const EntryPtr& entry,
    PatternCacheMetrics& metrics,
    CompilerMetrics& compiler_metrics,
    CompileFailure& failure) {

    // CACHE MISS - compile with no lock held (compilation can be slow)
    metrics.misses.fetch_add(1);

    CompileOutcome outcome;
    try {
        outcome.pattern = compiler_.compile(
            key.pattern, key.config, key.override_tier, compiler_metrics, outcome.failure);
    } catch (...) {
        // Remove first so retries do not find a dead entry, then wake waiters
        eraseIfSame(key, entry);
        entry->promise.set_exception(std::current_exception());
        throw;
    }

    if (!outcome.pattern) {
        metrics.compilation_errors.fetch_add(1);
        eraseIfSame(key, entry);
        failure = outcome.failure;
        entry->promise.set_value(std::move(outcome));
        return nullptr;
    }

    std::shared_ptr<const CompiledPattern> pattern = outcome.pattern;
    entry->size_bytes = pattern->approxSizeBytes();
    entry->ready.store(true, std::memory_order_release);
    entry->promise.set_value(std::move(outcome));
    commitSize(key, entry);

    if (config_.pattern_cache_max_entries > 0 && size() > config_.pattern_cache_max_entries) {
        size_t evicted = using_tbb_ ? evictTBB(metrics) : evictStd(metrics);
        if (evicted > 0) {
            log::logger()->debug("Pattern cache evicted {} entries (max {})",
                                 evicted, config_.pattern_cache_max_entries);
        }
    }

    return pattern;
}

std::shared_ptr<const CompiledPattern> PatternCache::awaitEntry(
    const EntryPtr& entry,
    CompileFailure& failure) {

    // Rethrows if the owner's compile threw
    const CompileOutcome& outcome = entry->outcome.get();

    if (!outcome.pattern) {
        failure = outcome.failure;
        return nullptr;
    }
    return outcome.pattern;
}

//============================================================================
// std::unordered_map Implementation
//============================================================================

PatternCache::EntryPtr PatternCache::findOrInsertStd(const CacheKey& key, bool& owner) {
    owner = false;

    // Try cache lookup first (shared lock - allows concurrent reads)
    {
        std::shared_lock lock(std_mutex_);
        auto it = std_cache_.find(key);
        if (it != std_cache_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(std_mutex_);

    // Double-check not added by another thread since the shared lock dropped
    auto it = std_cache_.find(key);
    if (it != std_cache_.end()) {
        return it->second;
    }

    auto entry = std::make_shared<PatternCacheEntry>();
    std_cache_.emplace(key, entry);
    owner = true;
    return entry;
}

size_t PatternCache::evictStd(PatternCacheMetrics& metrics) {
    std::unique_lock lock(std_mutex_);

    size_t evicted = 0;
    const size_t max_entries = config_.pattern_cache_max_entries;

    // LRU eviction (batch eviction for O(n + k log k) performance)
    while (std_cache_.size() > max_entries) {
        // Step 1: Collect completed entries (pending entries are never evicted)
        std::vector<std::unordered_map<CacheKey, EntryPtr, CacheKeyHash>::iterator> candidates;
        for (auto it = std_cache_.begin(); it != std_cache_.end(); ++it) {
            if (it->second->ready.load(std::memory_order_acquire)) {
                candidates.push_back(it);
            }
        }

        if (candidates.empty()) break;  // No evictable entries

        // Step 2: Partial sort to find N oldest (batch_size)
        size_t batch_size = std::min(config_.pattern_cache_lru_batch_size, candidates.size());
        std::partial_sort(candidates.begin(), candidates.begin() + batch_size, candidates.end(),
            [](const auto& a, const auto& b) {
                return a->second->last_access.load(std::memory_order_relaxed) <
                       b->second->last_access.load(std::memory_order_relaxed);
            });

        // Step 3: Evict batch, stopping once back within bound
        for (size_t i = 0; i < batch_size && std_cache_.size() > max_entries; i++) {
            size_t freed = candidates[i]->second->size_bytes;
            std_total_size_bytes_ -= std::min(freed, std_total_size_bytes_);
            std_cache_.erase(candidates[i]);

            metrics.lru_evictions.fetch_add(1);
            metrics.lru_evictions_bytes_freed.fetch_add(freed);
            evicted++;
        }
    }

    return evicted;
}

//============================================================================
// TBB concurrent_hash_map Implementation
//============================================================================

PatternCache::EntryPtr PatternCache::findOrInsertTBB(const CacheKey& key, bool& owner) {
    owner = false;
    std::shared_lock guard(tbb_iteration_mutex_);

    // Try cache lookup first (TBB accessor for read)
    {
        TBBMap::const_accessor acc;
        if (tbb_cache_.find(acc, key)) {
            return acc->second;
        }
    }

    // Insert pending entry (TBB accessor for write)
    TBBMap::accessor acc;
    if (tbb_cache_.insert(acc, key)) {
        acc->second = std::make_shared<PatternCacheEntry>();
        owner = true;
    }
    // else another thread inserted first - use theirs
    return acc->second;
}

size_t PatternCache::evictTBB(PatternCacheMetrics& metrics) {
    std::unique_lock guard(tbb_iteration_mutex_);

    size_t evicted = 0;
    const size_t max_entries = config_.pattern_cache_max_entries;

    while (tbb_cache_.size() > max_entries) {
        // Step 1: Collect completed entries
        std::vector<std::pair<int64_t, CacheKey>> candidates;
        for (TBBMap::iterator it = tbb_cache_.begin(); it != tbb_cache_.end(); ++it) {
            if (it->second->ready.load(std::memory_order_acquire)) {
                candidates.emplace_back(it->second->last_access.load(std::memory_order_relaxed), it->first);
            }
        }

        if (candidates.empty()) break;  // No evictable entries

        // Step 2: Partial sort to find N oldest (batch_size)
        size_t batch_size = std::min(config_.pattern_cache_lru_batch_size, candidates.size());
        std::partial_sort(candidates.begin(), candidates.begin() + batch_size, candidates.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

        // Step 3: Evict batch
        for (size_t i = 0; i < batch_size && tbb_cache_.size() > max_entries; i++) {
            TBBMap::accessor acc;
            if (tbb_cache_.find(acc, candidates[i].second)) {
                size_t freed = acc->second->size_bytes;
                tbb_cache_.erase(acc);
                tbb_total_size_bytes_.fetch_sub(std::min(freed, tbb_total_size_bytes_.load()));

                metrics.lru_evictions.fetch_add(1);
                metrics.lru_evictions_bytes_freed.fetch_add(freed);
                evicted++;
            }
        }
    }

    return evicted;
}

//============================================================================
// Helper Methods
//============================================================================

void PatternCache::eraseIfSame(const CacheKey& key, const EntryPtr& entry) {
    if (using_tbb_) {
        std::shared_lock guard(tbb_iteration_mutex_);
        TBBMap::accessor acc;
        if (tbb_cache_.find(acc, key) && acc->second == entry) {
            tbb_cache_.erase(acc);
        }
    } else {
        std::unique_lock lock(std_mutex_);
        auto it = std_cache_.find(key);
        if (it != std_cache_.end() && it->second == entry) {
            std_cache_.erase(it);
        }
    }
}

void PatternCache::commitSize(const CacheKey& key, const EntryPtr& entry) {
    if (using_tbb_) {
        std::shared_lock guard(tbb_iteration_mutex_);
        TBBMap::const_accessor acc;
        if (tbb_cache_.find(acc, key) && acc->second == entry) {
            tbb_total_size_bytes_.fetch_add(entry->size_bytes);
        }
    } else {
        std::unique_lock lock(std_mutex_);
        auto it = std_cache_.find(key);
        if (it != std_cache_.end() && it->second == entry) {
            std_total_size_bytes_ += entry->size_bytes;
        }
    }
}

}  // namespace cache
}  // namespace retier
