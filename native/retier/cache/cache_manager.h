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
#include "cache/cache_metrics.h"
#include "cache/pattern_cache.h"
#include "compiled_pattern.h"
#include "engine/engine_registry.h"
#include "tiered_compiler.h"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace retier {
namespace cache {

/**
 * Cache Manager - owns everything needed to turn a pattern into a shared
 * CompiledPattern.
 *
 * Provides single entry point for:
 * - Engine registry (which engine backs each tier)
 * - Tiered compiler
 * - Pattern Compilation Cache
 * - Metrics
 *
 * Explicitly constructed and injectable; the module API wraps one
 * process-wide instance. Independent instances share nothing.
 */
class CacheManager {
public:
    explicit CacheManager(
        const CacheConfig& config,
        engine::EngineRegistry registry = engine::EngineRegistry::defaults());
    ~CacheManager();

    // Disable copy/move
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    /**
     * Compile (or fetch) a pattern.
     *
     * @throws std::invalid_argument if config is invalid
     * @throws CompileError / ResourceLimitExceeded if no tier accepts the pattern
     */
    std::shared_ptr<const CompiledPattern> getOrCompile(
        const std::string& pattern,
        const Config& config,
        std::optional<EngineTier> override_tier = std::nullopt);

    /**
     * As getOrCompile, but compile failures are returned as data.
     *
     * @return compiled pattern, or nullptr with failure filled in
     * @throws std::invalid_argument if config is invalid
     */
    std::shared_ptr<const CompiledPattern> tryGetOrCompile(
        const std::string& pattern,
        const Config& config,
        std::optional<EngineTier> override_tier,
        CompileFailure& failure);

    /**
     * Get current metrics snapshot.
     *
     * @return JSON string with all metrics
     */
    std::string getMetricsJSON() const;

    /**
     * Clear all caches (for testing or reset).
     */
    void clearAllCaches();

    const CacheConfig& config() const { return config_; }
    const engine::EngineRegistry& registry() const { return registry_; }

    // Accessors (for testing and direct use)
    PatternCache& patternCache() { return pattern_cache_; }
    CacheMetrics& metrics() { return metrics_; }

private:
    CacheConfig config_;
    engine::EngineRegistry registry_;
    TieredCompiler compiler_;

    // Counters are atomic; snapshot fields are written under snapshot_mutex_
    mutable CacheMetrics metrics_;
    mutable std::mutex snapshot_mutex_;

    // Initialized last, references config_ and compiler_
    PatternCache pattern_cache_;
};

}  // namespace cache
}  // namespace retier
