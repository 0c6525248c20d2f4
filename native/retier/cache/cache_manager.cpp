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

#include "cache/cache_manager.h"
#include "logging.h"
#include <utility>

namespace retier {
namespace cache {

CacheManager::CacheManager(const CacheConfig& config, engine::EngineRegistry registry)
    : config_(config),
      registry_(std::move(registry)),
      compiler_(registry_),
      pattern_cache_(config_, compiler_) {

    config_.validate();
    log::setLevel(config_.log_level);

    log::logger()->debug("Cache manager created: {}", config_.toJson());
}

CacheManager::~CacheManager() {
    pattern_cache_.clear();
}

std::shared_ptr<const CompiledPattern> CacheManager::getOrCompile(
    const std::string& pattern,
    const Config& config,
    std::optional<EngineTier> override_tier) {

    CompileFailure failure;
    auto compiled = tryGetOrCompile(pattern, config, override_tier, failure);
    if (!compiled) {
        throwCompileError(failure);
    }
    return compiled;
}

std::shared_ptr<const CompiledPattern> CacheManager::tryGetOrCompile(
    const std::string& pattern,
    const Config& config,
    std::optional<EngineTier> override_tier,
    CompileFailure& failure) {

    config.validate();

    if (!config_.cache_enabled) {
        // NO CACHE - compile directly, nothing stored
        metrics_.pattern_cache.misses.fetch_add(1);
        auto compiled = compiler_.compile(pattern, config, override_tier, metrics_.compiler, failure);
        if (!compiled) {
            metrics_.pattern_cache.compilation_errors.fetch_add(1);
        }
        return compiled;
    }

    CacheKey key{pattern, config, override_tier};
    return pattern_cache_.getOrCompile(key, metrics_.pattern_cache, metrics_.compiler, failure);
}

std::string CacheManager::getMetricsJSON() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);

    pattern_cache_.snapshotMetrics(metrics_.pattern_cache);
    metrics_.generated_at = std::chrono::system_clock::now();

    return metrics_.toJson();
}

void CacheManager::clearAllCaches() {
    pattern_cache_.clear();
}

}  // namespace cache
}  // namespace retier
