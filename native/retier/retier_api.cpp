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

#include "retier_api.h"
#include "cache/cache_metrics.h"
#include <re2/re2.h>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace retier {
namespace api {

//============================================================================
// Global State (lazily created on first use, or explicitly via initCache)
//============================================================================

static std::shared_ptr<cache::CacheManager> g_cache_manager;
static std::mutex g_init_mutex;

static std::shared_ptr<cache::CacheManager> acquireManager() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (!g_cache_manager) {
        g_cache_manager = std::make_shared<cache::CacheManager>(cache::CacheConfig::defaults());
    }
    return g_cache_manager;
}

//============================================================================
// Compilation
//============================================================================

Pattern compile(const std::string& pattern, const Config& config) {
    return compile(*acquireManager(), pattern, config);
}

Pattern compile(cache::CacheManager& manager, const std::string& pattern, const Config& config) {
    return Pattern(manager.getOrCompile(pattern, config));
}

Pattern compileCustom(const std::string& pattern, const Config& config,
                      std::optional<EngineTier> override_tier) {
    return compileCustom(*acquireManager(), pattern, config, override_tier);
}

Pattern compileCustom(cache::CacheManager& manager, const std::string& pattern,
                      const Config& config, std::optional<EngineTier> override_tier) {
    return Pattern(manager.getOrCompile(pattern, config, override_tier));
}

//============================================================================
// One-shot matching
//============================================================================

bool isMatch(const std::string& pattern, std::string_view text, const Config& config) {
    return compile(pattern, config).isMatch(text);
}

bool isSearch(const std::string& pattern, std::string_view text, const Config& config) {
    return compile(pattern, config).isSearch(text);
}

std::optional<Match> match(const std::string& pattern, std::string_view text, const Config& config) {
    return compile(pattern, config).match(text);
}

std::optional<Match> search(const std::string& pattern, std::string_view text, const Config& config) {
    return compile(pattern, config).search(text);
}

std::vector<std::string> findall(const std::string& pattern, std::string_view text, const Config& config) {
    return compile(pattern, config).findall(text);
}

std::vector<std::string> split(const std::string& pattern, std::string_view text, const Config& config) {
    return compile(pattern, config).split(text);
}

std::string sub(const std::string& pattern, std::string_view repl, std::string_view text,
                const Config& config) {
    return compile(pattern, config).sub(repl, text);
}

//============================================================================
// Utilities
//============================================================================

std::string escape(std::string_view text) {
    // RE2::QuoteMeta is thread-safe, stateless
    return RE2::QuoteMeta(re2::StringPiece(text.data(), text.size()));
}

//============================================================================
// Cache lifecycle
//============================================================================

void initCache(const std::string& json_config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_cache_manager) {
        throw std::runtime_error("Cache already initialized");
    }

    // Parse config (empty = defaults)
    cache::CacheConfig config = cache::CacheConfig::fromJson(json_config);
    g_cache_manager = std::make_shared<cache::CacheManager>(config);
}

void shutdownCache() {
    std::shared_ptr<cache::CacheManager> mgr;
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        mgr.swap(g_cache_manager);
    }
    // Destroyed here (outside the lock) once in-flight users release it
}

bool isCacheInitialized() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    return g_cache_manager != nullptr;
}

std::string getMetricsJSON() {
    std::shared_ptr<cache::CacheManager> mgr;
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        mgr = g_cache_manager;
    }

    if (!mgr) {
        // Cache not initialized - return empty metrics
        cache::CacheMetrics empty;
        empty.generated_at = std::chrono::system_clock::now();
        return empty.toJson();
    }

    return mgr->getMetricsJSON();
}

}  // namespace api
}  // namespace retier
