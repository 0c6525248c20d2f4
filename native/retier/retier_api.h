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

#include "cache/cache_manager.h"
#include "config.h"
#include "engine_tier.h"
#include "errors.h"
#include "match.h"
#include "pattern.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace retier {
namespace api {

//============================================================================
// Compilation
//============================================================================

/**
 * Compile pattern, selecting the fastest tier that accepts it.
 *
 * Uses the process-wide cache (created with defaults on first use unless
 * initCache() ran first). Repeated calls with the same pattern and config
 * return handles over the same compiled pattern.
 *
 * @throws CompileError if no tier accepts the pattern
 * @throws ResourceLimitExceeded if the last failure was a size limit
 * @throws std::invalid_argument if config is invalid
 */
Pattern compile(const std::string& pattern, const Config& config = Config::defaults());
Pattern compile(cache::CacheManager& manager, const std::string& pattern,
                const Config& config = Config::defaults());

/**
 * Compile pattern, optionally forcing one tier. A forced tier that fails is
 * terminal (no fallback).
 */
Pattern compileCustom(const std::string& pattern, const Config& config,
                      std::optional<EngineTier> override_tier);
Pattern compileCustom(cache::CacheManager& manager, const std::string& pattern,
                      const Config& config, std::optional<EngineTier> override_tier);

//============================================================================
// One-shot matching (compiled through the shared cache)
//============================================================================

bool isMatch(const std::string& pattern, std::string_view text, const Config& config = Config::defaults());
bool isSearch(const std::string& pattern, std::string_view text, const Config& config = Config::defaults());
std::optional<Match> match(const std::string& pattern, std::string_view text,
                           const Config& config = Config::defaults());
std::optional<Match> search(const std::string& pattern, std::string_view text,
                            const Config& config = Config::defaults());
std::vector<std::string> findall(const std::string& pattern, std::string_view text,
                                 const Config& config = Config::defaults());
std::vector<std::string> split(const std::string& pattern, std::string_view text,
                               const Config& config = Config::defaults());
std::string sub(const std::string& pattern, std::string_view repl, std::string_view text,
                const Config& config = Config::defaults());

//============================================================================
// Utilities
//============================================================================

/**
 * Escape regex metacharacters so text matches literally. The result never
 * needs more than the linear tier.
 */
std::string escape(std::string_view text);

//============================================================================
// Cache lifecycle
//============================================================================

/**
 * Create the process-wide cache from JSON configuration (empty = defaults).
 *
 * @throws std::runtime_error if already initialized or JSON invalid
 * @throws std::invalid_argument if configuration invalid
 */
void initCache(const std::string& json_config);

/**
 * Destroy the process-wide cache. Patterns already handed out stay valid.
 * The next compile creates a fresh default cache.
 */
void shutdownCache();

bool isCacheInitialized();

/**
 * Metrics of the process-wide cache (empty metrics if not initialized).
 */
std::string getMetricsJSON();

}  // namespace api
}  // namespace retier
