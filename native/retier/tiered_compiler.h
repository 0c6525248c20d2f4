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

#include "cache/cache_metrics.h"
#include "compiled_pattern.h"
#include "config.h"
#include "engine/engine_registry.h"
#include "errors.h"
#include "feature_classifier.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace retier {

/**
 * Compiles a pattern with the fastest tier that accepts it.
 *
 * Without an override:
 * - no detected features: LinearAutomaton, JitBacktracking, FallbackBacktracking
 * - detected features:    JitBacktracking, FallbackBacktracking
 * With an override only that tier is attempted.
 *
 * Each tier failure is data and triggers the next tier. A tier with no
 * installed engine fails with Unavailable.
 */
class TieredCompiler {
public:
    explicit TieredCompiler(const engine::EngineRegistry& registry);

    /**
     * Ordered tiers to attempt. Pure function of its inputs.
     */
    static std::vector<EngineTier> plan(
        const Classification& classification,
        std::optional<EngineTier> override_tier);

    /**
     * Compile pattern.
     *
     * @param pattern regex source
     * @param config compile options (already validated)
     * @param override_tier force a single tier
     * @param metrics per-tier counters to update
     * @param failure filled in when nullptr is returned
     * @return compiled pattern, or nullptr if every attempted tier failed
     */
    std::shared_ptr<const CompiledPattern> compile(
        const std::string& pattern,
        const Config& config,
        std::optional<EngineTier> override_tier,
        cache::CompilerMetrics& metrics,
        CompileFailure& failure) const;

private:
    const engine::EngineRegistry& registry_;
};

}  // namespace retier
