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

#include "tiered_compiler.h"
#include "logging.h"

namespace retier {

TieredCompiler::TieredCompiler(const engine::EngineRegistry& registry)
    : registry_(registry) {}

std::vector<EngineTier> TieredCompiler::plan(
    const Classification& classification,
    std::optional<EngineTier> override_tier) {

    if (override_tier) {
        return {*override_tier};
    }
    if (classification.linearCompatible()) {
        return {EngineTier::LinearAutomaton, EngineTier::JitBacktracking, EngineTier::FallbackBacktracking};
    }
    return {EngineTier::JitBacktracking, EngineTier::FallbackBacktracking};
}

std::shared_ptr<const CompiledPattern> TieredCompiler::compile(
    const std::string& pattern,
    const Config& config,
    std::optional<EngineTier> override_tier,
    cache::CompilerMetrics& metrics,
    CompileFailure& failure) const {

    Classification classification;
    if (!override_tier) {
        classification = classify(pattern, config.ignore_whitespace);
        if (!classification.linearCompatible()) {
            log::logger()->debug("Pattern '{}' needs a backtracking tier ({})",
                                 pattern, describeFeatures(classification.features));
        }
    }

    failure = CompileFailure{};

    for (EngineTier tier : plan(classification, override_tier)) {
        metrics.recordAttempt(tier);

        EngineError error;
        std::unique_ptr<engine::EngineHandle> handle;
        const engine::Engine* engine = registry_.find(tier);

        if (!engine) {
            error = {EngineErrorKind::Unavailable, "tier not built"};
        } else {
            try {
                handle = engine->tryCompile(pattern, config, error);
            } catch (const std::exception& e) {
                log::logger()->warn("Engine {} threw while compiling '{}': {}", engine->name(), pattern, e.what());
                throw;
            }
        }

        if (handle) {
            metrics.recordSuccess(tier);
            return std::make_shared<const CompiledPattern>(
                pattern, config, tier, std::string(engine->name()), std::move(handle));
        }

        metrics.recordFailure(tier, error.kind);
        log::logger()->debug("{} rejected '{}': {}: {}",
                             tierName(tier), pattern, errorKindName(error.kind), error.message);

        failure.tier = tier;
        failure.cause = error;
        failure.attempts.push_back({tier, std::move(error)});
    }

    metrics.exhausted.fetch_add(1, std::memory_order_relaxed);
    return nullptr;
}

}  // namespace retier
