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
#include "test_engines.h"
#include <gtest/gtest.h>

using namespace retier;
using retier::testing::CountingEngine;
using retier::testing::RejectingEngine;

class TieredCompilerTest : public ::testing::Test {
protected:
    // Linear + fallback only, so results do not depend on PCRE2 being built
    engine::EngineRegistry makeRegistry() {
        engine::EngineRegistry registry;
        registry.install(EngineTier::LinearAutomaton, std::make_shared<engine::Re2Engine>());
        registry.install(EngineTier::FallbackBacktracking, std::make_shared<engine::BoostEngine>());
        return registry;
    }

    cache::CompilerMetrics metrics;
    CompileFailure failure;
};

TEST_F(TieredCompilerTest, Plan_NoFeatures) {
    auto plan = TieredCompiler::plan(Classification{}, std::nullopt);
    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan[0], EngineTier::LinearAutomaton);
    EXPECT_EQ(plan[1], EngineTier::JitBacktracking);
    EXPECT_EQ(plan[2], EngineTier::FallbackBacktracking);
}

TEST_F(TieredCompilerTest, Plan_FeaturesSkipLinear) {
    Classification c;
    c.features = kLookBehind;
    auto plan = TieredCompiler::plan(c, std::nullopt);
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan[0], EngineTier::JitBacktracking);
    EXPECT_EQ(plan[1], EngineTier::FallbackBacktracking);
}

TEST_F(TieredCompilerTest, Plan_OverrideIsSingleTier) {
    Classification c;
    c.features = kBackreference;
    auto plan = TieredCompiler::plan(c, EngineTier::LinearAutomaton);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], EngineTier::LinearAutomaton);
}

TEST_F(TieredCompilerTest, SimplePatternUsesLinearTier) {
    auto registry = makeRegistry();
    TieredCompiler compiler(registry);

    auto compiled = compiler.compile("\\d+", Config{}, std::nullopt, metrics, failure);

    ASSERT_NE(compiled, nullptr) << failure.describe();
    EXPECT_EQ(compiled->tier(), EngineTier::LinearAutomaton);
    EXPECT_EQ(compiled->engineInfo(), "LinearAutomaton (re2)");
    EXPECT_EQ(metrics.attempts[tierIndex(EngineTier::LinearAutomaton)].load(), 1u);
    EXPECT_EQ(metrics.successes[tierIndex(EngineTier::LinearAutomaton)].load(), 1u);
}

TEST_F(TieredCompilerTest, LookBehindFallsBackWhenJitNotBuilt) {
    auto registry = makeRegistry();
    TieredCompiler compiler(registry);

    auto compiled = compiler.compile("(?<=USD)\\d+", Config{}, std::nullopt, metrics, failure);

    ASSERT_NE(compiled, nullptr) << failure.describe();
    EXPECT_EQ(compiled->tier(), EngineTier::FallbackBacktracking);
    EXPECT_EQ(metrics.attempts[tierIndex(EngineTier::LinearAutomaton)].load(), 0u);
    EXPECT_EQ(metrics.failures[tierIndex(EngineTier::JitBacktracking)].load(), 1u);
    EXPECT_EQ(metrics.failures_by_kind[static_cast<size_t>(EngineErrorKind::Unavailable)].load(), 1u);
}

TEST_F(TieredCompilerTest, LinearRejectionFallsThrough) {
    // ignore_whitespace is unsupported by re2, so the fallback tier takes it
    auto registry = makeRegistry();
    TieredCompiler compiler(registry);
    Config config;
    config.ignore_whitespace = true;

    auto compiled = compiler.compile("a b c", config, std::nullopt, metrics, failure);

    ASSERT_NE(compiled, nullptr) << failure.describe();
    EXPECT_EQ(compiled->tier(), EngineTier::FallbackBacktracking);
    EXPECT_EQ(metrics.failures[tierIndex(EngineTier::LinearAutomaton)].load(), 1u);
    EXPECT_EQ(metrics.failures_by_kind[static_cast<size_t>(EngineErrorKind::Unsupported)].load(), 1u);
}

TEST_F(TieredCompilerTest, JitTierPreferredOverFallback) {
    auto registry = makeRegistry();
    auto jit = std::make_shared<CountingEngine>(std::make_shared<engine::BoostEngine>());
    registry.install(EngineTier::JitBacktracking, jit);
    TieredCompiler compiler(registry);

    auto compiled = compiler.compile("(a)\\1", Config{}, std::nullopt, metrics, failure);

    ASSERT_NE(compiled, nullptr);
    EXPECT_EQ(compiled->tier(), EngineTier::JitBacktracking);
    EXPECT_EQ(jit->compiles(), 1);
}

TEST_F(TieredCompilerTest, AllTiersFail_ReportsLastAndAttempts) {
    auto registry = makeRegistry();
    TieredCompiler compiler(registry);

    auto compiled = compiler.compile("(unclosed", Config{}, std::nullopt, metrics, failure);

    EXPECT_EQ(compiled, nullptr);
    EXPECT_EQ(failure.tier, EngineTier::FallbackBacktracking);
    EXPECT_EQ(failure.cause.kind, EngineErrorKind::Syntax);
    ASSERT_EQ(failure.attempts.size(), 3u);
    EXPECT_EQ(failure.attempts[0].tier, EngineTier::LinearAutomaton);
    EXPECT_EQ(failure.attempts[0].error.kind, EngineErrorKind::Syntax);
    EXPECT_EQ(failure.attempts[1].error.kind, EngineErrorKind::Unavailable);
    EXPECT_EQ(metrics.exhausted.load(), 1u);
}

TEST_F(TieredCompilerTest, OverrideFailureIsTerminal) {
    auto registry = makeRegistry();
    auto fallback = std::make_shared<CountingEngine>(std::make_shared<engine::BoostEngine>());
    registry.install(EngineTier::FallbackBacktracking, fallback);
    TieredCompiler compiler(registry);

    auto compiled = compiler.compile("(?<=a)b", Config{}, EngineTier::LinearAutomaton, metrics, failure);

    EXPECT_EQ(compiled, nullptr);
    EXPECT_EQ(failure.tier, EngineTier::LinearAutomaton);
    EXPECT_EQ(failure.attempts.size(), 1u);
    EXPECT_EQ(fallback->compiles(), 0);
}

TEST_F(TieredCompilerTest, OverrideUnbuiltTierIsUnavailable) {
    auto registry = makeRegistry();
    TieredCompiler compiler(registry);

    auto compiled = compiler.compile("abc", Config{}, EngineTier::JitBacktracking, metrics, failure);

    EXPECT_EQ(compiled, nullptr);
    EXPECT_EQ(failure.cause.kind, EngineErrorKind::Unavailable);
}

TEST_F(TieredCompilerTest, SizeLimitFallsThroughThenReportsResourceLimit) {
    engine::EngineRegistry registry;
    registry.install(EngineTier::LinearAutomaton, std::make_shared<engine::Re2Engine>());
    registry.install(EngineTier::FallbackBacktracking,
                     std::make_shared<RejectingEngine>(EngineErrorKind::ResourceLimit));
    TieredCompiler compiler(registry);
    Config config;
    config.size_limit = 64;

    auto compiled = compiler.compile("(\\w+\\s+){20}\\d{100}", config, std::nullopt, metrics, failure);

    EXPECT_EQ(compiled, nullptr);
    ASSERT_FALSE(failure.attempts.empty());
    EXPECT_EQ(failure.attempts[0].error.kind, EngineErrorKind::ResourceLimit);
    EXPECT_EQ(failure.cause.kind, EngineErrorKind::ResourceLimit);
}

TEST_F(TieredCompilerTest, SelectionIsDeterministic) {
    auto registry = makeRegistry();
    TieredCompiler compiler(registry);

    for (int i = 0; i < 5; i++) {
        auto a = compiler.compile("foo(?=bar)", Config{}, std::nullopt, metrics, failure);
        auto b = compiler.compile("foobar", Config{}, std::nullopt, metrics, failure);
        ASSERT_NE(a, nullptr);
        ASSERT_NE(b, nullptr);
        EXPECT_EQ(a->tier(), EngineTier::FallbackBacktracking);
        EXPECT_EQ(b->tier(), EngineTier::LinearAutomaton);
    }
}
