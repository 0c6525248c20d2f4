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

#include "engine_tier.h"
#include "errors.h"
#include <gtest/gtest.h>

using namespace retier;

TEST(EngineTierTest, PriorityOrder) {
    ASSERT_EQ(kTierPriority.size(), kTierCount);
    EXPECT_EQ(kTierPriority[0], EngineTier::LinearAutomaton);
    EXPECT_EQ(kTierPriority[1], EngineTier::JitBacktracking);
    EXPECT_EQ(kTierPriority[2], EngineTier::FallbackBacktracking);
}

TEST(EngineTierTest, NamesRoundTrip) {
    for (EngineTier tier : kTierPriority) {
        auto parsed = tierFromName(tierName(tier));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, tier);
    }
    EXPECT_EQ(tierName(EngineTier::LinearAutomaton), "LinearAutomaton");
    EXPECT_EQ(tierName(EngineTier::FallbackBacktracking), "FallbackBacktracking");
}

TEST(EngineTierTest, UnknownNameRejected) {
    EXPECT_FALSE(tierFromName("linearautomaton").has_value());  // case-sensitive
    EXPECT_FALSE(tierFromName("").has_value());
    EXPECT_FALSE(tierFromName("Pcre2").has_value());
}

TEST(CompileFailureTest, DescribeListsEarlierAttempts) {
    CompileFailure failure;
    failure.tier = EngineTier::FallbackBacktracking;
    failure.cause = {EngineErrorKind::Syntax, "missing )"};
    failure.attempts = {
        {EngineTier::JitBacktracking, {EngineErrorKind::Unavailable, "tier not built"}},
        {EngineTier::FallbackBacktracking, {EngineErrorKind::Syntax, "missing )"}},
    };

    EXPECT_EQ(failure.describe(), "FallbackBacktracking: Syntax: missing ) (after JitBacktracking)");
}

TEST(CompileFailureTest, ThrowSelectsResourceLimitSubclass) {
    CompileFailure failure;
    failure.tier = EngineTier::LinearAutomaton;
    failure.cause = {EngineErrorKind::ResourceLimit, "pattern too large"};
    failure.attempts = {{failure.tier, failure.cause}};

    try {
        throwCompileError(failure);
        FAIL() << "expected ResourceLimitExceeded";
    } catch (const ResourceLimitExceeded& e) {
        EXPECT_EQ(e.tier(), EngineTier::LinearAutomaton);
        EXPECT_EQ(e.cause().kind, EngineErrorKind::ResourceLimit);
        EXPECT_NE(std::string(e.what()).find("pattern too large"), std::string::npos);
    }

    failure.cause.kind = EngineErrorKind::Syntax;
    EXPECT_THROW(throwCompileError(failure), CompileError);
}
