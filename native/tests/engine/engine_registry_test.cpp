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

#include "engine/engine_registry.h"
#include "test_engines.h"
#include <gtest/gtest.h>

using namespace retier;
using namespace retier::engine;

TEST(EngineRegistryTest, DefaultsInstallLinearAndFallback) {
    EngineRegistry registry = EngineRegistry::defaults();

    ASSERT_TRUE(registry.has(EngineTier::LinearAutomaton));
    ASSERT_TRUE(registry.has(EngineTier::FallbackBacktracking));
    EXPECT_EQ(registry.find(EngineTier::LinearAutomaton)->name(), "re2");
    EXPECT_EQ(registry.find(EngineTier::FallbackBacktracking)->name(), "boost.regex");
#ifdef RETIER_HAVE_PCRE2
    EXPECT_TRUE(registry.has(EngineTier::JitBacktracking));
#else
    EXPECT_FALSE(registry.has(EngineTier::JitBacktracking));
#endif
}

TEST(EngineRegistryTest, InstallAndRemove) {
    EngineRegistry registry;
    EXPECT_FALSE(registry.has(EngineTier::JitBacktracking));

    auto fake = std::make_shared<retier::testing::RejectingEngine>(EngineErrorKind::Syntax, "fake");
    registry.install(EngineTier::JitBacktracking, fake);
    ASSERT_TRUE(registry.has(EngineTier::JitBacktracking));
    EXPECT_EQ(registry.find(EngineTier::JitBacktracking)->name(), "fake");

    registry.remove(EngineTier::JitBacktracking);
    EXPECT_EQ(registry.find(EngineTier::JitBacktracking), nullptr);
}

TEST(EngineRegistryTest, CopiesShareEngines) {
    EngineRegistry registry = EngineRegistry::defaults();
    EngineRegistry copy = registry;
    copy.remove(EngineTier::LinearAutomaton);

    EXPECT_TRUE(registry.has(EngineTier::LinearAutomaton));
    EXPECT_FALSE(copy.has(EngineTier::LinearAutomaton));
}
