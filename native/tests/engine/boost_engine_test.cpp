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

#include "engine/boost_engine.h"
#include <gtest/gtest.h>
#include <string>

using namespace retier;
using namespace retier::engine;

class BoostEngineTest : public ::testing::Test {
protected:
    std::unique_ptr<EngineHandle> compile(const std::string& pattern, const Config& config = Config{}) {
        EngineError error;
        auto handle = engine_.tryCompile(pattern, config, error);
        last_error_ = error;
        return handle;
    }

    BoostEngine engine_;
    EngineError last_error_;
};

TEST_F(BoostEngineTest, LookBehind) {
    auto h = compile("(?<=USD)\\d+");
    ASSERT_NE(h, nullptr) << last_error_.message;

    MatchSpans spans;
    ASSERT_TRUE(h->findAt("Price USD100", 0, Anchor::Unanchored, &spans));
    EXPECT_EQ(*spans.groups[0], (Span{9, 12}));
}

TEST_F(BoostEngineTest, LookBehindSeesBytesBeforeOffset) {
    auto h = compile("(?<=a)b");
    ASSERT_NE(h, nullptr);

    EXPECT_TRUE(h->findAt("ab", 1, Anchor::AnchorStart, nullptr));
    EXPECT_FALSE(h->findAt("cb", 1, Anchor::AnchorStart, nullptr));
}

TEST_F(BoostEngineTest, Backreference) {
    auto h = compile("(\\w)\\1");
    ASSERT_NE(h, nullptr);

    MatchSpans spans;
    ASSERT_TRUE(h->findAt("abccd", 0, Anchor::Unanchored, &spans));
    EXPECT_EQ(*spans.groups[0], (Span{2, 4}));
    EXPECT_EQ(*spans.groups[1], (Span{2, 3}));
}

TEST_F(BoostEngineTest, AnchoredMatch) {
    auto h = compile("\\d+");
    ASSERT_NE(h, nullptr);

    EXPECT_FALSE(h->findAt("abc123", 0, Anchor::AnchorStart, nullptr));
    EXPECT_TRUE(h->findAt("abc123", 3, Anchor::AnchorStart, nullptr));
}

TEST_F(BoostEngineTest, NamedGroupsFromScan) {
    auto h = compile("(?<a>x)(y)(?'c'z)");
    ASSERT_NE(h, nullptr) << last_error_.message;

    EXPECT_EQ(h->numberOfCapturingGroups(), 3);
    auto named = h->namedGroups();
    ASSERT_EQ(named.size(), 2u);
    EXPECT_EQ(named["a"], 1);
    EXPECT_EQ(named["c"], 3);
}

TEST_F(BoostEngineTest, SingleLineDefaults) {
    auto h = compile("^b$");
    ASSERT_NE(h, nullptr);
    EXPECT_FALSE(h->findAt("a\nb\nc", 0, Anchor::Unanchored, nullptr));

    auto dot = compile("a.c");
    ASSERT_NE(dot, nullptr);
    EXPECT_FALSE(dot->findAt("a\nc", 0, Anchor::Unanchored, nullptr));

    Config multiline;
    multiline.multiline = true;
    auto m = compile("^b$", multiline);
    ASSERT_NE(m, nullptr);
    EXPECT_TRUE(m->findAt("a\nb\nc", 0, Anchor::Unanchored, nullptr));
}

TEST_F(BoostEngineTest, CaseInsensitiveAndExtended) {
    Config config;
    config.case_insensitive = true;
    config.ignore_whitespace = true;
    auto h = compile("h e l l o  # greeting", config);
    ASSERT_NE(h, nullptr) << last_error_.message;
    EXPECT_TRUE(h->findAt("say HELLO", 0, Anchor::Unanchored, nullptr));
}

TEST_F(BoostEngineTest, SyntaxError) {
    EXPECT_EQ(compile("(unclosed"), nullptr);
    EXPECT_EQ(last_error_.kind, EngineErrorKind::Syntax);
}

TEST_F(BoostEngineTest, CatastrophicBacktrackingThrows) {
    auto h = compile("(x+x+)+y");
    ASSERT_NE(h, nullptr);

    std::string text(64, 'x');
    EXPECT_THROW(h->findAt(text, 0, Anchor::Unanchored, nullptr), BacktrackLimitExceeded);
}

TEST_F(BoostEngineTest, BacktrackLimitBoundsOneSearch) {
    Config config;
    config.backtrack_limit = 10;
    auto h = compile("(a|aa)+b", config);
    ASSERT_NE(h, nullptr);

    EXPECT_THROW(h->findAt(std::string(10, 'a'), 0, Anchor::Unanchored, nullptr), BacktrackLimitExceeded);
    EXPECT_THROW(h->findAt(std::string(10, 'a'), 0, Anchor::AnchorStart, nullptr), BacktrackLimitExceeded);
}

TEST_F(BoostEngineTest, LimitedHandleMatchesWithinBudget) {
    Config config;
    config.backtrack_limit = 1000;
    auto h = compile("(?<=USD)(\\d+)", config);
    ASSERT_NE(h, nullptr);

    MatchSpans spans;
    ASSERT_TRUE(h->findAt("Price USD100 or USD7", 0, Anchor::Unanchored, &spans));
    EXPECT_EQ(*spans.groups[0], (Span{9, 12}));
    EXPECT_EQ(*spans.groups[1], (Span{9, 12}));

    ASSERT_TRUE(h->findAt("Price USD100 or USD7", 12, Anchor::Unanchored, &spans));
    EXPECT_EQ(*spans.groups[0], (Span{19, 20}));

    EXPECT_TRUE(h->findAt("USD42", 3, Anchor::AnchorStart, nullptr));
    EXPECT_FALSE(h->findAt("no digits here", 0, Anchor::Unanchored, nullptr));
}

TEST_F(BoostEngineTest, BudgetResetsBetweenSearches) {
    Config config;
    config.backtrack_limit = 200;
    auto h = compile("a+b", config);
    ASSERT_NE(h, nullptr);

    for (int i = 0; i < 50; ++i) {
        EXPECT_TRUE(h->findAt("xxaaab", 0, Anchor::Unanchored, nullptr));
    }
}
