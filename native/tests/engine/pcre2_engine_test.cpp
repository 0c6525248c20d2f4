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

#include "engine/pcre2_engine.h"
#include <gtest/gtest.h>
#include <string>

using namespace retier;
using namespace retier::engine;

class Pcre2EngineTest : public ::testing::Test {
protected:
    std::unique_ptr<EngineHandle> compile(const std::string& pattern, const Config& config = Config{}) {
        EngineError error;
        auto handle = engine_.tryCompile(pattern, config, error);
        last_error_ = error;
        return handle;
    }

    Pcre2Engine engine_;
    EngineError last_error_;
};

TEST_F(Pcre2EngineTest, LookBehind) {
    auto h = compile("(?<=USD)\\d+");
    if (!h && last_error_.kind == EngineErrorKind::Unavailable) {
        GTEST_SKIP() << "PCRE2 JIT not available: " << last_error_.message;
    }
    ASSERT_NE(h, nullptr) << last_error_.message;

    MatchSpans spans;
    ASSERT_TRUE(h->findAt("Price USD100", 0, Anchor::Unanchored, &spans));
    EXPECT_EQ(*spans.groups[0], (Span{9, 12}));
}

TEST_F(Pcre2EngineTest, NamedGroupsFromNameTable) {
    auto h = compile("(?<year>\\d{4})-(\\d{2})-(?<day>\\d{2})");
    if (!h && last_error_.kind == EngineErrorKind::Unavailable) {
        GTEST_SKIP() << "PCRE2 JIT not available";
    }
    ASSERT_NE(h, nullptr);

    EXPECT_EQ(h->numberOfCapturingGroups(), 3);
    auto named = h->namedGroups();
    ASSERT_EQ(named.size(), 2u);
    EXPECT_EQ(named["year"], 1);
    EXPECT_EQ(named["day"], 3);
}

TEST_F(Pcre2EngineTest, UnsetGroups) {
    auto h = compile("(a)|(b)");
    if (!h && last_error_.kind == EngineErrorKind::Unavailable) {
        GTEST_SKIP() << "PCRE2 JIT not available";
    }
    ASSERT_NE(h, nullptr);

    MatchSpans spans;
    ASSERT_TRUE(h->findAt("b", 0, Anchor::Unanchored, &spans));
    ASSERT_EQ(spans.groups.size(), 3u);
    EXPECT_FALSE(spans.groups[1].has_value());
    EXPECT_EQ(*spans.groups[2], (Span{0, 1}));
}

TEST_F(Pcre2EngineTest, SyntaxError) {
    EXPECT_EQ(compile("(unclosed"), nullptr);
    EXPECT_EQ(last_error_.kind, EngineErrorKind::Syntax);
    EXPECT_NE(last_error_.message.find("offset"), std::string::npos);
}

TEST_F(Pcre2EngineTest, SizeLimit) {
    Config config;
    config.size_limit = 16;
    EXPECT_EQ(compile("(foo|bar|baz)+qux", config), nullptr);
    EXPECT_EQ(last_error_.kind, EngineErrorKind::ResourceLimit);
}

TEST_F(Pcre2EngineTest, BacktrackLimitExceeded) {
    Config config;
    config.backtrack_limit = 1000;
    auto h = compile("(a+)+$", config);
    if (!h && last_error_.kind == EngineErrorKind::Unavailable) {
        GTEST_SKIP() << "PCRE2 JIT not available";
    }
    ASSERT_NE(h, nullptr);

    std::string text = std::string(40, 'a') + "!";
    EXPECT_THROW(h->findAt(text, 0, Anchor::Unanchored, nullptr), retier::BacktrackLimitExceeded);
}

TEST_F(Pcre2EngineTest, OversizedBacktrackLimitIsClamped) {
    Config config;
    config.backtrack_limit = (size_t{1} << 32) + 5;
    auto h = compile("(?<=x)(a+)b", config);
    if (!h && last_error_.kind == EngineErrorKind::Unavailable) {
        GTEST_SKIP() << "PCRE2 JIT not available";
    }
    ASSERT_NE(h, nullptr);

    MatchSpans spans;
    ASSERT_TRUE(h->findAt("xaaab", 0, Anchor::Unanchored, &spans));
    EXPECT_EQ(*spans.groups[1], (Span{1, 4}));
}

TEST_F(Pcre2EngineTest, LongSubjectWithoutLimitMatches) {
    auto h = compile("^(?:a|b)*c");
    if (!h && last_error_.kind == EngineErrorKind::Unavailable) {
        GTEST_SKIP() << "PCRE2 JIT not available";
    }
    ASSERT_NE(h, nullptr);

    std::string text;
    for (int i = 0; i < 20000; ++i) {
        text += "ab";
    }
    text += 'c';

    MatchSpans spans;
    ASSERT_TRUE(h->findAt(text, 0, Anchor::Unanchored, &spans));
    EXPECT_EQ(*spans.groups[0], (Span{0, text.size()}));
}
