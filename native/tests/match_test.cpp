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
#include <gtest/gtest.h>
#include <string>

using namespace retier;

class MatchTest : public ::testing::Test {
protected:
    MatchTest() : manager_(cache::CacheConfig::defaults()) {}

    Pattern compile(const std::string& pattern) {
        return api::compile(manager_, pattern);
    }

    cache::CacheManager manager_;
};

TEST_F(MatchTest, GroupsByIndexAndName) {
    auto m = compile("(?P<year>\\d{4})-(?P<month>\\d{2})").search("on 2024-07-01");
    ASSERT_TRUE(m.has_value());

    EXPECT_EQ(m->start(), 3u);
    EXPECT_EQ(m->end(), 10u);
    EXPECT_EQ(*m->group(), "2024-07");
    EXPECT_EQ(*m->group(1), "2024");
    EXPECT_EQ(*m->group("month"), "07");
    EXPECT_EQ(m->groupCount(), 2);

    auto dict = m->groupDict();
    ASSERT_EQ(dict.size(), 2u);
    EXPECT_EQ(*dict["year"], "2024");
    EXPECT_EQ(*dict["month"], "07");
}

TEST_F(MatchTest, NonParticipatingVersusEmptyGroup) {
    auto m = compile("(a)|(b)()").search("b");
    ASSERT_TRUE(m.has_value());

    EXPECT_FALSE(m->group(1).has_value());
    EXPECT_FALSE(m->span(1).has_value());
    ASSERT_TRUE(m->group(3).has_value());
    EXPECT_EQ(*m->group(3), "");

    auto groups = m->groups();
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_FALSE(groups[0].has_value());
    EXPECT_EQ(*groups[1], "b");
}

TEST_F(MatchTest, Lastindex) {
    auto m = compile("(a)(b)?").search("a");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->lastindex(), 1);

    auto none = compile("abc").search("abc");
    ASSERT_TRUE(none.has_value());
    EXPECT_THROW(none->lastindex(), GroupLookupError);
}

TEST_F(MatchTest, InvalidGroupLookup) {
    auto m = compile("(x)").search("x");
    ASSERT_TRUE(m.has_value());

    EXPECT_THROW(m->group(2), GroupLookupError);
    EXPECT_THROW(m->group(-1), GroupLookupError);
    EXPECT_THROW(m->group("missing"), GroupLookupError);
    EXPECT_THROW(m->span(5), GroupLookupError);
}

TEST_F(MatchTest, OutlivesSearchedText) {
    std::optional<Match> m;
    {
        std::string text = "key=value";
        m = compile("(\\w+)=(\\w+)").search(text);
        text.assign(text.size(), '#');
    }
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(*m->group(1), "key");
    EXPECT_EQ(*m->group(2), "value");
}

TEST_F(MatchTest, CaptureOutsideWholeMatch) {
    Pattern p = compile("(?<=(USD))\\d+");
    EXPECT_NE(p.tier(), EngineTier::LinearAutomaton);

    auto m = p.search("Price USD100");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(*m->group(), "100");
    EXPECT_EQ(*m->group(1), "USD");
    EXPECT_EQ(*m->span(1), (engine::Span{6, 9}));
}

TEST_F(MatchTest, PatternAccessor) {
    Pattern p = compile("z+");
    auto m = p.search("zz");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(&m->pattern(), p.compiled().get());
}
