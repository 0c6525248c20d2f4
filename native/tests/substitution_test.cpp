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

#include "substitution.h"
#include "retier_api.h"
#include <gtest/gtest.h>
#include <string>

using namespace retier;

class SubstitutionTest : public ::testing::Test {
protected:
    SubstitutionTest() : manager_(cache::CacheConfig::defaults()) {}

    Match matchOf(const std::string& pattern, const std::string& text) {
        auto m = api::compile(manager_, pattern).search(text);
        EXPECT_TRUE(m.has_value());
        return *m;
    }

    cache::CacheManager manager_;
};

TEST_F(SubstitutionTest, NumericReferences) {
    Match m = matchOf("(\\w+)@(\\w+)", "user@host");

    EXPECT_EQ(ReplacementTemplate::parse("$2:$1").expand(m), "host:user");
    EXPECT_EQ(ReplacementTemplate::parse("[$0]").expand(m), "[user@host]");
    EXPECT_EQ(ReplacementTemplate::parse("${1}x").expand(m), "userx");
}

TEST_F(SubstitutionTest, DigitRunIsMaximal) {
    Match m = matchOf("(a)", "a");
    // $10 is group 10, which does not exist
    EXPECT_EQ(ReplacementTemplate::parse("$10").expand(m), "");
    EXPECT_EQ(ReplacementTemplate::parse("${1}0").expand(m), "a0");
}

TEST_F(SubstitutionTest, NamedReferences) {
    Match m = matchOf("(?P<word>\\w+)", "hello");
    EXPECT_EQ(ReplacementTemplate::parse("<${word}>").expand(m), "<hello>");
    EXPECT_EQ(ReplacementTemplate::parse("${missing}").expand(m), "");
}

TEST_F(SubstitutionTest, LiteralDollars) {
    Match m = matchOf("(x)", "x");

    EXPECT_EQ(ReplacementTemplate::parse("$$1").expand(m), "$1");
    EXPECT_EQ(ReplacementTemplate::parse("cost $").expand(m), "cost $");
    EXPECT_EQ(ReplacementTemplate::parse("$a").expand(m), "$a");
    EXPECT_EQ(ReplacementTemplate::parse("${").expand(m), "${");
    EXPECT_EQ(ReplacementTemplate::parse("${-}").expand(m), "${-}");
    EXPECT_EQ(ReplacementTemplate::parse("\\1").expand(m), "\\1");
}

TEST_F(SubstitutionTest, NonParticipatingGroupExpandsEmpty) {
    Match m = matchOf("(a)|(b)", "b");
    EXPECT_EQ(ReplacementTemplate::parse("[$1][$2]").expand(m), "[][b]");
}

TEST_F(SubstitutionTest, HugeIndexSaturates) {
    Match m = matchOf("(a)", "a");
    EXPECT_EQ(ReplacementTemplate::parse("$99999999999999999999999999").expand(m), "");
}

TEST_F(SubstitutionTest, IsLiteral) {
    EXPECT_TRUE(ReplacementTemplate::parse("plain").isLiteral());
    EXPECT_TRUE(ReplacementTemplate::parse("a$$b").isLiteral());
    EXPECT_FALSE(ReplacementTemplate::parse("$1").isLiteral());
    EXPECT_FALSE(ReplacementTemplate::parse("${n}").isLiteral());
}

TEST_F(SubstitutionTest, EscapeReplacement) {
    EXPECT_EQ(escapeReplacement("$5.00 & $$"), "$$5.00 & $$$$");

    Match m = matchOf("(x)", "x");
    std::string literal = "$1 costs ${2}";
    EXPECT_EQ(ReplacementTemplate::parse(escapeReplacement(literal)).expand(m), literal);
}
