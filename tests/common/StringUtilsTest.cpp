// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "common/StringUtils.h"
#include <cmath>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace MDG {

TEST(StringUtilsTest, SplitKeepsEmptySegments) {
    EXPECT_EQ((std::vector<std::string>{"", "a"}), split(".a", '.'));
    EXPECT_EQ((std::vector<std::string>{"a", "", "b"}), split("a..b", '.'));
    EXPECT_EQ((std::vector<std::string>{""}), split("", '.'));
    EXPECT_EQ("a, b", join({"a", "b"}, ", "));
}

TEST(StringUtilsTest, RecognizesBareIdentifiers) {
    EXPECT_TRUE(isValidIdentifier("idle"));
    EXPECT_TRUE(isValidIdentifier("$on_1"));
    EXPECT_FALSE(isValidIdentifier("1st"));
    EXPECT_FALSE(isValidIdentifier("a-b"));
    EXPECT_FALSE(isValidIdentifier(""));
}

TEST(StringUtilsTest, EscapesStringLiterals) {
    EXPECT_EQ("'it\\'s'", safeStringLiteral("it's", '\''));
    EXPECT_EQ("\"it's\"", safeStringLiteral("it's", '"'));
    EXPECT_EQ("\"a\\nb\\\\c\"", safeStringLiteral("a\nb\\c", '"'));
    EXPECT_EQ("\"\\x01\"", safeStringLiteral("\x01", '"'));
    EXPECT_EQ("\"\\u2028\"", safeStringLiteral("\xE2\x80\xA8", '"'));
}

TEST(StringUtilsTest, MultilineTextBecomesTemplateLiteral) {
    EXPECT_EQ("`a\nb`", safeStringLiteral("a\nb", '"', true));
    EXPECT_EQ("`\\`\n\\${y}`", safeStringLiteral("`\n${y}", '"', true));
    EXPECT_EQ("\"single\"", safeStringLiteral("single", '"', true));
}

TEST(StringUtilsTest, QuotesPropertyNamesOnlyWhenNeeded) {
    EXPECT_EQ("idle", safePropertyName("idle", '"'));
    EXPECT_EQ("'done.invoke'", safePropertyName("done.invoke", '\''));
    EXPECT_EQ("\"*\"", safePropertyName("*", '"'));
}

TEST(StringUtilsTest, FormatsNumbersLikeEcmaScript) {
    EXPECT_EQ("0", formatJsNumber(-0.0));
    EXPECT_EQ("42", formatJsNumber(42));
    EXPECT_EQ("-7", formatJsNumber(-7));
    EXPECT_EQ("0.1", formatJsNumber(0.1));
    EXPECT_EQ("1.5", formatJsNumber(1.5));
    EXPECT_EQ("1e+21", formatJsNumber(1e21));
    EXPECT_EQ("1.5e-7", formatJsNumber(1.5e-7));
    EXPECT_EQ("0.000001", formatJsNumber(1e-6));
    EXPECT_EQ("10000000000000000", formatJsNumber(1e16));
    EXPECT_EQ("-123.456", formatJsNumber(-123.456));
    EXPECT_EQ("1.2345678901234568e+21", formatJsNumber(1.2345678901234568e21));
    EXPECT_EQ("NaN", formatJsNumber(std::nan("")));
    EXPECT_EQ("-Infinity", formatJsNumber(-INFINITY));
}

}  // namespace MDG
