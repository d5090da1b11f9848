// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "common/JsonUtils.h"
#include <gtest/gtest.h>
#include <string>

namespace MDG {

TEST(JsonUtilsTest, ParseReportsErrors) {
    std::string error;
    EXPECT_FALSE(JsonUtils::parseJson("[1,", &error).has_value());
    EXPECT_FALSE(error.empty());

    auto parsed = JsonUtils::parseJson(R"({"op":"add"})");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ("add", parsed->at("op").get<std::string>());
    EXPECT_EQ("{\n  \"op\": \"add\"\n}", JsonUtils::toPrettyString(*parsed));
}

TEST(JsonUtilsTest, MissingAndNullReadAlike) {
    json object = {{"a", nullptr}, {"b", "x"}, {"tags", json::array({"t1", "t2"})}};

    EXPECT_FALSE(JsonUtils::hasKey(object, "a"));
    EXPECT_FALSE(JsonUtils::hasKey(object, "missing"));
    EXPECT_FALSE(JsonUtils::hasKey(json::array(), "a"));
    EXPECT_FALSE(JsonUtils::getOptionalString(object, "a").has_value());
    EXPECT_EQ("x", JsonUtils::getOptionalString(object, "b").value());
    EXPECT_TRUE(JsonUtils::getStrings(object, "a").empty());
    EXPECT_EQ((std::vector<std::string>{"t1", "t2"}), JsonUtils::getStrings(object, "tags"));

    EXPECT_TRUE(JsonUtils::fromOptional(std::nullopt).is_null());
    EXPECT_EQ(json("v"), JsonUtils::fromOptional(std::string("v")));
}

TEST(JsonUtilsTest, WrongTypesAreMalformed) {
    json object = {{"key", 5}, {"tags", "single"}};
    EXPECT_THROW(JsonUtils::getOptionalString(object, "key"), json::type_error);
    EXPECT_THROW(JsonUtils::getStrings(object, "tags"), json::type_error);
}

}  // namespace MDG
