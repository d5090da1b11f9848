// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "extraction/ExtractionContext.h"
#include "extraction/LiteralReader.h"
#include "tests/common/TestUtils.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace MDG {

class LiteralReaderTest : public ::testing::Test {
protected:
    SyntaxNodePtr parseConfig(const std::string &config) {
        sourceFile_ = MDG::Test::Utils::parseSource("createMachine(" + config + ");");
        auto calls = sourceFile_->findCallExpressions("createMachine");
        EXPECT_EQ(1u, calls.size());
        return calls.empty() ? nullptr : calls[0]->getElements()[0];
    }

    std::shared_ptr<ISourceFile> sourceFile_;
};

TEST_F(LiteralReaderTest, ReadsStaticPropertyKeys) {
    auto object = parseConfig("{ a: 1, 'b': 2, [`c`]: 3, 7: 4 }");
    ASSERT_NE(nullptr, object);
    const auto &members = object->getProperties();

    std::vector<ExtractionError> errors;
    EXPECT_EQ("a", LiteralReader::getPropertyKey(&errors, *members[0]));
    EXPECT_EQ("b", LiteralReader::getPropertyKey(&errors, *members[1]));
    EXPECT_EQ("c", LiteralReader::getPropertyKey(&errors, *members[2]));
    EXPECT_EQ("7", LiteralReader::getPropertyKey(&errors, *members[3]));
    EXPECT_TRUE(errors.empty());
}

TEST_F(LiteralReaderTest, ReportsKeysThatCannotBeRead) {
    auto object = parseConfig("{ [name]: 1, 0x10: 2 }");
    ASSERT_NE(nullptr, object);
    const auto &members = object->getProperties();

    std::vector<ExtractionError> errors;
    EXPECT_EQ(std::nullopt, LiteralReader::getPropertyKey(&errors, *members[0]));
    ASSERT_EQ(1u, errors.size());
    EXPECT_EQ((ExtractionError{ExtractionErrorType::PROPERTY_KEY_UNHANDLED, PropertyKind::COMPUTED}), errors[0]);

    // Numeric keys keep their source text
    EXPECT_EQ("0x10", LiteralReader::getPropertyKey(&errors, *members[1]));
    ASSERT_EQ(2u, errors.size());
    EXPECT_EQ(ExtractionErrorType::PROPERTY_KEY_NO_ROUNDTRIP, errors[1].type);

    // No list, no reporting
    EXPECT_EQ(std::nullopt, LiteralReader::getPropertyKey(nullptr, *members[0]));
}

TEST_F(LiteralReaderTest, DecodesLiteralJson) {
    auto object = parseConfig("{ count: 3, ratio: 0.5, name: 'x', flags: [true, false, null], nested: { deep: `t` } }");
    ASSERT_NE(nullptr, object);

    auto value = LiteralReader::getJsonValue(nullptr, object);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(nlohmann::json::parse(R"({"count":3,"ratio":0.5,"name":"x","flags":[true,false,null],"nested":{"deep":"t"}})"),
              *value);
}

TEST_F(LiteralReaderTest, NonLiteralPartsRejectTheWholeValue) {
    auto object = parseConfig("{ a: 1, b: [1, compute()] }");
    ASSERT_NE(nullptr, object);
    EXPECT_EQ(std::nullopt, LiteralReader::getJsonValue(nullptr, object));
}

TEST_F(LiteralReaderTest, FindPropertyReturnsLastAssignment) {
    auto object = parseConfig("{ a: 1, b: 2, a: 3 }");
    ASSERT_NE(nullptr, object);

    auto property = LiteralReader::findProperty(nullptr, object, "a");
    ASSERT_NE(nullptr, property);
    EXPECT_EQ("3", property->getInitializer()->getText());
    EXPECT_EQ(nullptr, LiteralReader::findProperty(nullptr, object, "missing"));
    EXPECT_EQ(nullptr, LiteralReader::findProperty(nullptr, object->getProperties()[0]->getInitializer(), "a"));
}

TEST_F(LiteralReaderTest, ForEachStaticPropertyPrefersFirstDeclaration) {
    auto object = parseConfig("{ a: 1, ...rest, b: 2, a: 3 }");
    ASSERT_NE(nullptr, object);

    ExtractionContext ctx;
    std::vector<std::pair<std::string, std::string>> visited;
    std::vector<AstPath> paths;
    LiteralReader::forEachStaticProperty(ctx, object, [&](const SyntaxNodePtr &property, const std::string &key) {
        visited.emplace_back(key, property->getInitializer()->getText());
        paths.push_back(ctx.currentAstPath);
    });

    ASSERT_EQ(2u, visited.size());
    EXPECT_EQ((std::pair<std::string, std::string>{"b", "2"}), visited[0]);
    EXPECT_EQ((std::pair<std::string, std::string>{"a", "1"}), visited[1]);
    EXPECT_EQ((AstPath{AstPathStep::property(2)}), paths[0]);
    EXPECT_EQ((AstPath{AstPathStep::property(0)}), paths[1]);
    EXPECT_EQ(1u, MDG::Test::Utils::countErrors(ctx.errors, ExtractionErrorType::PROPERTY_UNHANDLED));
    EXPECT_TRUE(ctx.currentAstPath.empty());
}

TEST_F(LiteralReaderTest, MapMaybeArrayElementsPushesElementSteps) {
    auto array = parseConfig("['a', 'b']");
    ASSERT_NE(nullptr, array);

    ExtractionContext ctx;
    auto mapped = LiteralReader::mapMaybeArrayElements<std::string>(
        ctx, array, [&ctx](const SyntaxNodePtr &element, size_t index) {
            return element->getLiteralText() + toString(ctx.currentAstPath) + std::to_string(index);
        });
    EXPECT_EQ((std::vector<std::string>{"a/e00", "b/e11"}), mapped);

    auto single = LiteralReader::mapMaybeArrayElements<std::string>(
        ctx, array->getElements()[0],
        [&ctx](const SyntaxNodePtr &element, size_t) { return element->getLiteralText() + toString(ctx.currentAstPath); });
    EXPECT_EQ((std::vector<std::string>{"a/"}), single);
}

TEST_F(LiteralReaderTest, FindNodeByAstPathWalksPropertiesAndElements) {
    auto root = parseConfig("{ on: { GO: ['a', { target: 'b' }] } }");
    ASSERT_NE(nullptr, root);

    auto node = LiteralReader::findNodeByAstPath(
        root, {AstPathStep::property(0), AstPathStep::property(0), AstPathStep::element(1)});
    EXPECT_EQ("{ target: 'b' }", node->getText());
    EXPECT_EQ(root, LiteralReader::findNodeByAstPath(root, {}));
}

TEST_F(LiteralReaderTest, FindNodeByAstPathRejectsMismatchedSteps) {
    auto root = parseConfig("{ on: { GO: 'a' }, ...rest }");
    ASSERT_NE(nullptr, root);

    EXPECT_THROW(LiteralReader::findNodeByAstPath(root, {AstPathStep::property(5)}), std::runtime_error);
    EXPECT_THROW(LiteralReader::findNodeByAstPath(root, {AstPathStep::element(0)}), std::runtime_error);
    EXPECT_THROW(LiteralReader::findNodeByAstPath(root, {AstPathStep::property(1)}), std::runtime_error);
}

}  // namespace MDG
