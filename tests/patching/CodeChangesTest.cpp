// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "extraction/LiteralReader.h"
#include "model/TextEdit.h"
#include "patching/CodeChanges.h"
#include "patching/InsertionElement.h"
#include "tests/common/TestUtils.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace MDG {

class CodeChangesTest : public ::testing::Test {
protected:
    SyntaxNodePtr load(const std::string &text) {
        sourceFile_ = MDG::Test::Utils::parseSource(text);
        auto calls = sourceFile_->findCallExpressions("createMachine");
        EXPECT_EQ(1u, calls.size());
        changes_ = std::make_unique<CodeChanges>(sourceFile_);
        return calls.empty() ? nullptr : calls[0]->getElements()[0];
    }

    static SyntaxNodePtr member(const SyntaxNodePtr &object, const std::string &key) {
        auto property = LiteralReader::findProperty(nullptr, object, key);
        if (!property) {
            throw std::out_of_range("No property " + key);
        }
        return property;
    }

    static SyntaxNodePtr value(const SyntaxNodePtr &object, const std::string &key) {
        return member(object, key)->getInitializer();
    }

    std::string result() const {
        return applyTextEdits(sourceFile_->getText(), changes_->getTextEdits());
    }

    std::shared_ptr<ISourceFile> sourceFile_;
    std::unique_ptr<CodeChanges> changes_;
};

TEST_F(CodeChangesTest, InsertsNestedPathIntoEmptyObject) {
    auto root = load("createMachine({ id: \"m\", states: { a: {} } })");
    auto a = value(value(root, "states"), "a");

    changes_->insertAtOptionalObjectPath(a, {PathSegment::property("on"), PathSegment::property("NEXT")},
                                         InsertionElement::string("b"));

    EXPECT_EQ("createMachine({ id: \"m\", states: { a: { on: { NEXT: \"b\" } } } })", result());
}

TEST_F(CodeChangesTest, AppendWrapsSingleValueIntoArray) {
    auto root = load("createMachine({ on: { NEXT: \"b\" } })");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("NEXT")},
                                         InsertionElement::string("c"));
    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("NEXT")},
                                         InsertionElement::string("d"));

    EXPECT_EQ("createMachine({ on: { NEXT: [\"b\", \"c\", \"d\"] } })", result());
}

TEST_F(CodeChangesTest, AppendExtendsExistingArray) {
    auto root = load("createMachine({ on: { NEXT: [\"b\"] } })");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("NEXT")},
                                         InsertionElement::string("c"));

    EXPECT_EQ("createMachine({ on: { NEXT: [\"b\", \"c\"] } })", result());
}

TEST_F(CodeChangesTest, AppendReplacesUndefined) {
    auto root = load("createMachine({ on: { NEXT: undefined } })");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("NEXT")},
                                         InsertionElement::string("c"));

    EXPECT_EQ("createMachine({ on: { NEXT: \"c\" } })", result());
}

TEST_F(CodeChangesTest, SetReplacesExistingValue) {
    auto root = load("createMachine({ initial: \"a\", states: {} })");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("initial")}, InsertionElement::string("b"),
                                         CodeChanges::Mode::SET);

    EXPECT_EQ("createMachine({ initial: \"b\", states: {} })", result());
}

TEST_F(CodeChangesTest, InsertionsFollowCanonicalPropertyOrder) {
    auto root = load("createMachine({ id: \"m\", states: {} })");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("description")}, InsertionElement::string("d"),
                                         CodeChanges::Mode::SET);
    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("initial")}, InsertionElement::string("a"),
                                         CodeChanges::Mode::SET);

    EXPECT_EQ("createMachine({ id: \"m\", initial: \"a\", description: \"d\", states: {} })", result());
}

TEST_F(CodeChangesTest, InsertionGoesBeforeFirstHigherPriorityMember) {
    auto root = load("createMachine({ states: {} })");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("GO")},
                                         InsertionElement::string("x"));

    EXPECT_EQ("createMachine({ on: { GO: \"x\" }, states: {} })", result());
}

TEST_F(CodeChangesTest, UnknownKeysGoLast) {
    auto root = load("createMachine({ states: {}, custom: 1 })");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("other")}, InsertionElement::boolean(true));

    EXPECT_EQ("createMachine({ states: {}, custom: 1, other: true })", result());
}

TEST_F(CodeChangesTest, MultilineObjectsKeepMemberIndentation) {
    auto root = load("createMachine({\n"
                     "  id: \"m\",\n"
                     "  entry: \"log\",\n"
                     "  states: {},\n"
                     "})");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("GO")},
                                         InsertionElement::string("x"));

    EXPECT_EQ("createMachine({\n"
              "  id: \"m\",\n"
              "  entry: \"log\",\n"
              "  on: { GO: \"x\" },\n"
              "  states: {},\n"
              "})",
              result());
}

TEST_F(CodeChangesTest, EmptyMultilineObjectIsRewrittenOnItsOwnLines) {
    auto root = load("createMachine({\n"
                     "  states: {\n"
                     "  },\n"
                     "})");

    changes_->insertAtOptionalObjectPath(value(root, "states"), {PathSegment::property("a")},
                                         InsertionElement::object(), CodeChanges::Mode::SET);

    EXPECT_EQ("createMachine({\n"
              "  states: {\n"
              "    a: {}\n"
              "  },\n"
              "})",
              result());
}

TEST_F(CodeChangesTest, RemovesPropertiesWithTheirSeparators) {
    auto root = load("createMachine({ a: 1, b: 2, c: 3 })");
    changes_->removeProperty(root, member(root, "b"));
    EXPECT_EQ("createMachine({ a: 1, c: 3 })", result());

    root = load("createMachine({ a: 1, b: 2, c: 3, })");
    changes_->removeProperty(root, member(root, "b"));
    changes_->removeProperty(root, member(root, "c"));
    EXPECT_EQ("createMachine({ a: 1, })", result());

    root = load("createMachine({ a: 1, b: 2 })");
    changes_->removeProperty(root, member(root, "a"));
    changes_->removeProperty(root, member(root, "b"));
    EXPECT_EQ("createMachine({})", result());
}

TEST_F(CodeChangesTest, RemovesMultilineProperty) {
    auto root = load("createMachine({\n"
                     "  a: 1,\n"
                     "  b: 2,\n"
                     "})");

    changes_->removeProperty(root, member(root, "a"));

    EXPECT_EQ("createMachine({\n"
              "  b: 2,\n"
              "})",
              result());
}

TEST_F(CodeChangesTest, RemovesArrayElements) {
    auto root = load("createMachine({ on: { GO: [\"a\", \"b\", \"c\"] } })");
    auto array = value(value(root, "on"), "GO");

    changes_->removeArrayElement(array, array->getElements()[0]);
    changes_->removeArrayElement(array, array->getElements()[2]);

    EXPECT_EQ("createMachine({ on: { GO: [\"b\"] } })", result());
}

TEST_F(CodeChangesTest, RemovedContentReplacedInOnePiece) {
    auto root = load("createMachine({ a: 1 })");

    changes_->removeProperty(root, member(root, "a"));
    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("b")}, InsertionElement::boolean(false));

    EXPECT_EQ("createMachine({ b: false })", result());
}

TEST_F(CodeChangesTest, PendingInsertionsMerge) {
    auto root = load("createMachine({})");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("A")},
                                         InsertionElement::string("x"));
    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("B")},
                                         InsertionElement::string("y"));
    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("A")},
                                         InsertionElement::string("z"));

    EXPECT_EQ("createMachine({ on: { A: [\"x\", \"z\"], B: \"y\" } })", result());
}

TEST_F(CodeChangesTest, RemovingPendingPropertyCancelsIt) {
    auto root = load("createMachine({ id: \"m\" })");

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("initial")}, InsertionElement::string("a"),
                                         CodeChanges::Mode::SET);
    changes_->removeAtOptionalObjectPath(root, {PathSegment::property("initial")});

    EXPECT_TRUE(changes_->getTextEdits().empty());
}

TEST_F(CodeChangesTest, ObjectPathsFollowTheFirstDuplicateKey) {
    auto root = load("createMachine({ type: \"final\", type: \"parallel\" })");
    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("type")}, InsertionElement::string("history"),
                                         CodeChanges::Mode::SET);
    EXPECT_EQ("createMachine({ type: \"history\", type: \"parallel\" })", result());

    root = load("createMachine({ type: \"final\", type: \"parallel\" })");
    changes_->removeAtOptionalObjectPath(root, {PathSegment::property("type")});
    EXPECT_EQ("createMachine({ type: \"parallel\" })", result());
}

TEST_F(CodeChangesTest, InsertPropertyBeforeAnchor) {
    auto root = load("createMachine({ id: \"m\", states: { a: {} } })");

    changes_->insertPropertyBeforeProperty(root, member(root, "states"), "initial", InsertionElement::string("a"));

    EXPECT_EQ("createMachine({ id: \"m\", initial: \"a\", states: { a: {} } })", result());
}

TEST_F(CodeChangesTest, RenamesPropertyKeys) {
    auto root = load("createMachine({ states: { a: {}, 'b': {} } })");
    auto states = value(root, "states");

    changes_->replacePropertyName(member(states, "a"), "renamed");
    changes_->replacePropertyName(member(states, "b"), "needs quoting");

    EXPECT_EQ("createMachine({ states: { renamed: {}, \"needs quoting\": {} } })", result());
}

TEST_F(CodeChangesTest, IndexStepOnSingleValueSelectsTheValue) {
    auto root = load("createMachine({ invoke: { src: \"svc\" } })");

    changes_->insertAtOptionalObjectPath(
        root, {PathSegment::property("invoke"), PathSegment::element(0), PathSegment::property("onDone")},
        InsertionElement::string("b"));

    EXPECT_EQ("createMachine({ invoke: { src: \"svc\", onDone: \"b\" } })", result());
}

TEST_F(CodeChangesTest, NonObjectParentIsRejected) {
    auto root = load("createMachine({ on: someEvents })");

    EXPECT_THROW(changes_->insertAtOptionalObjectPath(root, {PathSegment::property("on"), PathSegment::property("GO")},
                                                      InsertionElement::string("x")),
                 std::runtime_error);
    EXPECT_THROW(changes_->insertAtOptionalObjectPath(root, {}, InsertionElement::string("x")), std::invalid_argument);
}

TEST_F(CodeChangesTest, EditsInsideReplacedNodeAreDropped) {
    auto root = load("createMachine({ states: { a: {} } })");
    auto states = value(root, "states");

    changes_->insertAtOptionalObjectPath(value(states, "a"), {PathSegment::property("type")},
                                         InsertionElement::string("final"));
    changes_->replaceNode(states, InsertionElement::object());

    auto edits = changes_->getTextEdits();
    ASSERT_EQ(1u, edits.size());
    EXPECT_EQ(TextEdit::Type::REPLACE, edits[0].type);
    EXPECT_EQ("createMachine({ states: {} })", result());
}

TEST_F(CodeChangesTest, PrefersQuoteOfFirstImport) {
    auto root = load("import { createMachine } from 'xstate';\n"
                     "createMachine({})");
    EXPECT_EQ('\'', changes_->getQuote());

    changes_->insertAtOptionalObjectPath(root, {PathSegment::property("initial")}, InsertionElement::string("it's"));

    EXPECT_EQ("import { createMachine } from 'xstate';\n"
              "createMachine({ initial: 'it\\'s' })",
              result());
}

TEST_F(CodeChangesTest, DefaultsToDoubleQuotes) {
    load("createMachine({})");
    EXPECT_EQ('"', CodeChanges::getPreferredQuoteChar(*sourceFile_));
    EXPECT_TRUE(changes_->empty());
}

TEST(InsertionPriorityTest, KnowsStateLevelKeys) {
    EXPECT_EQ(InsertionPriority::ID, getInsertionPriority("id"));
    EXPECT_EQ(InsertionPriority::ON_DONE, getInsertionPriority("onDone"));
    EXPECT_EQ(std::nullopt, getInsertionPriority("src"));
    EXPECT_LT(*getInsertionPriority("initial"), *getInsertionPriority("states"));
}

TEST(InsertionElementTest, RendersLiterals) {
    auto transition = InsertionElement::object({
        {"target", InsertionElement::array({InsertionElement::string("a"), InsertionElement::string("b")})},
        {"reenter", InsertionElement::boolean(true)},
        {"guard-name", InsertionElement::raw("check")},
    });

    EXPECT_EQ("{ target: [\"a\", \"b\"], reenter: true, \"guard-name\": check }", transition.render('"'));
    EXPECT_EQ("{}", InsertionElement::object().render('"'));
    EXPECT_EQ("undefined", InsertionElement::undefined().render('"'));
}

TEST(InsertionElementTest, MultilineStringsBecomeTemplates) {
    EXPECT_EQ("`first\nsecond`", InsertionElement::string("first\nsecond", true).render('"'));
    EXPECT_EQ("'first\\nsecond'", InsertionElement::string("first\nsecond").render('\''));
}

TEST(InsertionElementTest, FindPropertyReturnsLastAndKindIsChecked) {
    auto object = InsertionElement::object({{"a", InsertionElement::boolean(true)}});
    object.addProperty("a", InsertionElement::boolean(false));

    ASSERT_NE(nullptr, object.findProperty("a"));
    EXPECT_EQ("false", object.findProperty("a")->render('"'));
    object.removeProperty("a");
    EXPECT_EQ(nullptr, object.findProperty("a"));

    auto text = InsertionElement::string("x");
    EXPECT_THROW(text.addElement(InsertionElement::string("y")), std::logic_error);
    EXPECT_THROW(text.addProperty("k", InsertionElement::string("y")), std::logic_error);
}

}  // namespace MDG
