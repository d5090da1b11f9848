// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "common/UniqueIdGenerator.h"
#include "patching/DigraphPatcher.h"
#include "tests/common/TestUtils.h"
#include <gtest/gtest.h>
#include <stdexcept>

namespace MDG {

class DigraphPatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        UniqueIdGenerator::resetForTesting();
        auto sourceFile = MDG::Test::Utils::parseSource("createMachine({ initial: 'a', states: {\n"
                                                   "  a: { tags: ['x'], on: { GO: 'b' } },\n"
                                                   "  b: {},\n"
                                                   "} });");
        digraph_ = *MDG::Test::Utils::extractMachine(sourceFile).digraph;
        a_ = MDG::Test::Utils::nodeIdByPath(digraph_, "a");
        b_ = MDG::Test::Utils::nodeIdByPath(digraph_, "b");
    }

    static Patch patch(PatchOp op, std::vector<std::string> path, nlohmann::json value = nullptr) {
        return Patch{op, std::move(path), std::move(value)};
    }

    Digraph digraph_;
    std::string a_;
    std::string b_;
};

TEST_F(DigraphPatcherTest, ReplacesNodeFields) {
    DigraphPatcher::apply(digraph_, patch(PatchOp::REPLACE, {"nodes", a_, "data", "key"}, "renamed"));
    DigraphPatcher::apply(digraph_, patch(PatchOp::REPLACE, {"nodes", b_, "data", "type"}, "final"));

    EXPECT_EQ("renamed", digraph_.nodes.at(a_).data.key);
    EXPECT_EQ(StateType::FINAL, digraph_.nodes.at(b_).data.type);
}

TEST_F(DigraphPatcherTest, AddsAndRemovesEntities) {
    Node node;
    node.uniqueId = "node_new";
    node.parentId = digraph_.root;
    node.data.key = "c";

    DigraphPatcher::apply(digraph_, patch(PatchOp::ADD, {"nodes", "node_new"}, node));
    ASSERT_EQ(1u, digraph_.nodes.count("node_new"));
    EXPECT_EQ("c", digraph_.nodes.at("node_new").data.key);

    Edge go = MDG::Test::Utils::findEdge(digraph_, a_, "GO");
    DigraphPatcher::apply(digraph_, patch(PatchOp::REMOVE, {"edges", go.uniqueId}));
    EXPECT_TRUE(digraph_.edges.empty());
}

TEST_F(DigraphPatcherTest, EditsArrays) {
    DigraphPatcher::apply(digraph_, patch(PatchOp::ADD, {"nodes", a_, "data", "tags", "-"}, "z"));
    DigraphPatcher::apply(digraph_, patch(PatchOp::ADD, {"nodes", a_, "data", "tags", "0"}, "first"));
    EXPECT_EQ((std::vector<std::string>{"first", "x", "z"}), digraph_.nodes.at(a_).data.tags);

    DigraphPatcher::apply(digraph_, patch(PatchOp::REPLACE, {"nodes", a_, "data", "tags", "1"}, "y"));
    DigraphPatcher::apply(digraph_, patch(PatchOp::REMOVE, {"nodes", a_, "data", "tags", "0"}));
    EXPECT_EQ((std::vector<std::string>{"y", "z"}), digraph_.nodes.at(a_).data.tags);
}

TEST_F(DigraphPatcherTest, RejectsInvalidArrayIndices) {
    EXPECT_THROW(DigraphPatcher::apply(digraph_, patch(PatchOp::REPLACE, {"nodes", a_, "data", "tags", "01"}, "q")),
                 std::invalid_argument);
    EXPECT_THROW(DigraphPatcher::apply(digraph_, patch(PatchOp::REPLACE, {"nodes", a_, "data", "tags", "1"}, "q")),
                 std::invalid_argument);
    EXPECT_THROW(DigraphPatcher::apply(digraph_, patch(PatchOp::REMOVE, {"nodes", a_, "data", "tags", "-"})),
                 std::invalid_argument);
}

TEST_F(DigraphPatcherTest, RejectsMissingTargets) {
    EXPECT_THROW(DigraphPatcher::apply(digraph_, patch(PatchOp::REPLACE, {"nodes", "node_404", "data", "key"}, "x")),
                 std::invalid_argument);
    EXPECT_THROW(DigraphPatcher::apply(digraph_, patch(PatchOp::REMOVE, {"edges", "edge_404"})), std::invalid_argument);
    EXPECT_THROW(DigraphPatcher::apply(digraph_, patch(PatchOp::REMOVE, {})), std::invalid_argument);
}

TEST_F(DigraphPatcherTest, RejectsPatchesThatBreakTheModel) {
    Digraph before = digraph_;
    EXPECT_THROW(DigraphPatcher::apply(digraph_, patch(PatchOp::REPLACE, {"nodes", a_, "uniqueId"}, 42)),
                 std::invalid_argument);
    EXPECT_EQ(nlohmann::json(before), nlohmann::json(digraph_));
}

TEST(JsonDocumentPatchTest, EmptyPathReplacesTheDocument) {
    nlohmann::json document = {{"a", 1}};
    DigraphPatcher::apply(document, Patch{PatchOp::REPLACE, {}, {{"b", 2}}});
    EXPECT_EQ((nlohmann::json{{"b", 2}}), document);
}

TEST(JsonDocumentPatchTest, PatchesBecomeSingleRfc6902Operations) {
    EXPECT_EQ(nlohmann::json::parse(R"({"op":"add","path":"/nodes/a~1b","value":1})"),
              DigraphPatcher::toOperation(Patch{PatchOp::ADD, {"nodes", "a/b"}, 1}));
    EXPECT_EQ(nlohmann::json::parse(R"({"op":"remove","path":"/edges/e~0"})"),
              DigraphPatcher::toOperation(Patch{PatchOp::REMOVE, {"edges", "e~"}, "ignored"}));
}

TEST(JsonDocumentPatchTest, FailedPatchLeavesTheDocumentUntouched) {
    nlohmann::json document = {{"list", {1, 2}}, {"scalar", 3}};
    const nlohmann::json before = document;

    EXPECT_THROW(DigraphPatcher::apply(document, Patch{PatchOp::REMOVE, {"list", "5"}, nullptr}), std::invalid_argument);
    EXPECT_THROW(DigraphPatcher::apply(document, Patch{PatchOp::ADD, {"scalar", "x"}, 1}), std::invalid_argument);
    EXPECT_THROW(DigraphPatcher::apply(document, Patch{PatchOp::REPLACE, {"missing"}, 1}), std::invalid_argument);
    EXPECT_EQ(before, document);
}

TEST(JsonDocumentPatchTest, AddCreatesObjectMembers) {
    nlohmann::json document = {{"a", {{"b", 1}}}};
    DigraphPatcher::apply(document, Patch{PatchOp::ADD, {"a", "c"}, true});
    EXPECT_EQ(nlohmann::json::parse(R"({"a":{"b":1,"c":true}})"), document);
    EXPECT_THROW(DigraphPatcher::apply(document, Patch{PatchOp::ADD, {"missing", "c"}, true}), std::invalid_argument);
    EXPECT_THROW(DigraphPatcher::apply(document, Patch{PatchOp::ADD, {"a", "b", "c"}, true}), std::invalid_argument);
}

}  // namespace MDG
