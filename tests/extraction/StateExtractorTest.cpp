// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "common/UniqueIdGenerator.h"
#include "extraction/MachineExtractor.h"
#include "tests/common/TestUtils.h"
#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace MDG {

class StateExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        UniqueIdGenerator::resetForTesting();
    }

    const Digraph &extract(const std::string &config) {
        sourceFile_ = MDG::Test::Utils::parseSource("import { createMachine } from 'xstate';\n"
                                               "export const machine = createMachine(" +
                                               config + ");\n");
        state_ = MDG::Test::Utils::extractMachine(sourceFile_);
        return *state_.digraph;
    }

    const Node &node(const std::string &keyPath) {
        return state_.digraph->nodes.at(MDG::Test::Utils::nodeIdByPath(*state_.digraph, keyPath));
    }

    std::vector<Edge> edgesOfKind(const std::string &keyPath, EventTypeData::Kind kind) {
        std::vector<Edge> result;
        for (const auto &edge : MDG::Test::Utils::edgesFrom(*state_.digraph, MDG::Test::Utils::nodeIdByPath(*state_.digraph, keyPath))) {
            if (edge.data.eventTypeData.kind == kind) {
                result.push_back(edge);
            }
        }
        return result;
    }

    size_t errorCount(ExtractionErrorType type) const {
        return MDG::Test::Utils::countErrors(state_.errors, type);
    }

    std::shared_ptr<ISourceFile> sourceFile_;
    ProjectMachineState state_;
};

TEST_F(StateExtractorTest, ExtractsNestedStatesAndTransitions) {
    const auto &digraph = extract("{\n"
                                  "  id: 'toggle',\n"
                                  "  initial: 'off',\n"
                                  "  states: {\n"
                                  "    off: { on: { TOGGLE: 'on' } },\n"
                                  "    on: { on: { TOGGLE: 'off' } },\n"
                                  "  },\n"
                                  "}");

    EXPECT_TRUE(state_.errors.empty());
    EXPECT_EQ("node_1", digraph.root);
    EXPECT_EQ(3u, digraph.nodes.size());
    EXPECT_EQ(2u, digraph.edges.size());

    const Node &root = node("");
    EXPECT_EQ(DEFAULT_ROOT_ID, root.data.key);
    EXPECT_FALSE(root.parentId.has_value());
    EXPECT_EQ("off", root.data.initial);
    EXPECT_EQ("toggle", state_.idMap.at(root.uniqueId));

    const Node &off = node("off");
    EXPECT_EQ(root.uniqueId, off.parentId);
    EXPECT_EQ(StateType::NORMAL, off.data.type);

    Edge toggle = MDG::Test::Utils::findEdge(digraph, off.uniqueId, "TOGGLE");
    EXPECT_EQ(std::vector<std::string>{node("on").uniqueId}, toggle.targets);
    EXPECT_TRUE(toggle.data.internal);
}

TEST_F(StateExtractorTest, RecordsLocatorsForNodesAndEdges) {
    extract("{ initial: 'a', states: { a: { entry: 'x', on: { GO: ['b', { target: 'b' }] } }, b: {} } }");

    EXPECT_TRUE(state_.astPaths.nodes.at(state_.digraph->root).empty());
    const Node &a = node("a");
    EXPECT_EQ((AstPath{AstPathStep::property(1), AstPathStep::property(0)}), state_.astPaths.nodes.at(a.uniqueId));

    auto edges = edgesOfKind("a", EventTypeData::Kind::NAMED);
    ASSERT_EQ(2u, edges.size());
    std::vector<AstPath> paths;
    for (const auto &edge : edges) {
        paths.push_back(state_.astPaths.edges.at(edge.uniqueId));
    }
    AstPath base{AstPathStep::property(1), AstPathStep::property(0), AstPathStep::property(1), AstPathStep::property(0)};
    AstPath first = base;
    first.push_back(AstPathStep::element(0));
    AstPath second = base;
    second.push_back(AstPathStep::element(1));
    EXPECT_NE(paths.end(), std::find(paths.begin(), paths.end(), first));
    EXPECT_NE(paths.end(), std::find(paths.begin(), paths.end(), second));
}

TEST_F(StateExtractorTest, FirstDeclaredDuplicateKeyWins) {
    extract("{ initial: 'a', initial: 'b', states: { a: { description: 'first' }, a: { description: 'second' }, b: {} } }");

    EXPECT_TRUE(state_.errors.empty());
    EXPECT_EQ("a", node("").data.initial);
    EXPECT_EQ(3u, state_.digraph->nodes.size());
    EXPECT_EQ("first", node("a").data.description);
}

TEST_F(StateExtractorTest, UnsupportedMembersAreReportedAndSkipped) {
    extract("{ ...base, entry() {}, [dynamicKey]: 1, states: { a: 'oops', b: {} } }");

    EXPECT_EQ(3u, errorCount(ExtractionErrorType::STATE_PROPERTY_UNHANDLED));
    EXPECT_EQ(1u, errorCount(ExtractionErrorType::PROPERTY_KEY_UNHANDLED));
    EXPECT_EQ(1u, errorCount(ExtractionErrorType::STATE_UNHANDLED));

    // The non-object state still becomes a node
    EXPECT_NO_THROW(node("a"));
    EXPECT_NO_THROW(node("b"));
}

TEST_F(StateExtractorTest, ReadsStateTypesAndHistory) {
    extract("{ states: {\n"
            "  p: { type: 'parallel' },\n"
            "  f: { type: 'final' },\n"
            "  h: { type: 'history', history: 'deep' },\n"
            "  legacy: { type: 'history', history: true },\n"
            "  c: { type: 'compound' },\n"
            "  bad: { type: 'weird' },\n"
            "  badHistory: { type: 'history', history: 'sideways' },\n"
            "} }");

    EXPECT_EQ(StateType::PARALLEL, node("p").data.type);
    EXPECT_EQ(StateType::FINAL, node("f").data.type);
    EXPECT_EQ(StateType::HISTORY, node("h").data.type);
    EXPECT_EQ(HistoryType::DEEP, node("h").data.history);
    EXPECT_EQ(HistoryType::DEEP, node("legacy").data.history);
    EXPECT_EQ(StateType::NORMAL, node("c").data.type);
    EXPECT_EQ(StateType::NORMAL, node("bad").data.type);
    EXPECT_FALSE(node("badHistory").data.history.has_value());

    EXPECT_EQ(1u, errorCount(ExtractionErrorType::STATE_TYPE_INVALID));
    EXPECT_EQ(1u, errorCount(ExtractionErrorType::STATE_HISTORY_INVALID));
    EXPECT_EQ(2u, state_.errors.size());
}

TEST_F(StateExtractorTest, ContextIsReadOnlyOnTheRoot) {
    const auto &digraph = extract("{ context: { count: 0, items: [] }, states: { a: { context: {} } } }");

    EXPECT_EQ(nlohmann::json::parse(R"({"count":0,"items":[]})"), digraph.data.context);
    EXPECT_EQ(1u, errorCount(ExtractionErrorType::STATE_PROPERTY_INVALID));
}

TEST_F(StateExtractorTest, ContextFactoryIsKeptAsExpressionText) {
    const auto &digraph = extract("{ context: function () { return {}; } }");

    EXPECT_EQ("{{function () { return {}; }}}", digraph.data.context.get<std::string>());
    EXPECT_TRUE(state_.errors.empty());
}

TEST_F(StateExtractorTest, ReadsDescriptionMetaAndTags) {
    extract("{ states: {\n"
            "  a: { description: `Waits`, meta: { b: 1, a: 'x', ...shared }, tags: ['busy', 'ui'] },\n"
            "  b: { tags: 'single' },\n"
            "} }");

    const Node &a = node("a");
    EXPECT_EQ("Waits", a.data.description);
    ASSERT_EQ(2u, a.data.metaEntries.size());
    EXPECT_EQ("b", a.data.metaEntries[0].first);
    EXPECT_EQ(1, a.data.metaEntries[0].second.get<int>());
    EXPECT_EQ("a", a.data.metaEntries[1].first);
    EXPECT_EQ((std::vector<std::string>{"busy", "ui"}), a.data.tags);
    EXPECT_EQ(std::vector<std::string>{"single"}, node("b").data.tags);
    EXPECT_EQ(1u, errorCount(ExtractionErrorType::PROPERTY_UNHANDLED));
}

TEST_F(StateExtractorTest, EntryAndExitBecomeActionBlocks) {
    const auto &digraph = extract("{ entry: ['log', { type: 'notify', delay: 5 }, () => {}], exit: 'cleanup' }");

    const Node &root = node("");
    ASSERT_EQ(3u, root.data.entry.size());
    ASSERT_EQ(1u, root.data.exit.size());

    const Block &log = digraph.blocks.at(root.data.entry[0]);
    EXPECT_EQ(BlockType::ACTION, log.blockType);
    EXPECT_EQ(root.uniqueId, log.parentId);
    EXPECT_EQ("log", log.sourceId);
    EXPECT_EQ("notify", digraph.blocks.at(root.data.entry[1]).sourceId);
    EXPECT_EQ(0u, digraph.blocks.at(root.data.entry[2]).sourceId.rfind(INLINE_PREFIX, 0));
    EXPECT_EQ("cleanup", digraph.blocks.at(root.data.exit[0]).sourceId);

    EXPECT_EQ(1u, digraph.implementations.actions.count("log"));
    EXPECT_EQ(1u, digraph.implementations.actions.count("cleanup"));
    EXPECT_TRUE(state_.errors.empty());
}

TEST_F(StateExtractorTest, InlineImplementationsKeepTheirSourceText) {
    const auto &digraph = extract("{ initial: 'a', states: {\n"
                                  "  a: { entry: (ctx) => console.log(ctx), on: { GO: { target: 'b', guard: ({ context }) => context.ok } } },\n"
                                  "  b: { exit: ['named'] },\n"
                                  "} }");

    const Block &entry = digraph.blocks.at(node("a").data.entry.at(0));
    EXPECT_EQ("(ctx) => console.log(ctx)", entry.properties.at(INLINE_SOURCE_PROPERTY).get<std::string>());
    EXPECT_EQ("(ctx) => console.log(ctx)", digraph.implementations.actions.at(entry.sourceId).jsImplementation.value());

    Edge go = MDG::Test::Utils::findEdge(digraph, node("a").uniqueId, "GO");
    ASSERT_TRUE(go.data.guard.has_value());
    const Block &guard = digraph.blocks.at(*go.data.guard);
    EXPECT_EQ("({ context }) => context.ok", digraph.implementations.guards.at(guard.sourceId).jsImplementation.value());

    const Block &named = digraph.blocks.at(node("b").data.exit.at(0));
    EXPECT_FALSE(named.properties.contains(INLINE_SOURCE_PROPERTY));
    EXPECT_FALSE(digraph.implementations.actions.at("named").jsImplementation.has_value());

    nlohmann::json serialized = digraph.implementations.actions.at(entry.sourceId);
    EXPECT_EQ("(ctx) => console.log(ctx)", serialized.at("jsImplementation").get<std::string>());
    EXPECT_EQ(digraph.implementations.actions.at(entry.sourceId).jsImplementation,
              serialized.get<Implementation>().jsImplementation);
}

TEST_F(StateExtractorTest, ActionObjectWithoutStaticTypeIsInline) {
    const auto &digraph = extract("{ entry: { type: actionName } }");

    const Node &root = node("");
    ASSERT_EQ(1u, root.data.entry.size());
    EXPECT_EQ(0u, digraph.blocks.at(root.data.entry[0]).sourceId.rfind(INLINE_PREFIX, 0));
    EXPECT_EQ(1u, errorCount(ExtractionErrorType::ACTION_UNHANDLED));
}

TEST_F(StateExtractorTest, ReadsTransitionObjects) {
    const auto &digraph = extract("{ initial: 'a', states: {\n"
                                  "  a: { on: { GO: { target: 'b', actions: ['act'], guard: 'ok', description: 'go', reenter: true } } },\n"
                                  "  b: {},\n"
                                  "} }");

    Edge go = MDG::Test::Utils::findEdge(digraph, node("a").uniqueId, "GO");
    EXPECT_EQ(std::vector<std::string>{node("b").uniqueId}, go.targets);
    EXPECT_EQ("go", go.data.description);
    EXPECT_FALSE(go.data.internal);

    ASSERT_EQ(1u, go.data.actions.size());
    const Block &action = digraph.blocks.at(go.data.actions[0]);
    EXPECT_EQ("act", action.sourceId);
    EXPECT_EQ(go.uniqueId, action.parentId);

    ASSERT_TRUE(go.data.guard.has_value());
    const Block &guard = digraph.blocks.at(*go.data.guard);
    EXPECT_EQ(BlockType::GUARD, guard.blockType);
    EXPECT_EQ("ok", guard.sourceId);
    EXPECT_EQ(1u, digraph.implementations.guards.count("ok"));
}

TEST_F(StateExtractorTest, GuardTakesPrecedenceOverCond) {
    const auto &digraph = extract("{ states: {\n"
                                  "  a: { on: { X: { target: 'b', cond: 'legacy', guard: 'modern' }, Y: { target: 'b', cond: 'legacy' } } },\n"
                                  "  b: {},\n"
                                  "} }");

    Edge x = MDG::Test::Utils::findEdge(digraph, node("a").uniqueId, "X");
    Edge y = MDG::Test::Utils::findEdge(digraph, node("a").uniqueId, "Y");
    EXPECT_EQ("modern", digraph.blocks.at(*x.data.guard).sourceId);
    EXPECT_EQ("legacy", digraph.blocks.at(*y.data.guard).sourceId);
    EXPECT_EQ(2u, digraph.blocks.size());
}

TEST_F(StateExtractorTest, ReadsEveryEdgeGroupShape) {
    const auto &digraph = extract("{ initial: 'a', states: {\n"
                                  "  a: {\n"
                                  "    on: { MANY: ['b', { target: ['b', 'c'] }, undefined], '*': 'c' },\n"
                                  "    always: { target: 'c' },\n"
                                  "    onDone: null,\n"
                                  "  },\n"
                                  "  b: {},\n"
                                  "  c: {},\n"
                                  "} }");

    const std::string b = node("b").uniqueId;
    const std::string c = node("c").uniqueId;

    auto named = edgesOfKind("a", EventTypeData::Kind::NAMED);
    ASSERT_EQ(3u, named.size());
    size_t targetless = 0;
    size_t multiTarget = 0;
    for (const auto &edge : named) {
        EXPECT_EQ("MANY", edge.data.eventTypeData.eventType);
        targetless += edge.targets.empty() ? 1 : 0;
        multiTarget += edge.targets == std::vector<std::string>{b, c} ? 1 : 0;
    }
    EXPECT_EQ(1u, targetless);
    EXPECT_EQ(1u, multiTarget);

    auto wildcard = edgesOfKind("a", EventTypeData::Kind::WILDCARD);
    ASSERT_EQ(1u, wildcard.size());
    EXPECT_EQ(std::vector<std::string>{c}, wildcard[0].targets);

    auto always = edgesOfKind("a", EventTypeData::Kind::ALWAYS);
    ASSERT_EQ(1u, always.size());
    EXPECT_EQ(std::vector<std::string>{c}, always[0].targets);

    auto done = edgesOfKind("a", EventTypeData::Kind::STATE_DONE);
    ASSERT_EQ(1u, done.size());
    EXPECT_TRUE(done[0].targets.empty());

    EXPECT_TRUE(state_.errors.empty());
    EXPECT_EQ(6u, digraph.edges.size());
}

TEST_F(StateExtractorTest, RejectedElementDropsTheWholeGroup) {
    const auto &digraph = extract("{ states: {\n"
                                  "  a: { on: { BAD: [{ target: 'b', actions: 'act' }, 42], OK: 'b' } },\n"
                                  "  b: {},\n"
                                  "} }");

    auto named = edgesOfKind("a", EventTypeData::Kind::NAMED);
    ASSERT_EQ(1u, named.size());
    EXPECT_EQ("OK", named[0].data.eventTypeData.eventType);
    EXPECT_TRUE(digraph.blocks.empty());
    EXPECT_TRUE(digraph.implementations.actions.empty());
    EXPECT_EQ(1u, errorCount(ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED));
}

TEST_F(StateExtractorTest, NonStringTargetRejectsTheTransition) {
    extract("{ states: { a: { on: { GO: { target: someVariable } } }, b: {} } }");

    EXPECT_TRUE(edgesOfKind("a", EventTypeData::Kind::NAMED).empty());
    EXPECT_EQ(2u, errorCount(ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED));
}

TEST_F(StateExtractorTest, InvocationsCarryCompletionTransitions) {
    const auto &digraph = extract("{ initial: 'loading', states: {\n"
                                  "  loading: {\n"
                                  "    invoke: [\n"
                                  "      { src: 'fetchUser', id: 'user', onDone: 'done', onError: { target: 'failed' } },\n"
                                  "      { src: () => Promise.resolve() },\n"
                                  "    ],\n"
                                  "  },\n"
                                  "  done: {},\n"
                                  "  failed: {},\n"
                                  "} }");

    const Node &loading = node("loading");
    ASSERT_EQ(2u, loading.data.invoke.size());

    const Block &fetch = digraph.blocks.at(loading.data.invoke[0]);
    EXPECT_EQ(BlockType::ACTOR, fetch.blockType);
    EXPECT_EQ("fetchUser", fetch.sourceId);
    EXPECT_EQ("user", fetch.properties.at("id").get<std::string>());
    EXPECT_EQ(1u, digraph.implementations.actors.count("fetchUser"));

    const Block &inlineActor = digraph.blocks.at(loading.data.invoke[1]);
    EXPECT_EQ(0u, inlineActor.sourceId.rfind(INLINE_PREFIX, 0));
    EXPECT_EQ("() => Promise.resolve()",
              digraph.implementations.actors.at(inlineActor.sourceId).jsImplementation.value());
    EXPECT_FALSE(digraph.implementations.actors.at("fetchUser").jsImplementation.has_value());

    auto done = edgesOfKind("loading", EventTypeData::Kind::INVOCATION_DONE);
    ASSERT_EQ(1u, done.size());
    EXPECT_EQ(fetch.uniqueId, done[0].data.eventTypeData.invocationId);
    EXPECT_EQ(std::vector<std::string>{node("done").uniqueId}, done[0].targets);

    auto error = edgesOfKind("loading", EventTypeData::Kind::INVOCATION_ERROR);
    ASSERT_EQ(1u, error.size());
    EXPECT_EQ(std::vector<std::string>{node("failed").uniqueId}, error[0].targets);

    const AstPath &path = state_.astPaths.edges.at(done[0].uniqueId);
    AstPath expected = state_.astPaths.nodes.at(loading.uniqueId);
    expected.push_back(AstPathStep::property(0));
    expected.push_back(AstPathStep::element(0));
    expected.push_back(AstPathStep::property(2));
    EXPECT_EQ(expected, path);
}

TEST_F(StateExtractorTest, MissingConfigurationYieldsBareRoot) {
    const auto &digraph = extract("");

    EXPECT_EQ(1u, digraph.nodes.size());
    EXPECT_TRUE(digraph.edges.empty());
    EXPECT_TRUE(state_.errors.empty());
}

}  // namespace MDG
