// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "common/UniqueIdGenerator.h"
#include "extraction/ExtractionContext.h"
#include "extraction/MachineExtractor.h"
#include "extraction/StateExtractor.h"
#include "extraction/TargetResolver.h"
#include "patching/TargetDescriptor.h"
#include "tests/common/TestUtils.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace MDG {

class TargetDescriptorTest : public ::testing::Test {
protected:
    void SetUp() override {
        UniqueIdGenerator::resetForTesting();
    }

    void load(const std::string &config) {
        sourceFile_ = MDG::Test::Utils::parseSource("createMachine(" + config + ");");
        auto calls = MachineExtractor::findCreateMachineCalls(*sourceFile_);
        ASSERT_EQ(1u, calls.size());

        ctx_ = ExtractionContext{};
        ctx_.sourceFile = sourceFile_;
        ctx_.digraph.root =
            StateExtractor::extractState(ctx_, MachineExtractor::getConfigRoot(calls[0]), std::nullopt, DEFAULT_ROOT_ID);

        state_ = ProjectMachineState{};
        state_.digraph = ctx_.digraph;
        for (const auto &[declaredId, nodeId] : ctx_.idToNodeIdMap) {
            state_.idMap[nodeId] = declaredId;
        }
    }

    std::string id(const std::string &keyPath) const {
        return MDG::Test::Utils::nodeIdByPath(ctx_.digraph, keyPath);
    }

    std::string describe(const std::string &sourcePath, const std::string &targetPath) const {
        return TargetDescriptor::getBestTargetDescriptor(id(sourcePath), id(targetPath), state_);
    }

    static constexpr const char *kAppMachine = "{\n"
                                               "  id: 'app',\n"
                                               "  states: {\n"
                                               "    idle: { states: { inner: {} } },\n"
                                               "    running: { states: { fast: { id: 'deep' }, slow: {} } },\n"
                                               "  },\n"
                                               "}";

    std::shared_ptr<ISourceFile> sourceFile_;
    ExtractionContext ctx_;
    ProjectMachineState state_;
};

TEST_F(TargetDescriptorTest, RootIsAddressedByItsId) {
    load(kAppMachine);
    EXPECT_EQ("#app", describe("idle", ""));
    EXPECT_EQ("#app", describe("", ""));
}

TEST_F(TargetDescriptorTest, SelfTargetUsesTheKey) {
    load(kAppMachine);
    EXPECT_EQ("idle", describe("idle", "idle"));
}

TEST_F(TargetDescriptorTest, DescendantsUseLeadingDot) {
    load(kAppMachine);
    EXPECT_EQ(".inner", describe("idle", "idle.inner"));
    EXPECT_EQ(".idle", describe("", "idle"));
    EXPECT_EQ(".running.slow", describe("", "running.slow"));
}

TEST_F(TargetDescriptorTest, SiblingSubtreesUsePlainKeys) {
    load(kAppMachine);
    EXPECT_EQ("running", describe("idle", "running"));
    EXPECT_EQ("running.fast", describe("idle", "running.fast"));
    EXPECT_EQ("slow", describe("running.fast", "running.slow"));
}

TEST_F(TargetDescriptorTest, DistantTargetsClimbToADeclaredId) {
    load(kAppMachine);
    EXPECT_EQ("#deep", describe("idle.inner", "running.fast"));
    EXPECT_EQ("#app.running.slow", describe("idle.inner", "running.slow"));
}

TEST_F(TargetDescriptorTest, ParentTargetClimbsInsteadOfSiblingPath) {
    load(kAppMachine);
    EXPECT_EQ("#app.idle", describe("idle.inner", "idle"));
    EXPECT_EQ("#app.running", describe("running.fast", "running"));
}

TEST_F(TargetDescriptorTest, MachineWithoutIdFallsBackToDefaultRootId) {
    load("{ states: { a: { states: { a1: {} } }, b: { states: { b1: {} } } } }");
    EXPECT_EQ("#(machine)", describe("a", ""));
    EXPECT_EQ("#(machine).b.b1", describe("a.a1", "b.b1"));
}

TEST_F(TargetDescriptorTest, DescriptorsResolveBackToTheirTarget) {
    load(kAppMachine);
    for (const auto &[sourceId, source] : ctx_.digraph.nodes) {
        for (const auto &[targetId, target] : ctx_.digraph.nodes) {
            std::string descriptor = TargetDescriptor::getBestTargetDescriptor(sourceId, targetId, state_);
            EXPECT_EQ(targetId, TargetResolver::resolveTargetId(ctx_, sourceId, descriptor))
                << sourceId << " -> " << targetId << " via " << descriptor;
        }
    }
}

TEST_F(TargetDescriptorTest, UnknownNodesAreRejected) {
    load(kAppMachine);
    EXPECT_THROW(TargetDescriptor::getBestTargetDescriptor(id("idle"), "node_999", state_), std::runtime_error);
    EXPECT_THROW(TargetDescriptor::getBestTargetDescriptor("node_999", id("idle"), state_), std::runtime_error);

    ProjectMachineState empty;
    EXPECT_THROW(TargetDescriptor::getBestTargetDescriptor(id("idle"), id("idle"), empty), std::runtime_error);
}

}  // namespace MDG
