// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/Patch.h"
#include "model/ProjectMachineState.h"
#include "model/TextEdit.h"
#include "parsing/ISourceFile.h"
#include "parsing/ISyntaxNode.h"
#include "patching/CodeChanges.h"
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Translates Digraph patches into text edits of the machine's source
 *
 * All patches are applied to a copy of the Digraph first; text edits are then
 * derived patch by patch from the locators recorded at extraction time. The
 * patched Digraph is stored back into the state only when every patch
 * succeeded.
 */
class PatchEngine {
public:
    /**
     * @param sourceFile File the state was extracted from
     * @param call The machine's `createMachine` call
     * @param state Machine state, updated in place
     */
    PatchEngine(std::shared_ptr<ISourceFile> sourceFile, const SyntaxNodePtr &call, ProjectMachineState &state);

    /**
     * @brief Apply patches and compute the matching text edits
     *
     * @return Non-overlapping edits sorted by start offset
     * @throws std::runtime_error on stale state, unknown states or unsupported insertions
     * @throws std::invalid_argument on malformed patches
     */
    std::vector<TextEdit> applyPatches(const std::vector<Patch> &patches);

private:
    /**
     * @brief Where a state's properties go: an existing literal, plus the
     *        pending path below it for states added in the same batch
     */
    struct NodeLocation {
        SyntaxNodePtr object;
        ObjectPath chain;
    };

    void applyAdd(const Patch &patch);
    void applyReplace(const Patch &patch);
    void applyRemove(const Patch &patch);

    void addNode(const Node &node);
    void addEdge(const Edge &edge);
    void removeNode(const std::string &nodeId);
    void removeEdge(const std::string &edgeId);

    void renameNode(const std::string &nodeId, const nlohmann::json &value);
    void setNodeProperty(const std::string &nodeId, const std::string &name, const InsertionElement &element);
    void removeNodeProperty(const std::string &nodeId, const std::string &name);

    NodeLocation locateNode(const std::string &nodeId) const;
    SyntaxNodePtr findMember(const AstPath &objectPath, size_t index) const;

    InsertionElement toTransitionElement(const Edge &edge) const;
    ObjectPath getTransitionInsertionPath(const Edge &edge) const;

    /**
     * @brief Edges added and then removed within one batch; neither patch touches source
     */
    static std::set<std::string> findTransientEdges(const std::vector<Patch> &patches);

    static std::optional<std::string> getOptionalString(const nlohmann::json &value, const std::string &field);

    std::shared_ptr<ISourceFile> sourceFile_;
    SyntaxNodePtr configRoot_;
    ProjectMachineState &state_;
    ProjectMachineState patched_;
    CodeChanges codeChanges_;
    std::map<std::string, NodeLocation> pendingNodes_;
    std::set<std::string> transientEdges_;
};

}  // namespace MDG
