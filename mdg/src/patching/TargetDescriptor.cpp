// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "patching/TargetDescriptor.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace MDG {

namespace {

const Node &getNode(const Digraph &digraph, const std::string &nodeId) {
    auto it = digraph.nodes.find(nodeId);
    if (it == digraph.nodes.end()) {
        LOG_ERROR("TargetDescriptor: Node {} not found", nodeId);
        throw std::runtime_error("Node not found: " + nodeId);
    }
    return it->second;
}

std::string declaredId(const ProjectMachineState &state, const std::string &nodeId) {
    auto it = state.idMap.find(nodeId);
    return it == state.idMap.end() ? "" : it->second;
}

}  // namespace

std::string TargetDescriptor::getBestTargetDescriptor(const std::string &sourceId, const std::string &targetId,
                                                      const ProjectMachineState &state) {
    if (!state.digraph) {
        throw std::runtime_error("Machine not found");
    }
    const Digraph &digraph = *state.digraph;
    const Node &source = getNode(digraph, sourceId);
    const Node &target = getNode(digraph, targetId);

    if (!target.parentId) {
        std::string id = declaredId(state, targetId);
        return "#" + (id.empty() ? std::string(DEFAULT_ROOT_ID) : id);
    }

    if (sourceId == targetId) {
        return source.data.key;
    }

    std::vector<const Node *> targetPathNodes = getPathNodes(digraph, target);
    std::vector<const Node *> sourcePathNodes = getPathNodes(digraph, source);

    auto common = std::find_first_of(targetPathNodes.begin(), targetPathNodes.end(), sourcePathNodes.begin(),
                                     sourcePathNodes.end());
    const Node *commonNode = common == targetPathNodes.end() ? nullptr : *common;

    // Descendant of the source
    if (commonNode == &source) {
        return "." + joinKeys(targetPathNodes.begin(), targetPathNodes.end() - sourcePathNodes.size());
    }

    // Within the source's parent; the parent itself has no sibling-relative path
    if (source.parentId && commonNode == &getNode(digraph, *source.parentId) && commonNode != &target) {
        return joinKeys(targetPathNodes.begin(), targetPathNodes.end() - (sourcePathNodes.size() - 1));
    }

    std::string targetDeclaredId = declaredId(state, targetId);
    if (!targetDeclaredId.empty()) {
        return "#" + targetDeclaredId;
    }

    for (size_t i = 0; i < targetPathNodes.size(); ++i) {
        const Node *current = targetPathNodes[i];
        std::string id = declaredId(state, current->uniqueId);
        if (!id.empty() || !current->parentId) {
            std::string descriptor = "#" + (id.empty() ? std::string(DEFAULT_ROOT_ID) : id);
            if (i > 0) {
                descriptor += "." + joinKeys(targetPathNodes.begin(), targetPathNodes.begin() + i);
            }
            return descriptor;
        }
    }

    LOG_ERROR("TargetDescriptor: No descriptor from {} to {}", sourceId, targetId);
    throw std::logic_error("Unreachable: target state is detached from the root");
}

std::vector<const Node *> TargetDescriptor::getPathNodes(const Digraph &digraph, const Node &node) {
    std::vector<const Node *> nodes{&node};
    const Node *current = &node;
    while (current->parentId) {
        current = &getNode(digraph, *current->parentId);
        nodes.push_back(current);
        if (nodes.size() > digraph.nodes.size()) {
            throw std::logic_error("Cycle in state hierarchy at " + node.uniqueId);
        }
    }
    return nodes;
}

std::string TargetDescriptor::joinKeys(std::vector<const Node *>::const_iterator begin,
                                       std::vector<const Node *>::const_iterator end) {
    // Path nodes run from the target upwards; descriptors read downwards
    std::string result;
    for (auto it = end; it != begin;) {
        --it;
        if (!result.empty()) {
            result += ".";
        }
        result += (*it)->data.key;
    }
    return result;
}

}  // namespace MDG
