// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "extraction/TargetResolver.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "model/DigraphTypes.h"

namespace MDG {

void TargetResolver::resolveTargets(ExtractionContext &ctx) {
    for (const auto &[edgeId, targets] : ctx.originalTargets) {
        Edge &edge = ctx.digraph.edges.at(edgeId);
        for (const auto &target : targets) {
            auto resolved = resolveTargetId(ctx, edge.source, target);
            if (!resolved) {
                LOG_DEBUG("TargetResolver: Unresolved target '{}' on edge {}", Log::sanitize(target), edgeId);
                ctx.addError(ExtractionErrorType::TRANSITION_TARGET_UNRESOLVED);
                continue;
            }
            edge.targets.push_back(*resolved);
        }
    }
}

std::optional<std::string> TargetResolver::resolveTargetId(const ExtractionContext &ctx, const std::string &sourceId,
                                                           const std::string &target) {
    std::vector<std::string> segments = split(target, '.');
    const TreeNode *marker = resolvePathOrigin(ctx, sourceId, segments.front());
    if (!marker) {
        return std::nullopt;
    }

    for (size_t i = 1; i < segments.size(); ++i) {
        // An empty segment ends the path
        if (segments[i].empty()) {
            break;
        }
        auto child = marker->children.find(segments[i]);
        if (child == marker->children.end()) {
            return std::nullopt;
        }
        marker = &ctx.treeNodes.at(child->second);
    }
    return marker->uniqueId;
}

const TreeNode *TargetResolver::resolvePathOrigin(const ExtractionContext &ctx, const std::string &sourceId,
                                                  const std::string &origin) {
    if (origin.empty()) {
        auto source = ctx.treeNodes.find(sourceId);
        return source == ctx.treeNodes.end() ? nullptr : &source->second;
    }

    if (origin[0] == '#') {
        const std::string id = origin.substr(1);
        auto declared = ctx.idToNodeIdMap.find(id);
        if (declared != ctx.idToNodeIdMap.end()) {
            return &ctx.treeNodes.at(declared->second);
        }
        // `#(machine)` names the root unless some state declares that id
        if (id == DEFAULT_ROOT_ID && !ctx.digraph.root.empty()) {
            return &ctx.treeNodes.at(ctx.digraph.root);
        }
        return nullptr;
    }

    const TreeNode &source = ctx.treeNodes.at(sourceId);
    if (!source.parentId) {
        return nullptr;
    }
    const TreeNode &parent = ctx.treeNodes.at(*source.parentId);
    auto sibling = parent.children.find(origin);
    return sibling == parent.children.end() ? nullptr : &ctx.treeNodes.at(sibling->second);
}

}  // namespace MDG
