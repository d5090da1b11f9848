// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "extraction/ExtractionContext.h"
#include "model/DigraphTypes.h"
#include "parsing/ISyntaxNode.h"
#include <optional>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Extracts states, transitions and blocks from a configuration literal
 *
 * Descends the literal tree recursively, registering every Node, Edge and
 * Block in the context's Digraph and stamping nodes and edges with their
 * locator. Unsupported shapes record soft errors and are skipped; raw
 * transition targets are left in ExtractionContext::originalTargets for
 * TargetResolver.
 */
class StateExtractor {
public:
    /**
     * @brief Extract one state literal and its descendants
     *
     * @param ctx Extraction context
     * @param state State literal, nullptr for a missing configuration argument
     * @param parentId Parent node id, nullopt for the root
     * @param key Property key under the parent's `states`, DEFAULT_ROOT_ID for the root
     * @return Id of the created node
     */
    static std::string extractState(ExtractionContext &ctx, const SyntaxNodePtr &state,
                                    const std::optional<std::string> &parentId, const std::string &key);

private:
    struct PendingEdge {
        Edge edge;
        std::optional<std::vector<std::string>> targets;
        AstPath path;
        std::vector<Block> blocks;
    };

    static void extractStateProperty(ExtractionContext &ctx, const std::string &nodeId, bool isRoot,
                                     const std::string &key, const SyntaxNodePtr &value);

    static void extractOn(ExtractionContext &ctx, const std::string &nodeId, const SyntaxNodePtr &value);
    static void extractStates(ExtractionContext &ctx, const std::string &nodeId, const SyntaxNodePtr &value);
    static void extractMeta(ExtractionContext &ctx, Node &node, const SyntaxNodePtr &value);
    static void extractTags(ExtractionContext &ctx, Node &node, const SyntaxNodePtr &value);
    static void extractInvoke(ExtractionContext &ctx, const std::string &nodeId, const SyntaxNodePtr &value);

    /**
     * @brief Extract a transition or list of transitions sharing one event
     *
     * A rejected element rejects the whole group.
     */
    static void extractEdgeGroup(ExtractionContext &ctx, const SyntaxNodePtr &value, const std::string &sourceId,
                                 const EventTypeData &eventTypeData);

    /**
     * @brief Read one object-literal transition into pending
     * @return false when the transition is rejected
     */
    static bool extractTransitionObject(ExtractionContext &ctx, const SyntaxNodePtr &transition,
                                        PendingEdge &pending);

    /**
     * @brief Targets of an object-literal transition
     * @return nullopt for targetless, a nullopt item for each non-string target
     */
    static std::optional<std::vector<std::optional<std::string>>>
    getObjectTransitionTargets(ExtractionContext &ctx, const SyntaxNodePtr &transition);

    /**
     * @brief Action blocks of a single action or array of actions
     * @return nullopt when any element is `undefined`
     */
    static std::optional<std::vector<Block>> extractActionBlocks(ExtractionContext &ctx, const SyntaxNodePtr &value,
                                                                 const std::string &parentId);

    static Block extractGuardBlock(const SyntaxNodePtr &value, const std::string &parentId);

    static void registerBlocks(ExtractionContext &ctx, const std::vector<Block> &blocks,
                               std::vector<std::string> &container);

    static Block createActionBlock(const std::string &sourceId, const std::string &parentId);
    static Block createActorBlock(const std::string &sourceId, const std::string &parentId,
                                  const std::string &actorId);
    static Block createGuardBlock(const std::string &sourceId, const std::string &parentId);
    /**
     * @brief Attach the raw source text of an inline implementation
     */
    static Block withInlineSource(Block block, const SyntaxNodePtr &expression);
    static Edge createEdge(const std::string &sourceId, const EventTypeData &eventTypeData);
    static std::string createInlineSourceId();

    static bool isForbiddenTarget(const SyntaxNodePtr &value);
};

}  // namespace MDG
