// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "extraction/StateExtractor.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"
#include "extraction/LiteralReader.h"

#include <utility>

namespace MDG {

std::string StateExtractor::extractState(ExtractionContext &ctx, const SyntaxNodePtr &state,
                                         const std::optional<std::string> &parentId, const std::string &key) {
    Node node;
    node.uniqueId = UniqueIdGenerator::generateNodeId();
    node.parentId = parentId;
    node.data.key = key;

    const std::string nodeId = node.uniqueId;
    ctx.digraph.nodes[nodeId] = node;
    ctx.treeNodes[nodeId] = TreeNode{nodeId, parentId, {}};
    ctx.astPaths.nodes[nodeId] = ctx.currentAstPath;

    LOG_DEBUG("StateExtractor: Extracting state '{}' as {} at {}", Log::sanitize(key), nodeId,
              toString(ctx.currentAstPath));

    if (!state) {
        return nodeId;
    }

    if (!LiteralReader::isObjectLiteral(state)) {
        ctx.addError(ExtractionErrorType::STATE_UNHANDLED);
        return nodeId;
    }

    const auto first = LiteralReader::getFirstDeclarations(state);
    const auto &properties = state->getProperties();

    // Reverse scan; only the syntactically first occurrence of a key is read
    for (size_t i = properties.size(); i-- > 0;) {
        const auto &property = properties[i];
        if (!LiteralReader::isPropertyAssignment(property)) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
            continue;
        }

        auto propertyKey = LiteralReader::getPropertyKey(&ctx.errors, *property);
        if (!propertyKey) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
            continue;
        }
        if (first.at(*propertyKey) != i) {
            continue;
        }

        AstPathSegmentGuard guard(ctx, AstPathStep::property(i));
        extractStateProperty(ctx, nodeId, !parentId.has_value(), *propertyKey, property->getInitializer());
    }

    return nodeId;
}

void StateExtractor::extractStateProperty(ExtractionContext &ctx, const std::string &nodeId, bool isRoot,
                                          const std::string &key, const SyntaxNodePtr &value) {
    Node &node = ctx.digraph.nodes.at(nodeId);

    if (key == "id") {
        if (LiteralReader::isStringLiteralLike(value)) {
            ctx.idToNodeIdMap[value->getLiteralText()] = nodeId;
        }
        return;
    }

    if (key == "context") {
        if (!isRoot) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_INVALID);
            return;
        }
        if (LiteralReader::isObjectLiteral(value)) {
            if (auto context = LiteralReader::getJsonObject(&ctx.errors, value)) {
                ctx.digraph.data.context = *context;
            }
            return;
        }
        if (value &&
            (value->getKind() == SyntaxKind::FunctionExpression || value->getKind() == SyntaxKind::ArrowFunction)) {
            ctx.digraph.data.context = "{{" + value->getText() + "}}";
            return;
        }
        ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
        return;
    }

    if (key == "always") {
        extractEdgeGroup(ctx, value, nodeId, EventTypeData::of(EventTypeData::Kind::ALWAYS));
        return;
    }

    if (key == "onDone") {
        extractEdgeGroup(ctx, value, nodeId, EventTypeData::of(EventTypeData::Kind::STATE_DONE));
        return;
    }

    if (key == "on") {
        extractOn(ctx, nodeId, value);
        return;
    }

    if (key == "states") {
        extractStates(ctx, nodeId, value);
        return;
    }

    if (key == "initial") {
        if (LiteralReader::isStringLiteralLike(value)) {
            node.data.initial = value->getLiteralText();
        } else if (!LiteralReader::isUndefined(value)) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
        }
        return;
    }

    if (key == "type") {
        if (LiteralReader::isStringLiteralLike(value)) {
            const std::string text = value->getLiteralText();
            if (text == "history" || text == "parallel" || text == "final") {
                node.data.type = stateTypeFromString(text);
            } else if (text != "atomic" && text != "compound") {
                ctx.addError(ExtractionErrorType::STATE_TYPE_INVALID);
            }
        } else if (!LiteralReader::isUndefined(value)) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
        }
        return;
    }

    if (key == "history") {
        if (LiteralReader::isStringLiteralLike(value)) {
            const std::string text = value->getLiteralText();
            if (text == "shallow" || text == "deep") {
                node.data.history = historyTypeFromString(text);
            } else {
                ctx.addError(ExtractionErrorType::STATE_HISTORY_INVALID);
            }
        } else if (value && value->getKind() == SyntaxKind::TrueKeyword) {
            node.data.history = HistoryType::DEEP;
        } else if (value && value->getKind() == SyntaxKind::FalseKeyword) {
            node.data.history = HistoryType::SHALLOW;
        } else if (!LiteralReader::isUndefined(value)) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
        }
        return;
    }

    if (key == "description") {
        if (LiteralReader::isStringLiteralLike(value)) {
            node.data.description = value->getLiteralText();
        } else if (!LiteralReader::isUndefined(value)) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
        }
        return;
    }

    if (key == "meta") {
        extractMeta(ctx, node, value);
        return;
    }

    if (key == "tags") {
        extractTags(ctx, node, value);
        return;
    }

    if (key == "entry" || key == "exit") {
        auto blocks = extractActionBlocks(ctx, value, nodeId);
        if (!blocks) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
            return;
        }
        registerBlocks(ctx, *blocks, key == "entry" ? node.data.entry : node.data.exit);
        return;
    }

    if (key == "invoke") {
        extractInvoke(ctx, nodeId, value);
        return;
    }

    // Other keys carry nothing the digraph models
}

void StateExtractor::extractOn(ExtractionContext &ctx, const std::string &nodeId, const SyntaxNodePtr &value) {
    if (!LiteralReader::isObjectLiteral(value)) {
        ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
        return;
    }

    const auto &transitions = value->getProperties();
    for (size_t i = 0; i < transitions.size(); ++i) {
        const auto &transition = transitions[i];
        if (!LiteralReader::isPropertyAssignment(transition)) {
            ctx.addError(ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED);
            return;
        }

        auto event = LiteralReader::getPropertyKey(&ctx.errors, *transition);
        if (!event) {
            ctx.addError(ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED);
            return;
        }

        AstPathSegmentGuard guard(ctx, AstPathStep::property(i));
        extractEdgeGroup(ctx, transition->getInitializer(), nodeId,
                         *event == "*" ? EventTypeData::of(EventTypeData::Kind::WILDCARD)
                                       : EventTypeData::named(*event));
    }
}

void StateExtractor::extractStates(ExtractionContext &ctx, const std::string &nodeId, const SyntaxNodePtr &value) {
    if (!LiteralReader::isObjectLiteral(value)) {
        ctx.addError(ExtractionErrorType::STATE_UNHANDLED);
        return;
    }

    const auto &states = value->getProperties();
    for (size_t i = 0; i < states.size(); ++i) {
        const auto &child = states[i];
        if (!LiteralReader::isPropertyAssignment(child)) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
            continue;
        }

        auto childKey = LiteralReader::getPropertyKey(&ctx.errors, *child);
        if (!childKey || ctx.treeNodes.at(nodeId).children.count(*childKey) > 0) {
            continue;
        }

        AstPathSegmentGuard guard(ctx, AstPathStep::property(i));
        std::string childId = extractState(ctx, child->getInitializer(), nodeId, *childKey);
        ctx.treeNodes.at(nodeId).children[*childKey] = childId;
    }
}

void StateExtractor::extractMeta(ExtractionContext &ctx, Node &node, const SyntaxNodePtr &value) {
    if (LiteralReader::isObjectLiteral(value)) {
        std::vector<std::pair<std::string, nlohmann::json>> entries;
        LiteralReader::forEachStaticProperty(ctx, value, [&ctx, &entries](const SyntaxNodePtr &entry,
                                                                          const std::string &metaKey) {
            auto metaValue = LiteralReader::getJsonValue(&ctx.errors, entry->getInitializer());
            entries.emplace_back(metaKey, metaValue ? *metaValue : nlohmann::json(nullptr));
        });
        // Visited back to front
        node.data.metaEntries.assign(entries.rbegin(), entries.rend());
        return;
    }
    if (!LiteralReader::isUndefined(value)) {
        ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
    }
}

void StateExtractor::extractTags(ExtractionContext &ctx, Node &node, const SyntaxNodePtr &value) {
    if (LiteralReader::isStringLiteralLike(value)) {
        node.data.tags = {value->getLiteralText()};
        return;
    }
    if (LiteralReader::isArrayLiteral(value)) {
        std::vector<std::string> tags;
        for (const auto &element : value->getElements()) {
            if (!LiteralReader::isStringLiteralLike(element)) {
                ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
                return;
            }
            tags.push_back(element->getLiteralText());
        }
        node.data.tags = tags;
        return;
    }
    if (!LiteralReader::isUndefined(value)) {
        ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
    }
}

void StateExtractor::extractInvoke(ExtractionContext &ctx, const std::string &nodeId, const SyntaxNodePtr &value) {
    auto blocks = LiteralReader::mapMaybeArrayElements<std::optional<Block>>(
        ctx, value, [&ctx, &nodeId](const SyntaxNodePtr &element, size_t) -> std::optional<Block> {
            if (LiteralReader::isUndefined(element)) {
                return std::nullopt;
            }
            if (LiteralReader::isObjectLiteral(element)) {
                auto srcProperty = LiteralReader::findProperty(&ctx.errors, element, "src");
                if (srcProperty) {
                    auto idProperty = LiteralReader::findProperty(&ctx.errors, element, "id");
                    auto src = srcProperty->getInitializer();
                    bool isInline = !LiteralReader::isStringLiteralLike(src);
                    std::string sourceId = isInline ? createInlineSourceId() : src->getLiteralText();
                    std::string actorId = idProperty && LiteralReader::isStringLiteralLike(idProperty->getInitializer())
                                              ? idProperty->getInitializer()->getLiteralText()
                                              : createInlineSourceId();
                    Block block = createActorBlock(sourceId, nodeId, actorId);
                    return isInline ? withInlineSource(std::move(block), src) : block;
                }
            }
            return withInlineSource(createActorBlock(createInlineSourceId(), nodeId, createInlineSourceId()), element);
        });

    std::vector<Block> accepted;
    for (const auto &block : blocks) {
        if (!block) {
            ctx.addError(ExtractionErrorType::STATE_PROPERTY_UNHANDLED);
            return;
        }
        accepted.push_back(*block);
    }

    registerBlocks(ctx, accepted, ctx.digraph.nodes.at(nodeId).data.invoke);

    // Completion and error transitions of each invocation
    bool isArray = LiteralReader::isArrayLiteral(value);
    for (size_t i = 0; i < accepted.size(); ++i) {
        SyntaxNodePtr element = isArray ? value->getElements()[i] : value;
        if (!LiteralReader::isObjectLiteral(element)) {
            continue;
        }

        std::optional<AstPathSegmentGuard> elementGuard;
        if (isArray) {
            elementGuard.emplace(ctx, AstPathStep::element(i));
        }

        const auto first = LiteralReader::getFirstDeclarations(element);
        const auto &properties = element->getProperties();
        for (size_t j = properties.size(); j-- > 0;) {
            const auto &property = properties[j];
            if (!LiteralReader::isPropertyAssignment(property)) {
                continue;
            }
            auto key = LiteralReader::getPropertyKey(nullptr, *property);
            if (!key || (*key != "onDone" && *key != "onError") || first.at(*key) != j) {
                continue;
            }

            AstPathSegmentGuard guard(ctx, AstPathStep::property(j));
            auto kind = *key == "onDone" ? EventTypeData::Kind::INVOCATION_DONE : EventTypeData::Kind::INVOCATION_ERROR;
            extractEdgeGroup(ctx, property->getInitializer(), nodeId,
                             EventTypeData::invocation(kind, accepted[i].uniqueId));
        }
    }
}

void StateExtractor::extractEdgeGroup(ExtractionContext &ctx, const SyntaxNodePtr &value,
                                      const std::string &sourceId, const EventTypeData &eventTypeData) {
    auto mapped = LiteralReader::mapMaybeArrayElements<std::optional<PendingEdge>>(
        ctx, value, [&ctx, &sourceId, &eventTypeData](const SyntaxNodePtr &element, size_t) {
            PendingEdge pending{createEdge(sourceId, eventTypeData), std::nullopt, ctx.currentAstPath, {}};

            if (isForbiddenTarget(element)) {
                return std::optional<PendingEdge>(pending);
            }
            if (LiteralReader::isStringLiteralLike(element)) {
                pending.targets = std::vector<std::string>{element->getLiteralText()};
                return std::optional<PendingEdge>(pending);
            }
            if (LiteralReader::isObjectLiteral(element) && extractTransitionObject(ctx, element, pending)) {
                return std::optional<PendingEdge>(pending);
            }
            return std::optional<PendingEdge>();
        });

    for (const auto &pending : mapped) {
        if (!pending) {
            ctx.addError(ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED);
            return;
        }
    }

    for (auto &pending : mapped) {
        Edge &edge = pending->edge;
        for (const auto &block : pending->blocks) {
            ctx.digraph.blocks[block.uniqueId] = block;
            ctx.digraph.implementations.registerBlock(block);
        }
        ctx.astPaths.edges[edge.uniqueId] = pending->path;
        if (pending->targets) {
            ctx.originalTargets.emplace_back(edge.uniqueId, *pending->targets);
        }
        LOG_DEBUG("StateExtractor: Edge {} ({}) from {} at {}", edge.uniqueId,
                  eventKindToString(edge.data.eventTypeData.kind), sourceId, toString(pending->path));
        ctx.digraph.edges[edge.uniqueId] = std::move(edge);
    }
}

bool StateExtractor::extractTransitionObject(ExtractionContext &ctx, const SyntaxNodePtr &transition,
                                             PendingEdge &pending) {
    auto targets = getObjectTransitionTargets(ctx, transition);
    if (targets) {
        std::vector<std::string> rawTargets;
        for (const auto &target : *targets) {
            if (!target) {
                ctx.addError(ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED);
                return false;
            }
            rawTargets.push_back(*target);
        }
        pending.targets = rawTargets;
    }

    Edge &edge = pending.edge;
    const auto first = LiteralReader::getFirstDeclarations(transition);
    const auto &properties = transition->getProperties();

    for (size_t i = properties.size(); i-- > 0;) {
        const auto &property = properties[i];
        if (!LiteralReader::isPropertyAssignment(property)) {
            ctx.addError(ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED);
            continue;
        }
        auto key = LiteralReader::getPropertyKey(&ctx.errors, *property);
        if (!key) {
            ctx.addError(ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED);
            continue;
        }
        if (first.at(*key) != i) {
            continue;
        }

        const SyntaxNodePtr value = property->getInitializer();
        if (*key == "actions") {
            auto blocks = extractActionBlocks(ctx, value, edge.uniqueId);
            if (!blocks) {
                ctx.addError(ExtractionErrorType::TRANSITION_PROPERTY_UNHANDLED);
                continue;
            }
            for (const auto &block : *blocks) {
                edge.data.actions.push_back(block.uniqueId);
                pending.blocks.push_back(block);
            }
        } else if (*key == "description") {
            edge.data.description = LiteralReader::isStringLiteralLike(value)
                                        ? std::optional<std::string>(value->getLiteralText())
                                        : std::nullopt;
        } else if (*key == "guard" || (*key == "cond" && first.count("guard") == 0)) {
            // `guard` takes precedence over the legacy `cond`
            if (LiteralReader::isUndefined(value)) {
                continue;
            }
            Block guard = extractGuardBlock(value, edge.uniqueId);
            edge.data.guard = guard.uniqueId;
            pending.blocks.push_back(guard);
        } else if (*key == "reenter") {
            if (value && value->getKind() == SyntaxKind::TrueKeyword) {
                edge.data.internal = false;
            } else if (value && value->getKind() == SyntaxKind::FalseKeyword) {
                edge.data.internal = true;
            }
        }
    }

    return true;
}

std::optional<std::vector<std::optional<std::string>>>
StateExtractor::getObjectTransitionTargets(ExtractionContext &ctx, const SyntaxNodePtr &transition) {
    auto targetProperty = LiteralReader::findProperty(&ctx.errors, transition, "target");
    if (!targetProperty || isForbiddenTarget(targetProperty->getInitializer())) {
        return std::nullopt;
    }

    return LiteralReader::mapMaybeArrayElements<std::optional<std::string>>(
        ctx, targetProperty->getInitializer(), [](const SyntaxNodePtr &element, size_t) {
            return LiteralReader::isStringLiteralLike(element) ? std::optional<std::string>(element->getLiteralText())
                                                               : std::nullopt;
        });
}

std::optional<std::vector<Block>> StateExtractor::extractActionBlocks(ExtractionContext &ctx,
                                                                      const SyntaxNodePtr &value,
                                                                      const std::string &parentId) {
    auto mapped = LiteralReader::mapMaybeArrayElements<std::optional<Block>>(
        ctx, value, [&ctx, &parentId](const SyntaxNodePtr &element, size_t) -> std::optional<Block> {
            if (LiteralReader::isUndefined(element)) {
                return std::nullopt;
            }
            if (LiteralReader::isStringLiteralLike(element)) {
                return createActionBlock(element->getLiteralText(), parentId);
            }
            if (LiteralReader::isObjectLiteral(element)) {
                auto typeProperty = LiteralReader::findProperty(&ctx.errors, element, "type");
                if (typeProperty) {
                    if (LiteralReader::isStringLiteralLike(typeProperty->getInitializer())) {
                        return createActionBlock(typeProperty->getInitializer()->getLiteralText(), parentId);
                    }
                    ctx.addError(ExtractionErrorType::ACTION_UNHANDLED);
                }
            }
            return withInlineSource(createActionBlock(createInlineSourceId(), parentId), element);
        });

    std::vector<Block> blocks;
    for (const auto &block : mapped) {
        if (!block) {
            return std::nullopt;
        }
        blocks.push_back(*block);
    }
    return blocks;
}

Block StateExtractor::extractGuardBlock(const SyntaxNodePtr &value, const std::string &parentId) {
    if (LiteralReader::isStringLiteralLike(value)) {
        return createGuardBlock(value->getLiteralText(), parentId);
    }
    if (LiteralReader::isObjectLiteral(value)) {
        auto typeProperty = LiteralReader::findProperty(nullptr, value, "type");
        if (typeProperty && LiteralReader::isStringLiteralLike(typeProperty->getInitializer())) {
            return createGuardBlock(typeProperty->getInitializer()->getLiteralText(), parentId);
        }
    }
    return withInlineSource(createGuardBlock(createInlineSourceId(), parentId), value);
}

void StateExtractor::registerBlocks(ExtractionContext &ctx, const std::vector<Block> &blocks,
                                    std::vector<std::string> &container) {
    for (const auto &block : blocks) {
        container.push_back(block.uniqueId);
        ctx.digraph.blocks[block.uniqueId] = block;
        ctx.digraph.implementations.registerBlock(block);
    }
}

Block StateExtractor::createActionBlock(const std::string &sourceId, const std::string &parentId) {
    Block block;
    block.uniqueId = UniqueIdGenerator::generateBlockId();
    block.blockType = BlockType::ACTION;
    block.parentId = parentId;
    block.sourceId = sourceId;
    block.properties = nlohmann::json{{"type", sourceId}, {"params", nlohmann::json::object()}};
    return block;
}

Block StateExtractor::createActorBlock(const std::string &sourceId, const std::string &parentId,
                                       const std::string &actorId) {
    Block block;
    block.uniqueId = UniqueIdGenerator::generateBlockId();
    block.blockType = BlockType::ACTOR;
    block.parentId = parentId;
    block.sourceId = sourceId;
    block.properties = nlohmann::json{{"src", sourceId}, {"id", actorId}};
    return block;
}

Block StateExtractor::createGuardBlock(const std::string &sourceId, const std::string &parentId) {
    Block block;
    block.uniqueId = UniqueIdGenerator::generateBlockId();
    block.blockType = BlockType::GUARD;
    block.parentId = parentId;
    block.sourceId = sourceId;
    block.properties = nlohmann::json{{"type", sourceId}, {"params", nlohmann::json::object()}};
    return block;
}

Block StateExtractor::withInlineSource(Block block, const SyntaxNodePtr &expression) {
    if (expression) {
        block.properties[INLINE_SOURCE_PROPERTY] = expression->getText();
    }
    return block;
}

Edge StateExtractor::createEdge(const std::string &sourceId, const EventTypeData &eventTypeData) {
    Edge edge;
    edge.uniqueId = UniqueIdGenerator::generateEdgeId();
    edge.source = sourceId;
    edge.data.eventTypeData = eventTypeData;
    return edge;
}

std::string StateExtractor::createInlineSourceId() {
    return std::string(INLINE_PREFIX) + UniqueIdGenerator::generateInlineToken();
}

bool StateExtractor::isForbiddenTarget(const SyntaxNodePtr &value) {
    // null isn't part of the typed API but behaves like undefined at runtime
    return LiteralReader::isUndefined(value) || (value && value->getKind() == SyntaxKind::NullKeyword);
}

}  // namespace MDG
