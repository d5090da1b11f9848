// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "patching/PatchEngine.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "extraction/LiteralReader.h"
#include "extraction/MachineExtractor.h"
#include "patching/DigraphPatcher.h"
#include "patching/TargetDescriptor.h"

#include <algorithm>
#include <stdexcept>

namespace MDG {

PatchEngine::PatchEngine(std::shared_ptr<ISourceFile> sourceFile, const SyntaxNodePtr &call,
                         ProjectMachineState &state)
    : sourceFile_(std::move(sourceFile)), configRoot_(MachineExtractor::getConfigRoot(call)), state_(state),
      codeChanges_(sourceFile_) {}

std::vector<TextEdit> PatchEngine::applyPatches(const std::vector<Patch> &patches) {
    if (patches.empty()) {
        return {};
    }
    if (!state_.digraph) {
        throw std::runtime_error("Machine not found");
    }
    if (fingerprintSource(sourceFile_->getText()) != state_.sourceFingerprint) {
        LOG_ERROR("PatchEngine: Source of {} changed since extraction", sourceFile_->getFileName());
        throw std::runtime_error("Machine state is stale: source changed since extraction");
    }

    patched_ = state_;
    for (const auto &patch : patches) {
        DigraphPatcher::apply(*patched_.digraph, patch);
    }
    transientEdges_ = findTransientEdges(patches);

    for (const auto &patch : patches) {
        if (patch.path.size() < 2) {
            LOG_DEBUG("PatchEngine: {} {} affects the digraph only", patchOpToString(patch.op),
                      toJsonPointer(patch.path));
            continue;
        }
        switch (patch.op) {
        case PatchOp::ADD:
            applyAdd(patch);
            break;
        case PatchOp::REPLACE:
            applyReplace(patch);
            break;
        case PatchOp::REMOVE:
            applyRemove(patch);
            break;
        }
    }

    std::vector<TextEdit> edits = codeChanges_.getTextEdits();
    state_.digraph = std::move(patched_.digraph);
    LOG_DEBUG("PatchEngine: {} patches -> {} edits", patches.size(), edits.size());
    return edits;
}

// ============================================================================
// Dispatch
// ============================================================================

void PatchEngine::applyAdd(const Patch &patch) {
    if (patch.path.size() != 2) {
        return;
    }
    const std::string &id = patch.path[1];
    if (patch.path[0] == "nodes") {
        addNode(patch.value.get<Node>());
    } else if (patch.path[0] == "edges") {
        if (transientEdges_.count(id) > 0) {
            LOG_DEBUG("PatchEngine: Transition {} is removed in the same batch", id);
            return;
        }
        addEdge(patch.value.get<Edge>());
    }
}

void PatchEngine::applyReplace(const Patch &patch) {
    if (patch.path[0] != "nodes" || patch.path.size() != 4 || patch.path[2] != "data") {
        return;
    }
    const std::string &nodeId = patch.path[1];
    const std::string &field = patch.path[3];

    if (field == "key") {
        renameNode(nodeId, patch.value);
    } else if (field == "initial") {
        auto initial = getOptionalString(patch.value, field);
        if (!initial) {
            removeNodeProperty(nodeId, "initial");
        } else {
            setNodeProperty(nodeId, "initial", InsertionElement::string(*initial));
        }
    } else if (field == "type") {
        auto type = getOptionalString(patch.value, field);
        if (!type || *type == stateTypeToString(StateType::NORMAL)) {
            removeNodeProperty(nodeId, "type");
        } else {
            setNodeProperty(nodeId, "type", InsertionElement::string(*type));
        }
    } else if (field == "history") {
        auto history = getOptionalString(patch.value, field);
        if (!history || *history == historyTypeToString(HistoryType::SHALLOW)) {
            removeNodeProperty(nodeId, "history");
        } else {
            setNodeProperty(nodeId, "history", InsertionElement::string(*history));
        }
    } else if (field == "description") {
        auto description = getOptionalString(patch.value, field);
        if (!description || description->empty()) {
            removeNodeProperty(nodeId, "description");
        } else {
            setNodeProperty(nodeId, "description", InsertionElement::string(*description, true));
        }
    }
}

void PatchEngine::applyRemove(const Patch &patch) {
    if (patch.path.size() != 2) {
        return;
    }
    if (patch.path[0] == "nodes") {
        removeNode(patch.path[1]);
    } else if (patch.path[0] == "edges") {
        removeEdge(patch.path[1]);
    }
}

// ============================================================================
// Nodes
// ============================================================================

void PatchEngine::addNode(const Node &node) {
    if (!node.parentId) {
        throw std::invalid_argument("Cannot add a second root state");
    }
    NodeLocation parent = locateNode(*node.parentId);

    NodeLocation location{parent.object, parent.chain};
    location.chain.push_back(PathSegment::property("states"));
    location.chain.push_back(PathSegment::property(node.data.key));

    codeChanges_.insertAtOptionalObjectPath(location.object, location.chain, InsertionElement::object(),
                                            CodeChanges::Mode::SET);
    pendingNodes_[node.uniqueId] = location;
    LOG_DEBUG("PatchEngine: Added state '{}' under {}", Log::sanitize(node.data.key), *node.parentId);
}

void PatchEngine::removeNode(const std::string &nodeId) {
    auto pending = pendingNodes_.find(nodeId);
    if (pending != pendingNodes_.end()) {
        codeChanges_.removeAtOptionalObjectPath(pending->second.object, pending->second.chain);
        pendingNodes_.erase(pending);
        return;
    }

    auto path = state_.astPaths.nodes.find(nodeId);
    if (path == state_.astPaths.nodes.end()) {
        LOG_WARN("PatchEngine: State {} has no source location, digraph-only removal", nodeId);
        return;
    }
    if (path->second.empty()) {
        LOG_ERROR("PatchEngine: Attempt to remove the root state");
        throw std::runtime_error("Cannot remove the root state");
    }

    AstPath objectPath(path->second.begin(), path->second.end() - 1);
    SyntaxNodePtr object = LiteralReader::findNodeByAstPath(configRoot_, objectPath);
    codeChanges_.removeProperty(object, findMember(objectPath, path->second.back().index));
}

void PatchEngine::renameNode(const std::string &nodeId, const nlohmann::json &value) {
    if (!value.is_string()) {
        throw std::invalid_argument("State key must be a string");
    }

    auto path = state_.astPaths.nodes.find(nodeId);
    if (path == state_.astPaths.nodes.end()) {
        LOG_WARN("PatchEngine: State {} has no source location, rename is digraph-only", nodeId);
        return;
    }
    if (path->second.empty()) {
        LOG_WARN("PatchEngine: The root state has no key in source, rename is digraph-only");
        return;
    }

    AstPath objectPath(path->second.begin(), path->second.end() - 1);
    codeChanges_.replacePropertyName(findMember(objectPath, path->second.back().index), value.get<std::string>());
}

void PatchEngine::setNodeProperty(const std::string &nodeId, const std::string &name,
                                  const InsertionElement &element) {
    NodeLocation location = locateNode(nodeId);

    if (location.chain.empty() && name == "initial" && !LiteralReader::findFirstProperty(location.object, name)) {
        if (SyntaxNodePtr states = LiteralReader::findFirstProperty(location.object, "states")) {
            codeChanges_.insertPropertyBeforeProperty(location.object, states, name, element);
            return;
        }
    }

    ObjectPath path = location.chain;
    path.push_back(PathSegment::property(name));
    codeChanges_.insertAtOptionalObjectPath(location.object, path, element, CodeChanges::Mode::SET);
}

void PatchEngine::removeNodeProperty(const std::string &nodeId, const std::string &name) {
    NodeLocation location = locateNode(nodeId);
    ObjectPath path = location.chain;
    path.push_back(PathSegment::property(name));
    codeChanges_.removeAtOptionalObjectPath(location.object, path);
}

PatchEngine::NodeLocation PatchEngine::locateNode(const std::string &nodeId) const {
    auto path = state_.astPaths.nodes.find(nodeId);
    if (path != state_.astPaths.nodes.end()) {
        SyntaxNodePtr literal = LiteralReader::findNodeByAstPath(configRoot_, path->second);
        if (!LiteralReader::isObjectLiteral(literal)) {
            LOG_ERROR("PatchEngine: State {} is not an object literal", nodeId);
            throw std::runtime_error("Unsupported insertion: state is not an object literal");
        }
        return NodeLocation{literal, {}};
    }

    auto pending = pendingNodes_.find(nodeId);
    if (pending != pendingNodes_.end()) {
        return pending->second;
    }

    LOG_ERROR("PatchEngine: State {} has no source location", nodeId);
    throw std::runtime_error("Invalid node");
}

SyntaxNodePtr PatchEngine::findMember(const AstPath &objectPath, size_t index) const {
    SyntaxNodePtr object = LiteralReader::findNodeByAstPath(configRoot_, objectPath);
    if (!LiteralReader::isObjectLiteral(object) || index >= object->getProperties().size()) {
        throw std::runtime_error("Invalid node");
    }
    return object->getProperties()[index];
}

// ============================================================================
// Edges
// ============================================================================

void PatchEngine::addEdge(const Edge &edge) {
    NodeLocation source = locateNode(edge.source);

    ObjectPath path = source.chain;
    ObjectPath transitionPath = getTransitionInsertionPath(edge);
    path.insert(path.end(), transitionPath.begin(), transitionPath.end());

    codeChanges_.insertAtOptionalObjectPath(source.object, path, toTransitionElement(edge));
    LOG_DEBUG("PatchEngine: Added transition {} from {}", edge.uniqueId, edge.source);
}

void PatchEngine::removeEdge(const std::string &edgeId) {
    if (transientEdges_.count(edgeId) > 0) {
        return;
    }
    auto it = state_.astPaths.edges.find(edgeId);
    if (it == state_.astPaths.edges.end()) {
        LOG_WARN("PatchEngine: Transition {} has no source location, digraph-only removal", edgeId);
        return;
    }
    const AstPath &path = it->second;
    if (path.empty()) {
        throw std::runtime_error("Invalid node");
    }

    AstPath ownerPath(path.begin(), path.end() - 1);
    if (path.back().kind == AstPathStep::Kind::ELEMENT) {
        SyntaxNodePtr array = LiteralReader::findNodeByAstPath(configRoot_, ownerPath);
        if (!LiteralReader::isArrayLiteral(array) || path.back().index >= array->getElements().size()) {
            throw std::runtime_error("Invalid node");
        }
        if (array->getElements().size() > 1) {
            codeChanges_.removeArrayElement(array, array->getElements()[path.back().index]);
            return;
        }
        // Only transition of its group: drop the owning property
        if (ownerPath.empty() || ownerPath.back().kind != AstPathStep::Kind::PROPERTY) {
            throw std::runtime_error("Invalid node");
        }
        size_t index = ownerPath.back().index;
        ownerPath.pop_back();
        codeChanges_.removeProperty(LiteralReader::findNodeByAstPath(configRoot_, ownerPath),
                                    findMember(ownerPath, index));
        return;
    }

    codeChanges_.removeProperty(LiteralReader::findNodeByAstPath(configRoot_, ownerPath),
                                findMember(ownerPath, path.back().index));
}

InsertionElement PatchEngine::toTransitionElement(const Edge &edge) const {
    InsertionElement target = InsertionElement::undefined();
    if (edge.targets.size() == 1) {
        target = InsertionElement::string(TargetDescriptor::getBestTargetDescriptor(edge.source, edge.targets[0],
                                                                                    patched_));
    } else if (edge.targets.size() > 1) {
        std::vector<InsertionElement> targets;
        for (const auto &targetId : edge.targets) {
            targets.push_back(
                InsertionElement::string(TargetDescriptor::getBestTargetDescriptor(edge.source, targetId, patched_)));
        }
        target = InsertionElement::array(std::move(targets));
    }

    std::vector<std::pair<std::string, InsertionElement>> properties{{"target", target}};

    if (edge.data.guard) {
        auto block = patched_.digraph->blocks.find(*edge.data.guard);
        if (block == patched_.digraph->blocks.end()) {
            LOG_ERROR("PatchEngine: Guard block {} not found", *edge.data.guard);
            throw std::runtime_error("Guard block not found: " + *edge.data.guard);
        }
        properties.emplace_back("guard", InsertionElement::string(block->second.sourceId));
    }
    if (!edge.data.internal) {
        properties.emplace_back("reenter", InsertionElement::boolean(true));
    }
    if (edge.data.description && !edge.data.description->empty()) {
        properties.emplace_back("description", InsertionElement::string(*edge.data.description, true));
    }

    if (properties.size() == 1) {
        return target;
    }
    return InsertionElement::object(std::move(properties));
}

ObjectPath PatchEngine::getTransitionInsertionPath(const Edge &edge) const {
    const EventTypeData &eventTypeData = edge.data.eventTypeData;

    switch (eventTypeData.kind) {
    case EventTypeData::Kind::NAMED:
        return {PathSegment::property("on"), PathSegment::property(eventTypeData.eventType)};
    case EventTypeData::Kind::ALWAYS:
        return {PathSegment::property("always")};
    case EventTypeData::Kind::STATE_DONE:
        return {PathSegment::property("onDone")};
    case EventTypeData::Kind::INVOCATION_DONE:
    case EventTypeData::Kind::INVOCATION_ERROR: {
        const auto &invoke = patched_.digraph->nodes.at(edge.source).data.invoke;
        auto it = std::find(invoke.begin(), invoke.end(), eventTypeData.invocationId);
        if (it == invoke.end()) {
            LOG_ERROR("PatchEngine: Invocation {} not found on {}", eventTypeData.invocationId, edge.source);
            throw std::runtime_error("Invocation not found: " + eventTypeData.invocationId);
        }
        return {PathSegment::property("invoke"), PathSegment::element(static_cast<size_t>(it - invoke.begin())),
                PathSegment::property(eventTypeData.kind == EventTypeData::Kind::INVOCATION_DONE ? "onDone"
                                                                                                 : "onError")};
    }
    case EventTypeData::Kind::WILDCARD:
    case EventTypeData::Kind::AFTER:
    case EventTypeData::Kind::INIT:
        break;
    }

    LOG_ERROR("PatchEngine: Inserting '{}' transitions is not supported", eventKindToString(eventTypeData.kind));
    throw std::runtime_error(std::string("Unsupported transition type: ") + eventKindToString(eventTypeData.kind));
}

std::set<std::string> PatchEngine::findTransientEdges(const std::vector<Patch> &patches) {
    std::set<std::string> added;
    std::set<std::string> transient;
    for (const auto &patch : patches) {
        if (patch.path.size() != 2 || patch.path[0] != "edges") {
            continue;
        }
        if (patch.op == PatchOp::ADD) {
            added.insert(patch.path[1]);
        } else if (patch.op == PatchOp::REMOVE && added.count(patch.path[1]) > 0) {
            transient.insert(patch.path[1]);
        }
    }
    return transient;
}

std::optional<std::string> PatchEngine::getOptionalString(const nlohmann::json &value, const std::string &field) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (!value.is_string()) {
        throw std::invalid_argument("State " + field + " must be a string");
    }
    return value.get<std::string>();
}

}  // namespace MDG
