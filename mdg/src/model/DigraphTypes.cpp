// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "model/DigraphTypes.h"
#include "common/JsonUtils.h"

#include <stdexcept>

namespace MDG {

EventTypeData EventTypeData::named(const std::string &eventType) {
    EventTypeData data;
    data.kind = Kind::NAMED;
    data.eventType = eventType;
    return data;
}

EventTypeData EventTypeData::invocation(Kind kind, const std::string &invocationId) {
    EventTypeData data;
    data.kind = kind;
    data.invocationId = invocationId;
    return data;
}

EventTypeData EventTypeData::of(Kind kind) {
    EventTypeData data;
    data.kind = kind;
    return data;
}

void Implementations::registerBlock(const Block &block) {
    std::map<std::string, Implementation> *registry = nullptr;
    switch (block.blockType) {
    case BlockType::ACTION:
        registry = &actions;
        break;
    case BlockType::ACTOR:
        registry = &actors;
        break;
    case BlockType::GUARD:
        registry = &guards;
        break;
    }
    registry->try_emplace(block.sourceId,
                          Implementation{block.blockType, block.sourceId, block.sourceId,
                                         JsonUtils::getOptionalString(block.properties, INLINE_SOURCE_PROPERTY)});
}

// ============================================================================
// Enum conversion
// ============================================================================

const char *stateTypeToString(StateType type) {
    switch (type) {
    case StateType::NORMAL:
        return "normal";
    case StateType::HISTORY:
        return "history";
    case StateType::PARALLEL:
        return "parallel";
    case StateType::FINAL:
        return "final";
    }
    return "normal";
}

StateType stateTypeFromString(const std::string &value) {
    if (value == "normal") {
        return StateType::NORMAL;
    }
    if (value == "history") {
        return StateType::HISTORY;
    }
    if (value == "parallel") {
        return StateType::PARALLEL;
    }
    if (value == "final") {
        return StateType::FINAL;
    }
    throw std::invalid_argument("Unknown state type: " + value);
}

const char *historyTypeToString(HistoryType type) {
    return type == HistoryType::DEEP ? "deep" : "shallow";
}

HistoryType historyTypeFromString(const std::string &value) {
    if (value == "shallow") {
        return HistoryType::SHALLOW;
    }
    if (value == "deep") {
        return HistoryType::DEEP;
    }
    throw std::invalid_argument("Unknown history type: " + value);
}

const char *blockTypeToString(BlockType type) {
    switch (type) {
    case BlockType::ACTION:
        return "action";
    case BlockType::ACTOR:
        return "actor";
    case BlockType::GUARD:
        return "guard";
    }
    return "action";
}

BlockType blockTypeFromString(const std::string &value) {
    if (value == "action") {
        return BlockType::ACTION;
    }
    if (value == "actor") {
        return BlockType::ACTOR;
    }
    if (value == "guard") {
        return BlockType::GUARD;
    }
    throw std::invalid_argument("Unknown block type: " + value);
}

const char *eventKindToString(EventTypeData::Kind kind) {
    switch (kind) {
    case EventTypeData::Kind::NAMED:
        return "named";
    case EventTypeData::Kind::WILDCARD:
        return "wildcard";
    case EventTypeData::Kind::ALWAYS:
        return "always";
    case EventTypeData::Kind::STATE_DONE:
        return "state.done";
    case EventTypeData::Kind::INVOCATION_DONE:
        return "invocation.done";
    case EventTypeData::Kind::INVOCATION_ERROR:
        return "invocation.error";
    case EventTypeData::Kind::AFTER:
        return "after";
    case EventTypeData::Kind::INIT:
        return "init";
    }
    return "named";
}

EventTypeData::Kind eventKindFromString(const std::string &value) {
    static const std::map<std::string, EventTypeData::Kind> kinds = {
        {"named", EventTypeData::Kind::NAMED},
        {"wildcard", EventTypeData::Kind::WILDCARD},
        {"always", EventTypeData::Kind::ALWAYS},
        {"state.done", EventTypeData::Kind::STATE_DONE},
        {"invocation.done", EventTypeData::Kind::INVOCATION_DONE},
        {"invocation.error", EventTypeData::Kind::INVOCATION_ERROR},
        {"after", EventTypeData::Kind::AFTER},
        {"init", EventTypeData::Kind::INIT},
    };
    auto it = kinds.find(value);
    if (it == kinds.end()) {
        throw std::invalid_argument("Unknown event type kind: " + value);
    }
    return it->second;
}

// ============================================================================
// JSON serialization
// ============================================================================

void to_json(json &j, const EventTypeData &data) {
    j = json{{"type", eventKindToString(data.kind)}};
    switch (data.kind) {
    case EventTypeData::Kind::NAMED:
        j["eventType"] = data.eventType;
        break;
    case EventTypeData::Kind::INVOCATION_DONE:
    case EventTypeData::Kind::INVOCATION_ERROR:
        j["invocationId"] = data.invocationId;
        break;
    case EventTypeData::Kind::AFTER:
        j["delay"] = data.delay;
        break;
    default:
        break;
    }
}

void from_json(const json &j, EventTypeData &data) {
    data = EventTypeData::of(eventKindFromString(j.at("type").get<std::string>()));
    data.eventType = j.value("eventType", "");
    data.invocationId = j.value("invocationId", "");
    if (j.contains("delay") && !j.at("delay").is_null()) {
        const json &delay = j.at("delay");
        data.delay = delay.is_string() ? delay.get<std::string>() : delay.dump();
    }
}

void to_json(json &j, const Node &node) {
    json meta = json::array();
    for (const auto &[key, value] : node.data.metaEntries) {
        meta.push_back(json::array({key, value}));
    }

    j = json{{"type", "node"},
             {"uniqueId", node.uniqueId},
             {"parentId", JsonUtils::fromOptional(node.parentId)},
             {"data",
              {{"key", node.data.key},
               {"initial", JsonUtils::fromOptional(node.data.initial)},
               {"type", stateTypeToString(node.data.type)},
               {"history", node.data.history ? json(historyTypeToString(*node.data.history)) : json(nullptr)},
               {"description", JsonUtils::fromOptional(node.data.description)},
               {"metaEntries", meta},
               {"entry", node.data.entry},
               {"exit", node.data.exit},
               {"invoke", node.data.invoke},
               {"tags", node.data.tags}}}};
}

void from_json(const json &j, Node &node) {
    node = Node{};
    node.uniqueId = j.at("uniqueId").get<std::string>();
    node.parentId = JsonUtils::getOptionalString(j, "parentId");

    if (!j.contains("data")) {
        return;
    }
    const json &data = j.at("data");
    node.data.key = data.value("key", "");
    node.data.initial = JsonUtils::getOptionalString(data, "initial");
    if (data.contains("type") && !data.at("type").is_null()) {
        node.data.type = stateTypeFromString(data.at("type").get<std::string>());
    }
    if (auto history = JsonUtils::getOptionalString(data, "history")) {
        node.data.history = historyTypeFromString(*history);
    }
    node.data.description = JsonUtils::getOptionalString(data, "description");
    if (data.contains("metaEntries") && data.at("metaEntries").is_array()) {
        for (const auto &entry : data.at("metaEntries")) {
            node.data.metaEntries.emplace_back(entry.at(0).get<std::string>(), entry.at(1));
        }
    }
    node.data.entry = JsonUtils::getStrings(data, "entry");
    node.data.exit = JsonUtils::getStrings(data, "exit");
    node.data.invoke = JsonUtils::getStrings(data, "invoke");
    node.data.tags = JsonUtils::getStrings(data, "tags");
}

void to_json(json &j, const Edge &edge) {
    j = json{{"type", "edge"},
             {"uniqueId", edge.uniqueId},
             {"source", edge.source},
             {"targets", edge.targets},
             {"data",
              {{"eventTypeData", edge.data.eventTypeData},
               {"actions", edge.data.actions},
               {"guard", JsonUtils::fromOptional(edge.data.guard)},
               {"description", JsonUtils::fromOptional(edge.data.description)},
               {"internal", edge.data.internal}}}};
}

void from_json(const json &j, Edge &edge) {
    edge = Edge{};
    edge.uniqueId = j.at("uniqueId").get<std::string>();
    edge.source = j.at("source").get<std::string>();
    edge.targets = JsonUtils::getStrings(j, "targets");

    const json &data = j.at("data");
    edge.data.eventTypeData = data.at("eventTypeData").get<EventTypeData>();
    edge.data.actions = JsonUtils::getStrings(data, "actions");
    edge.data.guard = JsonUtils::getOptionalString(data, "guard");
    edge.data.description = JsonUtils::getOptionalString(data, "description");
    if (data.contains("internal") && data.at("internal").is_boolean()) {
        edge.data.internal = data.at("internal").get<bool>();
    }
}

void to_json(json &j, const Block &block) {
    j = json{{"uniqueId", block.uniqueId},
             {"blockType", blockTypeToString(block.blockType)},
             {"parentId", block.parentId},
             {"sourceId", block.sourceId},
             {"properties", block.properties}};
}

void from_json(const json &j, Block &block) {
    block = Block{};
    block.uniqueId = j.at("uniqueId").get<std::string>();
    block.blockType = blockTypeFromString(j.at("blockType").get<std::string>());
    block.parentId = j.value("parentId", "");
    block.sourceId = j.at("sourceId").get<std::string>();
    if (j.contains("properties") && !j.at("properties").is_null()) {
        block.properties = j.at("properties");
    }
}

void to_json(json &j, const Implementation &implementation) {
    j = json{{"type", blockTypeToString(implementation.type)},
             {"id", implementation.id},
             {"name", implementation.name}};
    if (implementation.jsImplementation) {
        j[INLINE_SOURCE_PROPERTY] = *implementation.jsImplementation;
    }
}

void from_json(const json &j, Implementation &implementation) {
    implementation.type = blockTypeFromString(j.at("type").get<std::string>());
    implementation.id = j.at("id").get<std::string>();
    implementation.name = j.value("name", implementation.id);
    implementation.jsImplementation = JsonUtils::getOptionalString(j, INLINE_SOURCE_PROPERTY);
}

void to_json(json &j, const Digraph &digraph) {
    j = json{{"root", digraph.root},
             {"nodes", digraph.nodes},
             {"edges", digraph.edges},
             {"blocks", digraph.blocks},
             {"implementations",
              {{"actions", digraph.implementations.actions},
               {"actors", digraph.implementations.actors},
               {"guards", digraph.implementations.guards}}},
             {"data", {{"context", digraph.data.context}}}};
}

void from_json(const json &j, Digraph &digraph) {
    digraph = Digraph{};
    digraph.root = j.at("root").get<std::string>();
    if (j.contains("nodes")) {
        digraph.nodes = j.at("nodes").get<std::map<std::string, Node>>();
    }
    if (j.contains("edges")) {
        digraph.edges = j.at("edges").get<std::map<std::string, Edge>>();
    }
    if (j.contains("blocks")) {
        digraph.blocks = j.at("blocks").get<std::map<std::string, Block>>();
    }
    if (j.contains("implementations")) {
        const json &implementations = j.at("implementations");
        auto read = [&implementations](const char *key) {
            if (!implementations.contains(key)) {
                return std::map<std::string, Implementation>{};
            }
            return implementations.at(key).get<std::map<std::string, Implementation>>();
        };
        digraph.implementations.actions = read("actions");
        digraph.implementations.actors = read("actors");
        digraph.implementations.guards = read("guards");
    }
    if (j.contains("data") && j.at("data").contains("context")) {
        digraph.data.context = j.at("data").at("context");
    }
}

}  // namespace MDG
