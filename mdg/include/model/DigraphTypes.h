// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace MDG {

enum class StateType {
    NORMAL,    // Atomic or compound state
    HISTORY,   // History pseudo-state
    PARALLEL,  // Parallel state
    FINAL      // Final state
};

enum class HistoryType {
    SHALLOW,  // Shallow history (default)
    DEEP      // Deep history
};

enum class BlockType { ACTION, ACTOR, GUARD };

/**
 * @brief Root node key marker, also the default root id in target descriptors
 */
inline constexpr const char *DEFAULT_ROOT_ID = "(machine)";

/**
 * @brief Prefix of synthetic source ids of inline implementations
 */
inline constexpr const char *INLINE_PREFIX = "inline:";

/**
 * @brief Block property holding the source text of an inline implementation
 */
inline constexpr const char *INLINE_SOURCE_PROPERTY = "jsImplementation";

/**
 * @brief Kind of event a transition reacts to
 *
 * Determines where the transition lives in the configuration literal:
 * `on.<event>`, `on["*"]`, `always`, `onDone`, or `invoke[i].onDone/onError`.
 */
struct EventTypeData {
    enum class Kind { NAMED, WILDCARD, ALWAYS, STATE_DONE, INVOCATION_DONE, INVOCATION_ERROR, AFTER, INIT };

    Kind kind = Kind::NAMED;
    std::string eventType;     // NAMED
    std::string invocationId;  // INVOCATION_DONE / INVOCATION_ERROR
    std::string delay;         // AFTER

    static EventTypeData named(const std::string &eventType);
    static EventTypeData invocation(Kind kind, const std::string &invocationId);
    static EventTypeData of(Kind kind);

    bool operator==(const EventTypeData &other) const {
        return kind == other.kind && eventType == other.eventType && invocationId == other.invocationId &&
               delay == other.delay;
    }
};

struct NodeData {
    std::string key;
    std::optional<std::string> initial;
    StateType type = StateType::NORMAL;
    std::optional<HistoryType> history;
    std::optional<std::string> description;
    std::vector<std::pair<std::string, nlohmann::json>> metaEntries;
    std::vector<std::string> entry;
    std::vector<std::string> exit;
    std::vector<std::string> invoke;
    std::vector<std::string> tags;
};

/**
 * @brief A state of the machine
 */
struct Node {
    std::string uniqueId;
    std::optional<std::string> parentId;  // Absent only for the root
    NodeData data;
};

struct EdgeData {
    EventTypeData eventTypeData;
    std::vector<std::string> actions;
    std::optional<std::string> guard;
    std::optional<std::string> description;
    bool internal = true;
};

/**
 * @brief A transition between states
 */
struct Edge {
    std::string uniqueId;
    std::string source;
    std::vector<std::string> targets;  // Empty for targetless transitions
    EdgeData data;
};

/**
 * @brief An action, actor or guard reference attached to a node or edge
 */
struct Block {
    std::string uniqueId;
    BlockType blockType = BlockType::ACTION;
    std::string parentId;
    std::string sourceId;  // Implementation name or "inline:<token>"
    nlohmann::json properties = nlohmann::json::object();
};

struct Implementation {
    BlockType type = BlockType::ACTION;
    std::string id;
    std::string name;
    std::optional<std::string> jsImplementation;  // Source text, inline implementations only
};

struct Implementations {
    std::map<std::string, Implementation> actions;
    std::map<std::string, Implementation> actors;
    std::map<std::string, Implementation> guards;

    /**
     * @brief Register an implementation for a block, first registration wins
     */
    void registerBlock(const Block &block);
};

struct DigraphData {
    nlohmann::json context = nlohmann::json::object();
};

/**
 * @brief Normalized graph snapshot of one machine
 */
struct Digraph {
    std::string root;
    std::map<std::string, Node> nodes;
    std::map<std::string, Edge> edges;
    std::map<std::string, Block> blocks;
    Implementations implementations;
    DigraphData data;
};

// Enum <-> string conversion
const char *stateTypeToString(StateType type);
StateType stateTypeFromString(const std::string &value);
const char *historyTypeToString(HistoryType type);
HistoryType historyTypeFromString(const std::string &value);
const char *blockTypeToString(BlockType type);
BlockType blockTypeFromString(const std::string &value);
const char *eventKindToString(EventTypeData::Kind kind);
EventTypeData::Kind eventKindFromString(const std::string &value);

// JSON serialization
void to_json(nlohmann::json &j, const EventTypeData &data);
void from_json(const nlohmann::json &j, EventTypeData &data);
void to_json(nlohmann::json &j, const Node &node);
void from_json(const nlohmann::json &j, Node &node);
void to_json(nlohmann::json &j, const Edge &edge);
void from_json(const nlohmann::json &j, Edge &edge);
void to_json(nlohmann::json &j, const Block &block);
void from_json(const nlohmann::json &j, Block &block);
void to_json(nlohmann::json &j, const Implementation &implementation);
void from_json(const nlohmann::json &j, Implementation &implementation);
void to_json(nlohmann::json &j, const Digraph &digraph);
void from_json(const nlohmann::json &j, Digraph &digraph);

}  // namespace MDG
