// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace MDG {

/**
 * @brief Process-wide generator for digraph entity identifiers
 *
 * Identifiers are formed as "<prefix>_<counter>" from a single monotonically
 * increasing counter, so every id is unique within the process and a test that
 * calls resetForTesting() observes a reproducible sequence.
 */
class UniqueIdGenerator {
public:
    /**
     * @brief Generate id for a state node
     * @return Id such as "node_3"
     */
    static std::string generateNodeId();

    /**
     * @brief Generate id for a transition edge
     * @return Id such as "edge_7"
     */
    static std::string generateEdgeId();

    /**
     * @brief Generate id for an action/actor/guard block
     * @return Id such as "block_12"
     */
    static std::string generateBlockId();

    /**
     * @brief Generate token for an inline (anonymous) implementation
     *
     * Callers prepend "inline:" to form the block's sourceId.
     *
     * @return Token such as "impl_4"
     */
    static std::string generateInlineToken();

    /**
     * @brief Generate generic id with custom prefix
     * @param prefix Id prefix
     * @return Generated id
     */
    static std::string generateUniqueId(const std::string &prefix);

    /**
     * @brief Reset all counters (test use only)
     */
    static void resetForTesting();

    /**
     * @brief Number of ids generated since the last reset
     */
    static uint64_t getGeneratedCount();

private:
    static std::string generateBaseId(const std::string &prefix);

    static std::atomic<uint64_t> globalCounter_;
};

}  // namespace MDG
