// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/ProjectMachineState.h"
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Synthesizes the shortest textual reference from one state to another
 *
 * Inverse of TargetResolver: resolving the descriptor from the source state
 * yields the target state again.
 */
class TargetDescriptor {
public:
    /**
     * @brief Best target descriptor for a transition from sourceId to targetId
     *
     * Root: `#<declared id>` or `#(machine)`. Self: the state's key.
     * Descendant: `.a.b`. Sibling subtree: `a.b`. Anything else: the closest
     * ancestor of the target with a declared id (or the root) followed by the
     * descent path, as in `#id.a.b`.
     *
     * @throws std::runtime_error if either state is missing from the digraph
     * @throws std::logic_error if the climb from the target never reaches the root
     */
    static std::string getBestTargetDescriptor(const std::string &sourceId, const std::string &targetId,
                                               const ProjectMachineState &state);

private:
    /**
     * @brief The node followed by its ancestors up to the root
     */
    static std::vector<const Node *> getPathNodes(const Digraph &digraph, const Node &node);

    static std::string joinKeys(std::vector<const Node *>::const_iterator begin,
                                std::vector<const Node *>::const_iterator end);
};

}  // namespace MDG
