// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "extraction/ExtractionContext.h"
#include <optional>
#include <string>

namespace MDG {

/**
 * @brief Resolves raw transition target strings to node ids
 *
 * A target is split on '.'; the first segment selects the origin (empty for
 * the source itself, `#id` for a declared id, otherwise a sibling key) and
 * the remaining segments descend through child keys.
 */
class TargetResolver {
public:
    /**
     * @brief Resolve every pending target of the context
     *
     * Resolved ids are appended to the edges' targets; each unresolved target
     * records TRANSITION_TARGET_UNRESOLVED and is dropped.
     */
    static void resolveTargets(ExtractionContext &ctx);

    /**
     * @brief Resolve one target relative to a source node
     * @return Node id, nullopt if the target doesn't name a node
     */
    static std::optional<std::string> resolveTargetId(const ExtractionContext &ctx, const std::string &sourceId,
                                                      const std::string &target);

private:
    static const TreeNode *resolvePathOrigin(const ExtractionContext &ctx, const std::string &sourceId,
                                             const std::string &origin);
};

}  // namespace MDG
