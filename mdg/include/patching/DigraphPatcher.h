// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/DigraphTypes.h"
#include "model/Patch.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Applies structural patches to a Digraph through its JSON form
 */
class DigraphPatcher {
public:
    /**
     * @brief Apply one patch in place
     *
     * @throws std::invalid_argument if the path does not exist (or, for add, its
     *         parent does not exist) or the result is not a valid Digraph
     */
    static void apply(Digraph &digraph, const Patch &patch);

    /**
     * @brief Apply one patch to an arbitrary JSON document
     *
     * The document is left untouched when the patch fails.
     */
    static void apply(nlohmann::json &document, const Patch &patch);

    /**
     * @brief RFC 6902 operation object of a patch
     */
    static nlohmann::json toOperation(const Patch &patch);
};

}  // namespace MDG
