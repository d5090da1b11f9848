// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "patching/DigraphPatcher.h"
#include "common/Logger.h"

#include <stdexcept>

namespace MDG {

void DigraphPatcher::apply(Digraph &digraph, const Patch &patch) {
    nlohmann::json document = digraph;
    apply(document, patch);
    try {
        digraph = document.get<Digraph>();
    } catch (const nlohmann::json::exception &e) {
        LOG_ERROR("DigraphPatcher: {} {} produced an invalid digraph: {}", patchOpToString(patch.op),
                  toJsonPointer(patch.path), e.what());
        throw std::invalid_argument(std::string("Patch produces an invalid digraph: ") + e.what());
    }
}

void DigraphPatcher::apply(nlohmann::json &document, const Patch &patch) {
    const std::string pointer = toJsonPointer(patch.path);

    try {
        // json::patch asserts on an add below a scalar instead of throwing
        if (patch.op == PatchOp::ADD && !patch.path.empty()) {
            nlohmann::json::json_pointer parent(pointer);
            parent.pop_back();
            const nlohmann::json &container = document.at(parent);
            if (!container.is_object() && !container.is_array()) {
                throw std::invalid_argument("Patch parent is not a container: " + pointer);
            }
        }
        document = document.patch(nlohmann::json::array({toOperation(patch)}));
    } catch (const nlohmann::json::exception &e) {
        LOG_DEBUG("DigraphPatcher: {} {} failed: {}", patchOpToString(patch.op), pointer, e.what());
        throw std::invalid_argument("Patch path not found: " + pointer + " (" + e.what() + ")");
    }

    LOG_TRACE("DigraphPatcher: Applied {} {}", patchOpToString(patch.op), pointer);
}

nlohmann::json DigraphPatcher::toOperation(const Patch &patch) {
    nlohmann::json operation = {{"op", patchOpToString(patch.op)}, {"path", toJsonPointer(patch.path)}};
    if (patch.op != PatchOp::REMOVE) {
        operation["value"] = patch.value;
    }
    return operation;
}

}  // namespace MDG
