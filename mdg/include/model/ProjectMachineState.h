// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/AstPath.h"
#include "model/DigraphTypes.h"
#include "model/ExtractionError.h"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Persisted state of one machine between requests
 *
 * Replaced wholesale on every extraction. The patch engine reads the
 * locators and id map and stores the patched Digraph back.
 */
struct ProjectMachineState {
    std::optional<Digraph> digraph;
    std::vector<ExtractionError> errors;
    AstPaths astPaths;
    std::map<std::string, std::string> idMap;  // node id -> declared `id`
    size_t sourceFingerprint = 0;              // Hash of the source text the state was extracted from
};

inline size_t fingerprintSource(const std::string &text) {
    return std::hash<std::string>{}(text);
}

}  // namespace MDG
