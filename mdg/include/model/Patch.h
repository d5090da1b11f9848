// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace MDG {

enum class PatchOp { ADD, REMOVE, REPLACE };

/**
 * @brief Structural mutation of a Digraph
 *
 * Path segments address the JSON form of the Digraph
 * (`nodes/<id>/data/key`); numeric segments index arrays and `-` appends.
 */
struct Patch {
    PatchOp op = PatchOp::ADD;
    std::vector<std::string> path;
    nlohmann::json value;
};

const char *patchOpToString(PatchOp op);
PatchOp patchOpFromString(const std::string &value);

/**
 * @brief Split an RFC 6901 JSON pointer into unescaped segments
 * @throws std::invalid_argument if the pointer is neither empty nor starts with '/'
 */
std::vector<std::string> parseJsonPointer(const std::string &pointer);

std::string toJsonPointer(const std::vector<std::string> &path);

void to_json(nlohmann::json &j, const Patch &patch);

/**
 * @throws std::invalid_argument on an unknown op or malformed path
 */
void from_json(const nlohmann::json &j, Patch &patch);

}  // namespace MDG
