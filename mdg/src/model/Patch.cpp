// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "model/Patch.h"

#include <algorithm>
#include <stdexcept>

namespace MDG {

const char *patchOpToString(PatchOp op) {
    switch (op) {
    case PatchOp::ADD:
        return "add";
    case PatchOp::REMOVE:
        return "remove";
    case PatchOp::REPLACE:
        return "replace";
    }
    return "add";
}

PatchOp patchOpFromString(const std::string &value) {
    if (value == "add") {
        return PatchOp::ADD;
    }
    if (value == "remove") {
        return PatchOp::REMOVE;
    }
    if (value == "replace") {
        return PatchOp::REPLACE;
    }
    throw std::invalid_argument("Unsupported patch op: " + value);
}

std::vector<std::string> parseJsonPointer(const std::string &pointer) {
    nlohmann::json::json_pointer parsed;
    try {
        parsed = nlohmann::json::json_pointer(pointer);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::invalid_argument("Invalid JSON pointer: " + pointer + " (" + e.what() + ")");
    }

    std::vector<std::string> segments;
    while (!parsed.empty()) {
        segments.push_back(parsed.back());
        parsed.pop_back();
    }
    std::reverse(segments.begin(), segments.end());
    return segments;
}

std::string toJsonPointer(const std::vector<std::string> &path) {
    nlohmann::json::json_pointer pointer;
    for (const auto &segment : path) {
        pointer /= segment;
    }
    return pointer.to_string();
}

void to_json(nlohmann::json &j, const Patch &patch) {
    j = nlohmann::json{{"op", patchOpToString(patch.op)}, {"path", patch.path}};
    if (patch.op != PatchOp::REMOVE) {
        j["value"] = patch.value;
    }
}

void from_json(const nlohmann::json &j, Patch &patch) {
    if (!j.is_object() || !j.contains("op") || !j.at("op").is_string()) {
        throw std::invalid_argument("Patch must be an object with a string 'op'");
    }
    patch.op = patchOpFromString(j.at("op").get<std::string>());

    if (!j.contains("path")) {
        throw std::invalid_argument("Patch is missing 'path'");
    }
    const nlohmann::json &path = j.at("path");
    patch.path.clear();
    if (path.is_string()) {
        patch.path = parseJsonPointer(path.get<std::string>());
    } else if (path.is_array()) {
        for (const auto &segment : path) {
            if (segment.is_string()) {
                patch.path.push_back(segment.get<std::string>());
            } else if (segment.is_number_integer()) {
                patch.path.push_back(std::to_string(segment.get<long long>()));
            } else {
                throw std::invalid_argument("Patch path segments must be strings or integers");
            }
        }
    } else {
        throw std::invalid_argument("Patch 'path' must be a string or an array");
    }

    patch.value = j.contains("value") ? j.at("value") : nlohmann::json();
    if (patch.op == PatchOp::ADD && !j.contains("value")) {
        throw std::invalid_argument(std::string("Patch '") + patchOpToString(patch.op) + "' requires a 'value'");
    }
}

}  // namespace MDG
