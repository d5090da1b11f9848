// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <map>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief One step of a structural locator
 *
 * PROPERTY selects the index-th member of an object literal, ELEMENT the
 * index-th element of an array literal.
 */
struct AstPathStep {
    enum class Kind { PROPERTY, ELEMENT };

    Kind kind = Kind::PROPERTY;
    size_t index = 0;

    static AstPathStep property(size_t index) {
        return AstPathStep{Kind::PROPERTY, index};
    }

    static AstPathStep element(size_t index) {
        return AstPathStep{Kind::ELEMENT, index};
    }

    bool operator==(const AstPathStep &other) const {
        return kind == other.kind && index == other.index;
    }
};

/**
 * @brief Path from the configuration root literal to a nested literal
 */
using AstPath = std::vector<AstPathStep>;

/**
 * @brief Locators of every extracted node and edge, keyed by entity id
 */
struct AstPaths {
    std::map<std::string, AstPath> nodes;
    std::map<std::string, AstPath> edges;
};

inline std::string toString(const AstPath &path) {
    std::string result;
    for (const auto &step : path) {
        result += step.kind == AstPathStep::Kind::PROPERTY ? "/p" : "/e";
        result += std::to_string(step.index);
    }
    return result.empty() ? "/" : result;
}

}  // namespace MDG
