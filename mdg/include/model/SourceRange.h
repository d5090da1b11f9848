// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>

namespace MDG {

/**
 * @brief Half-open character range [start, end) in a source file
 */
struct Range {
    size_t start = 0;
    size_t end = 0;

    bool operator==(const Range &other) const {
        return start == other.start && end == other.end;
    }
};

/**
 * @brief Zero-based line and character position
 */
struct LineAndCharacter {
    size_t line = 0;
    size_t character = 0;

    bool operator==(const LineAndCharacter &other) const {
        return line == other.line && character == other.character;
    }
};

struct LinesAndCharactersRange {
    LineAndCharacter start;
    LineAndCharacter end;
};

inline void to_json(nlohmann::json &j, const Range &range) {
    j = nlohmann::json{{"start", range.start}, {"end", range.end}};
}

inline void from_json(const nlohmann::json &j, Range &range) {
    j.at("start").get_to(range.start);
    j.at("end").get_to(range.end);
}

inline void to_json(nlohmann::json &j, const LineAndCharacter &position) {
    j = nlohmann::json{{"line", position.line}, {"character", position.character}};
}

inline void to_json(nlohmann::json &j, const LinesAndCharactersRange &range) {
    j = nlohmann::json{{"start", range.start}, {"end", range.end}};
}

}  // namespace MDG
