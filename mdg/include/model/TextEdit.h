// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/SourceRange.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Text edit against a source file
 *
 * INSERT uses range.start as the insertion position (range.end == range.start).
 */
struct TextEdit {
    enum class Type { INSERT, DELETE, REPLACE };

    Type type = Type::INSERT;
    std::string fileName;
    Range range;
    std::string newText;

    static TextEdit insert(const std::string &fileName, size_t position, const std::string &newText);
    static TextEdit remove(const std::string &fileName, Range range);
    static TextEdit replace(const std::string &fileName, Range range, const std::string &newText);

    bool operator==(const TextEdit &other) const {
        return type == other.type && fileName == other.fileName && range == other.range && newText == other.newText;
    }
};

void to_json(nlohmann::json &j, const TextEdit &edit);

/**
 * @brief Apply non-overlapping edits computed against the same text
 *
 * Edits are applied back to front; an insertion sharing its position with a
 * replacement or deletion lands before the replaced text when it comes first
 * in the list.
 */
std::string applyTextEdits(const std::string &text, const std::vector<TextEdit> &edits);

}  // namespace MDG
