// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "model/TextEdit.h"

#include <algorithm>

namespace MDG {

TextEdit TextEdit::insert(const std::string &fileName, size_t position, const std::string &newText) {
    return TextEdit{Type::INSERT, fileName, Range{position, position}, newText};
}

TextEdit TextEdit::remove(const std::string &fileName, Range range) {
    return TextEdit{Type::DELETE, fileName, range, ""};
}

TextEdit TextEdit::replace(const std::string &fileName, Range range, const std::string &newText) {
    return TextEdit{Type::REPLACE, fileName, range, newText};
}

void to_json(nlohmann::json &j, const TextEdit &edit) {
    switch (edit.type) {
    case TextEdit::Type::INSERT:
        j = nlohmann::json{
            {"type", "insert"}, {"fileName", edit.fileName}, {"position", edit.range.start}, {"newText", edit.newText}};
        break;
    case TextEdit::Type::DELETE:
        j = nlohmann::json{{"type", "delete"}, {"fileName", edit.fileName}, {"range", edit.range}};
        break;
    case TextEdit::Type::REPLACE:
        j = nlohmann::json{
            {"type", "replace"}, {"fileName", edit.fileName}, {"range", edit.range}, {"newText", edit.newText}};
        break;
    }
}

std::string applyTextEdits(const std::string &text, const std::vector<TextEdit> &edits) {
    std::vector<TextEdit> sorted = edits;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TextEdit &a, const TextEdit &b) { return a.range.start < b.range.start; });

    std::string result = text;
    for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
        size_t start = std::min(it->range.start, result.size());
        size_t end = std::min(std::max(it->range.end, start), result.size());
        result.replace(start, end - start, it->newText);
    }
    return result;
}

}  // namespace MDG
