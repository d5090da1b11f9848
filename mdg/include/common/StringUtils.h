// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <cmath>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Split string on a single-character delimiter
 *
 * Empty segments are preserved: split(".a", '.') yields {"", "a"}.
 */
inline std::vector<std::string> split(const std::string &str, char delimiter) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

inline std::string join(const std::vector<std::string> &parts, const std::string &separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

/**
 * @brief Check whether name can be written as a bare ECMAScript property name
 *
 * Accepts ASCII word characters and '$', not starting with a digit.
 */
inline bool isValidIdentifier(const std::string &name) {
    if (name.empty() || (name[0] >= '0' && name[0] <= '9')) {
        return false;
    }
    for (char c : name) {
        bool word = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '$';
        if (!word) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Render text as an ECMAScript string literal
 *
 * @param text Raw string value
 * @param quote Quote character ('"' or '\'')
 * @param allowMultiline Render text containing a newline as a template literal
 * @return Literal source text including the delimiters
 */
inline std::string safeStringLiteral(const std::string &text, char quote, bool allowMultiline = false) {
    if (allowMultiline && text.find('\n') != std::string::npos) {
        std::string result = "`";
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c == '\\' || c == '`') {
                result += '\\';
                result += c;
            } else if (c == '$' && i + 1 < text.size() && text[i + 1] == '{') {
                result += "\\$";
            } else if (c == '\r') {
                result += "\\r";
            } else {
                result += c;
            }
        }
        result += '`';
        return result;
    }

    std::string result(1, quote);
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        switch (c) {
        case '\\':
            result += "\\\\";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\v':
            result += "\\v";
            break;
        default:
            if (c == static_cast<unsigned char>(quote)) {
                result += '\\';
                result += quote;
            } else if (c < 0x20) {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\x%02X", c);
                result += buffer;
            } else if (c == 0xE2 && i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x80 &&
                       (static_cast<unsigned char>(text[i + 2]) == 0xA8 ||
                        static_cast<unsigned char>(text[i + 2]) == 0xA9)) {
                // U+2028 / U+2029 terminate lines inside string literals
                result += static_cast<unsigned char>(text[i + 2]) == 0xA8 ? "\\u2028" : "\\u2029";
                i += 2;
            } else {
                result += static_cast<char>(c);
            }
        }
    }
    result += quote;
    return result;
}

/**
 * @brief Render a property name, quoting it only when required
 */
inline std::string safePropertyName(const std::string &name, char quote) {
    if (isValidIdentifier(name)) {
        return name;
    }
    return safeStringLiteral(name, quote);
}

/**
 * @brief Format a double the way Number.prototype.toString does for common values
 *
 * Shortest round-trip digits; positional for decimal exponents in [-6, 21),
 * scientific with an unpadded exponent otherwise.
 */
inline std::string formatJsNumber(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    if (value == 0) {
        return "0";
    }

    // Shortest round-trip digits, then laid out as value = 0.<digits> * 10^point
    const std::string shortest = fmt::format("{}", std::fabs(value));
    const size_t exponentAt = shortest.find('e');
    const std::string mantissa = shortest.substr(0, exponentAt);
    const size_t dot = mantissa.find('.');

    std::string digits = mantissa;
    if (dot != std::string::npos) {
        digits.erase(dot, 1);
    }
    int point = static_cast<int>(dot == std::string::npos ? mantissa.size() : dot);
    if (exponentAt != std::string::npos) {
        point += std::stoi(shortest.substr(exponentAt + 1));
    }
    size_t leading = digits.find_first_not_of('0');
    digits.erase(0, leading);
    point -= static_cast<int>(leading);
    digits.erase(digits.find_last_not_of('0') + 1);

    const int count = static_cast<int>(digits.size());
    std::string text = value < 0 ? "-" : "";
    if (count <= point && point <= 21) {
        text += digits + std::string(static_cast<size_t>(point - count), '0');
    } else if (0 < point && point <= 21) {
        text += digits.substr(0, static_cast<size_t>(point)) + "." + digits.substr(static_cast<size_t>(point));
    } else if (-6 < point && point <= 0) {
        text += "0." + std::string(static_cast<size_t>(-point), '0') + digits;
    } else {
        int exponent = point - 1;
        text += digits.substr(0, 1);
        if (count > 1) {
            text += "." + digits.substr(1);
        }
        text += (exponent < 0 ? "e-" : "e+") + std::to_string(std::abs(exponent));
    }
    return text;
}

}  // namespace MDG
