// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <algorithm>
#include <string>

namespace MDG {
namespace Log {

/**
 * @brief Make source text safe to embed in a single log line
 *
 * Keys, targets and expression text come straight from user source: line
 * breaks and tabs become visible escapes, other control bytes become '?',
 * and text longer than maxLength bytes is cut and marked with "...".
 * Bytes of multi-byte UTF-8 sequences are kept.
 */
inline std::string sanitize(const std::string &input, size_t maxLength = 120) {
    std::string sanitized;
    sanitized.reserve(std::min(input.size(), maxLength) + 3);

    for (size_t i = 0; i < input.size(); ++i) {
        if (i == maxLength) {
            // Cut before a UTF-8 sequence rather than inside it
            if ((static_cast<unsigned char>(input[i]) & 0xC0) == 0x80) {
                while (!sanitized.empty() && (static_cast<unsigned char>(sanitized.back()) & 0xC0) == 0x80) {
                    sanitized.pop_back();
                }
                if (!sanitized.empty() && static_cast<unsigned char>(sanitized.back()) >= 0xC0) {
                    sanitized.pop_back();
                }
            }
            sanitized += "...";
            break;
        }
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c == '\n') {
            sanitized += "\\n";
        } else if (c == '\r') {
            sanitized += "\\r";
        } else if (c == '\t') {
            sanitized += "\\t";
        } else if (c < 32 || c == 127) {
            sanitized += '?';
        } else {
            sanitized += static_cast<char>(c);
        }
    }

    return sanitized;
}

}  // namespace Log
}  // namespace MDG
