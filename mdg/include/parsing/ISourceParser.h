// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "parsing/ISourceFile.h"
#include <memory>
#include <string>

namespace MDG {

/**
 * @brief Source parser abstraction
 *
 * Single interface for the built-in parser and host-provided parsers.
 */
class ISourceParser {
public:
    virtual ~ISourceParser() = default;

    /**
     * @brief Parse source from file
     * @param filename Path to source file
     * @return Parsed file, nullptr if the file can't be read
     */
    virtual std::shared_ptr<ISourceFile> parseFile(const std::string &filename) = 0;

    /**
     * @brief Parse source from string content
     * @param fileName Name recorded on the parsed file
     * @param content Source text
     * @return Parsed file
     */
    virtual std::shared_ptr<ISourceFile> parseContent(const std::string &fileName, const std::string &content) = 0;

    /**
     * @brief Get last error message
     * @return Error message, empty if no error
     */
    virtual std::string getLastError() const = 0;

    /**
     * @brief Factory method for the built-in parser
     * @return Parser instance (EcmaLiteralParser)
     */
    static std::shared_ptr<ISourceParser> create();
};

}  // namespace MDG
