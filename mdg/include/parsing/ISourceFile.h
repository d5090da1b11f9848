// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "model/SourceRange.h"
#include "parsing/ISyntaxNode.h"
#include <memory>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Parsed representation of one source file
 */
class ISourceFile {
public:
    virtual ~ISourceFile() = default;

    virtual const std::string &getFileName() const = 0;

    /**
     * @brief Full source text the file was parsed from
     */
    virtual const std::string &getText() const = 0;

    /**
     * @brief Module specifier literals of top-level import/export declarations, in file order
     */
    virtual const std::vector<SyntaxNodePtr> &getModuleSpecifiers() const = 0;

    /**
     * @brief Call expressions whose callee is `name` or `<expr>.name`, in file order
     *
     * The call's getElements() returns its arguments.
     */
    virtual std::vector<SyntaxNodePtr> findCallExpressions(const std::string &name) const = 0;

    /**
     * @brief Map a character offset to a zero-based line/character pair
     */
    virtual LineAndCharacter getLineAndCharacterOfPosition(size_t position) const = 0;

    /**
     * @brief Syntax errors encountered while parsing (the file is still usable)
     */
    virtual const std::vector<std::string> &getDiagnostics() const = 0;
};

}  // namespace MDG
