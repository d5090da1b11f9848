// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "parsing/EcmaLexer.h"
#include "parsing/EcmaLiteralParser.h"
#include <memory>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Recursive-descent parser for the literal expression subset
 *
 * Works over a token stream produced by EcmaLexer. Literal forms are parsed
 * into structured nodes; every other expression is consumed up to the next
 * depth-zero terminator (`,` `)` `]` `}` `;`) and returned as an opaque
 * SyntaxKind::Unknown node covering its source text.
 */
class EcmaExpressionParser {
public:
    using NodePtr = std::shared_ptr<EcmaSyntaxNode>;

    EcmaExpressionParser(const std::vector<Token> &tokens, std::shared_ptr<const std::string> source);

    /**
     * @brief Parse the call whose callee identifier is at calleeIndex
     *
     * The call node spans from the start of the callee's member chain
     * (`a.b.createMachine`) to the closing parenthesis.
     *
     * @return Call node, nullptr when the identifier is not followed by an argument list
     */
    NodePtr parseCallExpression(size_t calleeIndex);

    /**
     * @brief Token index following the last parsed construct
     */
    size_t getPosition() const {
        return index_;
    }

    const std::vector<std::string> &getDiagnostics() const {
        return diagnostics_;
    }

private:
    const Token &peek(size_t offset = 0) const;
    const Token &advance();
    size_t previousEnd() const;
    bool isTerminator(const Token &token) const;
    bool isOpener(const Token &token) const;
    bool isCloser(const Token &token) const;

    NodePtr makeNode(SyntaxKind kind, size_t start, size_t end) const;

    NodePtr parseAssignmentExpression();
    NodePtr parsePrimary();
    NodePtr parseObjectLiteral();
    NodePtr parseArrayLiteral();
    NodePtr parseMember();
    NodePtr parsePropertyName();
    NodePtr parseSpread(SyntaxKind kind);
    NodePtr parseFunctionExpression();
    NodePtr tryParseArrowFunction();

    /**
     * @brief Parse comma-separated elements up to the closer, adding them to owner
     * @param allowHoles Elisions produce OmittedExpression elements
     */
    void parseElementList(const NodePtr &owner, const char *closer, bool allowHoles);

    size_t findMatching(size_t index) const;
    void skipBalanced();
    void skipTypeArguments();
    void skipToTerminator();
    void skipReturnType(const char *stopAt);

    /**
     * @brief Skip to the next depth-zero `,` or closer after a syntax error
     */
    void recover(const char *closer);

    void addDiagnostic(const std::string &message, const Token &token);

    const std::vector<Token> &tokens_;
    std::shared_ptr<const std::string> source_;
    size_t index_ = 0;
    std::vector<std::string> diagnostics_;
};

/**
 * @brief Canonical ECMAScript text of a numeric literal's value
 *
 * `0x10` yields "16", `1_000` yields "1000", `1.50` yields "1.5".
 */
std::string canonicalNumericText(const std::string &literal);

}  // namespace MDG
