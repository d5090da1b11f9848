// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Syntax kinds the extraction and patching engines distinguish
 *
 * Anything else a host parser produces is reported as Unknown and treated as
 * an opaque expression.
 */
enum class SyntaxKind {
    // Expressions
    ObjectLiteral,
    ArrayLiteral,
    StringLiteral,
    NoSubstitutionTemplate,
    TemplateExpression,
    NumericLiteral,
    BigIntLiteral,
    TrueKeyword,
    FalseKeyword,
    NullKeyword,
    Identifier,
    FunctionExpression,
    ArrowFunction,
    CallExpression,
    SpreadElement,
    OmittedExpression,
    Unknown,

    // Object literal members
    PropertyAssignment,
    ShorthandPropertyAssignment,
    SpreadAssignment,
    MethodDeclaration,
    GetAccessor,
    SetAccessor,

    // Property names (besides Identifier / StringLiteral / NumericLiteral)
    ComputedPropertyName,
    PrivateIdentifier
};

const char *syntaxKindToString(SyntaxKind kind);

/**
 * @brief Platform-agnostic syntax node of a host source file
 *
 * Capability interface consumed by the extraction and patching engines.
 * Implementation: EcmaSyntaxNode (built-in literal-subset parser); editor
 * hosts may adapt their own AST to it.
 */
class ISyntaxNode {
public:
    virtual ~ISyntaxNode() = default;

    /**
     * @brief Get node kind
     */
    virtual SyntaxKind getKind() const = 0;

    /**
     * @brief Start offset of the node (first character of its first token)
     */
    virtual size_t getStart() const = 0;

    /**
     * @brief End offset of the node (one past its last character)
     */
    virtual size_t getEnd() const = 0;

    /**
     * @brief Exact source text of the node
     */
    virtual std::string getText() const = 0;

    /**
     * @brief Members of an object literal (empty for other kinds)
     */
    virtual const std::vector<std::shared_ptr<ISyntaxNode>> &getProperties() const = 0;

    /**
     * @brief Elements of an array literal, or arguments of a call expression
     */
    virtual const std::vector<std::shared_ptr<ISyntaxNode>> &getElements() const = 0;

    /**
     * @brief Property name node of an object member, nullptr for spreads
     */
    virtual std::shared_ptr<ISyntaxNode> getName() const = 0;

    /**
     * @brief Initializer of a property assignment, or the expression of a computed property name
     */
    virtual std::shared_ptr<ISyntaxNode> getInitializer() const = 0;

    /**
     * @brief Literal value
     *
     * String and no-substitution template literals return the cooked string,
     * identifiers and private identifiers their name, numeric literals their
     * canonical numeric text (the value printed back as a number).
     */
    virtual std::string getLiteralText() const = 0;

    /**
     * @brief Parent node, nullptr for call expressions
     */
    virtual std::shared_ptr<ISyntaxNode> getParent() const = 0;
};

using SyntaxNodePtr = std::shared_ptr<ISyntaxNode>;

}  // namespace MDG
