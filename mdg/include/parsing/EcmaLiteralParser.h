// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include "ISourceFile.h"
#include "ISourceParser.h"
#include "ISyntaxNode.h"
#include "parsing/EcmaLexer.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace MDG {

/**
 * @brief Syntax node produced by the built-in literal parser
 */
class EcmaSyntaxNode : public ISyntaxNode {
public:
    EcmaSyntaxNode(SyntaxKind kind, size_t start, size_t end, std::shared_ptr<const std::string> source);

    SyntaxKind getKind() const override;
    size_t getStart() const override;
    size_t getEnd() const override;
    std::string getText() const override;
    const std::vector<std::shared_ptr<ISyntaxNode>> &getProperties() const override;
    const std::vector<std::shared_ptr<ISyntaxNode>> &getElements() const override;
    std::shared_ptr<ISyntaxNode> getName() const override;
    std::shared_ptr<ISyntaxNode> getInitializer() const override;
    std::string getLiteralText() const override;
    std::shared_ptr<ISyntaxNode> getParent() const override;

    // Construction interface used by the parser
    void setKind(SyntaxKind kind) {
        kind_ = kind;
    }

    void setEnd(size_t end) {
        end_ = end;
    }

    void setLiteralText(std::string text) {
        literalText_ = std::move(text);
    }

    void setParent(const std::shared_ptr<EcmaSyntaxNode> &parent) {
        parent_ = parent;
    }

    void addProperty(std::shared_ptr<ISyntaxNode> property);
    void addElement(std::shared_ptr<ISyntaxNode> element);
    void setName(std::shared_ptr<ISyntaxNode> name);
    void setInitializer(std::shared_ptr<ISyntaxNode> initializer);

private:
    SyntaxKind kind_;
    size_t start_;
    size_t end_;
    std::shared_ptr<const std::string> source_;  // Keep source text alive
    std::vector<std::shared_ptr<ISyntaxNode>> properties_;
    std::vector<std::shared_ptr<ISyntaxNode>> elements_;
    std::shared_ptr<ISyntaxNode> name_;
    std::shared_ptr<ISyntaxNode> initializer_;
    std::string literalText_;
    std::weak_ptr<ISyntaxNode> parent_;
};

/**
 * @brief Source file parsed by the built-in literal parser
 *
 * Tokens are kept for the lifetime of the file; call expressions are parsed
 * lazily per callee name and cached.
 */
class EcmaSourceFile : public ISourceFile {
public:
    EcmaSourceFile(std::string fileName, std::shared_ptr<const std::string> text, std::vector<Token> tokens,
                   std::vector<std::string> diagnostics);

    const std::string &getFileName() const override;
    const std::string &getText() const override;
    const std::vector<SyntaxNodePtr> &getModuleSpecifiers() const override;
    std::vector<SyntaxNodePtr> findCallExpressions(const std::string &name) const override;
    LineAndCharacter getLineAndCharacterOfPosition(size_t position) const override;
    const std::vector<std::string> &getDiagnostics() const override;

private:
    void collectModuleSpecifiers();
    void computeLineStarts();

    /**
     * @brief Find the module specifier of an `... from "x"` clause starting at index
     * @return Token index of the specifier, or 0 when the statement has none
     */
    size_t findFromClause(size_t index) const;

    std::string fileName_;
    std::shared_ptr<const std::string> text_;
    std::vector<Token> tokens_;
    std::vector<SyntaxNodePtr> moduleSpecifiers_;
    std::vector<size_t> lineStarts_;
    mutable std::vector<std::string> diagnostics_;
    mutable std::map<std::string, std::vector<SyntaxNodePtr>> callCache_;
};

/**
 * @brief Literal-subset ECMAScript/TypeScript parser
 *
 * Understands object, array and primitive literals, property shapes, function
 * expressions (as opaque spans), import/export module specifiers and call
 * sites by callee name. Any other expression is returned as an opaque
 * SyntaxKind::Unknown span. Offsets are byte offsets into the source text.
 */
class EcmaLiteralParser : public ISourceParser {
public:
    EcmaLiteralParser() = default;
    ~EcmaLiteralParser() override = default;

    std::shared_ptr<ISourceFile> parseFile(const std::string &filename) override;
    std::shared_ptr<ISourceFile> parseContent(const std::string &fileName, const std::string &content) override;
    std::string getLastError() const override;

private:
    std::string lastError_;
};

}  // namespace MDG
