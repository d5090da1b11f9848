// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "parsing/EcmaLiteralParser.h"
#include "common/Logger.h"
#include "parsing/EcmaExpressionParser.h"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace MDG {

const char *syntaxKindToString(SyntaxKind kind) {
    switch (kind) {
    case SyntaxKind::ObjectLiteral:
        return "ObjectLiteral";
    case SyntaxKind::ArrayLiteral:
        return "ArrayLiteral";
    case SyntaxKind::StringLiteral:
        return "StringLiteral";
    case SyntaxKind::NoSubstitutionTemplate:
        return "NoSubstitutionTemplate";
    case SyntaxKind::TemplateExpression:
        return "TemplateExpression";
    case SyntaxKind::NumericLiteral:
        return "NumericLiteral";
    case SyntaxKind::BigIntLiteral:
        return "BigIntLiteral";
    case SyntaxKind::TrueKeyword:
        return "TrueKeyword";
    case SyntaxKind::FalseKeyword:
        return "FalseKeyword";
    case SyntaxKind::NullKeyword:
        return "NullKeyword";
    case SyntaxKind::Identifier:
        return "Identifier";
    case SyntaxKind::FunctionExpression:
        return "FunctionExpression";
    case SyntaxKind::ArrowFunction:
        return "ArrowFunction";
    case SyntaxKind::CallExpression:
        return "CallExpression";
    case SyntaxKind::SpreadElement:
        return "SpreadElement";
    case SyntaxKind::OmittedExpression:
        return "OmittedExpression";
    case SyntaxKind::Unknown:
        return "Unknown";
    case SyntaxKind::PropertyAssignment:
        return "PropertyAssignment";
    case SyntaxKind::ShorthandPropertyAssignment:
        return "ShorthandPropertyAssignment";
    case SyntaxKind::SpreadAssignment:
        return "SpreadAssignment";
    case SyntaxKind::MethodDeclaration:
        return "MethodDeclaration";
    case SyntaxKind::GetAccessor:
        return "GetAccessor";
    case SyntaxKind::SetAccessor:
        return "SetAccessor";
    case SyntaxKind::ComputedPropertyName:
        return "ComputedPropertyName";
    case SyntaxKind::PrivateIdentifier:
        return "PrivateIdentifier";
    }
    return "Unknown";
}

// ============================================================================
// EcmaSyntaxNode
// ============================================================================

EcmaSyntaxNode::EcmaSyntaxNode(SyntaxKind kind, size_t start, size_t end, std::shared_ptr<const std::string> source)
    : kind_(kind), start_(start), end_(end), source_(std::move(source)) {}

SyntaxKind EcmaSyntaxNode::getKind() const {
    return kind_;
}

size_t EcmaSyntaxNode::getStart() const {
    return start_;
}

size_t EcmaSyntaxNode::getEnd() const {
    return end_;
}

std::string EcmaSyntaxNode::getText() const {
    if (!source_ || start_ >= source_->size() || end_ <= start_) {
        return "";
    }
    return source_->substr(start_, end_ - start_);
}

const std::vector<std::shared_ptr<ISyntaxNode>> &EcmaSyntaxNode::getProperties() const {
    return properties_;
}

const std::vector<std::shared_ptr<ISyntaxNode>> &EcmaSyntaxNode::getElements() const {
    return elements_;
}

std::shared_ptr<ISyntaxNode> EcmaSyntaxNode::getName() const {
    return name_;
}

std::shared_ptr<ISyntaxNode> EcmaSyntaxNode::getInitializer() const {
    return initializer_;
}

std::string EcmaSyntaxNode::getLiteralText() const {
    return literalText_;
}

std::shared_ptr<ISyntaxNode> EcmaSyntaxNode::getParent() const {
    return parent_.lock();
}

void EcmaSyntaxNode::addProperty(std::shared_ptr<ISyntaxNode> property) {
    properties_.push_back(std::move(property));
}

void EcmaSyntaxNode::addElement(std::shared_ptr<ISyntaxNode> element) {
    elements_.push_back(std::move(element));
}

void EcmaSyntaxNode::setName(std::shared_ptr<ISyntaxNode> name) {
    name_ = std::move(name);
}

void EcmaSyntaxNode::setInitializer(std::shared_ptr<ISyntaxNode> initializer) {
    initializer_ = std::move(initializer);
}

// ============================================================================
// EcmaSourceFile
// ============================================================================

EcmaSourceFile::EcmaSourceFile(std::string fileName, std::shared_ptr<const std::string> text, std::vector<Token> tokens,
                               std::vector<std::string> diagnostics)
    : fileName_(std::move(fileName)), text_(std::move(text)), tokens_(std::move(tokens)),
      diagnostics_(std::move(diagnostics)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::EndOfFile) {
        Token eof;
        eof.start = eof.end = text_->size();
        tokens_.push_back(eof);
    }
    computeLineStarts();
    collectModuleSpecifiers();
}

const std::string &EcmaSourceFile::getFileName() const {
    return fileName_;
}

const std::string &EcmaSourceFile::getText() const {
    return *text_;
}

const std::vector<SyntaxNodePtr> &EcmaSourceFile::getModuleSpecifiers() const {
    return moduleSpecifiers_;
}

const std::vector<std::string> &EcmaSourceFile::getDiagnostics() const {
    return diagnostics_;
}

std::vector<SyntaxNodePtr> EcmaSourceFile::findCallExpressions(const std::string &name) const {
    auto cached = callCache_.find(name);
    if (cached != callCache_.end()) {
        return cached->second;
    }

    std::vector<SyntaxNodePtr> calls;
    EcmaExpressionParser parser(tokens_, text_);

    for (size_t i = 0; i + 1 < tokens_.size(); ++i) {
        const Token &token = tokens_[i];
        if (token.type != TokenType::Identifier || token.value != name) {
            continue;
        }
        if (i > 0 && tokens_[i - 1].isIdentifier("function")) {
            continue;
        }

        const Token &next = tokens_[i + 1];
        if (!next.isPunctuator("(") && !next.isPunctuator("<")) {
            continue;
        }

        auto call = parser.parseCallExpression(i);
        if (!call) {
            continue;
        }

        // `createMachine(config) { ... }` is a method declaration
        size_t after = parser.getPosition();
        if (after < tokens_.size() && tokens_[after].isPunctuator("{")) {
            continue;
        }

        calls.push_back(call);
    }

    for (const auto &diagnostic : parser.getDiagnostics()) {
        if (std::find(diagnostics_.begin(), diagnostics_.end(), diagnostic) == diagnostics_.end()) {
            diagnostics_.push_back(diagnostic);
        }
    }

    LOG_DEBUG("EcmaSourceFile: Found {} '{}' calls in {}", calls.size(), name, fileName_);
    callCache_[name] = calls;
    return calls;
}

LineAndCharacter EcmaSourceFile::getLineAndCharacterOfPosition(size_t position) const {
    position = std::min(position, text_->size());
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), position);
    size_t line = static_cast<size_t>(it - lineStarts_.begin()) - 1;
    return LineAndCharacter{line, position - lineStarts_[line]};
}

void EcmaSourceFile::computeLineStarts() {
    lineStarts_.clear();
    lineStarts_.push_back(0);
    const std::string &text = *text_;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') {
            lineStarts_.push_back(i + 1);
        } else if (text[i] == '\r' && (i + 1 >= text.size() || text[i + 1] != '\n')) {
            lineStarts_.push_back(i + 1);
        }
    }
}

void EcmaSourceFile::collectModuleSpecifiers() {
    int depth = 0;

    for (size_t i = 0; i + 1 < tokens_.size(); ++i) {
        const Token &token = tokens_[i];
        if (token.isPunctuator("{") || token.isPunctuator("(") || token.isPunctuator("[")) {
            ++depth;
            continue;
        }
        if (token.isPunctuator("}") || token.isPunctuator(")") || token.isPunctuator("]")) {
            depth = std::max(0, depth - 1);
            continue;
        }
        if (depth != 0) {
            continue;
        }

        size_t specifier = 0;
        const Token &next = tokens_[i + 1];
        if (token.isIdentifier("import")) {
            if (i > 0 && tokens_[i - 1].isPunctuator(".")) {
                continue;
            }
            // Dynamic import and import.meta are expressions
            if (next.isPunctuator("(") || next.isPunctuator(".")) {
                continue;
            }
            specifier = next.type == TokenType::String ? i + 1 : findFromClause(i + 1);
        } else if (token.isIdentifier("export")) {
            bool reexport = next.isPunctuator("*") || next.isPunctuator("{") ||
                            (next.isIdentifier("type") && i + 2 < tokens_.size() &&
                             (tokens_[i + 2].isPunctuator("{") || tokens_[i + 2].isPunctuator("*")));
            if (reexport) {
                specifier = findFromClause(i + 1);
            }
        }

        if (specifier != 0) {
            const Token &literal = tokens_[specifier];
            auto node = std::make_shared<EcmaSyntaxNode>(SyntaxKind::StringLiteral, literal.start, literal.end, text_);
            node->setLiteralText(literal.value);
            moduleSpecifiers_.push_back(node);
        }
    }
}

size_t EcmaSourceFile::findFromClause(size_t index) const {
    static const char *const statementStarts[] = {"import", "export", "const", "let", "var", "function", "class"};

    for (size_t j = index; j + 1 < tokens_.size(); ++j) {
        const Token &token = tokens_[j];
        if (token.isPunctuator(";") || token.isPunctuator("=")) {
            return 0;
        }
        if (token.isIdentifier("from") && tokens_[j + 1].type == TokenType::String) {
            return j + 1;
        }
        if (token.type == TokenType::Identifier && !tokens_[j - 1].isPunctuator("{") &&
            !tokens_[j - 1].isPunctuator(",")) {
            for (const char *keyword : statementStarts) {
                if (token.value == keyword) {
                    return 0;
                }
            }
        }
    }
    return 0;
}

// ============================================================================
// EcmaLiteralParser
// ============================================================================

std::shared_ptr<ISourceFile> EcmaLiteralParser::parseFile(const std::string &filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        lastError_ = "Failed to open file: " + filename;
        LOG_ERROR("EcmaLiteralParser: {}", lastError_);
        return nullptr;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseContent(filename, buffer.str());
}

std::shared_ptr<ISourceFile> EcmaLiteralParser::parseContent(const std::string &fileName,
                                                             const std::string &content) {
    lastError_.clear();

    auto text = std::make_shared<const std::string>(content);
    EcmaLexer lexer(*text);
    std::vector<Token> tokens = lexer.tokenize();
    std::vector<std::string> diagnostics = lexer.getDiagnostics();

    if (!diagnostics.empty()) {
        lastError_ = diagnostics.front();
        LOG_DEBUG("EcmaLiteralParser: {} syntax diagnostics in {}, first: {}", diagnostics.size(), fileName,
                  lastError_);
    }

    return std::make_shared<EcmaSourceFile>(fileName, text, std::move(tokens), std::move(diagnostics));
}

std::string EcmaLiteralParser::getLastError() const {
    return lastError_;
}

std::shared_ptr<ISourceParser> ISourceParser::create() {
    return std::make_shared<EcmaLiteralParser>();
}

}  // namespace MDG
