// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "parsing/EcmaExpressionParser.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <cstdlib>

namespace MDG {

std::string canonicalNumericText(const std::string &literal) {
    std::string digits;
    for (char c : literal) {
        if (c != '_') {
            digits += c;
        }
    }

    double value = 0;
    if (digits.size() > 2 && digits[0] == '0') {
        char prefix = digits[1];
        int base = 0;
        if (prefix == 'x' || prefix == 'X') {
            base = 16;
        } else if (prefix == 'o' || prefix == 'O') {
            base = 8;
        } else if (prefix == 'b' || prefix == 'B') {
            base = 2;
        }
        if (base != 0) {
            value = static_cast<double>(std::strtoull(digits.c_str() + 2, nullptr, base));
            return formatJsNumber(value);
        }
    }

    value = std::strtod(digits.c_str(), nullptr);
    return formatJsNumber(value);
}

EcmaExpressionParser::EcmaExpressionParser(const std::vector<Token> &tokens, std::shared_ptr<const std::string> source)
    : tokens_(tokens), source_(std::move(source)) {}

EcmaExpressionParser::NodePtr EcmaExpressionParser::parseCallExpression(size_t calleeIndex) {
    index_ = calleeIndex;

    // Include the member chain of `a.b.createMachine`
    size_t first = calleeIndex;
    while (first >= 2 && (tokens_[first - 1].isPunctuator(".") || tokens_[first - 1].isPunctuator("?.")) &&
           tokens_[first - 2].type == TokenType::Identifier) {
        first -= 2;
    }

    advance();
    if (peek().isPunctuator("<")) {
        skipTypeArguments();
    }
    if (!peek().isPunctuator("(")) {
        return nullptr;
    }

    auto call = makeNode(SyntaxKind::CallExpression, tokens_[first].start, 0);
    advance();
    parseElementList(call, ")", false);
    call->setEnd(previousEnd());
    return call;
}

const Token &EcmaExpressionParser::peek(size_t offset) const {
    size_t position = index_ + offset;
    if (position >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[position];
}

const Token &EcmaExpressionParser::advance() {
    const Token &token = peek();
    if (token.type != TokenType::EndOfFile) {
        ++index_;
    }
    return token;
}

size_t EcmaExpressionParser::previousEnd() const {
    if (index_ == 0) {
        return 0;
    }
    return tokens_[index_ - 1].end;
}

bool EcmaExpressionParser::isTerminator(const Token &token) const {
    return token.type == TokenType::EndOfFile || token.isPunctuator(",") || token.isPunctuator(")") ||
           token.isPunctuator("]") || token.isPunctuator("}") || token.isPunctuator(";");
}

bool EcmaExpressionParser::isOpener(const Token &token) const {
    return token.isPunctuator("(") || token.isPunctuator("[") || token.isPunctuator("{");
}

bool EcmaExpressionParser::isCloser(const Token &token) const {
    return token.isPunctuator(")") || token.isPunctuator("]") || token.isPunctuator("}");
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::makeNode(SyntaxKind kind, size_t start, size_t end) const {
    return std::make_shared<EcmaSyntaxNode>(kind, start, end, source_);
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::parseAssignmentExpression() {
    size_t startIndex = index_;
    size_t start = peek().start;

    NodePtr node = parsePrimary();
    if (node && isTerminator(peek())) {
        return node;
    }

    skipToTerminator();
    if (index_ == startIndex) {
        addDiagnostic("Expression expected", peek());
        return makeNode(SyntaxKind::Unknown, start, start);
    }
    return makeNode(SyntaxKind::Unknown, start, previousEnd());
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::parsePrimary() {
    const Token &token = peek();

    switch (token.type) {
    case TokenType::String: {
        advance();
        auto node = makeNode(SyntaxKind::StringLiteral, token.start, token.end);
        node->setLiteralText(token.value);
        return node;
    }
    case TokenType::Template: {
        advance();
        auto node = makeNode(token.hasSubstitutions ? SyntaxKind::TemplateExpression
                                                    : SyntaxKind::NoSubstitutionTemplate,
                             token.start, token.end);
        node->setLiteralText(token.value);
        return node;
    }
    case TokenType::Number: {
        advance();
        auto node = makeNode(SyntaxKind::NumericLiteral, token.start, token.end);
        node->setLiteralText(canonicalNumericText(token.value));
        return node;
    }
    case TokenType::BigInt: {
        advance();
        auto node = makeNode(SyntaxKind::BigIntLiteral, token.start, token.end);
        node->setLiteralText(token.value.substr(0, token.value.size() - 1));
        return node;
    }
    case TokenType::Identifier: {
        if (token.value == "true" || token.value == "false" || token.value == "null") {
            advance();
            SyntaxKind kind = token.value == "true"    ? SyntaxKind::TrueKeyword
                              : token.value == "false" ? SyntaxKind::FalseKeyword
                                                       : SyntaxKind::NullKeyword;
            auto node = makeNode(kind, token.start, token.end);
            node->setLiteralText(token.value);
            return node;
        }
        if (token.value == "function" || (token.value == "async" && peek(1).isIdentifier("function"))) {
            return parseFunctionExpression();
        }
        if (token.value == "async" || peek(1).isPunctuator("=>")) {
            if (auto arrow = tryParseArrowFunction()) {
                return arrow;
            }
        }
        advance();
        auto node = makeNode(SyntaxKind::Identifier, token.start, token.end);
        node->setLiteralText(token.value);
        return node;
    }
    case TokenType::Punctuator:
        if (token.value == "{") {
            return parseObjectLiteral();
        }
        if (token.value == "[") {
            return parseArrayLiteral();
        }
        if (token.value == "(" || token.value == "<") {
            return tryParseArrowFunction();
        }
        return nullptr;
    default:
        return nullptr;
    }
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::parseObjectLiteral() {
    auto object = makeNode(SyntaxKind::ObjectLiteral, peek().start, 0);
    advance();

    while (true) {
        if (peek().isPunctuator("}")) {
            advance();
            break;
        }
        if (peek().type == TokenType::EndOfFile) {
            addDiagnostic("'}' expected", peek());
            break;
        }

        size_t before = index_;
        NodePtr member = parseMember();
        if (member) {
            member->setParent(object);
            object->addProperty(member);
        }

        if (peek().isPunctuator(",")) {
            advance();
            continue;
        }
        if (member && peek().isPunctuator("}")) {
            continue;
        }

        addDiagnostic("',' expected", peek());
        recover("}");
        if (index_ == before) {
            advance();
        }
    }

    object->setEnd(previousEnd());
    return object;
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::parseArrayLiteral() {
    auto array = makeNode(SyntaxKind::ArrayLiteral, peek().start, 0);
    advance();
    parseElementList(array, "]", true);
    array->setEnd(previousEnd());
    return array;
}

void EcmaExpressionParser::parseElementList(const NodePtr &owner, const char *closer, bool allowHoles) {
    while (true) {
        if (peek().isPunctuator(closer)) {
            advance();
            return;
        }
        if (peek().type == TokenType::EndOfFile) {
            addDiagnostic(fmt::format("'{}' expected", closer), peek());
            return;
        }

        if (peek().isPunctuator(",")) {
            if (allowHoles) {
                auto hole = makeNode(SyntaxKind::OmittedExpression, peek().start, peek().start);
                hole->setParent(owner);
                owner->addElement(hole);
            } else {
                addDiagnostic("Argument expression expected", peek());
            }
            advance();
            continue;
        }

        size_t before = index_;
        NodePtr element = peek().isPunctuator("...") ? parseSpread(SyntaxKind::SpreadElement)
                                                     : parseAssignmentExpression();
        element->setParent(owner);
        owner->addElement(element);

        if (peek().isPunctuator(",")) {
            advance();
            continue;
        }
        if (peek().isPunctuator(closer)) {
            continue;
        }

        addDiagnostic("',' expected", peek());
        recover(closer);
        if (index_ == before) {
            advance();
        }
    }
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::parseSpread(SyntaxKind kind) {
    size_t start = peek().start;
    advance();
    NodePtr expression = parseAssignmentExpression();
    auto spread = makeNode(kind, start, previousEnd());
    expression->setParent(spread);
    spread->setInitializer(expression);
    return spread;
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::parseMember() {
    if (peek().isPunctuator("...")) {
        return parseSpread(SyntaxKind::SpreadAssignment);
    }

    size_t start = peek().start;
    SyntaxKind kind = SyntaxKind::PropertyAssignment;
    bool isFunctionLike = false;

    // Modifiers only count when a property name follows them
    auto namesFollow = [this]() {
        const Token &next = peek(1);
        return !(next.isPunctuator(":") || next.isPunctuator("(") || next.isPunctuator(",") ||
                 next.isPunctuator("}") || next.isPunctuator("=") || next.isPunctuator("<") ||
                 next.isPunctuator("?"));
    };
    if ((peek().isIdentifier("get") || peek().isIdentifier("set") || peek().isIdentifier("async")) && namesFollow()) {
        if (peek().value == "get") {
            kind = SyntaxKind::GetAccessor;
        } else if (peek().value == "set") {
            kind = SyntaxKind::SetAccessor;
        } else {
            kind = SyntaxKind::MethodDeclaration;
        }
        isFunctionLike = true;
        advance();
    }
    if (peek().isPunctuator("*")) {
        kind = SyntaxKind::MethodDeclaration;
        isFunctionLike = true;
        advance();
    }

    NodePtr name = parsePropertyName();
    if (!name) {
        addDiagnostic("Property assignment expected", peek());
        return nullptr;
    }

    // TypeScript optional / definite markers
    if (peek().isPunctuator("?") || peek().isPunctuator("!")) {
        advance();
    }

    NodePtr initializer;
    if (isFunctionLike || peek().isPunctuator("(") || peek().isPunctuator("<")) {
        if (!isFunctionLike) {
            kind = SyntaxKind::MethodDeclaration;
        }
        if (peek().isPunctuator("<")) {
            skipTypeArguments();
        }
        if (peek().isPunctuator("(")) {
            skipBalanced();
        }
        if (peek().isPunctuator(":")) {
            skipReturnType("{");
        }
        if (peek().isPunctuator("{")) {
            skipBalanced();
        }
    } else if (peek().isPunctuator(":")) {
        advance();
        initializer = parseAssignmentExpression();
    } else if (peek().isPunctuator(",") || peek().isPunctuator("}")) {
        kind = SyntaxKind::ShorthandPropertyAssignment;
    } else if (peek().isPunctuator("=")) {
        // Shorthand with default value (destructuring-only syntax)
        kind = SyntaxKind::ShorthandPropertyAssignment;
        advance();
        parseAssignmentExpression();
    } else {
        addDiagnostic("':' expected", peek());
        return nullptr;
    }

    auto member = makeNode(kind, start, previousEnd());
    name->setParent(member);
    member->setName(name);
    if (initializer) {
        initializer->setParent(member);
        member->setInitializer(initializer);
    }
    return member;
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::parsePropertyName() {
    const Token &token = peek();
    NodePtr name;

    switch (token.type) {
    case TokenType::Identifier:
        name = makeNode(SyntaxKind::Identifier, token.start, token.end);
        name->setLiteralText(token.value);
        break;
    case TokenType::String:
        name = makeNode(SyntaxKind::StringLiteral, token.start, token.end);
        name->setLiteralText(token.value);
        break;
    case TokenType::Template:
        if (token.hasSubstitutions) {
            return nullptr;
        }
        name = makeNode(SyntaxKind::NoSubstitutionTemplate, token.start, token.end);
        name->setLiteralText(token.value);
        break;
    case TokenType::Number:
        name = makeNode(SyntaxKind::NumericLiteral, token.start, token.end);
        name->setLiteralText(canonicalNumericText(token.value));
        break;
    case TokenType::BigInt:
        name = makeNode(SyntaxKind::BigIntLiteral, token.start, token.end);
        name->setLiteralText(token.value.substr(0, token.value.size() - 1));
        break;
    case TokenType::PrivateName:
        name = makeNode(SyntaxKind::PrivateIdentifier, token.start, token.end);
        name->setLiteralText(token.value);
        break;
    case TokenType::Punctuator:
        if (token.value == "[") {
            size_t start = token.start;
            advance();
            NodePtr expression = parseAssignmentExpression();
            if (peek().isPunctuator("]")) {
                advance();
            } else {
                addDiagnostic("']' expected", peek());
            }
            auto computed = makeNode(SyntaxKind::ComputedPropertyName, start, previousEnd());
            expression->setParent(computed);
            computed->setInitializer(expression);
            return computed;
        }
        return nullptr;
    default:
        return nullptr;
    }

    advance();
    return name;
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::parseFunctionExpression() {
    size_t start = peek().start;
    if (peek().isIdentifier("async")) {
        advance();
    }
    advance();  // function
    if (peek().isPunctuator("*")) {
        advance();
    }
    if (peek().type == TokenType::Identifier) {
        advance();
    }
    if (peek().isPunctuator("<")) {
        skipTypeArguments();
    }
    if (peek().isPunctuator("(")) {
        skipBalanced();
    }
    if (peek().isPunctuator(":")) {
        skipReturnType("{");
    }
    if (peek().isPunctuator("{")) {
        skipBalanced();
    } else {
        addDiagnostic("Function body expected", peek());
    }
    return makeNode(SyntaxKind::FunctionExpression, start, previousEnd());
}

EcmaExpressionParser::NodePtr EcmaExpressionParser::tryParseArrowFunction() {
    size_t save = index_;
    size_t start = peek().start;

    if (peek().isIdentifier("async") && !peek(1).isPunctuator("=>")) {
        advance();
    }
    if (peek().isPunctuator("<")) {
        skipTypeArguments();
    }

    if (peek().type == TokenType::Identifier && peek(1).isPunctuator("=>")) {
        advance();
    } else if (peek().isPunctuator("(")) {
        skipBalanced();
        if (peek().isPunctuator(":")) {
            skipReturnType("=>");
        }
    } else {
        index_ = save;
        return nullptr;
    }

    if (!peek().isPunctuator("=>")) {
        index_ = save;
        return nullptr;
    }
    advance();

    if (peek().isPunctuator("{")) {
        skipBalanced();
    } else {
        parseAssignmentExpression();
    }
    return makeNode(SyntaxKind::ArrowFunction, start, previousEnd());
}

size_t EcmaExpressionParser::findMatching(size_t index) const {
    int depth = 0;
    for (size_t i = index; i < tokens_.size(); ++i) {
        const Token &token = tokens_[i];
        if (isOpener(token)) {
            ++depth;
        } else if (isCloser(token)) {
            --depth;
            if (depth == 0) {
                return i;
            }
        } else if (token.type == TokenType::EndOfFile) {
            return i;
        }
    }
    return tokens_.size() - 1;
}

void EcmaExpressionParser::skipBalanced() {
    size_t closer = findMatching(index_);
    if (tokens_[closer].type == TokenType::EndOfFile) {
        addDiagnostic("Unbalanced bracket", peek());
        index_ = closer;
        return;
    }
    index_ = closer + 1;
}

void EcmaExpressionParser::skipTypeArguments() {
    int depth = 0;
    while (peek().type != TokenType::EndOfFile && !peek().isPunctuator(";")) {
        const Token &token = peek();
        if (isOpener(token)) {
            skipBalanced();
            continue;
        }
        if (token.type == TokenType::Punctuator && token.value != "=>") {
            for (char c : token.value) {
                if (c == '<') {
                    ++depth;
                } else if (c == '>') {
                    --depth;
                }
            }
        }
        advance();
        if (depth <= 0) {
            return;
        }
    }
}

void EcmaExpressionParser::skipToTerminator() {
    while (!isTerminator(peek())) {
        if (isOpener(peek())) {
            skipBalanced();
        } else {
            advance();
        }
    }
}

void EcmaExpressionParser::skipReturnType(const char *stopAt) {
    advance();  // ':'
    while (!peek().isPunctuator(stopAt) && !isTerminator(peek())) {
        if (isOpener(peek()) && !peek().isPunctuator(stopAt)) {
            skipBalanced();
        } else {
            advance();
        }
    }
}

void EcmaExpressionParser::recover(const char *closer) {
    while (peek().type != TokenType::EndOfFile && !peek().isPunctuator(",") && !peek().isPunctuator(closer)) {
        if (isOpener(peek())) {
            skipBalanced();
        } else {
            advance();
        }
    }
    if (peek().isPunctuator(",")) {
        advance();
    }
}

void EcmaExpressionParser::addDiagnostic(const std::string &message, const Token &token) {
    diagnostics_.push_back(message + " at offset " + std::to_string(token.start));
    LOG_DEBUG("EcmaExpressionParser: {} at offset {}", message, token.start);
}

}  // namespace MDG
