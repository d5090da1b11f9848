// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#include "parsing/EcmaLexer.h"
#include "common/Logger.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <utility>

namespace MDG {

namespace {

// Longest first so that a prefix never shadows a longer punctuator
constexpr std::array<const char *, 48> PUNCTUATORS = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=", "?\?=", "=>", "==", "!=", "<=", ">=",
    "&&",   "||",  "??",  "?.",  "++",  "--",  "+=",  "-=",  "*=",  "/=",  "%=",  "&=", "|=", "^=", "**", "<<",
    ">>",   "{",   "}",   "(",   ")",   "[",   "]",   ";",   ",",   "<",   ">",   "+",  "-",  "*",  "%",  "&"};

constexpr std::array<const char *, 14> KEYWORDS_BEFORE_EXPRESSION = {
    "return", "typeof", "instanceof", "in", "of", "new", "delete", "void", "throw", "case", "do", "else", "yield", "await"};

bool isDigit(unsigned char c) {
    return c >= '0' && c <= '9';
}

bool isHexDigit(unsigned char c) {
    return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

int hexValue(unsigned char c) {
    if (isDigit(c)) {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return c - 'A' + 10;
}

}  // namespace

void appendUtf8(std::string &out, unsigned long codePoint) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

EcmaLexer::EcmaLexer(std::string source) : source_(std::move(source)) {}

std::vector<Token> EcmaLexer::tokenize() {
    std::vector<Token> tokens;
    pos_ = 0;
    hasPrevious_ = false;

    // Hashbang line
    if (source_.compare(0, 2, "#!") == 0) {
        while (pos_ < source_.size() && source_[pos_] != '\n') {
            ++pos_;
        }
    }

    while (true) {
        Token token = scanToken();
        tokens.push_back(token);
        if (token.type == TokenType::EndOfFile) {
            break;
        }
    }

    LOG_TRACE("EcmaLexer: Produced {} tokens, {} diagnostics", tokens.size(), diagnostics_.size());
    return tokens;
}

Token EcmaLexer::scanToken() {
    skipTrivia();

    Token token;
    if (pos_ >= source_.size()) {
        token.type = TokenType::EndOfFile;
        token.start = token.end = source_.size();
        return token;
    }

    unsigned char c = static_cast<unsigned char>(source_[pos_]);
    if (c == '"' || c == '\'') {
        token = scanString(static_cast<char>(c));
    } else if (c == '`') {
        token = scanTemplate();
    } else if (isDigit(c) || (c == '.' && pos_ + 1 < source_.size() && isDigit(source_[pos_ + 1]))) {
        token = scanNumber();
    } else if (isIdentifierStart(c) || c == '\\') {
        token = scanIdentifier();
    } else if (c == '#' && pos_ + 1 < source_.size() && isIdentifierStart(source_[pos_ + 1])) {
        token = scanPrivateName();
    } else if (c == '/' && regexAllowed()) {
        token = scanRegex();
    } else {
        token = scanPunctuator();
    }

    previous_ = token;
    hasPrevious_ = true;
    return token;
}

void EcmaLexer::skipTrivia() {
    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f') {
            ++pos_;
        } else if (c == '/' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '/') {
            while (pos_ < source_.size() && source_[pos_] != '\n') {
                ++pos_;
            }
        } else if (c == '/' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '*') {
            size_t close = source_.find("*/", pos_ + 2);
            if (close == std::string::npos) {
                addDiagnostic("Unterminated block comment", pos_);
                pos_ = source_.size();
            } else {
                pos_ = close + 2;
            }
        } else if (static_cast<unsigned char>(c) == 0xC2 && pos_ + 1 < source_.size() &&
                   static_cast<unsigned char>(source_[pos_ + 1]) == 0xA0) {
            // NBSP
            pos_ += 2;
        } else {
            break;
        }
    }
}

bool EcmaLexer::regexAllowed() const {
    if (!hasPrevious_) {
        return true;
    }
    switch (previous_.type) {
    case TokenType::Punctuator:
        return previous_.value != ")" && previous_.value != "]" && previous_.value != "}";
    case TokenType::Identifier:
        for (const char *keyword : KEYWORDS_BEFORE_EXPRESSION) {
            if (previous_.value == keyword) {
                return true;
            }
        }
        return false;
    default:
        return false;
    }
}

Token EcmaLexer::scanString(char quote) {
    Token token;
    token.type = TokenType::String;
    token.start = pos_;
    ++pos_;

    bool terminated = false;
    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == quote) {
            ++pos_;
            terminated = true;
            break;
        }
        if (c == '\n') {
            break;
        }
        if (c == '\\') {
            ++pos_;
            appendEscape(token.value);
            continue;
        }
        token.value += c;
        ++pos_;
    }

    if (!terminated) {
        addDiagnostic("Unterminated string literal", token.start);
    }
    token.end = pos_;
    return token;
}

Token EcmaLexer::scanTemplate() {
    Token token;
    token.type = TokenType::Template;
    token.start = pos_;
    ++pos_;

    bool terminated = false;
    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == '`') {
            ++pos_;
            terminated = true;
            break;
        }
        if (c == '\\') {
            ++pos_;
            appendEscape(token.value);
            continue;
        }
        if (c == '$' && pos_ + 1 < source_.size() && source_[pos_ + 1] == '{') {
            pos_ += 2;
            token.hasSubstitutions = true;
            skipTemplateSubstitution();
            continue;
        }
        if (c == '\r') {
            // Template values normalize CRLF and CR to LF
            ++pos_;
            if (pos_ < source_.size() && source_[pos_] == '\n') {
                ++pos_;
            }
            token.value += '\n';
            continue;
        }
        token.value += c;
        ++pos_;
    }

    if (!terminated) {
        addDiagnostic("Unterminated template literal", token.start);
    }
    if (token.hasSubstitutions) {
        token.value.clear();
    }
    token.end = pos_;
    return token;
}

void EcmaLexer::skipTemplateSubstitution() {
    Token saved = previous_;
    bool savedHasPrevious = hasPrevious_;
    hasPrevious_ = false;

    int depth = 0;
    while (true) {
        Token inner = scanToken();
        if (inner.type == TokenType::EndOfFile) {
            break;
        }
        if (inner.isPunctuator("{")) {
            ++depth;
        } else if (inner.isPunctuator("}")) {
            if (depth == 0) {
                break;
            }
            --depth;
        }
    }

    previous_ = saved;
    hasPrevious_ = savedHasPrevious;
}

void EcmaLexer::appendEscape(std::string &out) {
    if (pos_ >= source_.size()) {
        return;
    }

    char c = source_[pos_++];
    switch (c) {
    case 'n':
        out += '\n';
        return;
    case 't':
        out += '\t';
        return;
    case 'r':
        out += '\r';
        return;
    case 'b':
        out += '\b';
        return;
    case 'f':
        out += '\f';
        return;
    case 'v':
        out += '\v';
        return;
    case '0':
        if (pos_ < source_.size() && isDigit(source_[pos_])) {
            break;
        }
        out += '\0';
        return;
    case '\r':
        // Line continuation
        if (pos_ < source_.size() && source_[pos_] == '\n') {
            ++pos_;
        }
        return;
    case '\n':
        return;
    case 'x':
        if (pos_ + 1 < source_.size() && isHexDigit(source_[pos_]) && isHexDigit(source_[pos_ + 1])) {
            appendUtf8(out, hexValue(source_[pos_]) * 16 + hexValue(source_[pos_ + 1]));
            pos_ += 2;
            return;
        }
        break;
    case 'u': {
        unsigned long codePoint = 0;
        if (pos_ < source_.size() && source_[pos_] == '{') {
            size_t close = source_.find('}', pos_);
            if (close != std::string::npos) {
                for (size_t i = pos_ + 1; i < close; ++i) {
                    codePoint = codePoint * 16 + hexValue(source_[i]);
                }
                pos_ = close + 1;
                appendUtf8(out, codePoint);
                return;
            }
            break;
        }
        if (pos_ + 3 < source_.size() && isHexDigit(source_[pos_]) && isHexDigit(source_[pos_ + 1]) &&
            isHexDigit(source_[pos_ + 2]) && isHexDigit(source_[pos_ + 3])) {
            for (int i = 0; i < 4; ++i) {
                codePoint = codePoint * 16 + hexValue(source_[pos_ + i]);
            }
            pos_ += 4;
            appendUtf8(out, codePoint);
            return;
        }
        break;
    }
    default:
        break;
    }

    // Unknown or malformed escape: the character stands for itself
    out += c;
}

Token EcmaLexer::scanNumber() {
    Token token;
    token.type = TokenType::Number;
    token.start = pos_;

    auto consumeDigits = [this](bool hex) {
        while (pos_ < source_.size() &&
               (source_[pos_] == '_' || (hex ? isHexDigit(source_[pos_]) : isDigit(source_[pos_])))) {
            ++pos_;
        }
    };

    if (source_[pos_] == '0' && pos_ + 1 < source_.size() && std::strchr("xXoObB", source_[pos_ + 1]) != nullptr) {
        pos_ += 2;
        consumeDigits(true);
    } else {
        consumeDigits(false);
        if (pos_ < source_.size() && source_[pos_] == '.') {
            ++pos_;
            consumeDigits(false);
        }
        if (pos_ < source_.size() && (source_[pos_] == 'e' || source_[pos_] == 'E')) {
            size_t save = pos_;
            ++pos_;
            if (pos_ < source_.size() && (source_[pos_] == '+' || source_[pos_] == '-')) {
                ++pos_;
            }
            if (pos_ < source_.size() && isDigit(source_[pos_])) {
                consumeDigits(false);
            } else {
                pos_ = save;
            }
        }
    }

    if (pos_ < source_.size() && source_[pos_] == 'n') {
        ++pos_;
        token.type = TokenType::BigInt;
    }

    token.end = pos_;
    token.value = source_.substr(token.start, token.end - token.start);
    return token;
}

Token EcmaLexer::scanIdentifier() {
    Token token;
    token.type = TokenType::Identifier;
    token.start = pos_;

    while (pos_ < source_.size()) {
        unsigned char c = static_cast<unsigned char>(source_[pos_]);
        if (c == '\\' && pos_ + 1 < source_.size() && source_[pos_ + 1] == 'u') {
            pos_ += 2;
            appendEscape(token.value);
            continue;
        }
        if (!isIdentifierPart(c)) {
            break;
        }
        token.value += static_cast<char>(c);
        ++pos_;
    }

    if (token.value.empty()) {
        // Lone backslash
        ++pos_;
        token.type = TokenType::Punctuator;
        token.value = "\\";
        addDiagnostic("Invalid character", token.start);
    }
    token.end = pos_;
    return token;
}

Token EcmaLexer::scanPrivateName() {
    Token token;
    token.start = pos_;
    ++pos_;
    Token name = scanIdentifier();
    token.type = TokenType::PrivateName;
    token.value = "#" + name.value;
    token.end = name.end;
    return token;
}

Token EcmaLexer::scanRegex() {
    Token token;
    token.type = TokenType::Regex;
    token.start = pos_;
    ++pos_;

    bool inClass = false;
    bool terminated = false;
    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == '\n') {
            break;
        }
        if (c == '\\') {
            pos_ += 2;
            continue;
        }
        if (c == '[') {
            inClass = true;
        } else if (c == ']') {
            inClass = false;
        } else if (c == '/' && !inClass) {
            ++pos_;
            terminated = true;
            break;
        }
        ++pos_;
    }

    if (!terminated) {
        addDiagnostic("Unterminated regular expression literal", token.start);
    }

    // Flags
    while (pos_ < source_.size() && isIdentifierPart(source_[pos_])) {
        ++pos_;
    }

    pos_ = std::min(pos_, source_.size());
    token.end = pos_;
    token.value = source_.substr(token.start, token.end - token.start);
    return token;
}

Token EcmaLexer::scanPunctuator() {
    Token token;
    token.type = TokenType::Punctuator;
    token.start = pos_;

    for (const char *punctuator : PUNCTUATORS) {
        size_t length = std::strlen(punctuator);
        if (source_.compare(pos_, length, punctuator) == 0) {
            // `?.5` is a conditional followed by a number
            if (std::strcmp(punctuator, "?.") == 0 && pos_ + 2 < source_.size() && isDigit(source_[pos_ + 2])) {
                continue;
            }
            pos_ += length;
            token.end = pos_;
            token.value = punctuator;
            return token;
        }
    }

    // Remaining single-character punctuators: . : ? = ! ~ | ^ / @ #
    token.value = std::string(1, source_[pos_]);
    ++pos_;
    token.end = pos_;
    return token;
}

bool EcmaLexer::isIdentifierStart(unsigned char c) const {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || c >= 0x80;
}

bool EcmaLexer::isIdentifierPart(unsigned char c) const {
    return isIdentifierStart(c) || isDigit(c);
}

void EcmaLexer::addDiagnostic(const std::string &message, size_t position) {
    diagnostics_.push_back(message + " at offset " + std::to_string(position));
    LOG_DEBUG("EcmaLexer: {} at offset {}", message, position);
}

}  // namespace MDG
