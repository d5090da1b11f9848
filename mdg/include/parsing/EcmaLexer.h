// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RSM-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//

#pragma once

#include <string>
#include <vector>

namespace MDG {

enum class TokenType { Identifier, PrivateName, String, Template, Number, BigInt, Punctuator, Regex, EndOfFile };

/**
 * @brief Lexical token of an ECMAScript/TypeScript source
 *
 * `value` holds the cooked string for String and substitution-free Template
 * tokens, the name for Identifier/PrivateName tokens, the source text for
 * everything else.
 */
struct Token {
    TokenType type = TokenType::EndOfFile;
    size_t start = 0;
    size_t end = 0;
    std::string value;
    bool hasSubstitutions = false;

    bool is(TokenType tokenType, const char *text) const {
        return type == tokenType && value == text;
    }

    bool isPunctuator(const char *text) const {
        return is(TokenType::Punctuator, text);
    }

    bool isIdentifier(const char *text) const {
        return is(TokenType::Identifier, text);
    }
};

/**
 * @brief Tokenizer for the syntax subset the literal parser needs
 *
 * Comments are skipped, template substitutions are consumed as part of their
 * template token, and regular expression literals are recognized from the
 * preceding token. Malformed input (unterminated strings, comments or
 * templates) is reported through getDiagnostics() and tokenization stops at
 * the end of the input.
 */
class EcmaLexer {
public:
    explicit EcmaLexer(std::string source);

    /**
     * @brief Tokenize the whole source
     * @return Tokens, terminated by an EndOfFile token
     */
    std::vector<Token> tokenize();

    const std::vector<std::string> &getDiagnostics() const {
        return diagnostics_;
    }

private:
    Token scanToken();
    void skipTrivia();
    bool regexAllowed() const;

    Token scanString(char quote);
    Token scanTemplate();
    Token scanNumber();
    Token scanIdentifier();
    Token scanPrivateName();
    Token scanRegex();
    Token scanPunctuator();

    /**
     * @brief Consume a `${ ... }` substitution body up to its closing brace
     */
    void skipTemplateSubstitution();

    /**
     * @brief Decode one escape sequence starting after the backslash
     */
    void appendEscape(std::string &out);

    bool isIdentifierStart(unsigned char c) const;
    bool isIdentifierPart(unsigned char c) const;
    void addDiagnostic(const std::string &message, size_t position);

    const std::string source_;
    size_t pos_ = 0;
    Token previous_;
    bool hasPrevious_ = false;
    std::vector<std::string> diagnostics_;
};

/**
 * @brief Append a code point to a UTF-8 string
 */
void appendUtf8(std::string &out, unsigned long codePoint);

}  // namespace MDG
