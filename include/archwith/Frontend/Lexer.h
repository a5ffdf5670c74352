//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Token and lexer declarations for transforming `.mirror` text into token streams.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_FRONTEND_LEXER_H
#define ARCHWITH_FRONTEND_LEXER_H

#include "archwith/Frontend/SourceLocation.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace archwith
{

/// @file
/// @brief Tokenization interfaces for mirror declaration files.

/// @brief Token categories recognized by the lexer.
enum class TokenKind
{

    /// @brief End-of-file sentinel.
    Eof,

    /// @brief Identifier or keyword token.
    Identifier,

    /// @brief Integer literal token.
    Integer,

    /// @brief String literal token; the text holds the unescaped value.
    String,

    /// @brief `#` token.
    Hash,

    /// @brief `::` token.
    Scope,

    /// @brief `:` token.
    Colon,

    /// @brief `;` token.
    Semicolon,

    /// @brief `,` token.
    Comma,

    /// @brief `(` token.
    LParen,

    /// @brief `)` token.
    RParen,

    /// @brief `[` token.
    LBracket,

    /// @brief `]` token.
    RBracket,

    /// @brief `{` token.
    LBrace,

    /// @brief `}` token.
    RBrace,

    /// @brief `<` token.
    Less,

    /// @brief `>` token.
    Greater,

    /// @brief `=` token.
    Equal,

    /// @brief `*` token.
    Star,

    /// @brief `&` token.
    Amp,

    /// @brief `.` token.
    Dot,

    /// @brief `/` token.
    Slash,

    /// @brief `~` token.
    Tilde,

    /// @brief Any other single character.
    Unknown,
};

/// @brief Single lexical token emitted by @ref Lexer.
struct Token
{
    /// @brief Token category.
    TokenKind kind{TokenKind::Eof};

    /// @brief Original token spelling.
    std::string text;

    /// @brief Start location of the token.
    SourceLocation location;
};

/// @brief Converts mirror declaration text into a token stream.
class Lexer final
{
public:
    /// @brief Constructs a lexer for one source file.
    /// @param[in] file Logical file name used in token locations.
    /// @param[in] text Full source text to tokenize.
    Lexer(std::string file, std::string text);

    /// @brief Tokenizes the input source.
    /// @return Token sequence terminated by @ref TokenKind::Eof.
    [[nodiscard]] std::vector<Token> lex();

private:
    [[nodiscard]] bool isAtEnd() const;

    [[nodiscard]] char peek(std::size_t lookahead = 0) const;

    char advance();

    void emit(TokenKind kind, std::string text, std::uint32_t line, std::uint32_t column);

    void lexIdentifier(std::uint32_t line, std::uint32_t column);

    void lexNumber(std::uint32_t line, std::uint32_t column);

    void lexString(std::uint32_t line, std::uint32_t column);

    /// @brief Skips a `/* ... */` comment, including unterminated ones.
    void skipBlockComment();

    /// @brief Logical file name for token locations.
    std::string file_;

    /// @brief Full source text.
    std::string text_;

    /// @brief Current byte offset.
    std::size_t index_{0};

    /// @brief Current 1-based source line.
    std::uint32_t line_{1};

    /// @brief Current 1-based source column.
    std::uint32_t column_{1};

    /// @brief Output token buffer.
    std::vector<Token> tokens_;
};

/// @brief Re-spells a token range as C++ source text.
///
/// @details Adjacent word-like tokens are separated by one space, a comma is followed by one space, and all other
/// tokens are joined without whitespace, so `std :: map < int , T >` becomes `std::map<int, T>`.
///
/// @param[in] tokens Token range to render.
/// @return Canonical spelling.
std::string spellTokens(const std::vector<Token>& tokens);

}  // namespace archwith

#endif  // ARCHWITH_FRONTEND_LEXER_H
