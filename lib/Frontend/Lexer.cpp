//===----------------------------------------------------------------------===//
///
/// @file
/// Implements lexical analysis for mirror declaration files.
///
/// The lexer converts source characters into parser tokens while preserving precise source-location diagnostics.
///
//===----------------------------------------------------------------------===//

#include "archwith/Frontend/Lexer.h"

#include <cctype>
#include <utility>

namespace archwith
{
namespace
{

bool isWordLike(const TokenKind kind)
{
    return kind == TokenKind::Identifier || kind == TokenKind::Integer;
}

}  // namespace

Lexer::Lexer(std::string file, std::string text)
    : file_(std::move(file))
    , text_(std::move(text))
{
}

bool Lexer::isAtEnd() const
{
    return index_ >= text_.size();
}

char Lexer::peek(std::size_t lookahead) const
{
    const std::size_t i = index_ + lookahead;
    return i < text_.size() ? text_[i] : '\0';
}

char Lexer::advance()
{
    if (isAtEnd())
    {
        return '\0';
    }
    const char c = text_[index_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

void Lexer::emit(TokenKind kind, std::string text, std::uint32_t line, std::uint32_t column)
{
    tokens_.push_back(Token{kind, std::move(text), SourceLocation{file_, line, column}});
}

void Lexer::lexIdentifier(std::uint32_t line, std::uint32_t column)
{
    std::string text;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
    {
        text.push_back(advance());
    }
    emit(TokenKind::Identifier, text, line, column);
}

void Lexer::lexNumber(std::uint32_t line, std::uint32_t column)
{
    std::string text;
    while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '\'')
    {
        text.push_back(advance());
    }
    emit(TokenKind::Integer, text, line, column);
}

void Lexer::lexString(std::uint32_t line, std::uint32_t column)
{
    std::string value;
    (void) advance();
    while (!isAtEnd() && peek() != '"' && peek() != '\n' && peek() != '\r')
    {
        char c = advance();
        if (c == '\\' && !isAtEnd())
        {
            const char esc = advance();
            switch (esc)
            {
            case 'n':
                value.push_back('\n');
                break;
            case 't':
                value.push_back('\t');
                break;
            default:
                value.push_back(esc);
                break;
            }
        }
        else
        {
            value.push_back(c);
        }
    }
    if (peek() == '"')
    {
        (void) advance();
    }
    emit(TokenKind::String, value, line, column);
}

void Lexer::skipBlockComment()
{
    (void) advance();
    (void) advance();
    while (!isAtEnd() && !(peek() == '*' && peek(1) == '/'))
    {
        (void) advance();
    }
    (void) advance();
    (void) advance();
}

std::vector<Token> Lexer::lex()
{
    while (!isAtEnd())
    {
        const std::uint32_t tokLine = line_;
        const std::uint32_t tokCol  = column_;
        const char          c       = peek();

        if (std::isspace(static_cast<unsigned char>(c)))
        {
            (void) advance();
            continue;
        }
        if (c == '/' && peek(1) == '/')
        {
            while (!isAtEnd() && peek() != '\n')
            {
                (void) advance();
            }
            continue;
        }
        if (c == '/' && peek(1) == '*')
        {
            skipBlockComment();
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_')
        {
            lexIdentifier(tokLine, tokCol);
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c)))
        {
            lexNumber(tokLine, tokCol);
            continue;
        }

        if (c == '"')
        {
            lexString(tokLine, tokCol);
            continue;
        }

        if (c == ':' && peek(1) == ':')
        {
            (void) advance();
            (void) advance();
            emit(TokenKind::Scope, "::", tokLine, tokCol);
            continue;
        }

        const TokenKind kind = [&]() {
            switch (c)
            {
            case '#':
                return TokenKind::Hash;
            case ':':
                return TokenKind::Colon;
            case ';':
                return TokenKind::Semicolon;
            case ',':
                return TokenKind::Comma;
            case '(':
                return TokenKind::LParen;
            case ')':
                return TokenKind::RParen;
            case '[':
                return TokenKind::LBracket;
            case ']':
                return TokenKind::RBracket;
            case '{':
                return TokenKind::LBrace;
            case '}':
                return TokenKind::RBrace;
            case '<':
                return TokenKind::Less;
            case '>':
                return TokenKind::Greater;
            case '=':
                return TokenKind::Equal;
            case '*':
                return TokenKind::Star;
            case '&':
                return TokenKind::Amp;
            case '.':
                return TokenKind::Dot;
            case '/':
                return TokenKind::Slash;
            case '~':
                return TokenKind::Tilde;
            default:
                return TokenKind::Unknown;
            }
        }();

        (void) advance();
        emit(kind, std::string(1, c), tokLine, tokCol);
    }

    emit(TokenKind::Eof, "", line_, column_);
    return tokens_;
}

std::string spellTokens(const std::vector<Token>& tokens)
{
    std::string out;
    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        const Token& token = tokens[i];
        if (i > 0 && isWordLike(tokens[i - 1].kind) && isWordLike(token.kind))
        {
            out.push_back(' ');
        }
        if (token.kind == TokenKind::String)
        {
            out += '"' + token.text + '"';
        }
        else
        {
            out += token.text;
        }
        if (token.kind == TokenKind::Comma)
        {
            out.push_back(' ');
        }
    }
    return out;
}

}  // namespace archwith
