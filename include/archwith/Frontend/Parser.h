//===----------------------------------------------------------------------===//
///
/// @file
/// Parser declarations for constructing mirror declaration ASTs from token streams.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_FRONTEND_PARSER_H
#define ARCHWITH_FRONTEND_PARSER_H

#include "archwith/Frontend/AST.h"
#include "archwith/Frontend/Lexer.h"

#include "llvm/Support/Error.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace archwith
{

class DiagnosticEngine;

/// @file
/// @brief Recursive-descent parser interfaces.

/// @brief Parses a token stream into the mirror declarations of one file.
class Parser final
{
public:
    /// @brief Constructs a parser for one `.mirror` file.
    /// @param[in] filePath Source file path for diagnostics.
    /// @param[in] tokens Token stream to parse.
    /// @param[in,out] diagnostics Diagnostic sink for parse errors.
    Parser(std::string filePath, std::vector<Token> tokens, DiagnosticEngine& diagnostics);

    /// @brief Parses the token stream as one mirror file.
    ///
    /// @details Grammar errors are reported to the diagnostic sink and drop only the declaration they occur in;
    /// every well-formed sibling declaration is still returned.
    ///
    /// @return Parsed file AST.
    MirrorFileAST parseFile();

private:
    /// @brief Returns the current token.
    const Token& current() const;

    /// @brief Returns the token `offset` positions ahead.
    const Token& peek(std::size_t offset) const;

    /// @brief Returns the previous token.
    const Token& previous() const;

    /// @brief Returns true when parser reached EOF.
    bool isAtEnd() const;

    /// @brief Returns true when the current token matches `kind`.
    bool check(TokenKind kind) const;

    /// @brief Returns true when the current token is the identifier `word`.
    bool checkWord(const char* word) const;

    /// @brief Consumes current token when it matches `kind`.
    bool match(TokenKind kind);

    /// @brief Consumes and returns the current token.
    const Token& advance();

    /// @brief Enforces the next token kind and emits diagnostics on mismatch.
    bool expect(TokenKind kind, const std::string& message);

    /// @brief Error recovery that advances past the next `;` or to the next `}`.
    void syncToStatementEnd();

    /// @brief Parses the body of a namespace block or the file scope until `}` or EOF.
    void parseScope(std::vector<std::string>& namespaceComponents, MirrorFileAST& file);

    /// @brief Parses `#include` lines.
    std::optional<IncludeAST> parseInclude();

    /// @brief Parses `namespace a::b { ... }`.
    bool parseNamespace(std::vector<std::string>& namespaceComponents, MirrorFileAST& file);

    /// @brief Parses one attributed struct/class declaration.
    /// @param[in] namespaceComponents Enclosing namespace path.
    /// @param[out] synchronized Set when the declaration was consumed through its closing `;`, even on failure.
    std::optional<MirrorDeclAST> parseMirror(const std::vector<std::string>& namespaceComponents, bool& synchronized);

    /// @brief Parses zero or more `[[...]]` groups.
    bool parseAttributeGroups(std::vector<AttributeAST>& out);

    /// @brief Parses a `template <...>` parameter list.
    bool parseTemplateParams(std::vector<TemplateParamAST>& out);

    /// @brief Parses one field declaration.
    std::optional<FieldDeclAST> parseField();

    /// @brief Source file path for diagnostics.
    std::string filePath_;

    /// @brief Token stream being parsed.
    std::vector<Token> tokens_;

    /// @brief Current token index.
    std::size_t cursor_{0};

    /// @brief Diagnostic sink.
    DiagnosticEngine& diagnostics_;
};

/// @brief Discovers, lexes, and parses all mirror files below the given inputs.
/// @param[in] inputs Files or directories to scan.
/// @param[in,out] diagnostics Diagnostic sink for discovery/parse issues.
/// @return Parsed AST module holding every well-formed declaration, or an error when no input file was found.
llvm::Expected<ASTModule> parseMirrorFiles(const std::vector<std::string>& inputs, DiagnosticEngine& diagnostics);

}  // namespace archwith

#endif  // ARCHWITH_FRONTEND_PARSER_H
