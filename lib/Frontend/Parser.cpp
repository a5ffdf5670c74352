//===----------------------------------------------------------------------===//
///
/// @file
/// Implements recursive-descent parsing for mirror declaration files.
///
/// The parser accepts a subset of C++ declarations: include lines, namespace blocks, and attributed struct or class
/// definitions whose members are plain data fields. Attribute arguments are kept as raw tokens.
///
//===----------------------------------------------------------------------===//

#include "archwith/Frontend/Parser.h"

#include "archwith/Frontend/Discovery.h"
#include "archwith/Frontend/Lexer.h"
#include "archwith/Support/Diagnostics.h"

#include "llvm/Support/Error.h"

#include <utility>

namespace archwith
{
namespace
{

constexpr const char* kDirectiveAttribute = "archive_with";

bool isOpener(const TokenKind kind)
{
    return kind == TokenKind::LParen || kind == TokenKind::LBracket || kind == TokenKind::LBrace ||
           kind == TokenKind::Less;
}

bool isCloser(const TokenKind kind)
{
    return kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace ||
           kind == TokenKind::Greater;
}

}  // namespace

Parser::Parser(std::string filePath, std::vector<Token> tokens, DiagnosticEngine& diagnostics)
    : filePath_(std::move(filePath))
    , tokens_(std::move(tokens))
    , diagnostics_(diagnostics)
{
    if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof)
    {
        tokens_.push_back(Token{TokenKind::Eof, "", SourceLocation{filePath_, 1, 1}});
    }
}

const Token& Parser::current() const
{
    return tokens_[cursor_];
}

const Token& Parser::peek(std::size_t offset) const
{
    const std::size_t i = cursor_ + offset;
    return i < tokens_.size() ? tokens_[i] : tokens_.back();
}

const Token& Parser::previous() const
{
    return tokens_[cursor_ - 1];
}

bool Parser::isAtEnd() const
{
    return current().kind == TokenKind::Eof;
}

bool Parser::check(TokenKind kind) const
{
    return current().kind == kind;
}

bool Parser::checkWord(const char* word) const
{
    return check(TokenKind::Identifier) && current().text == word;
}

bool Parser::match(TokenKind kind)
{
    if (!check(kind))
    {
        return false;
    }
    (void) advance();
    return true;
}

const Token& Parser::advance()
{
    if (!isAtEnd())
    {
        ++cursor_;
    }
    return previous();
}

bool Parser::expect(TokenKind kind, const std::string& message)
{
    if (check(kind))
    {
        (void) advance();
        return true;
    }
    diagnostics_.error(current().location, message);
    return false;
}

void Parser::syncToStatementEnd()
{
    int depth = 0;
    while (!isAtEnd())
    {
        if (check(TokenKind::LBrace))
        {
            ++depth;
        }
        else if (check(TokenKind::RBrace))
        {
            if (depth == 0)
            {
                return;
            }
            --depth;
            (void) advance();
            if (depth == 0)
            {
                (void) match(TokenKind::Semicolon);
                return;
            }
            continue;
        }
        else if (check(TokenKind::Semicolon) && depth == 0)
        {
            (void) advance();
            return;
        }
        (void) advance();
    }
}

MirrorFileAST Parser::parseFile()
{
    MirrorFileAST file;
    file.filePath = filePath_;

    std::vector<std::string> namespaceComponents;
    while (!isAtEnd())
    {
        parseScope(namespaceComponents, file);
        if (check(TokenKind::RBrace))
        {
            diagnostics_.error(current().location, "unbalanced '}' at file scope");
            (void) advance();
        }
    }
    return file;
}

void Parser::parseScope(std::vector<std::string>& namespaceComponents, MirrorFileAST& file)
{
    while (!isAtEnd() && !check(TokenKind::RBrace))
    {
        const std::size_t start = cursor_;
        if (check(TokenKind::Hash))
        {
            if (auto inc = parseInclude())
            {
                if (!namespaceComponents.empty())
                {
                    diagnostics_.warning(inc->location, "#include inside a namespace block is hoisted to file scope");
                }
                file.includes.push_back(std::move(*inc));
            }
            continue;
        }
        if (checkWord("namespace"))
        {
            if (!parseNamespace(namespaceComponents, file))
            {
                syncToStatementEnd();
            }
            continue;
        }
        if (match(TokenKind::Semicolon))
        {
            continue;
        }

        bool synchronized = false;
        auto mirror       = parseMirror(namespaceComponents, synchronized);
        if (mirror)
        {
            file.mirrors.push_back(std::move(*mirror));
        }
        else if (!synchronized)
        {
            syncToStatementEnd();
        }
        if (cursor_ == start)
        {
            (void) advance();
        }
    }
}

std::optional<IncludeAST> Parser::parseInclude()
{
    IncludeAST inc;
    inc.location = current().location;
    (void) advance();

    if (!checkWord("include"))
    {
        diagnostics_.error(current().location, "only '#include' preprocessor lines are supported");
        const auto line = inc.location.line;
        while (!isAtEnd() && current().location.line == line)
        {
            (void) advance();
        }
        return std::nullopt;
    }
    const auto line = current().location.line;
    (void) advance();

    if (check(TokenKind::String) && current().location.line == line)
    {
        inc.target = '"' + advance().text + '"';
        return inc;
    }
    if (check(TokenKind::Less) && current().location.line == line)
    {
        std::string target = advance().text;
        while (!isAtEnd() && current().location.line == line && !check(TokenKind::Greater))
        {
            target += advance().text;
        }
        if (!check(TokenKind::Greater) || current().location.line != line)
        {
            diagnostics_.error(inc.location, "unterminated '<...>' include target");
            return std::nullopt;
        }
        target += advance().text;
        inc.target = target;
        return inc;
    }

    diagnostics_.error(inc.location, "expected \"file\" or <file> after #include");
    while (!isAtEnd() && current().location.line == line)
    {
        (void) advance();
    }
    return std::nullopt;
}

bool Parser::parseNamespace(std::vector<std::string>& namespaceComponents, MirrorFileAST& file)
{
    const SourceLocation location = current().location;
    (void) advance();

    std::vector<std::string> components;
    do
    {
        if (!check(TokenKind::Identifier))
        {
            diagnostics_.error(current().location, "expected namespace name (anonymous namespaces are not supported)");
            return false;
        }
        components.push_back(advance().text);
    } while (match(TokenKind::Scope));

    if (!expect(TokenKind::LBrace, "expected '{' after namespace name"))
    {
        return false;
    }

    const std::size_t depth = namespaceComponents.size();
    namespaceComponents.insert(namespaceComponents.end(), components.begin(), components.end());
    parseScope(namespaceComponents, file);
    namespaceComponents.resize(depth);

    if (!match(TokenKind::RBrace))
    {
        diagnostics_.error(location, "namespace block is not closed");
        return false;
    }
    return true;
}

bool Parser::parseAttributeGroups(std::vector<AttributeAST>& out)
{
    while (check(TokenKind::LBracket) && peek(1).kind == TokenKind::LBracket)
    {
        (void) advance();
        (void) advance();
        do
        {
            if (check(TokenKind::RBracket))
            {
                break;
            }
            AttributeAST attr;
            attr.location = current().location;
            if (!check(TokenKind::Identifier))
            {
                diagnostics_.error(current().location, "expected attribute name");
                return false;
            }
            attr.name = advance().text;
            while (match(TokenKind::Scope))
            {
                if (!check(TokenKind::Identifier))
                {
                    diagnostics_.error(current().location, "expected attribute name after '::'");
                    return false;
                }
                attr.name += "::" + advance().text;
            }

            if (match(TokenKind::LParen))
            {
                attr.hasArguments = true;
                int depth         = 1;
                while (!isAtEnd())
                {
                    if (check(TokenKind::LParen))
                    {
                        ++depth;
                    }
                    else if (check(TokenKind::RParen) && --depth == 0)
                    {
                        break;
                    }
                    attr.arguments.push_back(advance());
                }
                if (!expect(TokenKind::RParen, "unbalanced parentheses in attribute '" + attr.name + "'"))
                {
                    return false;
                }
            }

            if (attr.name == kDirectiveAttribute)
            {
                out.push_back(std::move(attr));
            }
            else
            {
                diagnostics_.warning(attr.location, "ignoring attribute '" + attr.name + "'");
            }
        } while (match(TokenKind::Comma));

        if (!expect(TokenKind::RBracket, "expected ']]' to close attribute list") ||
            !expect(TokenKind::RBracket, "expected ']]' to close attribute list"))
        {
            return false;
        }
    }
    return true;
}

bool Parser::parseTemplateParams(std::vector<TemplateParamAST>& out)
{
    (void) advance();
    if (!expect(TokenKind::Less, "expected '<' after 'template'"))
    {
        return false;
    }

    std::vector<Token> param;
    int                depth = 0;
    auto               flush = [&]() -> bool {
        if (param.empty())
        {
            diagnostics_.error(current().location, "empty template parameter");
            return false;
        }
        TemplateParamAST p;
        p.location = param.front().location;
        for (const Token& t : param)
        {
            if (t.kind == TokenKind::Equal)
            {
                diagnostics_.error(t.location, "default template arguments are not supported on mirror types");
                return false;
            }
        }
        if (param.back().kind != TokenKind::Identifier || param.size() < 2)
        {
            diagnostics_.error(p.location, "template parameter must be named");
            return false;
        }
        p.name        = param.back().text;
        p.declaration = spellTokens(param);
        out.push_back(std::move(p));
        param.clear();
        return true;
    };

    while (!isAtEnd())
    {
        if (depth == 0 && check(TokenKind::Greater))
        {
            (void) advance();
            return flush();
        }
        if (depth == 0 && check(TokenKind::Comma))
        {
            (void) advance();
            if (!flush())
            {
                return false;
            }
            continue;
        }
        if (isOpener(current().kind))
        {
            ++depth;
        }
        else if (isCloser(current().kind))
        {
            --depth;
        }
        param.push_back(advance());
    }
    diagnostics_.error(current().location, "unterminated template parameter list");
    return false;
}

std::optional<MirrorDeclAST> Parser::parseMirror(const std::vector<std::string>& namespaceComponents,
                                                 bool&                           synchronized)
{
    synchronized = false;
    MirrorDeclAST decl;
    decl.namespaceComponents = namespaceComponents;

    if (!parseAttributeGroups(decl.attributes))
    {
        return std::nullopt;
    }
    if (checkWord("template"))
    {
        if (!parseTemplateParams(decl.templateParams))
        {
            return std::nullopt;
        }
        if (decl.templateParams.empty())
        {
            diagnostics_.error(previous().location, "explicit specializations cannot be mirror types");
            return std::nullopt;
        }
        if (!parseAttributeGroups(decl.attributes))
        {
            return std::nullopt;
        }
    }

    if (!checkWord("struct") && !checkWord("class"))
    {
        diagnostics_.error(current().location, "expected 'struct' or 'class' declaration, found '" + current().text + "'");
        return std::nullopt;
    }
    decl.isClass  = current().text == "class";
    decl.location = advance().location;

    if (!parseAttributeGroups(decl.attributes))
    {
        return std::nullopt;
    }
    if (!check(TokenKind::Identifier))
    {
        diagnostics_.error(current().location, "expected mirror type name");
        return std::nullopt;
    }
    decl.location = current().location;
    decl.name     = advance().text;

    if (check(TokenKind::Semicolon))
    {
        diagnostics_.error(decl.location, "mirror type '" + decl.name + "' must be defined, not forward-declared");
        (void) advance();
        synchronized = true;
        return std::nullopt;
    }
    if (check(TokenKind::Colon))
    {
        diagnostics_.error(current().location, "mirror type '" + decl.name + "' cannot have base classes");
        return std::nullopt;
    }
    if (!expect(TokenKind::LBrace, "expected '{' to open mirror type body"))
    {
        return std::nullopt;
    }

    bool ok = true;
    while (!isAtEnd() && !check(TokenKind::RBrace))
    {
        if (checkWord("public") && peek(1).kind == TokenKind::Colon)
        {
            (void) advance();
            (void) advance();
            continue;
        }
        if ((checkWord("private") || checkWord("protected")) && peek(1).kind == TokenKind::Colon)
        {
            diagnostics_.error(current().location, "mirror fields must be public");
            ok = false;
            (void) advance();
            (void) advance();
            continue;
        }
        const std::size_t start = cursor_;
        auto              field = parseField();
        if (field)
        {
            decl.fields.push_back(std::move(*field));
        }
        else
        {
            ok = false;
            // Stay inside the body: skip to the end of the member, including any braced body it has.
            int depth = 0;
            while (!isAtEnd())
            {
                if (check(TokenKind::LBrace))
                {
                    ++depth;
                }
                else if (check(TokenKind::RBrace))
                {
                    if (depth == 0)
                    {
                        break;
                    }
                    --depth;
                }
                else if (check(TokenKind::Semicolon) && depth == 0)
                {
                    break;
                }
                (void) advance();
                if (depth == 0 && previous().kind == TokenKind::RBrace)
                {
                    break;
                }
            }
            (void) match(TokenKind::Semicolon);
        }
        if (cursor_ == start)
        {
            (void) advance();
        }
    }

    if (!expect(TokenKind::RBrace, "expected '}' to close mirror type body"))
    {
        return std::nullopt;
    }
    if (!expect(TokenKind::Semicolon, "expected ';' after mirror type definition"))
    {
        return std::nullopt;
    }
    synchronized = true;
    if (!ok)
    {
        return std::nullopt;
    }
    return decl;
}

std::optional<FieldDeclAST> Parser::parseField()
{
    FieldDeclAST field;
    if (!parseAttributeGroups(field.attributes))
    {
        return std::nullopt;
    }

    field.location = current().location;
    std::vector<Token> declTokens;
    int                depth = 0;
    while (!isAtEnd())
    {
        if (depth == 0 && (check(TokenKind::Semicolon) || check(TokenKind::RBrace)))
        {
            break;
        }
        if (depth == 0 && check(TokenKind::Equal))
        {
            diagnostics_.error(current().location, "default member initializers are not supported on mirror fields");
            return std::nullopt;
        }
        if (depth == 0 && check(TokenKind::LParen))
        {
            diagnostics_.error(current().location, "mirror types may only declare data fields");
            return std::nullopt;
        }
        if (isOpener(current().kind))
        {
            ++depth;
        }
        else if (isCloser(current().kind))
        {
            --depth;
        }
        declTokens.push_back(advance());
    }

    if (!expect(TokenKind::Semicolon, "expected ';' after field declaration"))
    {
        return std::nullopt;
    }
    if (declTokens.size() < 2 || declTokens.back().kind != TokenKind::Identifier)
    {
        diagnostics_.error(field.location, "expected '<type> <name>;' field declaration");
        return std::nullopt;
    }
    if (declTokens.front().kind == TokenKind::Identifier &&
        (declTokens.front().text == "static" || declTokens.front().text == "using" ||
         declTokens.front().text == "typedef"))
    {
        diagnostics_.error(field.location, "mirror types may only declare data fields");
        return std::nullopt;
    }

    field.location = declTokens.back().location;
    field.name     = declTokens.back().text;
    declTokens.pop_back();
    field.type.location = declTokens.front().location;
    field.type.spelling = spellTokens(declTokens);
    return field;
}

llvm::Expected<ASTModule> parseMirrorFiles(const std::vector<std::string>& inputs, DiagnosticEngine& diagnostics)
{
    ASTModule  module;
    const auto files = discoverMirrorFiles(inputs, diagnostics);

    if (files.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "no .mirror input files found");
    }

    for (const auto& source : files)
    {
        Lexer  lexer(source.filePath, source.text);
        auto   tokens = lexer.lex();
        Parser parser(source.filePath, std::move(tokens), diagnostics);
        module.files.push_back(parser.parseFile());
    }
    return module;
}

}  // namespace archwith
