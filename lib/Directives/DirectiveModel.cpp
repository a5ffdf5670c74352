//===----------------------------------------------------------------------===//
///
/// @file
/// Implements parsing of `archive_with` attribute arguments into the directive model.
///
//===----------------------------------------------------------------------===//

#include "archwith/Directives/DirectiveModel.h"

#include "archwith/Frontend/Lexer.h"
#include "archwith/Support/Diagnostics.h"

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <utility>

namespace archwith
{
namespace
{

using TokenList = std::vector<Token>;

/// One `key`, `key(args)` or `key = value` item of an argument list.
struct DirectiveItem
{
    SourceLocation location;
    std::string    key;
    bool           hasParens{false};
    TokenList      parenArgs;
    bool           hasValue{false};
    TokenList      value;
};

std::string mirrorContext(const MirrorDeclAST& decl)
{
    return "mirror '" + decl.qualifiedName() + "'";
}

std::string fieldContext(const MirrorDeclAST& decl, const FieldDeclAST& field)
{
    return mirrorContext(decl) + " field '" + field.name + "'";
}

/// Splits `tokens` at commas outside any bracket pair.
std::vector<TokenList> splitTopLevel(const TokenList& tokens)
{
    std::vector<TokenList> parts(1);
    int                    depth = 0;
    for (const Token& t : tokens)
    {
        switch (t.kind)
        {
        case TokenKind::LParen:
        case TokenKind::LBracket:
        case TokenKind::LBrace:
        case TokenKind::Less:
            ++depth;
            break;
        case TokenKind::RParen:
        case TokenKind::RBracket:
        case TokenKind::RBrace:
        case TokenKind::Greater:
            --depth;
            break;
        case TokenKind::Comma:
            if (depth == 0)
            {
                parts.emplace_back();
                continue;
            }
            break;
        default:
            break;
        }
        parts.back().push_back(t);
    }
    if (parts.size() == 1 && parts.front().empty())
    {
        parts.clear();
    }
    return parts;
}

bool isBalanced(const TokenList& tokens)
{
    int depth = 0;
    for (const Token& t : tokens)
    {
        if (t.kind == TokenKind::LParen || t.kind == TokenKind::LBracket || t.kind == TokenKind::LBrace ||
            t.kind == TokenKind::Less)
        {
            ++depth;
        }
        else if (t.kind == TokenKind::RParen || t.kind == TokenKind::RBracket || t.kind == TokenKind::RBrace ||
                 t.kind == TokenKind::Greater)
        {
            if (--depth < 0)
            {
                return false;
            }
        }
    }
    return depth == 0;
}

/// Parses one comma-separated item; returns false after reporting a syntax error.
bool parseItem(const TokenList&      tokens,
               const std::string&    context,
               const SourceLocation& fallback,
               DirectiveItem&        item,
               DiagnosticEngine&     diagnostics)
{
    if (tokens.empty())
    {
        diagnostics.error(fallback, context + ": empty argument in archive_with", DiagnosticKind::Syntax);
        return false;
    }
    if (tokens.front().kind != TokenKind::Identifier)
    {
        diagnostics.error(tokens.front().location,
                          context + ": expected directive key, found '" + tokens.front().text + "'",
                          DiagnosticKind::Syntax);
        return false;
    }
    item.location = tokens.front().location;
    item.key      = tokens.front().text;

    if (tokens.size() == 1)
    {
        return true;
    }

    const Token& second = tokens[1];
    if (second.kind == TokenKind::LParen)
    {
        if (tokens.back().kind != TokenKind::RParen || !isBalanced(tokens))
        {
            diagnostics.error(second.location,
                              context + ": unbalanced parentheses after '" + item.key + "'",
                              DiagnosticKind::Syntax);
            return false;
        }
        TokenList inner(tokens.begin() + 2, tokens.end() - 1);
        if (!isBalanced(inner))
        {
            diagnostics.error(second.location,
                              context + ": unexpected tokens after '" + item.key + "(...)'",
                              DiagnosticKind::Syntax);
            return false;
        }
        item.hasParens = true;
        item.parenArgs = std::move(inner);
        return true;
    }
    if (second.kind == TokenKind::Equal)
    {
        item.hasValue = true;
        item.value.assign(tokens.begin() + 2, tokens.end());
        if (item.value.empty())
        {
            diagnostics.error(second.location,
                              context + ": missing value after '" + item.key + " ='",
                              DiagnosticKind::Syntax);
            return false;
        }
        return true;
    }

    diagnostics.error(second.location,
                      context + ": unexpected '" + second.text + "' after '" + item.key + "'",
                      DiagnosticKind::Syntax);
    return false;
}

/// Splits an attribute's argument list into items.
bool parseItems(const AttributeAST&         attr,
                const std::string&          context,
                std::vector<DirectiveItem>& out,
                DiagnosticEngine&           diagnostics)
{
    if (!attr.hasArguments)
    {
        diagnostics.error(attr.location, context + ": archive_with requires an argument list", DiagnosticKind::Syntax);
        return false;
    }
    const auto parts = splitTopLevel(attr.arguments);
    if (parts.empty())
    {
        diagnostics.error(attr.location, context + ": archive_with argument list is empty", DiagnosticKind::Syntax);
        return false;
    }
    bool ok = true;
    for (const TokenList& part : parts)
    {
        DirectiveItem item;
        if (parseItem(part, context, attr.location, item, diagnostics))
        {
            out.push_back(std::move(item));
        }
        else
        {
            ok = false;
        }
    }
    return ok;
}

/// Parses the argument of `from(...)` or `via(...)` into type paths.
bool parseTypeList(const DirectiveItem&   item,
                   const std::string&     context,
                   std::vector<TypePath>& out,
                   DiagnosticEngine&      diagnostics)
{
    if (!item.hasParens)
    {
        diagnostics.error(item.location,
                          context + ": '" + item.key + "' expects a parenthesized type list",
                          DiagnosticKind::Syntax);
        return false;
    }
    const auto parts = splitTopLevel(item.parenArgs);
    bool       ok    = true;
    for (const TokenList& part : parts)
    {
        if (part.empty())
        {
            diagnostics.error(item.location,
                              context + ": empty type argument in '" + item.key + "'",
                              DiagnosticKind::Syntax);
            ok = false;
            continue;
        }
        if (part.front().kind == TokenKind::String)
        {
            diagnostics.error(part.front().location,
                              context + ": '" + item.key + "' expects a type, not a string literal",
                              DiagnosticKind::Syntax);
            ok = false;
            continue;
        }
        out.push_back(TypePath{spellTokens(part), part.front().location});
    }
    return ok;
}

bool parseSingleType(const DirectiveItem&     item,
                     const std::string&       context,
                     std::optional<TypePath>& out,
                     DiagnosticEngine&        diagnostics)
{
    std::vector<TypePath> types;
    if (!parseTypeList(item, context, types, diagnostics))
    {
        return false;
    }
    if (types.size() != 1)
    {
        diagnostics.error(item.location,
                          context + ": '" + item.key + "' on a field takes exactly one type",
                          DiagnosticKind::Syntax);
        return false;
    }
    out = std::move(types.front());
    return true;
}

/// Accepts `::`-separated identifiers, optionally with template argument lists; at least one `::` is required.
bool isQualifiedName(const TokenList& tokens)
{
    if (tokens.empty() || tokens.back().kind != TokenKind::Identifier || !isBalanced(tokens))
    {
        return false;
    }
    bool        qualified = false;
    int         depth     = 0;
    std::size_t i         = 0;
    if (tokens.front().kind == TokenKind::Scope)
    {
        qualified = true;
        ++i;
    }
    bool expectName = true;
    for (; i < tokens.size(); ++i)
    {
        const Token& t = tokens[i];
        if (depth > 0)
        {
            if (t.kind == TokenKind::Less)
            {
                ++depth;
            }
            else if (t.kind == TokenKind::Greater)
            {
                --depth;
            }
            continue;
        }
        if (expectName)
        {
            if (t.kind != TokenKind::Identifier)
            {
                return false;
            }
            expectName = false;
            continue;
        }
        if (t.kind == TokenKind::Scope)
        {
            qualified  = true;
            expectName = true;
        }
        else if (t.kind == TokenKind::Less)
        {
            ++depth;
        }
        else
        {
            return false;
        }
    }
    return qualified && !expectName;
}

bool parseGetter(const DirectiveItem&         item,
                 const std::string&           context,
                 std::optional<FunctionPath>& out,
                 DiagnosticEngine&            diagnostics)
{
    if (!item.hasValue || item.value.size() != 1 || item.value.front().kind != TokenKind::String)
    {
        diagnostics.error(item.location,
                          context + ": 'getter' expects a string literal, e.g. getter = \"::ns::read\"",
                          DiagnosticKind::Syntax);
        return false;
    }
    const Token& literal = item.value.front();
    Lexer        lexer(literal.location.file, literal.text);
    TokenList    tokens = lexer.lex();
    tokens.pop_back();
    if (!isQualifiedName(tokens))
    {
        diagnostics.error(literal.location,
                          context + ": getter \"" + literal.text + "\" is not a '::'-qualified function name",
                          DiagnosticKind::Syntax);
        return false;
    }
    out = FunctionPath{spellTokens(tokens), literal.location};
    return true;
}

bool rejectDuplicate(bool                 seen,
                     const DirectiveItem& item,
                     const std::string&   context,
                     DiagnosticEngine&    diagnostics)
{
    if (seen)
    {
        diagnostics.error(item.location,
                          context + ": directive '" + item.key + "' given more than once",
                          DiagnosticKind::Syntax);
    }
    return seen;
}

}  // namespace

llvm::Expected<TypeDirectives> parseTypeDirectives(const MirrorDeclAST& decl, DiagnosticEngine& diagnostics)
{
    TypeDirectives out;
    out.location = decl.location;

    const std::string context = mirrorContext(decl);
    bool              ok      = true;
    for (const AttributeAST& attr : decl.attributes)
    {
        if (!out.present)
        {
            out.location = attr.location;
            out.present  = true;
        }
        std::vector<DirectiveItem> items;
        ok = parseItems(attr, context, items, diagnostics) && ok;
        for (const DirectiveItem& item : items)
        {
            if (item.key == "from")
            {
                ok = parseTypeList(item, context, out.remoteTypes, diagnostics) && ok;
            }
            else if (item.key == "via" || item.key == "getter" || item.key == "getter_owned")
            {
                diagnostics.error(item.location,
                                  context + ": '" + item.key + "' is only valid on fields",
                                  DiagnosticKind::Syntax);
                ok = false;
            }
            else
            {
                diagnostics.error(item.location,
                                  context + ": unknown archive_with directive '" + item.key + "'",
                                  DiagnosticKind::Syntax);
                ok = false;
            }
        }
    }

    if (!ok)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid type directives on %s",
                                       decl.qualifiedName().c_str());
    }
    return out;
}

llvm::Expected<FieldDirectives> parseFieldDirectives(const MirrorDeclAST& decl,
                                                     const FieldDeclAST&  field,
                                                     DiagnosticEngine&    diagnostics)
{
    FieldDirectives   out;
    const std::string context = fieldContext(decl, field);
    bool              ok      = true;

    for (const AttributeAST& attr : field.attributes)
    {
        std::vector<DirectiveItem> items;
        ok = parseItems(attr, context, items, diagnostics) && ok;
        for (const DirectiveItem& item : items)
        {
            const llvm::StringRef key(item.key);
            if (key == "from")
            {
                if (rejectDuplicate(out.fromType.has_value(), item, context, diagnostics))
                {
                    ok = false;
                    continue;
                }
                ok = parseSingleType(item, context, out.fromType, diagnostics) && ok;
            }
            else if (key == "via")
            {
                if (rejectDuplicate(out.via.has_value(), item, context, diagnostics))
                {
                    ok = false;
                    continue;
                }
                ok = parseSingleType(item, context, out.via, diagnostics) && ok;
            }
            else if (key == "getter")
            {
                if (rejectDuplicate(out.getter.has_value(), item, context, diagnostics))
                {
                    ok = false;
                    continue;
                }
                ok = parseGetter(item, context, out.getter, diagnostics) && ok;
            }
            else if (key == "getter_owned")
            {
                if (rejectDuplicate(out.getterOwned, item, context, diagnostics))
                {
                    ok = false;
                    continue;
                }
                if (item.hasParens || item.hasValue)
                {
                    diagnostics.error(item.location,
                                      context + ": 'getter_owned' is a flag and takes no arguments",
                                      DiagnosticKind::Syntax);
                    ok = false;
                    continue;
                }
                out.getterOwned         = true;
                out.getterOwnedLocation = item.location;
            }
            else
            {
                diagnostics.error(item.location,
                                  context + ": unknown archive_with directive '" + item.key + "'",
                                  DiagnosticKind::Syntax);
                ok = false;
            }
        }
    }

    if (!ok)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid directives on %s::%s",
                                       decl.qualifiedName().c_str(),
                                       field.name.c_str());
    }
    return out;
}

llvm::Expected<DirectiveModel> parseDirectives(const MirrorDeclAST& decl, DiagnosticEngine& diagnostics)
{
    DirectiveModel model;
    bool           ok = true;

    auto type = parseTypeDirectives(decl, diagnostics);
    if (type)
    {
        model.type = std::move(*type);
    }
    else
    {
        llvm::consumeError(type.takeError());
        ok = false;
    }

    for (const FieldDeclAST& field : decl.fields)
    {
        auto directives = parseFieldDirectives(decl, field, diagnostics);
        if (!directives)
        {
            llvm::consumeError(directives.takeError());
            ok = false;
            model.fields.emplace_back();
            continue;
        }
        model.fields.push_back(std::move(*directives));
    }

    if (!ok)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "archive_with syntax errors in %s",
                                       decl.qualifiedName().c_str());
    }
    return model;
}

}  // namespace archwith
