//===----------------------------------------------------------------------===//
///
/// @file
/// Implements completeness and consistency checks over type specifications.
///
/// Each check emits its own diagnostic kind. All checks run even after a failure so a single pass reports every
/// problem of the mirror type.
///
//===----------------------------------------------------------------------===//

#include "archwith/Semantics/Validator.h"

#include "archwith/Frontend/Lexer.h"
#include "archwith/Support/Diagnostics.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"

#include <string>
#include <utility>
#include <vector>

namespace archwith
{
namespace
{

const llvm::StringSet<>& fundamentalKeywords()
{
    static const llvm::StringSet<> keywords = {"void",
                                               "bool",
                                               "char",
                                               "char8_t",
                                               "char16_t",
                                               "char32_t",
                                               "wchar_t",
                                               "short",
                                               "int",
                                               "long",
                                               "float",
                                               "double",
                                               "signed",
                                               "unsigned",
                                               "auto"};
    return keywords;
}

const llvm::StringSet<>& fundamentalAliases()
{
    static const llvm::StringSet<> aliases = {"int8_t",   "int16_t",  "int32_t",   "int64_t",   "uint8_t",
                                              "uint16_t", "uint32_t", "uint64_t",  "size_t",    "ptrdiff_t",
                                              "intptr_t", "uintptr_t", "intmax_t", "uintmax_t", "nullptr_t",
                                              "byte"};
    return aliases;
}

/// Spelling with whitespace and global-scope `::` qualifiers removed, so `::a::B<::c::D>` and `a::B<c::D>` compare
/// equal. Adapters are emitted inside `archwith::rt`, where both spellings name the same type.
std::string remoteTypeKey(llvm::StringRef spelling)
{
    std::string key;
    key.reserve(spelling.size());
    for (const char c : spelling)
    {
        if (c != ' ' && c != '\t' && c != '\n')
        {
            key.push_back(c);
        }
    }

    std::string out;
    out.reserve(key.size());
    for (std::size_t i = 0; i < key.size(); ++i)
    {
        const bool atScopeStart = out.empty() || out.back() == '<' || out.back() == ',' || out.back() == '(';
        if (atScopeStart && key.compare(i, 2, "::") == 0)
        {
            ++i;
            continue;
        }
        out.push_back(key[i]);
    }
    return out;
}

std::string fieldContext(const TypeSpec& spec, const FieldSpec& field)
{
    return "mirror '" + spec.header.qualifiedName() + "' field '" + field.name + "'";
}

}  // namespace

bool isNonClassTypeSpelling(llvm::StringRef spelling)
{
    Lexer lexer("<type>", spelling.str());
    auto  tokens = lexer.lex();
    tokens.pop_back();
    if (tokens.empty())
    {
        return true;
    }

    std::vector<const Token*> topLevel;
    int                       depth = 0;
    for (const Token& t : tokens)
    {
        if (t.kind == TokenKind::Less || t.kind == TokenKind::LParen)
        {
            ++depth;
            continue;
        }
        if (t.kind == TokenKind::Greater || t.kind == TokenKind::RParen)
        {
            --depth;
            continue;
        }
        if (depth == 0)
        {
            topLevel.push_back(&t);
        }
    }

    bool allFundamental = true;
    for (const Token* t : topLevel)
    {
        switch (t->kind)
        {
        case TokenKind::Star:
        case TokenKind::Amp:
        case TokenKind::LBracket:
            return true;
        case TokenKind::Identifier:
            if (t->text == "const" || t->text == "volatile")
            {
                return true;
            }
            if (!fundamentalKeywords().contains(t->text))
            {
                allFundamental = false;
            }
            break;
        default:
            allFundamental = false;
            break;
        }
    }
    if (allFundamental)
    {
        return true;
    }

    // `std::uint32_t`, `::std::size_t`, `uint8_t`.
    llvm::StringRef name = spelling;
    (void) name.consume_front("::");
    (void) name.consume_front("std::");
    return fundamentalAliases().contains(name);
}

llvm::Expected<FieldMappingTable> validate(const TypeSpec& spec, DiagnosticEngine& diagnostics)
{
    const std::string mirrorName = spec.header.qualifiedName();
    bool              ok         = true;

    if (spec.header.remoteTypes.empty())
    {
        diagnostics.error(spec.header.location,
                          "mirror '" + mirrorName +
                              "': no remote type declared; add [[archive_with(from(RemoteType))]] to the type",
                          DiagnosticKind::MissingRemoteType);
        ok = false;
    }

    llvm::StringMap<SourceLocation> remotes;
    for (const TypePath& remote : spec.header.remoteTypes)
    {
        const auto inserted = remotes.try_emplace(remoteTypeKey(remote.spelling), remote.location);
        if (!inserted.second)
        {
            diagnostics.error(remote.location,
                              "mirror '" + mirrorName + "': remote type '" + remote.spelling +
                                  "' is already listed (first at " + inserted.first->second.str() + ")",
                              DiagnosticKind::DuplicateRemoteType);
            ok = false;
        }
    }

    FieldMappingTable table;
    table.header = spec.header;
    for (const FieldSpec& field : spec.fields)
    {
        if (field.getterOwned && !field.getter)
        {
            diagnostics.error(field.getterOwnedLocation,
                              fieldContext(spec, field) + ": 'getter_owned' requires a 'getter'",
                              DiagnosticKind::GetterOwnedWithoutGetter);
            ok = false;
        }

        const Converter& converter = field.converter;
        if (converter.kind == ConverterKind::Explicit && isNonClassTypeSpelling(converter.spelling))
        {
            diagnostics.error(converter.location,
                              fieldContext(spec, field) + ": converter '" + converter.spelling +
                                  "' is not a class type and cannot convert '" + fieldValueType(field) + "'",
                              DiagnosticKind::AmbiguousConversion);
            ok = false;
        }
        else if (converter.kind == ConverterKind::MirrorSelf && isNonClassTypeSpelling(converter.spelling))
        {
            diagnostics.error(converter.location,
                              fieldContext(spec, field) + ": from(" + field.fromType->spelling +
                                  ") without via(...) makes the field type '" + converter.spelling +
                                  "' the converter, but it is not a class type; name a converter with via(...)",
                              DiagnosticKind::AmbiguousConversion);
            ok = false;
        }

        FieldMapping mapping;
        mapping.spec            = field;
        mapping.reconstructable = !field.getter.has_value();
        if (!field.getter)
        {
            mapping.access = FieldAccessKind::DirectField;
        }
        else
        {
            mapping.access = field.getterOwned ? FieldAccessKind::GetterOwned : FieldAccessKind::GetterByReference;
        }
        table.fullyReconstructable = table.fullyReconstructable && mapping.reconstructable;
        table.fields.push_back(std::move(mapping));
    }

    if (!ok)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "validation failed for %s",
                                       mirrorName.c_str());
    }
    return table;
}

}  // namespace archwith
