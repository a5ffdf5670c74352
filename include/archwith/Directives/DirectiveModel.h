//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Typed directive model for `archive_with` attributes on mirror types and fields.
///
/// The model holds what the attributes say, not what they mean: converter inference and consistency checks live
/// in the IR builder and validator.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_DIRECTIVES_DIRECTIVE_MODEL_H
#define ARCHWITH_DIRECTIVES_DIRECTIVE_MODEL_H

#include "archwith/Frontend/AST.h"
#include "archwith/Frontend/SourceLocation.h"

#include "llvm/Support/Error.h"

#include <optional>
#include <string>
#include <vector>

namespace archwith
{

class DiagnosticEngine;

/// @brief Type reference exactly as written in a directive.
struct TypePath
{
    /// @brief Canonical token spelling, e.g. `::geo::Point`.
    std::string spelling;

    /// @brief Location of the first token.
    SourceLocation location;
};

/// @brief Function reference taken from a `getter = "..."` directive.
struct FunctionPath
{
    /// @brief Canonical spelling of the qualified name.
    std::string spelling;

    /// @brief Location of the string literal.
    SourceLocation location;
};

/// @brief Type-level directives of one mirror declaration.
struct TypeDirectives
{
    /// @brief Location of the first `archive_with` attribute, or of the declaration when there is none.
    SourceLocation location;

    /// @brief True when at least one type-level `archive_with` attribute was written.
    bool present{false};

    /// @brief Remote types from every `from(...)` list, in order of appearance.
    std::vector<TypePath> remoteTypes;
};

/// @brief Field-level directives of one mirror field.
struct FieldDirectives
{
    /// @brief Field type in the remote type.
    std::optional<TypePath> fromType;

    /// @brief Explicit converter.
    std::optional<TypePath> via;

    /// @brief Accessor used instead of direct field reads.
    std::optional<FunctionPath> getter;

    /// @brief Getter takes the remote instance by value.
    bool getterOwned{false};

    /// @brief Location of the `getter_owned` flag when set.
    SourceLocation getterOwnedLocation;
};

/// @brief Directives of one mirror declaration and all of its fields.
struct DirectiveModel
{
    /// @brief Type-level directives.
    TypeDirectives type;

    /// @brief Field directives, parallel to the declaration's field list.
    std::vector<FieldDirectives> fields;
};

/// @brief Parses the type-level `archive_with` attributes of a declaration.
/// @param[in] decl Mirror declaration.
/// @param[in,out] diagnostics Sink for `Syntax` diagnostics.
/// @return Parsed directives or an error when any syntax diagnostic was reported.
llvm::Expected<TypeDirectives> parseTypeDirectives(const MirrorDeclAST& decl, DiagnosticEngine& diagnostics);

/// @brief Parses the `archive_with` attributes of one field.
/// @param[in] decl Owning mirror declaration, used in messages.
/// @param[in] field Field declaration.
/// @param[in,out] diagnostics Sink for `Syntax` diagnostics.
/// @return Parsed directives or an error when any syntax diagnostic was reported.
llvm::Expected<FieldDirectives> parseFieldDirectives(const MirrorDeclAST& decl,
                                                     const FieldDeclAST&  field,
                                                     DiagnosticEngine&    diagnostics);

/// @brief Parses every directive of a declaration.
///
/// @details All attributes are parsed even after a failure so every syntax problem of the type is reported at once.
///
/// @param[in] decl Mirror declaration.
/// @param[in,out] diagnostics Sink for `Syntax` diagnostics.
/// @return Directive model or an error when any part failed to parse.
llvm::Expected<DirectiveModel> parseDirectives(const MirrorDeclAST& decl, DiagnosticEngine& diagnostics);

}  // namespace archwith

#endif  // ARCHWITH_DIRECTIVES_DIRECTIVE_MODEL_H
