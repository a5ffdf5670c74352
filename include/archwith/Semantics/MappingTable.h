//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Intermediate representation shared by the IR builder, the validator, and both emitters.
///
/// A `TypeSpec` is the unvalidated correspondence between one mirror type and its remote types. The validator turns
/// it into a `FieldMappingTable`, which is the only structure the emitters read.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_SEMANTICS_MAPPING_TABLE_H
#define ARCHWITH_SEMANTICS_MAPPING_TABLE_H

#include "archwith/Directives/DirectiveModel.h"
#include "archwith/Frontend/SourceLocation.h"

#include <optional>
#include <string>
#include <vector>

namespace archwith
{

/// @file
/// @brief Field mapping IR types.

/// @brief How a field's converter was chosen.
enum class ConverterKind
{

    /// @brief No `from`, no `via`: the value is archived unchanged.
    Identity,

    /// @brief `from` without `via`: the field's own mirror type converts.
    MirrorSelf,

    /// @brief `via` given: the named converter is used verbatim.
    Explicit,
};

/// @brief Converter chosen for one field.
struct Converter
{
    /// @brief Inference rule that produced this converter.
    ConverterKind kind{ConverterKind::Identity};

    /// @brief Converter type spelling; empty for @ref ConverterKind::Identity.
    std::string spelling;

    /// @brief Where the converter was named (the `via` argument or the field type).
    SourceLocation location;
};

/// @brief Template parameter carried from the mirror declaration.
struct TemplateParam
{
    /// @brief Parameter declaration, e.g. `typename T`.
    std::string declaration;

    /// @brief Parameter name, e.g. `T`.
    std::string name;
};

/// @brief Everything about a mirror type except its fields.
struct MirrorHeader
{
    /// @brief Unqualified mirror type name.
    std::string name;

    /// @brief Location of the declaration name.
    SourceLocation location;

    /// @brief `.mirror` file the declaration came from.
    std::string sourceFile;

    /// @brief Enclosing namespace path.
    std::vector<std::string> namespaceComponents;

    /// @brief Template parameters; empty for ordinary mirrors.
    std::vector<TemplateParam> templateParams;

    /// @brief Include targets of the source file, with delimiters.
    std::vector<std::string> includes;

    /// @brief Remote types in declaration order.
    std::vector<TypePath> remoteTypes;

    /// @brief Mirror name qualified with its namespace, without a leading `::`.
    [[nodiscard]] std::string qualifiedName() const;

    /// @brief Fully qualified reference usable from any scope, e.g. `::geo::Point<T>`.
    [[nodiscard]] std::string typeReference() const;
};

/// @brief One field's correspondence rule after default inference.
struct FieldSpec
{
    std::string                 name;
    SourceLocation              location;
    TypePath                    mirrorType;
    std::optional<TypePath>     fromType;
    std::optional<TypePath>     via;
    std::optional<FunctionPath> getter;
    bool                        getterOwned{false};
    SourceLocation              getterOwnedLocation;
    Converter                   converter;
};

/// @brief Mirror type correspondence as built from directives, before validation.
struct TypeSpec
{
    MirrorHeader           header;
    std::vector<FieldSpec> fields;
};

/// @brief How a field value is read from a remote instance.
enum class FieldAccessKind
{

    /// @brief `remote.name`.
    DirectField,

    /// @brief Getter called on the remote instance.
    GetterByReference,

    /// @brief Getter called on a copy of the remote instance.
    GetterOwned,
};

/// @brief Validated field entry.
struct FieldMapping
{
    /// @brief Field rule.
    FieldSpec spec;

    /// @brief Access mode derived from the getter directives.
    FieldAccessKind access{FieldAccessKind::DirectField};

    /// @brief True when no getter was used for this field.
    bool reconstructable{true};
};

/// @brief Finalized, validated mapping for one mirror type.
struct FieldMappingTable
{
    /// @brief Mirror type description.
    MirrorHeader header;

    /// @brief Fields in declaration order.
    std::vector<FieldMapping> fields;

    /// @brief True when every field is reconstructable.
    bool fullyReconstructable{true};
};

/// @brief Returns the stable spelling of a converter kind.
const char* converterKindName(ConverterKind kind);

/// @brief Returns the stable spelling of an access kind.
const char* fieldAccessKindName(FieldAccessKind kind);

/// @brief Returns the type a converter acts on for this field: `from` when given, else the mirror field type.
std::string fieldValueType(const FieldSpec& field);

}  // namespace archwith

#endif  // ARCHWITH_SEMANTICS_MAPPING_TABLE_H
