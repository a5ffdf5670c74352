//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Output layout and shared C++ spelling helpers for generated adapter units.
///
/// Every unit of mirror `M` declared in namespace `a::b` lives under `a/b/` below
/// the output root and is included by other units relative to that root.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_CODEGEN_ADAPTER_LAYOUT_H
#define ARCHWITH_CODEGEN_ADAPTER_LAYOUT_H

#include "archwith/Semantics/MappingTable.h"

#include <string>
#include <vector>

namespace archwith
{

/// @brief File name of the runtime contract header copied into the output root.
inline constexpr const char* kRuntimeHeaderName = "archwith_runtime.hpp";

/// @brief One rendered output file.
struct GeneratedUnit
{
    /// @brief Path relative to the output root, `/`-separated.
    std::string relativePath;

    /// @brief File contents.
    std::string content;
};

/// @brief Remote type paired with the file-name slug of its archive unit.
struct RemoteUnitName
{
    /// @brief Remote type spelling.
    std::string remoteType;

    /// @brief Unique slug among the mirror's remote types.
    std::string slug;
};

/// @brief Directory of a mirror's units, relative to the output root (empty at global scope).
std::string unitDirectory(const std::vector<std::string>& namespaceComponents);

/// @brief Relative path of `<name>.<suffix>` in the mirror's unit directory.
std::string unitPath(const std::vector<std::string>& namespaceComponents,
                     const std::string&              mirrorName,
                     const std::string&              suffix);

/// @brief Relative path of the umbrella header `<name>.hpp`.
std::string umbrellaUnitPath(const std::vector<std::string>& namespaceComponents, const std::string& mirrorName);

/// @brief Assigns one slug per remote type, suffixing `_2`, `_3`, ... on collisions.
std::vector<RemoteUnitName> remoteUnitNames(const MirrorHeader& header);

/// @brief Name of the archived representation type, e.g. `ArchivedPoint`.
std::string archivedTypeName(const MirrorHeader& header);

/// @brief Name of the resolver type, e.g. `PointResolver`.
std::string resolverTypeName(const MirrorHeader& header);

/// @brief Fully qualified archived representation reference, e.g. `::geo::ArchivedPoint<T>`.
std::string archivedTypeReference(const MirrorHeader& header);

/// @brief Fully qualified resolver reference, e.g. `::geo::PointResolver<T>`.
std::string resolverTypeReference(const MirrorHeader& header);

/// @brief `template <...>` line opening a primary template; empty for non-template mirrors.
std::string templateHead(const MirrorHeader& header);

/// @brief `template <...>` line opening a specialization; `template <>` for non-template mirrors.
std::string specializationHead(const MirrorHeader& header);

/// @brief Type the converter acts on: the `from` type, else the mirror field's declared type.
std::string valueTypeExpr(const MirrorHeader& header, const FieldSpec& field);

/// @brief Converter type expression of one field.
std::string converterExpr(const MirrorHeader& header, const FieldSpec& field);

/// @brief First lines of every generated unit: banner and include guard opening.
///
/// @details The banner names the source by file name only.
std::string renderUnitPrologue(const MirrorHeader& header, const std::string& guard);

/// @brief Include guard closing line.
std::string renderUnitEpilogue(const std::string& guard);

}  // namespace archwith

#endif  // ARCHWITH_CODEGEN_ADAPTER_LAYOUT_H
