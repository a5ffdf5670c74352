//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Archived-representation, build, and serialize emission for validated mapping tables.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_CODEGEN_ARCHIVE_EMITTER_H
#define ARCHWITH_CODEGEN_ARCHIVE_EMITTER_H

#include "archwith/CodeGen/AdapterLayout.h"
#include "archwith/CodeGen/MirrorIndex.h"
#include "archwith/Semantics/MappingTable.h"

#include <vector>

namespace archwith
{

/// @file
/// @brief Archive/serialize emitter entry points.

/// @brief Renders `<M>.repr.hpp`.
///
/// @details The unit declares the mirror struct, its archived representation
/// (one member per field, in declaration order) and its resolver. Umbrella
/// headers of mirrors named as converters are included through `index`.
///
/// @param[in] table Validated mapping table.
/// @param[in] index Mirror index of the compilation.
/// @return Rendered unit.
GeneratedUnit renderReprUnit(const FieldMappingTable& table, const MirrorIndex& index);

/// @brief Renders one `<M>.archive.<remote>.hpp` per remote type.
///
/// @details Each unit specializes `ArchiveWith<M, Remote>` (build) and
/// `SerializeWith<M, Remote>` (serialize). Units for different remote types
/// differ only in the remote type they read from.
///
/// @param[in] table Validated mapping table.
/// @return Rendered units in remote-type declaration order.
std::vector<GeneratedUnit> renderArchiveUnits(const FieldMappingTable& table);

}  // namespace archwith

#endif  // ARCHWITH_CODEGEN_ARCHIVE_EMITTER_H
