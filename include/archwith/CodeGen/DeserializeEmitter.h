//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Deserialize emission for validated mapping tables.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_CODEGEN_DESERIALIZE_EMITTER_H
#define ARCHWITH_CODEGEN_DESERIALIZE_EMITTER_H

#include "archwith/CodeGen/AdapterLayout.h"
#include "archwith/Semantics/MappingTable.h"

#include <optional>

namespace archwith
{

class DiagnosticEngine;

/// @brief Renders `<M>.deserialize.hpp` when the mirror is fully reconstructable.
///
/// @details One `DeserializeWith<M, Remote>` specialization is emitted per
/// remote type. Each deserializes the fields in declaration order, then assigns
/// them by name onto a value-initialized remote instance, so the remote type
/// may declare its members in any order. When any field uses a getter no
/// unit is produced and a `NotReconstructable` note naming those fields is
/// reported instead.
///
/// @param[in] table Validated mapping table.
/// @param[in,out] diagnostics Sink for the `NotReconstructable` note.
/// @return Rendered unit, or `std::nullopt` when reconstruction is not derivable.
std::optional<GeneratedUnit> renderDeserializeUnit(const FieldMappingTable& table, DiagnosticEngine& diagnostics);

}  // namespace archwith

#endif  // ARCHWITH_CODEGEN_DESERIALIZE_EMITTER_H
