//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Validator declarations: `TypeSpec` to finalized `FieldMappingTable`.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_SEMANTICS_VALIDATOR_H
#define ARCHWITH_SEMANTICS_VALIDATOR_H

#include "archwith/Semantics/MappingTable.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace archwith
{

class DiagnosticEngine;

/// @brief Returns true when a type spelling cannot name a converter class.
///
/// @details Fundamental types (including the `<cstdint>` aliases), pointers, references, arrays, and cv-qualified
/// types are rejected. Everything else is assumed to be a class type; mismatches beyond this surface as compile
/// errors in the generated code.
///
/// @param[in] spelling Canonical type spelling.
/// @return True for spellings that are certainly not class types.
bool isNonClassTypeSpelling(llvm::StringRef spelling);

/// @brief Checks a type specification and annotates each field.
///
/// @details Reports `MissingRemoteType`, `DuplicateRemoteType`, `GetterOwnedWithoutGetter`, and
/// `AmbiguousConversion` errors. Every field is marked reconstructable iff it has no getter, and receives its
/// access mode.
///
/// @param[in] spec Type spec built by the IR builder.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Validated table or an error when any check failed.
llvm::Expected<FieldMappingTable> validate(const TypeSpec& spec, DiagnosticEngine& diagnostics);

}  // namespace archwith

#endif  // ARCHWITH_SEMANTICS_VALIDATOR_H
