//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// IR builder declarations: directive model to unvalidated `TypeSpec`.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_SEMANTICS_IR_BUILDER_H
#define ARCHWITH_SEMANTICS_IR_BUILDER_H

#include "archwith/Directives/DirectiveModel.h"
#include "archwith/Frontend/AST.h"
#include "archwith/Semantics/MappingTable.h"

#include "llvm/Support/Error.h"

namespace archwith
{

class DiagnosticEngine;

/// @brief Infers the converter of one field from its directives.
///
/// @details Rules, in order: no `from` and no `via` gives the identity converter; `from` without `via` makes the
/// field's own mirror type the converter; `via` is taken verbatim whether or not `from` is present.
///
/// @param[in] mirrorType Declared type of the field in the mirror.
/// @param[in] directives Field directives.
/// @return Chosen converter.
Converter inferConverter(const TypePath& mirrorType, const FieldDirectives& directives);

/// @brief Builds the type specification of one mirror declaration.
/// @param[in] file File the declaration belongs to (source path and includes).
/// @param[in] decl Mirror declaration.
/// @param[in] directives Parsed directives of `decl`, one field entry per declared field.
/// @param[in,out] diagnostics Sink for `DuplicateField` errors.
/// @return Type specification or an error when the declaration is not a valid mapping.
llvm::Expected<TypeSpec> buildTypeSpec(const MirrorFileAST&  file,
                                       const MirrorDeclAST&  decl,
                                       const DirectiveModel& directives,
                                       DiagnosticEngine&     diagnostics);

}  // namespace archwith

#endif  // ARCHWITH_SEMANTICS_IR_BUILDER_H
