//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Naming helpers for generated C++ adapter units.
///
/// This interface centralizes identifier checks, file-name slugs for remote
/// types, and include-guard projection used by the emitters.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_CODEGEN_NAMING_POLICY_H
#define ARCHWITH_CODEGEN_NAMING_POLICY_H

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace archwith
{

/// @brief Returns true when an identifier is a C++ keyword.
/// @param[in] name Candidate identifier.
/// @return True when the identifier is reserved.
bool codegenIsCppKeyword(llvm::StringRef name);

/// @brief Sanitizes one identifier for C++.
/// @param[in] name Candidate identifier.
/// @return Identifier with invalid characters replaced and keywords suffixed with `_`.
std::string codegenSanitizeIdentifier(llvm::StringRef name);

/// @brief Projects a type spelling into a file-name slug.
///
/// @details `::geo::Point<std::uint8_t>` becomes `geo_Point_std_uint8_t`. Slugs only contain
/// `[A-Za-z0-9_]`, never start or end with `_`, and never contain `__`.
///
/// @param[in] typeSpelling Type spelling.
/// @return Slug; `type` when nothing remains.
std::string codegenTypeSlug(llvm::StringRef typeSpelling);

/// @brief Projects path components into an UPPER_SNAKE include guard.
/// @param[in] components Guard components, e.g. namespace path, type name, unit kind.
/// @return Guard macro name prefixed with `ARCHWITH_GENERATED_` and suffixed with `_HPP`.
std::string codegenHeaderGuard(const std::vector<std::string>& components);

}  // namespace archwith

#endif  // ARCHWITH_CODEGEN_NAMING_POLICY_H
