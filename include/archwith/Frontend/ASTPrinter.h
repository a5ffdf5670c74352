//===----------------------------------------------------------------------===//
///
/// @file
/// AST pretty-printing declarations for debugging and diagnostics.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_FRONTEND_AST_PRINTER_H
#define ARCHWITH_FRONTEND_AST_PRINTER_H

#include <string>

namespace archwith
{
struct ASTModule;

/// @file
/// @brief AST pretty-printer entry points.

/// @brief Produces a human-readable representation of an AST module.
/// @param[in] module Parsed AST module.
/// @return Pretty-printed AST text.
std::string printAST(const ASTModule& module);

}  // namespace archwith

#endif  // ARCHWITH_FRONTEND_AST_PRINTER_H
