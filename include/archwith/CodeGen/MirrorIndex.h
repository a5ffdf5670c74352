//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Read-only index of every mirror type in a compilation, used to locate the
/// generated headers of mirrors that other mirrors name as converters.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_CODEGEN_MIRROR_INDEX_H
#define ARCHWITH_CODEGEN_MIRROR_INDEX_H

#include "archwith/Frontend/AST.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace archwith
{

/// @brief Index entry for one mirror type.
struct MirrorIndexEntry
{
    /// @brief Namespace-qualified name without leading `::`.
    std::string qualifiedName;

    /// @brief Umbrella header path relative to the output root.
    std::string umbrellaHeader;
};

/// @brief Qualified-name lookup over all mirror declarations of a module.
class MirrorIndex final
{
public:
    /// @brief Builds the index from every declaration in a module.
    /// @param[in] module Parsed module.
    /// @return Populated index; later duplicates of a name are ignored.
    static MirrorIndex build(const ASTModule& module);

    /// @brief Adds one mirror type.
    /// @param[in] namespaceComponents Enclosing namespace path.
    /// @param[in] name Mirror type name.
    void add(const std::vector<std::string>& namespaceComponents, const std::string& name);

    /// @brief Resolves a type spelling the way C++ would from inside `scope`.
    ///
    /// @details Template arguments are ignored. A spelling with a leading `::` is
    /// looked up at global scope only; otherwise each enclosing namespace of
    /// `scope` is tried from the innermost outwards.
    ///
    /// @param[in] spelling Type spelling, e.g. `Inner`, `geo::Inner<T>`, `::geo::Inner`.
    /// @param[in] scope Namespace path the spelling appears in.
    /// @return Entry, or `nullptr` when the spelling does not name an indexed mirror.
    [[nodiscard]] const MirrorIndexEntry* lookup(llvm::StringRef spelling, const std::vector<std::string>& scope) const;

    /// @brief Number of indexed mirror types.
    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

private:
    llvm::StringMap<MirrorIndexEntry> entries_;
};

}  // namespace archwith

#endif  // ARCHWITH_CODEGEN_MIRROR_INDEX_H
