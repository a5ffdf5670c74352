//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Public entry points and options for C++ adapter emission.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_CODEGEN_CPP_ADAPTER_EMITTER_H
#define ARCHWITH_CODEGEN_CPP_ADAPTER_EMITTER_H

#include "archwith/CodeGen/AdapterLayout.h"
#include "archwith/CodeGen/EmitCommon.h"
#include "archwith/CodeGen/MirrorIndex.h"
#include "archwith/Frontend/AST.h"
#include "archwith/Semantics/MappingTable.h"
#include "archwith/Support/Diagnostics.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "llvm/Support/Error.h"

namespace archwith
{

/// @file
/// @brief C++ adapter emission entry points.

/// @brief Configuration options for C++ adapter generation.
struct CppAdapterEmitOptions final
{
    /// @brief Output directory root.
    std::string outDir;

    /// @brief Worker threads for per-mirror pipelines; 0 or 1 runs inline.
    unsigned jobs{1};

    /// @brief Emit `<unit>.d` make depfiles next to every generated unit.
    bool writeDepfiles{false};

    /// @brief Output write policy.
    EmitWritePolicy writePolicy;
};

/// @brief Result of one mirror type's pipeline.
struct MirrorCompilation final
{
    /// @brief Namespace-qualified mirror name.
    std::string qualifiedName;

    /// @brief `.mirror` file of the declaration.
    std::string sourceFile;

    /// @brief Diagnostics of this mirror only.
    DiagnosticEngine diagnostics;

    /// @brief Validated table; empty when any stage failed.
    std::optional<FieldMappingTable> table;

    /// @brief Rendered units; empty when any stage failed.
    std::vector<GeneratedUnit> units;

    /// @brief True when the pipeline stopped with errors.
    [[nodiscard]] bool failed() const
    {
        return !table.has_value();
    }
};

/// @brief Aggregate counters of one emission run.
struct CppAdapterEmitSummary final
{
    /// @brief Mirrors whose units were produced.
    std::size_t mirrorsEmitted{0};

    /// @brief Mirrors stopped by diagnostics.
    std::size_t mirrorsFailed{0};

    /// @brief Files written or, in dry-run mode, that would be written.
    std::size_t filesWritten{0};
};

/// @brief Runs directives, IR builder, validator and both emitters for one mirror.
/// @param[in] file File containing the declaration.
/// @param[in] decl Mirror declaration.
/// @param[in] index Mirror index of the compilation.
/// @return Pipeline result with its own diagnostics.
MirrorCompilation compileMirror(const MirrorFileAST& file, const MirrorDeclAST& decl, const MirrorIndex& index);

/// @brief Compiles every mirror declaration of a module.
///
/// @details Pipelines share no mutable state. With `jobs > 1` they run on an
/// `llvm::ThreadPool`; results are returned in declaration order either way. A
/// mirror declared twice under the same qualified name fails on its second
/// declaration.
///
/// @param[in] module Parsed module.
/// @param[in] jobs Worker thread count.
/// @return One result per declaration, in file then declaration order.
std::vector<MirrorCompilation> compileMirrors(const ASTModule& module, unsigned jobs = 1);

/// @brief Renders the umbrella header `<M>.hpp` including all other units of a mirror.
/// @param[in] table Validated mapping table.
/// @param[in] units Units already rendered for the mirror.
/// @return Rendered unit.
GeneratedUnit renderUmbrellaUnit(const FieldMappingTable& table, const std::vector<GeneratedUnit>& units);

/// @brief Loads the runtime contract header shipped with archwithc.
/// @return Header text or a read error.
llvm::Expected<std::string> loadRuntimeHeader();

/// @brief Emits C++ adapters for every valid mirror in a module.
///
/// @details Diagnostics of all mirrors are appended to `diagnostics` in
/// declaration order. Mirrors with errors produce no output and do not prevent
/// their siblings from being written.
///
/// @param[in] module Parsed module.
/// @param[in] options Emission configuration.
/// @param[in,out] diagnostics Diagnostic sink.
/// @param[out] summary Optional run counters.
/// @return Success, or an I/O error when an output could not be written.
llvm::Error emitCppAdapters(const ASTModule&             module,
                            const CppAdapterEmitOptions& options,
                            DiagnosticEngine&            diagnostics,
                            CppAdapterEmitSummary*       summary = nullptr);

}  // namespace archwith

#endif  // ARCHWITH_CODEGEN_CPP_ADAPTER_EMITTER_H
