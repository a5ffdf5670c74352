//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shared emission helpers for file-write policy and depfiles.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_CODEGEN_EMITCOMMON_H
#define ARCHWITH_CODEGEN_EMITCOMMON_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace archwith
{

/// @brief Output-file write policy shared by all generated units.
struct EmitWritePolicy final
{
    /// @brief Do not create or modify any files.
    bool dryRun{false};

    /// @brief Reject writes when destination file already exists.
    bool noOverwrite{false};

    /// @brief File mode applied after writing (POSIX-like bitmask).
    std::uint32_t fileMode{0444U};

    /// @brief Optional sink of absolute generated output paths.
    std::vector<std::string>* recordedOutputs{nullptr};
};

/// @brief Returns the absolute, lexically normalized form of a path.
/// @param[in] path Input path.
/// @return Normalized path; the lexical form of `path` when it cannot be made absolute.
std::string absoluteNormalizedPath(const std::filesystem::path& path);

/// @brief Writes one generated file under a policy.
///
/// @details
/// When @ref EmitWritePolicy::dryRun is true, no filesystem mutation occurs.
/// In all modes, if @ref EmitWritePolicy::recordedOutputs is set, the resolved
/// absolute path is appended.
///
/// @param[in] path Destination file path.
/// @param[in] content File contents.
/// @param[in] policy Write policy.
/// @return Success or a descriptive I/O error.
llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy);

/// @brief Renders one make-style depfile body.
///
/// @details
/// The output format is: `<escaped_target>: <escaped_dep_1> <escaped_dep_2> ...\n`.
/// Dependency inputs are sorted and de-duplicated for deterministic output.
///
/// @param[in] target Make-rule target path.
/// @param[in] deps Dependency path list.
/// @return Rendered depfile text with trailing newline.
std::string renderMakeDepfile(const std::string& target, const std::vector<std::string>& deps);

/// @brief Writes `<outputPath>.d` make depfile for one generated output path.
///
/// @details
/// Dependency paths and target path are normalized to absolute lexical paths.
/// The write path obeys @ref EmitWritePolicy semantics (`dryRun`,
/// `noOverwrite`, `fileMode`, and `recordedOutputs`).
///
/// @param[in] outputPath Generated output path the depfile describes.
/// @param[in] deps Dependency path list.
/// @param[in] policy Write policy.
/// @return Success or a descriptive I/O error.
llvm::Error writeDepfileForGeneratedOutput(const std::filesystem::path&    outputPath,
                                           const std::vector<std::string>& deps,
                                           const EmitWritePolicy&          policy);

}  // namespace archwith

#endif  // ARCHWITH_CODEGEN_EMITCOMMON_H
