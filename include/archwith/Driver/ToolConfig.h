//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON configuration file accepted by `archwithc --config`.
///
/// Every key is optional. Values that are present override the built-in
/// defaults and are themselves overridden by explicit command-line options.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_DRIVER_TOOL_CONFIG_H
#define ARCHWITH_DRIVER_TOOL_CONFIG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace archwith
{

/// @brief Settings read from a configuration file.
struct ToolConfig final
{
    /// @brief `.mirror` files or directories; relative entries are resolved against the config file directory.
    std::vector<std::string> inputs;

    /// @brief Output directory root.
    std::optional<std::string> outDir;

    /// @brief Worker thread count for per-mirror pipelines.
    std::optional<unsigned> jobs;

    /// @brief Report outputs without writing them.
    std::optional<bool> dryRun;

    /// @brief Refuse to replace existing outputs.
    std::optional<bool> noOverwrite;

    /// @brief Mode bits applied to written files.
    std::optional<std::uint32_t> fileMode;

    /// @brief Emit make depfiles beside generated units.
    std::optional<bool> writeDepfiles;
};

/// @brief Parses an octal permission string such as `0644` or `444`.
/// @param[in] text Permission text.
/// @return Mode bits, or `std::nullopt` when `text` is not octal or exceeds `07777`.
std::optional<std::uint32_t> parseFileMode(llvm::StringRef text);

/// @brief Parses configuration JSON text.
/// @param[in] text JSON document; must be an object.
/// @param[in] baseDirectory Directory used to resolve relative inputs and `outDir`; empty keeps them as written.
/// @return Parsed configuration or a descriptive error.
llvm::Expected<ToolConfig> parseToolConfig(llvm::StringRef text, llvm::StringRef baseDirectory = "");

/// @brief Reads and parses a configuration file.
/// @param[in] path Configuration file path.
/// @return Parsed configuration or a descriptive error.
llvm::Expected<ToolConfig> loadToolConfig(llvm::StringRef path);

}  // namespace archwith

#endif  // ARCHWITH_DRIVER_TOOL_CONFIG_H
