//===----------------------------------------------------------------------===//
///
/// @file
/// Input discovery declarations for locating and loading `.mirror` source files.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_FRONTEND_DISCOVERY_H
#define ARCHWITH_FRONTEND_DISCOVERY_H

#include "archwith/Support/Diagnostics.h"

#include <string>
#include <vector>

namespace archwith
{

/// @file
/// @brief Discovery routines for locating and loading mirror declaration files.

/// @brief One loaded input file.
struct DiscoveredMirrorFile
{
    /// @brief Normalized path of the file.
    std::string filePath;

    /// @brief Full file contents.
    std::string text;
};

/// @brief Expands inputs into a sorted, de-duplicated list of loaded `.mirror` files.
///
/// @details Regular files are taken as given regardless of extension; directories are scanned recursively for
/// `*.mirror`. Missing or unreadable inputs are reported as errors and skipped.
///
/// @param[in] inputs Files or directories.
/// @param[in,out] diagnostics Diagnostic sink for discovery/I/O issues.
/// @return Loaded files in path order.
std::vector<DiscoveredMirrorFile> discoverMirrorFiles(const std::vector<std::string>& inputs,
                                                      DiagnosticEngine&               diagnostics);

}  // namespace archwith

#endif  // ARCHWITH_FRONTEND_DISCOVERY_H
