//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements filesystem discovery for mirror declaration inputs.
///
/// Discovery expands directories, loads file text, and fixes a deterministic processing order.
///
//===----------------------------------------------------------------------===//

#include "archwith/Frontend/Discovery.h"
#include "archwith/Support/Diagnostics.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <system_error>

namespace archwith
{
namespace
{

constexpr const char* kMirrorExtension = ".mirror";

bool readTextFile(const std::filesystem::path& path, std::string& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.good())
    {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

void collectFromDirectory(const std::filesystem::path& root, std::set<std::string>& out, DiagnosticEngine& diagnostics)
{
    std::error_code ec;
    for (std::filesystem::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->is_regular_file() && it->path().extension() == kMirrorExtension)
        {
            out.insert(it->path().lexically_normal().string());
        }
    }
    if (ec)
    {
        diagnostics.error({root.string(), 1, 1}, "failed to scan directory: " + ec.message());
    }
}

}  // namespace

std::vector<DiscoveredMirrorFile> discoverMirrorFiles(const std::vector<std::string>& inputs,
                                                      DiagnosticEngine&               diagnostics)
{
    std::set<std::string> paths;
    for (const std::string& input : inputs)
    {
        const std::filesystem::path path(input);
        std::error_code             ec;
        if (std::filesystem::is_directory(path, ec))
        {
            collectFromDirectory(path, paths, diagnostics);
        }
        else if (std::filesystem::is_regular_file(path, ec))
        {
            paths.insert(path.lexically_normal().string());
        }
        else
        {
            diagnostics.error({input, 1, 1}, "input does not exist: " + input);
        }
    }

    std::vector<DiscoveredMirrorFile> out;
    out.reserve(paths.size());
    for (const std::string& path : paths)
    {
        DiscoveredMirrorFile file;
        file.filePath = path;
        if (!readTextFile(path, file.text))
        {
            diagnostics.error({path, 1, 1}, "failed to read file");
            continue;
        }
        out.push_back(std::move(file));
    }
    return out;
}

}  // namespace archwith
