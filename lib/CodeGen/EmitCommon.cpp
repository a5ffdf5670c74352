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

#include "archwith/CodeGen/EmitCommon.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <system_error>

namespace archwith
{

namespace
{

std::filesystem::perms permsFromMode(const std::uint32_t mode)
{
    using Perm = std::filesystem::perms;
    Perm out   = Perm::none;

    constexpr std::uint32_t bits[]  = {0400U, 0200U, 0100U, 0040U, 0020U, 0010U, 0004U, 0002U, 0001U};
    constexpr Perm          perms[] = {Perm::owner_read,
                                       Perm::owner_write,
                                       Perm::owner_exec,
                                       Perm::group_read,
                                       Perm::group_write,
                                       Perm::group_exec,
                                       Perm::others_read,
                                       Perm::others_write,
                                       Perm::others_exec};
    for (std::size_t i = 0; i < std::size(bits); ++i)
    {
        if ((mode & bits[i]) != 0U)
        {
            out |= perms[i];
        }
    }
    return out;
}

std::string escapeMakeToken(llvm::StringRef text)
{
    std::string out;
    out.reserve(text.size());

    for (const char c : text)
    {
        switch (c)
        {
        case '\\':
            out.append("\\\\");
            break;
        case ' ':
            out.append("\\ ");
            break;
        case '\t':
            out.push_back('\\');
            out.push_back('\t');
            break;
        case '#':
            out.append("\\#");
            break;
        case '$':
            out.append("$$");
            break;
        case ':':
            out.append("\\:");
            break;
        default:
            out.push_back(c);
            break;
        }
    }

    return out;
}

}  // namespace

std::string absoluteNormalizedPath(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto      absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy)
{
    if (policy.recordedOutputs != nullptr)
    {
        policy.recordedOutputs->push_back(absoluteNormalizedPath(path));
    }

    if (policy.dryRun)
    {
        return llvm::Error::success();
    }

    std::error_code ec;

    const auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return llvm::createStringError(ec, "failed to create output directory %s", parent.string().c_str());
        }
    }

    const bool exists = std::filesystem::exists(path, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to stat output path %s", path.string().c_str());
    }
    if (exists)
    {
        if (policy.noOverwrite)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "refusing to overwrite existing output file: %s",
                                           path.string().c_str());
        }
        const bool removed = std::filesystem::remove(path, ec);
        if (ec || !removed)
        {
            return llvm::createStringError(ec ? ec : llvm::inconvertibleErrorCode(),
                                           "failed to remove existing output file %s",
                                           path.string().c_str());
        }
    }

    llvm::raw_fd_ostream os(path.string(), ec, llvm::sys::fs::OF_Text);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to open %s", path.string().c_str());
    }
    os << content;
    os.close();
    if (os.has_error())
    {
        const std::error_code writeError = os.error();
        os.clear_error();
        return llvm::createStringError(writeError, "failed to write %s", path.string().c_str());
    }

    std::filesystem::permissions(path, permsFromMode(policy.fileMode), std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to set mode on %s", path.string().c_str());
    }

    return llvm::Error::success();
}

std::string renderMakeDepfile(const std::string& target, const std::vector<std::string>& deps)
{
    std::vector<std::string> normalizedDeps = deps;
    std::sort(normalizedDeps.begin(), normalizedDeps.end());
    normalizedDeps.erase(std::unique(normalizedDeps.begin(), normalizedDeps.end()), normalizedDeps.end());

    std::string out = escapeMakeToken(target);
    out += ':';
    for (const auto& dep : normalizedDeps)
    {
        out.push_back(' ');
        out += escapeMakeToken(dep);
    }
    out.push_back('\n');
    return out;
}

llvm::Error writeDepfileForGeneratedOutput(const std::filesystem::path&    outputPath,
                                           const std::vector<std::string>& deps,
                                           const EmitWritePolicy&          policy)
{
    const std::filesystem::path depfilePath = outputPath.string() + ".d";

    std::vector<std::string> normalizedDeps;
    normalizedDeps.reserve(deps.size());
    for (const auto& dep : deps)
    {
        normalizedDeps.push_back(absoluteNormalizedPath(dep));
    }

    const std::string depfileContent = renderMakeDepfile(absoluteNormalizedPath(outputPath), normalizedDeps);
    return writeGeneratedFile(depfilePath, depfileContent, policy);
}

}  // namespace archwith
