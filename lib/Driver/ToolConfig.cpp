//===----------------------------------------------------------------------===//
///
/// @file
/// Implements loading of `archwithc` configuration files.
///
//===----------------------------------------------------------------------===//

#include "archwith/Driver/ToolConfig.h"

#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"

#include <filesystem>
#include <limits>

namespace archwith
{
namespace
{

llvm::Error configError(const llvm::Twine& message)
{
    return llvm::createStringError(llvm::inconvertibleErrorCode(), "invalid config: " + message.str());
}

std::string resolveAgainst(llvm::StringRef baseDirectory, llvm::StringRef path)
{
    const std::filesystem::path value(path.str());
    if (baseDirectory.empty() || value.is_absolute())
    {
        return value.lexically_normal().string();
    }
    return (std::filesystem::path(baseDirectory.str()) / value).lexically_normal().string();
}

llvm::Error readBoolean(const llvm::json::Object& object, llvm::StringRef key, std::optional<bool>& out)
{
    const auto* value = object.get(key);
    if (!value)
    {
        return llvm::Error::success();
    }
    const auto parsed = value->getAsBoolean();
    if (!parsed)
    {
        return configError("'" + key + "' must be a boolean");
    }
    out = *parsed;
    return llvm::Error::success();
}

}  // namespace

std::optional<std::uint32_t> parseFileMode(llvm::StringRef text)
{
    std::uint32_t mode = 0;
    if (text.empty() || text.getAsInteger(8, mode) || mode > 07777U)
    {
        return std::nullopt;
    }
    return mode;
}

llvm::Expected<ToolConfig> parseToolConfig(llvm::StringRef text, llvm::StringRef baseDirectory)
{
    auto parsed = llvm::json::parse(text);
    if (!parsed)
    {
        return configError(llvm::toString(parsed.takeError()));
    }
    const auto* object = parsed->getAsObject();
    if (!object)
    {
        return configError("top-level value must be an object");
    }

    ToolConfig config;
    if (const auto* inputsValue = object->get("inputs"))
    {
        const auto* inputs = inputsValue->getAsArray();
        if (!inputs)
        {
            return configError("'inputs' must be an array of strings");
        }
        for (const llvm::json::Value& item : *inputs)
        {
            const auto input = item.getAsString();
            if (!input)
            {
                return configError("'inputs' must be an array of strings");
            }
            config.inputs.push_back(resolveAgainst(baseDirectory, *input));
        }
    }

    if (const auto* outDirValue = object->get("outDir"))
    {
        const auto outDir = outDirValue->getAsString();
        if (!outDir || outDir->empty())
        {
            return configError("'outDir' must be a non-empty string");
        }
        config.outDir = resolveAgainst(baseDirectory, *outDir);
    }

    if (const auto* jobsValue = object->get("jobs"))
    {
        const auto jobs = jobsValue->getAsInteger();
        if (!jobs || *jobs < 1 || *jobs > std::numeric_limits<unsigned>::max())
        {
            return configError("'jobs' must be a positive integer");
        }
        config.jobs = static_cast<unsigned>(*jobs);
    }

    if (const auto* fileModeValue = object->get("fileMode"))
    {
        const auto modeText = fileModeValue->getAsString();
        if (!modeText)
        {
            return configError("'fileMode' must be an octal string");
        }
        config.fileMode = parseFileMode(*modeText);
        if (!config.fileMode)
        {
            return configError("'fileMode' must be an octal string, got '" + *modeText + "'");
        }
    }

    if (auto err = readBoolean(*object, "dryRun", config.dryRun))
    {
        return std::move(err);
    }
    if (auto err = readBoolean(*object, "noOverwrite", config.noOverwrite))
    {
        return std::move(err);
    }
    if (auto err = readBoolean(*object, "writeDepfiles", config.writeDepfiles))
    {
        return std::move(err);
    }
    return config;
}

llvm::Expected<ToolConfig> loadToolConfig(llvm::StringRef path)
{
    auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!buffer)
    {
        return llvm::createStringError(buffer.getError(), "failed to read config '%s'", path.str().c_str());
    }
    const std::string baseDirectory = std::filesystem::path(path.str()).parent_path().string();
    return parseToolConfig((*buffer)->getBuffer(), baseDirectory);
}

}  // namespace archwith
