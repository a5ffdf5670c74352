//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements per-mirror pipelines and C++ adapter emission.
///
/// Every mirror declaration runs directives -> IR builder -> validator ->
/// emitters with its own diagnostic engine. Only the read-only mirror index is
/// shared, so pipelines can run concurrently and a failing mirror never stops
/// its siblings.
///
//===----------------------------------------------------------------------===//

#include "archwith/CodeGen/CppAdapterEmitter.h"

#include "archwith/CodeGen/ArchiveEmitter.h"
#include "archwith/CodeGen/DeserializeEmitter.h"
#include "archwith/CodeGen/NamingPolicy.h"
#include "archwith/Directives/DirectiveModel.h"
#include "archwith/Semantics/IRBuilder.h"
#include "archwith/Semantics/Validator.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/ThreadPool.h"
#include "llvm/Support/Threading.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace archwith
{
namespace
{

bool checkIdentifiers(const MirrorDeclAST& decl, DiagnosticEngine& diagnostics)
{
    bool ok = true;
    if (codegenIsCppKeyword(decl.name))
    {
        diagnostics.error(decl.location,
                          "mirror type name '" + decl.name + "' is a C++ keyword; rename it, e.g. '" +
                              codegenSanitizeIdentifier(decl.name) + "'");
        ok = false;
    }
    for (const auto& component : decl.namespaceComponents)
    {
        if (codegenIsCppKeyword(component))
        {
            diagnostics.error(decl.location,
                              "namespace component '" + component + "' is a C++ keyword; rename it, e.g. '" +
                                  codegenSanitizeIdentifier(component) + "'");
            ok = false;
        }
    }
    for (const auto& field : decl.fields)
    {
        if (codegenIsCppKeyword(field.name))
        {
            diagnostics.error(field.location,
                              "mirror '" + decl.qualifiedName() + "' field '" + field.name +
                                  "' is a C++ keyword; rename it, e.g. '" + codegenSanitizeIdentifier(field.name) +
                                  "'");
            ok = false;
        }
    }
    return ok;
}

}  // namespace

MirrorCompilation compileMirror(const MirrorFileAST& file, const MirrorDeclAST& decl, const MirrorIndex& index)
{
    MirrorCompilation result;
    result.qualifiedName       = decl.qualifiedName();
    result.sourceFile          = file.filePath;
    DiagnosticEngine& diagnostics = result.diagnostics;

    if (!checkIdentifiers(decl, diagnostics))
    {
        return result;
    }

    auto directives = parseDirectives(decl, diagnostics);
    if (!directives)
    {
        llvm::consumeError(directives.takeError());
        return result;
    }

    auto spec = buildTypeSpec(file, decl, *directives, diagnostics);
    if (!spec)
    {
        llvm::consumeError(spec.takeError());
        return result;
    }

    auto table = validate(*spec, diagnostics);
    if (!table)
    {
        llvm::consumeError(table.takeError());
        return result;
    }

    result.units.push_back(renderReprUnit(*table, index));
    for (auto& unit : renderArchiveUnits(*table))
    {
        result.units.push_back(std::move(unit));
    }
    if (auto deserialize = renderDeserializeUnit(*table, diagnostics))
    {
        result.units.push_back(std::move(*deserialize));
    }
    result.units.push_back(renderUmbrellaUnit(*table, result.units));
    result.table = std::move(*table);
    return result;
}

std::vector<MirrorCompilation> compileMirrors(const ASTModule& module, const unsigned jobs)
{
    struct WorkItem
    {
        const MirrorFileAST* file;
        const MirrorDeclAST* decl;
        const MirrorDeclAST* firstDeclaration;
    };

    std::vector<WorkItem>                 work;
    llvm::StringMap<const MirrorDeclAST*> firstByName;
    for (const auto& file : module.files)
    {
        for (const auto& decl : file.mirrors)
        {
            const auto inserted = firstByName.try_emplace(decl.qualifiedName(), &decl);
            work.push_back(WorkItem{&file, &decl, inserted.second ? nullptr : inserted.first->second});
        }
    }

    const MirrorIndex              index = MirrorIndex::build(module);
    std::vector<MirrorCompilation> results(work.size());

    auto runOne = [&work, &results, &index](const std::size_t i) {
        const WorkItem& item = work[i];
        if (item.firstDeclaration != nullptr)
        {
            MirrorCompilation duplicate;
            duplicate.qualifiedName = item.decl->qualifiedName();
            duplicate.sourceFile    = item.file->filePath;
            duplicate.diagnostics.error(item.decl->location,
                                        "mirror type '" + duplicate.qualifiedName + "' is already declared at " +
                                            item.firstDeclaration->location.str());
            results[i] = std::move(duplicate);
            return;
        }
        results[i] = compileMirror(*item.file, *item.decl, index);
    };

    if (jobs > 1 && work.size() > 1)
    {
        llvm::ThreadPool pool(llvm::hardware_concurrency(jobs));
        for (std::size_t i = 0; i < work.size(); ++i)
        {
            (void) pool.async(runOne, i);
        }
        pool.wait();
    }
    else
    {
        for (std::size_t i = 0; i < work.size(); ++i)
        {
            runOne(i);
        }
    }
    return results;
}

GeneratedUnit renderUmbrellaUnit(const FieldMappingTable& table, const std::vector<GeneratedUnit>& units)
{
    const MirrorHeader&      header     = table.header;
    std::vector<std::string> guardParts = header.namespaceComponents;
    guardParts.push_back(header.name);
    const std::string guard = codegenHeaderGuard(guardParts);

    std::ostringstream out;
    out << renderUnitPrologue(header, guard);
    for (const auto& unit : units)
    {
        out << "#include \"" << unit.relativePath << "\"\n";
    }
    out << renderUnitEpilogue(guard);
    return GeneratedUnit{umbrellaUnitPath(header.namespaceComponents, header.name), out.str()};
}

llvm::Expected<std::string> loadRuntimeHeader()
{
    const std::filesystem::path absoluteRuntimeHeader =
        std::filesystem::path(ARCHWITH_SOURCE_DIR) / "runtime" / "cpp" / kRuntimeHeaderName;
    std::ifstream in(absoluteRuntimeHeader.string());
    if (!in)
    {
        in.open(std::string("runtime/cpp/") + kRuntimeHeaderName);
    }
    if (!in)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "failed to read C++ runtime header");
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

llvm::Error emitCppAdapters(const ASTModule&             module,
                            const CppAdapterEmitOptions& options,
                            DiagnosticEngine&            diagnostics,
                            CppAdapterEmitSummary*       summary)
{
    if (options.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output directory is required");
    }

    CppAdapterEmitSummary counters;
    auto                  compilations = compileMirrors(module, options.jobs);
    for (const auto& compilation : compilations)
    {
        diagnostics.append(compilation.diagnostics);
        if (compilation.failed())
        {
            ++counters.mirrorsFailed;
        }
        else
        {
            ++counters.mirrorsEmitted;
        }
    }

    auto runtime = loadRuntimeHeader();
    if (!runtime)
    {
        return runtime.takeError();
    }

    const std::filesystem::path outRoot(options.outDir);
    if (auto err = writeGeneratedFile(outRoot / kRuntimeHeaderName, *runtime, options.writePolicy))
    {
        return err;
    }
    ++counters.filesWritten;

    for (const auto& compilation : compilations)
    {
        if (compilation.failed())
        {
            continue;
        }
        for (const auto& unit : compilation.units)
        {
            const std::filesystem::path path = outRoot / unit.relativePath;
            if (auto err = writeGeneratedFile(path, unit.content, options.writePolicy))
            {
                return err;
            }
            ++counters.filesWritten;

            if (options.writeDepfiles)
            {
                if (auto err = writeDepfileForGeneratedOutput(path, {compilation.sourceFile}, options.writePolicy))
                {
                    return err;
                }
                ++counters.filesWritten;
            }
        }
    }

    if (summary != nullptr)
    {
        *summary = counters;
    }
    return llvm::Error::success();
}

}  // namespace archwith
