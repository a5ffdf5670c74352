//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "archwith/CodeGen/CppAdapterEmitter.h"
#include "archwith/Frontend/Lexer.h"
#include "archwith/Frontend/Parser.h"
#include "archwith/Support/Diagnostics.h"

namespace
{

const char* kGeometry = "#include \"remote/shapes.hpp\"\n"
                        "namespace geo\n"
                        "{\n"
                        "[[archive_with(from(::remote::Point))]]\n"
                        "struct Point\n"
                        "{\n"
                        "    std::int32_t x;\n"
                        "    std::int32_t y;\n"
                        "};\n"
                        "\n"
                        "struct Orphan\n"
                        "{\n"
                        "    int lost;\n"
                        "};\n"
                        "\n"
                        "[[archive_with(from(::remote::Segment))]]\n"
                        "struct Segment\n"
                        "{\n"
                        "    [[archive_with(from(::remote::Point))]] Point start;\n"
                        "    [[archive_with(getter = \"::remote::Segment::label\")]] std::string label;\n"
                        "};\n"
                        "}\n";

const char* kExtra = "namespace geo\n"
                     "{\n"
                     "[[archive_with(from(::remote::Point))]]\n"
                     "struct Point\n"
                     "{\n"
                     "    std::int32_t z;\n"
                     "};\n"
                     "\n"
                     "[[archive_with(from(::remote::Keyed))]]\n"
                     "struct Keyed\n"
                     "{\n"
                     "    int class;\n"
                     "};\n"
                     "}\n";

archwith::MirrorFileAST parseText(const std::string& path, const std::string& text, archwith::DiagnosticEngine& diag)
{
    archwith::Lexer  lexer(path, text);
    archwith::Parser parser(path, lexer.lex(), diag);
    return parser.parseFile();
}

archwith::ASTModule buildModule(archwith::DiagnosticEngine& diag)
{
    archwith::ASTModule module;
    module.files.push_back(parseText("geometry.mirror", kGeometry, diag));
    module.files.push_back(parseText("extra.mirror", kExtra, diag));
    return module;
}

const archwith::MirrorCompilation* findCompilation(const std::vector<archwith::MirrorCompilation>& compilations,
                                                   std::string_view                                 name,
                                                   std::string_view                                 sourceFile)
{
    for (const auto& compilation : compilations)
    {
        if (compilation.qualifiedName == name && compilation.sourceFile == sourceFile)
        {
            return &compilation;
        }
    }
    return nullptr;
}

bool hasErrorContaining(const archwith::DiagnosticEngine& diag, std::string_view fragment)
{
    for (const auto& d : diag.diagnostics())
    {
        if (d.level == archwith::DiagnosticLevel::Error && d.message.find(fragment) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

bool runCompileChecks()
{
    archwith::DiagnosticEngine parseDiag;
    const auto                 module = buildModule(parseDiag);
    if (parseDiag.hasErrors())
    {
        std::cerr << "adapter emitter fixture failed to parse\n";
        return false;
    }

    const auto serial = archwith::compileMirrors(module, 1);
    if (serial.size() != 5)
    {
        std::cerr << "expected one compilation per declaration, got " << serial.size() << "\n";
        return false;
    }

    const auto* point   = findCompilation(serial, "geo::Point", "geometry.mirror");
    const auto* orphan  = findCompilation(serial, "geo::Orphan", "geometry.mirror");
    const auto* segment = findCompilation(serial, "geo::Segment", "geometry.mirror");
    const auto* again   = findCompilation(serial, "geo::Point", "extra.mirror");
    const auto* keyed   = findCompilation(serial, "geo::Keyed", "extra.mirror");
    if (!point || !orphan || !segment || !again || !keyed)
    {
        std::cerr << "missing compilation result\n";
        return false;
    }

    if (point->failed() || point->units.size() != 4 || point->units[0].relativePath != "geo/Point.repr.hpp" ||
        point->units[1].relativePath != "geo/Point.archive.remote_Point.hpp" ||
        point->units[2].relativePath != "geo/Point.deserialize.hpp" || point->units[3].relativePath != "geo/Point.hpp")
    {
        std::cerr << "Point should produce repr, archive, deserialize and umbrella units\n";
        return false;
    }
    const std::string& umbrella = point->units[3].content;
    if (umbrella.find("#include \"geo/Point.repr.hpp\"\n#include \"geo/Point.archive.remote_Point.hpp\"\n"
                      "#include \"geo/Point.deserialize.hpp\"\n") == std::string::npos ||
        umbrella.find("#ifndef ARCHWITH_GENERATED_GEO_POINT_HPP") == std::string::npos)
    {
        std::cerr << "umbrella unit mismatch:\n" << umbrella;
        return false;
    }

    if (segment->failed() || segment->units.size() != 3 ||
        segment->diagnostics.count(archwith::DiagnosticKind::NotReconstructable) != 1)
    {
        std::cerr << "Segment should compile without a deserialize unit and carry one note\n";
        return false;
    }

    if (!orphan->failed() || !orphan->units.empty() ||
        orphan->diagnostics.count(archwith::DiagnosticKind::MissingRemoteType) != 1)
    {
        std::cerr << "Orphan should fail alone with MissingRemoteType\n";
        return false;
    }

    if (!again->failed() || !hasErrorContaining(again->diagnostics, "is already declared at geometry.mirror:5:"))
    {
        std::cerr << "second declaration of a qualified name should be rejected\n";
        return false;
    }

    if (!keyed->failed() || !hasErrorContaining(keyed->diagnostics, "rename it, e.g. 'class_'"))
    {
        std::cerr << "keyword field names should be rejected with a suggestion\n";
        return false;
    }

    const auto parallel = archwith::compileMirrors(module, 4);
    if (parallel.size() != serial.size())
    {
        std::cerr << "parallel compilation changed the result count\n";
        return false;
    }
    for (std::size_t i = 0; i < serial.size(); ++i)
    {
        if (parallel[i].qualifiedName != serial[i].qualifiedName || parallel[i].failed() != serial[i].failed() ||
            parallel[i].units.size() != serial[i].units.size() ||
            parallel[i].diagnostics.diagnostics().size() != serial[i].diagnostics.diagnostics().size())
        {
            std::cerr << "parallel compilation diverged at index " << i << "\n";
            return false;
        }
        for (std::size_t u = 0; u < serial[i].units.size(); ++u)
        {
            if (parallel[i].units[u].relativePath != serial[i].units[u].relativePath ||
                parallel[i].units[u].content != serial[i].units[u].content)
            {
                std::cerr << "generated text must not depend on the job count\n";
                return false;
            }
        }
    }
    return true;
}

bool runEmitChecks()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path root =
        std::filesystem::temp_directory_path() / ("archwith-adapter-tests-" + std::to_string(now));
    std::error_code ec;
    auto            cleanup = [&]() { std::filesystem::remove_all(root, ec); };

    archwith::DiagnosticEngine parseDiag;
    archwith::ASTModule        module;
    module.files.push_back(parseText("geometry.mirror", kGeometry, parseDiag));

    {
        archwith::DiagnosticEngine     diag;
        archwith::CppAdapterEmitOptions options;
        if (auto err = archwith::emitCppAdapters(module, options, diag))
        {
            llvm::consumeError(std::move(err));
        }
        else
        {
            std::cerr << "emission without an output directory should fail\n";
            return false;
        }
    }

    {
        std::vector<std::string>        recorded;
        archwith::DiagnosticEngine      diag;
        archwith::CppAdapterEmitOptions options;
        options.outDir                      = (root / "dry").string();
        options.writePolicy.dryRun          = true;
        options.writePolicy.recordedOutputs = &recorded;
        archwith::CppAdapterEmitSummary summary;
        if (auto err = archwith::emitCppAdapters(module, options, diag, &summary))
        {
            std::cerr << "dry-run emission failed: " << llvm::toString(std::move(err)) << "\n";
            cleanup();
            return false;
        }
        if (summary.mirrorsEmitted != 2 || summary.mirrorsFailed != 1 || summary.filesWritten != 8 ||
            recorded.size() != 8)
        {
            std::cerr << "dry-run summary mismatch: " << summary.filesWritten << " files, " << recorded.size()
                      << " recorded\n";
            cleanup();
            return false;
        }
        if (std::filesystem::exists(root / "dry", ec))
        {
            std::cerr << "dry run must not create the output directory\n";
            cleanup();
            return false;
        }
        const bool hasRuntime = std::any_of(recorded.begin(), recorded.end(), [](const std::string& path) {
            return path.size() >= 20 && path.compare(path.size() - 20, 20, "archwith_runtime.hpp") == 0;
        });
        if (!hasRuntime || !diag.hasErrors())
        {
            std::cerr << "dry run should record the runtime header and forward per-mirror errors\n";
            cleanup();
            return false;
        }
    }

    {
        archwith::DiagnosticEngine      diag;
        archwith::CppAdapterEmitOptions options;
        options.outDir               = (root / "out").string();
        options.jobs                 = 2;
        options.writeDepfiles        = true;
        options.writePolicy.fileMode = 0644U;
        archwith::CppAdapterEmitSummary summary;
        if (auto err = archwith::emitCppAdapters(module, options, diag, &summary))
        {
            std::cerr << "emission failed: " << llvm::toString(std::move(err)) << "\n";
            cleanup();
            return false;
        }
        if (summary.filesWritten != 15)
        {
            std::cerr << "expected runtime header, seven units and seven depfiles; got " << summary.filesWritten
                      << "\n";
            cleanup();
            return false;
        }
        const std::filesystem::path out = root / "out";
        if (!std::filesystem::exists(out / "archwith_runtime.hpp", ec) ||
            !std::filesystem::exists(out / "geo" / "Point.hpp", ec) ||
            !std::filesystem::exists(out / "geo" / "Segment.archive.remote_Segment.hpp.d", ec) ||
            std::filesystem::exists(out / "geo" / "Segment.deserialize.hpp", ec) ||
            std::filesystem::exists(out / "geo" / "Orphan.hpp", ec))
        {
            std::cerr << "emitted tree does not match the compiled mirrors\n";
            cleanup();
            return false;
        }

        std::ifstream     depfile(out / "geo" / "Point.repr.hpp.d");
        const std::string depText((std::istreambuf_iterator<char>(depfile)), std::istreambuf_iterator<char>());
        if (depText.find("geometry.mirror\n") == std::string::npos)
        {
            std::cerr << "depfile should name the source .mirror file\n";
            cleanup();
            return false;
        }

        archwith::DiagnosticEngine again;
        options.writePolicy.noOverwrite = true;
        if (auto err = archwith::emitCppAdapters(module, options, again))
        {
            llvm::consumeError(std::move(err));
        }
        else
        {
            std::cerr << "no-overwrite emission should refuse to replace the runtime header\n";
            cleanup();
            return false;
        }
    }

    cleanup();
    return true;
}

}  // namespace

bool runCppAdapterEmitterTests()
{
    bool ok = true;
    ok      = runCompileChecks() && ok;
    ok      = runEmitChecks() && ok;
    return ok;
}
