//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `archwithc` command-line adapter compiler.
///
/// This tool parses `.mirror` declarations, builds and validates one field
/// mapping table per mirror type, and prints the parsed AST, prints the tables
/// as JSON, or emits C++ archive adapters.
///
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "archwith/CodeGen/CppAdapterEmitter.h"
#include "archwith/Driver/ToolConfig.h"
#include "archwith/Frontend/ASTPrinter.h"
#include "archwith/Frontend/Parser.h"
#include "archwith/Semantics/MappingTableJson.h"
#include "archwith/Support/Diagnostics.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// @brief Checks whether a command token is implemented by `archwithc`.
///
/// @param[in] command Command token from argv.
/// @return `true` if the command is one of the supported subcommands.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "ast" || command == "table" || command == "cpp";
}

/// @brief Checks whether a token is a help switch.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: archwithc <ast|table|cpp> --input <path> [options]\n"
                 << "Try: archwithc --help\n";
}

/// @brief Prints the full help text and optional command-focused details.
///
/// @param[in] selectedCommand Optional command name used for focused help.
void printHelp(const std::string& selectedCommand = "")
{
    llvm::errs() << "NAME\n"
                 << "  archwithc - mirror type to archive adapter compiler\n\n"
                 << "SYNOPSIS\n"
                 << "  archwithc <command> --input <path> [--input <path> ...] [options]\n"
                 << "  archwithc <command> --config <file.json> [options]\n"
                 << "  archwithc --help\n\n"
                 << "DESCRIPTION\n"
                 << "  archwithc reads .mirror declarations of local mirror types annotated with\n"
                 << "  archive_with attributes, checks every field correspondence against its remote\n"
                 << "  types, and generates C++ adapters that archive, serialize and, where possible,\n"
                 << "  deserialize the remote types through the mirror's layout.\n\n"
                 << "COMMANDS\n"
                 << "  ast    Print the parsed AST of all inputs.\n"
                 << "  table  Print validated field mapping tables as JSON.\n"
                 << "  cpp    Generate C++ adapter headers.\n\n"
                 << "COMMON OPTIONS\n"
                 << "  --input <path>\n"
                 << "      A .mirror file, or a directory scanned recursively for .mirror files.\n"
                 << "      Repeat as needed. Adds to inputs listed in --config.\n"
                 << "  --config <file.json>\n"
                 << "      JSON object with keys inputs, outDir, jobs, dryRun, noOverwrite,\n"
                 << "      fileMode and writeDepfiles. Command-line options take precedence.\n"
                 << "  --jobs <N>\n"
                 << "      Run per-mirror pipelines on N worker threads (default: 1).\n"
                 << "  --help, -h\n"
                 << "      Print this help text. With a command, prints command-focused guidance.\n\n"
                 << "CODEGEN OPTIONS (cpp)\n"
                 << "  --out-dir <dir>\n"
                 << "      Output directory root for generated files.\n"
                 << "  --dry-run\n"
                 << "      Compute outputs without writing them.\n"
                 << "  --no-overwrite\n"
                 << "      Fail instead of replacing an existing output.\n"
                 << "  --file-mode <octal>\n"
                 << "      Permission bits applied to written files (default: 0444).\n"
                 << "  --write-depfiles\n"
                 << "      Write a make-style <output>.d depfile next to every generated header.\n"
                 << "  --list-outputs\n"
                 << "      Print the absolute path of every generated file to stdout.\n";

    if (!selectedCommand.empty())
    {
        llvm::errs() << "\nCOMMAND DETAILS (" << selectedCommand << ")\n";
        if (selectedCommand == "ast")
        {
            llvm::errs() << "  Stops after parsing. Directive and validation errors are not reported.\n";
        }
        else if (selectedCommand == "table")
        {
            llvm::errs() << "  Runs every check. Tables of mirrors with errors are omitted.\n";
        }
        else if (selectedCommand == "cpp")
        {
            llvm::errs() << "  Requires --out-dir. Honors --dry-run, --no-overwrite, --file-mode,\n"
                         << "  --write-depfiles and --list-outputs.\n";
        }
    }
}

/// @brief Emits collected diagnostics to stderr.
///
/// @param[in] diag Diagnostic engine containing accumulated diagnostics.
void printDiagnostics(const archwith::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        llvm::errs() << archwith::formatDiagnostic(d) << "\n";
    }
}

/// @brief Resolves a path to an absolute output-root string when possible.
std::string resolveOutputRoot(const std::string& root)
{
    if (root.empty())
    {
        return "stdout";
    }
    std::error_code ec;
    const auto      abs = std::filesystem::absolute(root, ec);
    if (!ec)
    {
        return abs.string();
    }
    return root;
}

/// @brief Prints the post-run command summary.
///
/// @param[in] command Executed top-level command.
/// @param[in] outputRoot Resolved output root description.
/// @param[in] generatedFiles Number of generated files.
/// @param[in] summary Per-mirror counters.
/// @param[in] elapsed Wall-clock execution duration.
void printRunSummary(llvm::StringRef                           command,
                     llvm::StringRef                           outputRoot,
                     const std::uint64_t                       generatedFiles,
                     const archwith::CppAdapterEmitSummary&    summary,
                     const std::chrono::steady_clock::duration elapsed)
{
    const auto elapsedMs         = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    const auto elapsedWholeSec   = elapsedMs / 1000;
    const auto elapsedFractionMs = elapsedMs % 1000;
    llvm::errs() << "Run summary:\n"
                 << "  command: " << command << "\n"
                 << "  output root: " << outputRoot << "\n"
                 << "  files generated: " << generatedFiles << "\n"
                 << "  mirrors emitted: " << summary.mirrorsEmitted << "\n"
                 << "  mirrors failed: " << summary.mirrorsFailed << "\n"
                 << "  elapsed: " << elapsedWholeSec << ".";
    if (elapsedFractionMs < 100)
    {
        llvm::errs() << "0";
    }
    if (elapsedFractionMs < 10)
    {
        llvm::errs() << "0";
    }
    llvm::errs() << elapsedFractionMs << "s\n";
}

}  // namespace

/// @brief Program entry point for `archwithc`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI, parse, validation, or
///         code-generation failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (!isKnownCommand(command))
    {
        llvm::errs() << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    }

    std::vector<std::string>     inputs;
    std::string                  configPath;
    std::optional<std::string>   outDir;
    std::optional<unsigned>      jobs;
    std::optional<bool>          dryRun;
    std::optional<bool>          noOverwrite;
    std::optional<std::uint32_t> fileMode;
    std::optional<bool>          writeDepfiles;
    bool                         listOutputs   = false;
    bool                         helpRequested = false;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--input")
        {
            inputs.push_back(requireValue(arg));
        }
        else if (arg == "--config")
        {
            configPath = requireValue(arg);
        }
        else if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else if (arg == "--out-dir")
        {
            outDir = requireValue(arg);
        }
        else if (arg == "--jobs")
        {
            const auto            value = requireValue(arg);
            std::uint64_t         parsedJobs{};
            const llvm::StringRef valueRef(value);
            if (valueRef.getAsInteger(10, parsedJobs) || parsedJobs == 0U ||
                parsedJobs > std::numeric_limits<unsigned>::max())
            {
                llvm::errs() << "Invalid --jobs value: " << value << "\n";
                printUsage();
                return 1;
            }
            jobs = static_cast<unsigned>(parsedJobs);
        }
        else if (arg == "--dry-run")
        {
            dryRun = true;
        }
        else if (arg == "--no-overwrite")
        {
            noOverwrite = true;
        }
        else if (arg == "--file-mode")
        {
            const auto value = requireValue(arg);
            fileMode         = archwith::parseFileMode(value);
            if (!fileMode)
            {
                llvm::errs() << "Invalid --file-mode value: " << value << "\n";
                printUsage();
                return 1;
            }
        }
        else if (arg == "--write-depfiles")
        {
            writeDepfiles = true;
        }
        else if (arg == "--list-outputs")
        {
            listOutputs = true;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (helpRequested)
    {
        printHelp(command);
        return 0;
    }

    archwith::ToolConfig config;
    if (!configPath.empty())
    {
        auto loaded = archwith::loadToolConfig(configPath);
        if (!loaded)
        {
            llvm::errs() << llvm::toString(loaded.takeError()) << "\n";
            return 1;
        }
        config = std::move(*loaded);
    }

    std::vector<std::string> allInputs = config.inputs;
    allInputs.insert(allInputs.end(), inputs.begin(), inputs.end());
    if (allInputs.empty())
    {
        llvm::errs() << "At least one --input is required\n";
        return 1;
    }

    const auto                 startTime = std::chrono::steady_clock::now();
    archwith::DiagnosticEngine diagnostics;

    auto ast = archwith::parseMirrorFiles(allInputs, diagnostics);
    if (!ast)
    {
        llvm::consumeError(ast.takeError());
        printDiagnostics(diagnostics);
        return 1;
    }

    if (command == "ast")
    {
        llvm::outs() << archwith::printAST(*ast);
        printDiagnostics(diagnostics);
        return diagnostics.hasErrors() ? 1 : 0;
    }

    const unsigned effectiveJobs = jobs.value_or(config.jobs.value_or(1U));

    if (command == "table")
    {
        std::vector<archwith::FieldMappingTable> tables;
        for (auto& compilation : archwith::compileMirrors(*ast, effectiveJobs))
        {
            diagnostics.append(compilation.diagnostics);
            if (compilation.table)
            {
                tables.push_back(std::move(*compilation.table));
            }
        }
        llvm::outs() << archwith::renderMappingTablesJson(tables);
        printDiagnostics(diagnostics);
        return diagnostics.hasErrors() ? 1 : 0;
    }

    const std::string resolvedOutDir = outDir.value_or(config.outDir.value_or(""));
    if (resolvedOutDir.empty())
    {
        llvm::errs() << "--out-dir is required for 'cpp' command\n";
        return 1;
    }

    std::vector<std::string>        recordedOutputs;
    archwith::CppAdapterEmitOptions options;
    options.outDir                      = resolvedOutDir;
    options.jobs                        = effectiveJobs;
    options.writeDepfiles               = writeDepfiles.value_or(config.writeDepfiles.value_or(false));
    options.writePolicy.dryRun          = dryRun.value_or(config.dryRun.value_or(false));
    options.writePolicy.noOverwrite     = noOverwrite.value_or(config.noOverwrite.value_or(false));
    options.writePolicy.fileMode        = fileMode.value_or(config.fileMode.value_or(0444U));
    options.writePolicy.recordedOutputs = &recordedOutputs;

    archwith::CppAdapterEmitSummary summary;
    if (llvm::Error err = archwith::emitCppAdapters(*ast, options, diagnostics, &summary))
    {
        llvm::errs() << llvm::toString(std::move(err)) << "\n";
        printDiagnostics(diagnostics);
        return 1;
    }

    if (listOutputs)
    {
        for (const auto& path : recordedOutputs)
        {
            llvm::outs() << path << "\n";
        }
    }

    printDiagnostics(diagnostics);
    printRunSummary(command,
                    resolveOutputRoot(resolvedOutDir),
                    summary.filesWritten,
                    summary,
                    std::chrono::steady_clock::now() - startTime);
    return diagnostics.hasErrors() ? 1 : 0;
}
