//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "archwith/Frontend/AST.h"
#include "archwith/Frontend/ASTPrinter.h"
#include "archwith/Frontend/Lexer.h"
#include "archwith/Frontend/Parser.h"
#include "archwith/Support/Diagnostics.h"

namespace
{

archwith::MirrorFileAST parseText(const std::string& text, archwith::DiagnosticEngine& diag)
{
    archwith::Lexer  lexer("test.mirror", text);
    archwith::Parser parser("test.mirror", lexer.lex(), diag);
    return parser.parseFile();
}

bool runLexerChecks()
{
    archwith::Lexer lexer("lex.mirror", "a::b<c, 42> // trailing\n/* block */ \"s\\\"q\"");
    const auto      tokens = lexer.lex();

    const std::vector<archwith::TokenKind> expected = {archwith::TokenKind::Identifier,
                                                       archwith::TokenKind::Scope,
                                                       archwith::TokenKind::Identifier,
                                                       archwith::TokenKind::Less,
                                                       archwith::TokenKind::Identifier,
                                                       archwith::TokenKind::Comma,
                                                       archwith::TokenKind::Integer,
                                                       archwith::TokenKind::Greater,
                                                       archwith::TokenKind::String,
                                                       archwith::TokenKind::Eof};
    if (tokens.size() != expected.size())
    {
        std::cerr << "unexpected token count: " << tokens.size() << "\n";
        return false;
    }
    for (std::size_t i = 0; i < expected.size(); ++i)
    {
        if (tokens[i].kind != expected[i])
        {
            std::cerr << "unexpected token kind at index " << i << "\n";
            return false;
        }
    }
    if (tokens[8].text != "s\"q" || tokens[8].location.line != 2)
    {
        std::cerr << "string literal was not unescaped or located correctly\n";
        return false;
    }

    std::vector<archwith::Token> spelled(tokens.begin(), tokens.begin() + 8);
    if (archwith::spellTokens(spelled) != "a::b<c, 42>")
    {
        std::cerr << "spellTokens mismatch: " << archwith::spellTokens(spelled) << "\n";
        return false;
    }

    archwith::Lexer wordLexer("lex.mirror", "unsigned   long\tint");
    auto            words = wordLexer.lex();
    words.pop_back();
    if (archwith::spellTokens(words) != "unsigned long int")
    {
        std::cerr << "spellTokens did not separate adjacent words\n";
        return false;
    }
    return true;
}

bool runWellFormedFileChecks()
{
    const std::string text = "#include \"remote/geometry.hpp\"\n"
                             "#include <string>\n"
                             "\n"
                             "namespace geo::mirror\n"
                             "{\n"
                             "\n"
                             "[[archive_with(from(::remote::Point))]]\n"
                             "struct Point\n"
                             "{\n"
                             "    std::int32_t x;\n"
                             "    std::int32_t y;\n"
                             "};\n"
                             "\n"
                             "template <typename T>\n"
                             "[[archive_with(from(::remote::Tagged<T>))]]\n"
                             "struct Tagged\n"
                             "{\n"
                             "    [[archive_with(from(::remote::Point), via(::geo::mirror::Point))]] Point where;\n"
                             "    T tag;\n"
                             "};\n"
                             "\n"
                             "}  // namespace geo::mirror\n";

    archwith::DiagnosticEngine diag;
    const auto                 file = parseText(text, diag);
    if (diag.hasErrors())
    {
        std::cerr << "parser reported errors on a well-formed file\n";
        return false;
    }

    if (file.includes.size() != 2 || file.includes[0].target != "\"remote/geometry.hpp\"" ||
        file.includes[1].target != "<string>")
    {
        std::cerr << "include targets were not preserved with their delimiters\n";
        return false;
    }

    if (file.mirrors.size() != 2)
    {
        std::cerr << "unexpected mirror count: " << file.mirrors.size() << "\n";
        return false;
    }

    const auto& point = file.mirrors[0];
    if (point.qualifiedName() != "geo::mirror::Point" || point.fields.size() != 2 ||
        point.fields[0].type.spelling != "std::int32_t" || point.fields[1].name != "y")
    {
        std::cerr << "first mirror declaration mismatch\n";
        return false;
    }
    if (point.attributes.size() != 1 || point.attributes[0].name != "archive_with" ||
        archwith::spellTokens(point.attributes[0].arguments) != "from(::remote::Point)")
    {
        std::cerr << "type-level attribute mismatch\n";
        return false;
    }
    if (point.location.line != 8)
    {
        std::cerr << "mirror location should point at the type name\n";
        return false;
    }

    const auto& tagged = file.mirrors[1];
    if (tagged.templateParams.size() != 1 || tagged.templateParams[0].declaration != "typename T" ||
        tagged.templateParams[0].name != "T")
    {
        std::cerr << "template parameter mismatch\n";
        return false;
    }
    if (tagged.fields.size() != 2 || tagged.fields[0].attributes.size() != 1 ||
        archwith::spellTokens(tagged.fields[0].attributes[0].arguments) !=
            "from(::remote::Point), via(::geo::mirror::Point)")
    {
        std::cerr << "field attribute mismatch\n";
        return false;
    }

    archwith::ASTModule module;
    module.files.push_back(file);
    const std::string printed = archwith::printAST(module);
    if (printed.find("struct geo::mirror::Tagged<typename T> {") == std::string::npos ||
        printed.find("field Point where") == std::string::npos ||
        printed.find("include <string>") == std::string::npos)
    {
        std::cerr << "AST printer output mismatch:\n" << printed;
        return false;
    }
    return true;
}

bool runRecoveryChecks()
{
    const std::string text = "namespace a\n"
                             "{\n"
                             "[[archive_with(from(::r::A))]]\n"
                             "struct WithInitializer\n"
                             "{\n"
                             "    int x = 3;\n"
                             "};\n"
                             "\n"
                             "[[archive_with(from(::r::F))]]\n"
                             "struct WithFunction\n"
                             "{\n"
                             "    int f() { return 1; }\n"
                             "};\n"
                             "\n"
                             "[[archive_with(from(::r::B))]]\n"
                             "struct Good\n"
                             "{\n"
                             "    int y;\n"
                             "};\n"
                             "\n"
                             "struct Forward;\n"
                             "\n"
                             "[[archive_with(from(::r::C))]]\n"
                             "struct Derived : Good\n"
                             "{\n"
                             "    int z;\n"
                             "};\n"
                             "\n"
                             "[[archive_with(from(::r::D))]]\n"
                             "struct AlsoGood\n"
                             "{\n"
                             "};\n"
                             "}\n";

    archwith::DiagnosticEngine diag;
    const auto                 file = parseText(text, diag);
    if (!diag.hasErrors())
    {
        std::cerr << "expected grammar errors\n";
        return false;
    }
    if (file.mirrors.size() != 2 || file.mirrors[0].name != "Good" || file.mirrors[1].name != "AlsoGood")
    {
        std::cerr << "malformed declarations should not take their siblings down; got " << file.mirrors.size()
                  << " mirrors\n";
        return false;
    }
    if (!file.mirrors[1].fields.empty())
    {
        std::cerr << "unit mirror should have no fields\n";
        return false;
    }
    return true;
}

bool runAttributeChecks()
{
    const std::string text = "[[nodiscard]] [[archive_with(from(::r::A))]]\n"
                             "struct [[archive_with(from(::r::B))]] Both\n"
                             "{\n"
                             "    [[maybe_unused, archive_with(getter = \"::r::readX\")]] int x;\n"
                             "};\n";

    archwith::DiagnosticEngine diag;
    const auto                 file = parseText(text, diag);
    if (diag.hasErrors() || file.mirrors.size() != 1)
    {
        std::cerr << "attribute placement test failed to parse\n";
        return false;
    }
    const auto& decl = file.mirrors.front();
    if (decl.attributes.size() != 2 || decl.fields.front().attributes.size() != 1)
    {
        std::cerr << "non-archive_with attributes should be dropped, archive_with ones kept\n";
        return false;
    }
    std::size_t warnings = 0;
    for (const auto& d : diag.diagnostics())
    {
        if (d.level == archwith::DiagnosticLevel::Warning && d.message.find("ignoring attribute") != std::string::npos)
        {
            ++warnings;
        }
    }
    if (warnings != 2)
    {
        std::cerr << "expected one warning per ignored attribute, got " << warnings << "\n";
        return false;
    }
    return true;
}

bool runParseMirrorFilesChecks()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path root =
        std::filesystem::temp_directory_path() / ("archwith-parser-tests-" + std::to_string(now));
    std::error_code ec;
    std::filesystem::create_directories(root / "nested", ec);
    if (ec)
    {
        std::cerr << "failed to create temp parser test dir: " << ec.message() << "\n";
        return false;
    }
    {
        std::ofstream b(root / "nested" / "b.mirror");
        b << "[[archive_with(from(::r::B))]] struct B { int v; };\n";
        std::ofstream a(root / "a.mirror");
        a << "[[archive_with(from(::r::A))]] struct A { int v; };\n";
        std::ofstream ignored(root / "notes.txt");
        ignored << "struct Ignored {};\n";
    }

    auto cleanup = [&]() { std::filesystem::remove_all(root, ec); };

    archwith::DiagnosticEngine diag;
    auto module = archwith::parseMirrorFiles({root.string(), (root / "a.mirror").string()}, diag);
    if (!module)
    {
        std::cerr << "parseMirrorFiles failed: " << llvm::toString(module.takeError()) << "\n";
        cleanup();
        return false;
    }
    if (module->files.size() != 2 || module->files[0].mirrors.front().name != "A" ||
        module->files[1].mirrors.front().name != "B")
    {
        std::cerr << "discovery should de-duplicate inputs and order files by path\n";
        cleanup();
        return false;
    }

    archwith::DiagnosticEngine missingDiag;
    auto missing = archwith::parseMirrorFiles({(root / "does-not-exist").string()}, missingDiag);
    cleanup();
    if (missing)
    {
        std::cerr << "expected an error when no input file exists\n";
        return false;
    }
    llvm::consumeError(missing.takeError());
    if (!missingDiag.hasErrors())
    {
        std::cerr << "missing input should be reported as a diagnostic\n";
        return false;
    }
    return true;
}

}  // namespace

bool runParserTests()
{
    bool ok = true;
    ok      = runLexerChecks() && ok;
    ok      = runWellFormedFileChecks() && ok;
    ok      = runRecoveryChecks() && ok;
    ok      = runAttributeChecks() && ok;
    ok      = runParseMirrorFilesChecks() && ok;
    return ok;
}
