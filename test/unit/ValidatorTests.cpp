//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <llvm/Support/Error.h>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "archwith/Directives/DirectiveModel.h"
#include "archwith/Frontend/Lexer.h"
#include "archwith/Frontend/Parser.h"
#include "archwith/Semantics/IRBuilder.h"
#include "archwith/Semantics/Validator.h"
#include "archwith/Support/Diagnostics.h"

namespace
{

/// Runs parser, directives and IR builder over one declaration.
std::optional<archwith::TypeSpec> buildSpec(const std::string& text, archwith::DiagnosticEngine& diag)
{
    archwith::Lexer  lexer("validate.mirror", text);
    archwith::Parser parser("validate.mirror", lexer.lex(), diag);
    const auto       file = parser.parseFile();
    if (diag.hasErrors() || file.mirrors.size() != 1)
    {
        std::cerr << "validator fixture failed to parse:\n" << text;
        return std::nullopt;
    }
    auto model = archwith::parseDirectives(file.mirrors.front(), diag);
    if (!model)
    {
        std::cerr << "validator fixture directives failed: " << llvm::toString(model.takeError()) << "\n";
        return std::nullopt;
    }
    auto spec = archwith::buildTypeSpec(file, file.mirrors.front(), *model, diag);
    if (!spec)
    {
        std::cerr << "validator fixture IR failed: " << llvm::toString(spec.takeError()) << "\n";
        return std::nullopt;
    }
    return std::move(*spec);
}

bool expectRejected(const std::string& text, archwith::DiagnosticKind kind, std::size_t expectedCount = 1)
{
    archwith::DiagnosticEngine diag;
    const auto                 spec = buildSpec(text, diag);
    if (!spec)
    {
        return false;
    }
    auto table = archwith::validate(*spec, diag);
    if (table)
    {
        std::cerr << "expected validation to fail with " << archwith::diagnosticKindName(kind).str() << "\n";
        return false;
    }
    llvm::consumeError(table.takeError());
    if (diag.count(kind) != expectedCount)
    {
        std::cerr << "expected " << expectedCount << " " << archwith::diagnosticKindName(kind).str()
                  << " diagnostic(s), got " << diag.count(kind) << "\n";
        return false;
    }
    return true;
}

}  // namespace

bool runValidatorTests()
{
    {
        const std::string text = "namespace app\n"
                                 "{\n"
                                 "[[archive_with(from(::remote::Widget, ::remote::WidgetV2))]]\n"
                                 "struct Widget\n"
                                 "{\n"
                                 "    std::int32_t id;\n"
                                 "    [[archive_with(from(::remote::Color), via(::conv::AsRgb))]] Rgb color;\n"
                                 "    [[archive_with(getter = \"::remote::Widget::label\")]] std::string label;\n"
                                 "    [[archive_with(getter = \"::remote::takeTags\", getter_owned)]] Tags tags;\n"
                                 "};\n"
                                 "}\n";

        archwith::DiagnosticEngine diag;
        const auto                 spec = buildSpec(text, diag);
        if (!spec)
        {
            return false;
        }
        auto table = archwith::validate(*spec, diag);
        if (!table)
        {
            std::cerr << "valid mirror failed validation: " << llvm::toString(table.takeError()) << "\n";
            for (const auto& d : diag.diagnostics())
            {
                std::cerr << "  " << archwith::formatDiagnostic(d) << "\n";
            }
            return false;
        }
        if (table->fields.size() != 4 || table->header.remoteTypes.size() != 2)
        {
            std::cerr << "validated table lost fields or remote types\n";
            return false;
        }
        if (table->fields[0].access != archwith::FieldAccessKind::DirectField || !table->fields[0].reconstructable ||
            table->fields[1].access != archwith::FieldAccessKind::DirectField ||
            table->fields[2].access != archwith::FieldAccessKind::GetterByReference ||
            table->fields[2].reconstructable ||
            table->fields[3].access != archwith::FieldAccessKind::GetterOwned)
        {
            std::cerr << "access kinds or reconstructability mismatch\n";
            return false;
        }
        if (table->fullyReconstructable)
        {
            std::cerr << "a getter field should make the table not fully reconstructable\n";
            return false;
        }
        if (table->fields[1].spec.converter.kind != archwith::ConverterKind::Explicit ||
            table->fields[1].spec.converter.spelling != "::conv::AsRgb")
        {
            std::cerr << "validator must not change the inferred converter\n";
            return false;
        }
        if (std::string(archwith::fieldAccessKindName(table->fields[3].access)) != "getter-owned" ||
            std::string(archwith::converterKindName(table->fields[1].spec.converter.kind)) != "explicit")
        {
            std::cerr << "kind names mismatch\n";
            return false;
        }
    }

    {
        archwith::DiagnosticEngine diag;
        const auto spec = buildSpec("[[archive_with(from(::r::Empty))]] struct Unit {};\n", diag);
        if (!spec)
        {
            return false;
        }
        auto table = archwith::validate(*spec, diag);
        if (!table || !table->fields.empty() || !table->fullyReconstructable)
        {
            if (!table)
            {
                llvm::consumeError(table.takeError());
            }
            std::cerr << "unit mirror should validate and be reconstructable\n";
            return false;
        }
    }

    bool ok = true;
    ok = expectRejected("struct NoRemote { int v; };\n", archwith::DiagnosticKind::MissingRemoteType) && ok;
    ok = expectRejected("[[archive_with(from(::r::A, ::r::B))]] [[archive_with(from(::r::A))]]\n"
                        "struct Twice { int v; };\n",
                        archwith::DiagnosticKind::DuplicateRemoteType) &&
         ok;
    // Global qualification and whitespace do not make a different type.
    ok = expectRejected("[[archive_with(from(::rp::Pair, rp::Pair))]] struct Pair { int x; };\n",
                        archwith::DiagnosticKind::DuplicateRemoteType) &&
         ok;
    ok = expectRejected("[[archive_with(from(::rp::Box<::rp::Pair, int>, rp::Box< rp::Pair,int >))]]\n"
                        "struct Box { int x; };\n",
                        archwith::DiagnosticKind::DuplicateRemoteType) &&
         ok;

    {
        // Distinct types whose unit slugs collide are still two remotes.
        archwith::DiagnosticEngine diag;
        const auto spec = buildSpec("[[archive_with(from(::a::B_c, ::a_B::c))]] struct Slugged { int x; };\n", diag);
        if (!spec)
        {
            return false;
        }
        auto table = archwith::validate(*spec, diag);
        if (!table || diag.count(archwith::DiagnosticKind::DuplicateRemoteType) != 0)
        {
            if (!table)
            {
                llvm::consumeError(table.takeError());
            }
            std::cerr << "distinct remote types must not be reported as duplicates\n";
            return false;
        }
    }

    {
        archwith::DiagnosticEngine diag;
        const auto spec = buildSpec("[[archive_with(from(::rp::Pair))]]\n"
                                    "[[archive_with(from(rp::Pair))]] struct Pair { int x; };\n",
                                    diag);
        if (!spec)
        {
            return false;
        }
        auto table = archwith::validate(*spec, diag);
        if (table)
        {
            std::cerr << "respelled remote type should be rejected\n";
            return false;
        }
        llvm::consumeError(table.takeError());
        const auto& diagnostics = diag.diagnostics();
        if (diagnostics.size() != 1 || diagnostics.front().location.line != 2 ||
            diagnostics.front().message.find("'rp::Pair'") == std::string::npos ||
            diagnostics.front().message.find("validate.mirror:1:") == std::string::npos)
        {
            std::cerr << "duplicate remote diagnostic should point at the second spelling and name the first\n";
            return false;
        }
    }

    ok = expectRejected("[[archive_with(from(::r::A))]] struct Owned { [[archive_with(getter_owned)]] int v; };\n",
                        archwith::DiagnosticKind::GetterOwnedWithoutGetter) &&
         ok;
    ok = expectRejected("[[archive_with(from(::r::A))]] struct Prim {\n"
                        "  [[archive_with(from(std::uint64_t))]] std::uint32_t narrowed;\n"
                        "  [[archive_with(from(long))]] int widened;\n"
                        "};\n",
                        archwith::DiagnosticKind::AmbiguousConversion,
                        2) &&
         ok;
    ok = expectRejected("[[archive_with(from(::r::A))]] struct ViaPtr {\n"
                        "  [[archive_with(via(::conv::Thing*))]] int v;\n"
                        "};\n",
                        archwith::DiagnosticKind::AmbiguousConversion) &&
         ok;

    {
        // All checks run in one pass.
        archwith::DiagnosticEngine diag;
        const auto spec = buildSpec("struct Many {\n"
                                    "  [[archive_with(getter_owned)]] int a;\n"
                                    "  [[archive_with(from(int))]] long b;\n"
                                    "};\n",
                                    diag);
        if (!spec)
        {
            return false;
        }
        auto table = archwith::validate(*spec, diag);
        if (table)
        {
            std::cerr << "expected combined validation failure\n";
            return false;
        }
        llvm::consumeError(table.takeError());
        if (diag.count(archwith::DiagnosticKind::MissingRemoteType) != 1 ||
            diag.count(archwith::DiagnosticKind::GetterOwnedWithoutGetter) != 1 ||
            diag.count(archwith::DiagnosticKind::AmbiguousConversion) != 1)
        {
            std::cerr << "validator should report every problem of a type at once\n";
            return false;
        }
    }

    if (!archwith::isNonClassTypeSpelling("unsigned long") || !archwith::isNonClassTypeSpelling("::std::size_t") ||
        !archwith::isNonClassTypeSpelling("const Foo") || !archwith::isNonClassTypeSpelling("Foo&") ||
        !archwith::isNonClassTypeSpelling("int[4]") || archwith::isNonClassTypeSpelling("::conv::AsString") ||
        archwith::isNonClassTypeSpelling("std::vector<int*>") || archwith::isNonClassTypeSpelling("Inner"))
    {
        std::cerr << "isNonClassTypeSpelling classification mismatch\n";
        return false;
    }

    return ok;
}
