//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection and formatting helpers.
///
/// The diagnostic engine records source-aware notes, warnings, and errors. Each mirror type's pipeline owns one
/// engine; the driver merges them in declaration order.
///
//===----------------------------------------------------------------------===//

#include "archwith/Support/Diagnostics.h"

#include <algorithm>
#include <utility>

namespace archwith
{

llvm::StringRef diagnosticKindName(const DiagnosticKind kind)
{
    switch (kind)
    {
    case DiagnosticKind::Generic:
        return "Generic";
    case DiagnosticKind::Syntax:
        return "Syntax";
    case DiagnosticKind::DuplicateField:
        return "DuplicateField";
    case DiagnosticKind::MissingRemoteType:
        return "MissingRemoteType";
    case DiagnosticKind::DuplicateRemoteType:
        return "DuplicateRemoteType";
    case DiagnosticKind::GetterOwnedWithoutGetter:
        return "GetterOwnedWithoutGetter";
    case DiagnosticKind::AmbiguousConversion:
        return "AmbiguousConversion";
    case DiagnosticKind::NotReconstructable:
        return "NotReconstructable";
    }
    return "Generic";
}

void DiagnosticEngine::report(DiagnosticLevel       level,
                              const SourceLocation& location,
                              std::string           message,
                              const DiagnosticKind  kind,
                              const std::uint32_t   length)
{
    diagnostics_.push_back(Diagnostic{level, location, std::move(message), kind, std::max<std::uint32_t>(1, length)});
}

void DiagnosticEngine::note(const SourceLocation& location, std::string message, const DiagnosticKind kind)
{
    report(DiagnosticLevel::Note, location, std::move(message), kind);
}

void DiagnosticEngine::warning(const SourceLocation& location, std::string message, const DiagnosticKind kind)
{
    report(DiagnosticLevel::Warning, location, std::move(message), kind);
}

void DiagnosticEngine::error(const SourceLocation& location, std::string message, const DiagnosticKind kind)
{
    report(DiagnosticLevel::Error, location, std::move(message), kind);
}

void DiagnosticEngine::append(const DiagnosticEngine& other)
{
    diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

bool DiagnosticEngine::hasErrors() const
{
    for (const Diagnostic& d : diagnostics_)
    {
        if (d.level == DiagnosticLevel::Error)
        {
            return true;
        }
    }
    return false;
}

std::size_t DiagnosticEngine::count(const DiagnosticKind kind) const
{
    return static_cast<std::size_t>(
        std::count_if(diagnostics_.begin(), diagnostics_.end(), [kind](const Diagnostic& d) { return d.kind == kind; }));
}

std::string formatDiagnostic(const Diagnostic& diagnostic)
{
    llvm::StringRef level = "note";
    if (diagnostic.level == DiagnosticLevel::Warning)
    {
        level = "warning";
    }
    else if (diagnostic.level == DiagnosticLevel::Error)
    {
        level = "error";
    }
    std::string out = diagnostic.location.str() + ": " + level.str() + ": " + diagnostic.message;
    if (diagnostic.kind != DiagnosticKind::Generic)
    {
        out += " [" + diagnosticKindName(diagnostic.kind).str() + "]";
    }
    return out;
}

}  // namespace archwith
