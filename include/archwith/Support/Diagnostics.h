//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used across the frontend, directive model, validation, and
/// code generation.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_SUPPORT_DIAGNOSTICS_H
#define ARCHWITH_SUPPORT_DIAGNOSTICS_H

#include "archwith/Frontend/SourceLocation.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"

namespace archwith
{

/// @file
/// @brief Diagnostic collection and reporting interfaces.

/// @brief Severity level for a diagnostic message.
enum class DiagnosticLevel
{

    /// @brief Informational note.
    Note,

    /// @brief Non-fatal warning.
    Warning,

    /// @brief Fatal error.
    Error,
};

/// @brief Classifies a diagnostic by the check that produced it.
enum class DiagnosticKind
{

    /// @brief Grammar, I/O, or other diagnostics without a dedicated check.
    Generic,

    /// @brief Malformed `archive_with` argument list.
    Syntax,

    /// @brief Two fields of one mirror type share a name.
    DuplicateField,

    /// @brief Type-level remote type list is absent or empty.
    MissingRemoteType,

    /// @brief The same remote type is listed more than once.
    DuplicateRemoteType,

    /// @brief `getter_owned` was given without `getter`.
    GetterOwnedWithoutGetter,

    /// @brief A converter cannot act on the declared field type.
    AmbiguousConversion,

    /// @brief Deserialization is not derivable because a getter was used.
    NotReconstructable,
};

/// @brief Returns the stable spelling of a diagnostic kind.
/// @param[in] kind Diagnostic kind.
/// @return Kind name, e.g. `MissingRemoteType`.
llvm::StringRef diagnosticKindName(DiagnosticKind kind);

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Source location associated with the message.
    SourceLocation location;

    /// @brief Human-readable message text.
    std::string message;

    /// @brief Check that produced this diagnostic.
    DiagnosticKind kind{DiagnosticKind::Generic};

    /// @brief Highlight length in source characters.
    std::uint32_t length{1};
};

/// @brief Accumulates diagnostics emitted across all compilation stages.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    /// @param[in] kind Check that produced the diagnostic.
    /// @param[in] length Highlight length in source characters.
    void report(DiagnosticLevel       level,
                const SourceLocation& location,
                std::string           message,
                DiagnosticKind        kind   = DiagnosticKind::Generic,
                std::uint32_t         length = 1);

    /// @brief Emits a note-level diagnostic.
    void note(const SourceLocation& location, std::string message, DiagnosticKind kind = DiagnosticKind::Generic);

    /// @brief Emits a warning-level diagnostic.
    void warning(const SourceLocation& location, std::string message, DiagnosticKind kind = DiagnosticKind::Generic);

    /// @brief Emits an error-level diagnostic.
    void error(const SourceLocation& location, std::string message, DiagnosticKind kind = DiagnosticKind::Generic);

    /// @brief Appends every diagnostic of another engine, preserving order.
    /// @param[in] other Engine whose records are copied.
    void append(const DiagnosticEngine& other);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Counts diagnostics of one kind.
    /// @param[in] kind Kind to count.
    /// @return Number of matching records.
    [[nodiscard]] std::size_t count(DiagnosticKind kind) const;

    /// @brief Returns all recorded diagnostics in insertion order.
    /// @return Immutable diagnostic list.
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const
    {
        return diagnostics_;
    }

private:
    /// @brief Backing storage for collected diagnostics.
    std::vector<Diagnostic> diagnostics_;
};

/// @brief Renders one diagnostic as `file:line:col: level: message`.
/// @param[in] diagnostic Diagnostic record.
/// @return Rendered line without trailing newline.
std::string formatDiagnostic(const Diagnostic& diagnostic);

}  // namespace archwith

#endif  // ARCHWITH_SUPPORT_DIAGNOSTICS_H
