//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations for diagnostic reporting interfaces used across model loading, semantics, and code generation.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_SUPPORT_DIAGNOSTICS_H
#define LLVMMETA_SUPPORT_DIAGNOSTICS_H

#include "llvmmeta/Frontend/SourceLocation.h"

#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <string>
#include <vector>

namespace llvmmeta
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

/// @brief Single diagnostic record produced by the pipeline.
struct Diagnostic
{
    /// @brief Severity level.
    DiagnosticLevel level;

    /// @brief Source location associated with the message.
    SourceLocation location;

    /// @brief Human-readable message text.
    std::string message;
};

/// @brief Returns the lower-case label of a diagnostic level.
/// @param[in] level Severity level.
/// @return `note`, `warning`, or `error`.
llvm::StringRef diagnosticLevelName(DiagnosticLevel level);

/// @brief Accumulates diagnostics emitted across all pipeline stages.
///
/// @details
/// Stages never stop at the first problem: every finding is appended here and
/// the stage fails only after its full pass, so one run reports everything.
class DiagnosticEngine final
{
public:
    /// @brief Appends a diagnostic entry.
    /// @param[in] level Severity level.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void report(DiagnosticLevel level, const SourceLocation& location, std::string message);

    /// @brief Emits a note-level diagnostic.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void note(const SourceLocation& location, std::string message);

    /// @brief Emits a warning-level diagnostic.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void warning(const SourceLocation& location, std::string message);

    /// @brief Emits an error-level diagnostic.
    /// @param[in] location Source location associated with the message.
    /// @param[in] message Human-readable message text.
    void error(const SourceLocation& location, std::string message);

    /// @brief Indicates whether any error diagnostics were recorded.
    /// @return True when at least one error exists.
    [[nodiscard]] bool hasErrors() const;

    /// @brief Counts error-level diagnostics.
    /// @return Number of recorded errors.
    [[nodiscard]] std::size_t errorCount() const;

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

}  // namespace llvmmeta

#endif  // LLVMMETA_SUPPORT_DIAGNOSTICS_H
