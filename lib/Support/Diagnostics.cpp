//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic collection helpers.
///
/// The diagnostic engine records model-aware notes, warnings, and errors consumed throughout the pipeline.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/Support/Diagnostics.h"

#include <algorithm>
#include <utility>

namespace llvmmeta
{

llvm::StringRef diagnosticLevelName(const DiagnosticLevel level)
{
    switch (level)
    {
    case DiagnosticLevel::Note:
        return "note";
    case DiagnosticLevel::Warning:
        return "warning";
    case DiagnosticLevel::Error:
        return "error";
    }
    return "error";
}

void DiagnosticEngine::report(DiagnosticLevel level, const SourceLocation& location, std::string message)
{
    diagnostics_.push_back(Diagnostic{level, location, std::move(message)});
}

void DiagnosticEngine::note(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Note, location, std::move(message));
}

void DiagnosticEngine::warning(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Warning, location, std::move(message));
}

void DiagnosticEngine::error(const SourceLocation& location, std::string message)
{
    report(DiagnosticLevel::Error, location, std::move(message));
}

bool DiagnosticEngine::hasErrors() const
{
    return errorCount() != 0U;
}

std::size_t DiagnosticEngine::errorCount() const
{
    return static_cast<std::size_t>(std::count_if(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic& d) {
        return d.level == DiagnosticLevel::Error;
    }));
}

}  // namespace llvmmeta
