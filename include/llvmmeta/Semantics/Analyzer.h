//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Semantic analysis of loaded meta-models.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_SEMANTICS_ANALYZER_H
#define LLVMMETA_SEMANTICS_ANALYZER_H

#include "llvmmeta/Semantics/Model.h"

#include "llvm/Support/Error.h"

namespace llvmmeta
{
class DiagnosticEngine;

/// @file
/// @brief Semantic analysis entry points.

/// @brief Options that control semantic-analysis policy checks.
struct AnalyzeOptions final
{
    /// @brief Treat warnings (unreachable abstract classes, ignored defaults) as errors.
    bool warningsAsErrors{false};
};

/// @brief Indicates whether the codecs support an annotation shape.
///
/// @details
/// Supported shapes are `Atomic`, `List[Atomic]`, `Optional[Atomic]` and
/// `Optional[List[Atomic]]`, where `Atomic` is a primitive or a named type.
///
/// @param[in] annotation Annotation to inspect.
/// @return True for supported shapes.
bool isSupportedTypeAnnotation(const TypeAnnotation& annotation);

/// @brief Resolves relationships and validates a loaded model.
///
/// @details
/// Computes ancestors and descendants, synthesizes interfaces, decides which
/// classes carry the discriminator, and reports every invariant violation
/// before failing.
///
/// @param[in] model Loaded model.
/// @param[in,out] diagnostics Diagnostic sink for semantic issues.
/// @return Resolved model on success.
llvm::Expected<MetaModel> analyze(MetaModel model, DiagnosticEngine& diagnostics);

/// @brief Resolves relationships and validates a loaded model with options.
/// @param[in] model Loaded model.
/// @param[in,out] diagnostics Diagnostic sink for semantic issues.
/// @param[in] options Semantic policy options.
/// @return Resolved model on success.
llvm::Expected<MetaModel> analyze(MetaModel model, DiagnosticEngine& diagnostics, const AnalyzeOptions& options);

}  // namespace llvmmeta

#endif  // LLVMMETA_SEMANTICS_ANALYZER_H
