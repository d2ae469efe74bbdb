//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Markdown API documentation backend.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_DOCEMITTER_H
#define LLVMMETA_CODEGEN_DOCEMITTER_H

#include "llvmmeta/CodeGen/EmitCommon.h"

#include "llvm/Support/Error.h"

#include <string>

namespace llvmmeta
{
class DiagnosticEngine;
struct MetaModel;

/// @brief Configuration options for documentation generation.
struct DocEmitOptions final
{
    /// @brief Output directory root.
    std::string outDir;

    /// @brief Output write policy.
    EmitWritePolicy writePolicy;
};

/// @brief Renders the Markdown reference of an analyzed model.
/// @param[in] model Analyzed model.
/// @return Markdown document text.
std::string renderModelMarkdown(const MetaModel& model);

/// @brief Writes `<snake model name>.md` into @ref DocEmitOptions::outDir.
/// @param[in] model Analyzed model.
/// @param[in] options Backend configuration.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Success or detailed failure.
llvm::Error emitDocs(const MetaModel& model, const DocEmitOptions& options, DiagnosticEngine& diagnostics);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_DOCEMITTER_H
