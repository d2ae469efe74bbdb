//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Go backend emission entry points.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_GOEMITTER_H
#define LLVMMETA_CODEGEN_GOEMITTER_H

#include "llvmmeta/CodeGen/EmitCommon.h"

#include "llvm/Support/Error.h"

#include <string>

namespace llvmmeta
{
class DiagnosticEngine;
struct JsonizationPlan;
struct MetaModel;

/// @brief Configuration options for Go code generation.
struct GoEmitOptions final
{
    /// @brief Output directory root.
    std::string outDir;

    /// @brief Generated Go module path; derived from the model name when empty.
    std::string moduleName;

    /// @brief Emits `go.mod` when true.
    bool emitGoMod{true};

    /// @brief Output write policy.
    EmitWritePolicy writePolicy;
};

/// @brief Returns the module path used when no explicit one is configured.
/// @param[in] model Analyzed model.
/// @return Snake-case model name.
std::string defaultGoModule(const MetaModel& model);

/// @brief Emits Go packages from an analyzed model and its codec plan.
///
/// @details
/// Packages are written below @ref GoEmitOptions::outDir: `types`,
/// `stringification`, `reporting` and `jsonization`, plus `go.mod`.
///
/// @param[in] model Analyzed model.
/// @param[in] plan Codec plan built with the `go` fragment extension.
/// @param[in] options Backend configuration.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Success or detailed failure.
llvm::Error emitGo(const MetaModel&       model,
                   const JsonizationPlan& plan,
                   const GoEmitOptions&   options,
                   DiagnosticEngine&      diagnostics);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_GOEMITTER_H
