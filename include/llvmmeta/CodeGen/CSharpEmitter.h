//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// C# backend emission entry points.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_CSHARPEMITTER_H
#define LLVMMETA_CODEGEN_CSHARPEMITTER_H

#include "llvmmeta/CodeGen/EmitCommon.h"

#include <string>

#include "llvm/Support/Error.h"

namespace llvmmeta
{
class DiagnosticEngine;
struct JsonizationPlan;
struct MetaModel;

/// @brief Configuration options for C# code generation.
struct CSharpEmitOptions final
{
    /// @brief Output directory root.
    std::string outDir;

    /// @brief Namespace of the generated code; derived from the model name when empty.
    std::string csharpNamespace;

    /// @brief Output write policy.
    EmitWritePolicy writePolicy;
};

/// @brief Returns the namespace used when no explicit one is configured.
/// @param[in] model Analyzed model.
/// @return Capital-camel model name.
std::string defaultCSharpNamespace(const MetaModel& model);

/// @brief Emits C# types, stringification, jsonization, and the reporting runtime.
///
/// @details
/// Files are written directly into @ref CSharpEmitOptions::outDir:
/// `Types.cs`, `Stringification.cs`, `Jsonization.cs`, and `Reporting.cs`.
///
/// @param[in] model Analyzed model.
/// @param[in] plan Codec plan built with the `cs` fragment extension.
/// @param[in] options Backend configuration.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Success or detailed failure.
llvm::Error emitCSharp(const MetaModel&         model,
                       const JsonizationPlan&   plan,
                       const CSharpEmitOptions& options,
                       DiagnosticEngine&        diagnostics);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_CSHARPEMITTER_H
