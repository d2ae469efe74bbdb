//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// C++ backend emission entry points.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_CPPEMITTER_H
#define LLVMMETA_CODEGEN_CPPEMITTER_H

#include "llvmmeta/CodeGen/EmitCommon.h"

#include <string>

#include "llvm/Support/Error.h"

namespace llvmmeta
{
class DiagnosticEngine;
struct JsonizationPlan;
struct MetaModel;

/// @brief Configuration options for C++ code generation.
struct CppEmitOptions final
{
    /// @brief Output directory root.
    std::string outDir;

    /// @brief Namespace of the generated code, `::`-separated; derived from the model name when empty.
    std::string cppNamespace;

    /// @brief Output write policy.
    EmitWritePolicy writePolicy;
};

/// @brief Returns the namespace used when no explicit one is configured.
/// @param[in] model Analyzed model.
/// @return Snake-case model name.
std::string defaultCppNamespace(const MetaModel& model);

/// @brief Emits C++ types, stringification, jsonization, and the runtime header.
///
/// @details
/// Files are written directly into @ref CppEmitOptions::outDir:
/// `types.hpp`, `stringification.hpp`, `stringification.cpp`,
/// `jsonization.hpp`, `jsonization.cpp`, and `llvmmeta_runtime.hpp`.
///
/// @param[in] model Analyzed model.
/// @param[in] plan Codec plan built with the `cpp` fragment extension.
/// @param[in] options Backend configuration.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Success or detailed failure.
llvm::Error emitCpp(const MetaModel&       model,
                    const JsonizationPlan& plan,
                    const CppEmitOptions&  options,
                    DiagnosticEngine&      diagnostics);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_CPPEMITTER_H
