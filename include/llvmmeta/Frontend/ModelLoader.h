//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Loading of JSON meta-model documents into the unresolved @ref llvmmeta::MetaModel.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_FRONTEND_MODEL_LOADER_H
#define LLVMMETA_FRONTEND_MODEL_LOADER_H

#include "llvmmeta/Semantics/Model.h"
#include "llvmmeta/Support/Diagnostics.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace llvmmeta
{

/// @brief Parses a meta-model document held in memory.
///
/// @details
/// Structural problems (wrong JSON kinds, missing names, bad type expressions)
/// are reported per element and loading continues, so one call reports every
/// malformed element. Relationships between types are not checked here; see
/// @ref analyze.
///
/// @param[in] text JSON document text.
/// @param[in] sourcePath Path used in diagnostics and recorded on the model.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Loaded model, or an error when any element was malformed.
llvm::Expected<MetaModel> loadModelFromText(llvm::StringRef    text,
                                            const std::string& sourcePath,
                                            DiagnosticEngine&  diagnostics);

/// @brief Reads and parses a meta-model file.
/// @param[in] path Model file path.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Loaded model, or an I/O or load error.
llvm::Expected<MetaModel> loadModelFile(const std::string& path, DiagnosticEngine& diagnostics);

}  // namespace llvmmeta

#endif  // LLVMMETA_FRONTEND_MODEL_LOADER_H
