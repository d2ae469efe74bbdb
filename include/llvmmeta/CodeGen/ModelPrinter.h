//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Resolved meta-model pretty-printing for the `model` command.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_MODEL_PRINTER_H
#define LLVMMETA_CODEGEN_MODEL_PRINTER_H

#include <string>

namespace llvmmeta
{
struct MetaModel;

/// @brief Produces a human-readable listing of an analyzed model.
///
/// @details
/// Lists every named type with its resolved relationships, every property
/// with its JSON name and codec strategy, and every synthesized interface with
/// its implementers and their discriminators.
///
/// @param[in] model Analyzed model.
/// @return Pretty-printed model text.
std::string printModel(const MetaModel& model);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_MODEL_PRINTER_H
