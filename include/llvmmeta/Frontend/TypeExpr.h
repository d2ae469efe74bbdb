//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Parser for type-annotation expressions such as `Optional[List[Point]]`.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_FRONTEND_TYPE_EXPR_H
#define LLVMMETA_FRONTEND_TYPE_EXPR_H

#include "llvmmeta/Semantics/Model.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace llvmmeta
{

/// @brief Parses one type-annotation expression.
///
/// @details
/// Accepted grammar: `expr := name | "List" "[" expr "]" | "Optional" "[" expr "]"`,
/// where `name` is a primitive spelling or a named-type identifier. Blanks
/// around tokens are ignored. Whether the nesting is supported by the codecs is
/// checked later by semantic analysis.
///
/// @param[in] text Expression text.
/// @return Parsed annotation or a descriptive syntax error.
llvm::Expected<TypeAnnotation> parseTypeExpression(llvm::StringRef text);

}  // namespace llvmmeta

#endif  // LLVMMETA_FRONTEND_TYPE_EXPR_H
