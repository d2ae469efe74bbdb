//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Literal rendering of constructor-argument defaults for the code backends.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_DEFAULT_LITERAL_RENDER_H
#define LLVMMETA_CODEGEN_DEFAULT_LITERAL_RENDER_H

#include "llvmmeta/Semantics/Model.h"

#include "llvm/Support/JSON.h"

#include <string>

namespace llvmmeta
{

/// @brief Target language for default-literal rendering.
enum class DefaultLiteralLanguage
{
    /// @brief C++ literal syntax.
    Cpp,

    /// @brief C# literal syntax.
    CSharp,

    /// @brief Go literal syntax.
    Go,
};

/// @brief Renders a primitive default value as source code for one language.
///
/// @details
/// The value has been checked against @p primitive by semantic analysis. The
/// rendered expression has exactly the type the backend maps @p primitive to.
///
/// @param[in] language Target language syntax.
/// @param[in] primitive Primitive kind of the covered property.
/// @param[in] value Default value.
/// @return Rendered expression.
std::string renderDefaultLiteral(DefaultLiteralLanguage language, PrimitiveType primitive, const llvm::json::Value& value);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_DEFAULT_LITERAL_RENDER_H
