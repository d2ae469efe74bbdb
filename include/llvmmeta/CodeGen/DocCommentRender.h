//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Rendering of model descriptions as doc comments of generated code.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_DOC_COMMENT_RENDER_H
#define LLVMMETA_CODEGEN_DOC_COMMENT_RENDER_H

#include "llvmmeta/Semantics/Model.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace llvmmeta
{

/// @brief Doc-comment convention of a target language.
enum class DocCommentStyle
{
    /// @brief `///` lines with `@brief`.
    Doxygen,

    /// @brief `///` lines with XML `<summary>` and `<remarks>`.
    CSharpXml,

    /// @brief Plain `//` lines.
    GoLine,
};

/// @brief Escapes `&`, `<` and `>` for XML doc comments.
/// @param[in] text Raw text.
/// @return Escaped text.
std::string escapeXmlText(llvm::StringRef text);

/// @brief Renders a description as comment lines without indentation.
/// @param[in] style Target convention.
/// @param[in] description Description to render.
/// @return Comment lines; empty for an empty description.
std::vector<std::string> renderDocComment(DocCommentStyle style, const Description& description);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_DOC_COMMENT_RENDER_H
