//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Source location primitives shared by model loading, diagnostics, and semantic analysis.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_FRONTEND_SOURCE_LOCATION_H
#define LLVMMETA_FRONTEND_SOURCE_LOCATION_H

#include <string>

namespace llvmmeta
{

/// @file
/// @brief Source location primitives shared across frontend and diagnostics.

/// @brief Identifies one element of a meta-model input document.
///
/// @details
/// Meta-models are JSON documents, so positions are expressed as element
/// paths (for example `types[2].properties[0]`) rather than line/column pairs.
struct SourceLocation
{
    /// @brief Path to the model file.
    std::string file;

    /// @brief Element path inside the model document; empty for the document itself.
    std::string element;

    /// @brief Formats this location as a human-readable string.
    /// @return Formatted location text.
    [[nodiscard]] std::string str() const;

    /// @brief Returns a location for a child element.
    /// @param[in] child Child path component, either `.name` or `[index]` form.
    /// @return Location of the child element in the same file.
    [[nodiscard]] SourceLocation child(const std::string& child) const;
};

}  // namespace llvmmeta

#endif  // LLVMMETA_FRONTEND_SOURCE_LOCATION_H
