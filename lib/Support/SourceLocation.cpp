//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements source-location rendering helpers.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/Frontend/SourceLocation.h"

namespace llvmmeta
{

std::string SourceLocation::str() const
{
    if (element.empty())
    {
        return file;
    }
    return file + ":" + element;
}

SourceLocation SourceLocation::child(const std::string& child) const
{
    SourceLocation out{file, element};
    if (!child.empty() && child.front() == '.' && out.element.empty())
    {
        out.element = child.substr(1);
    }
    else
    {
        out.element += child;
    }
    return out;
}

}  // namespace llvmmeta
