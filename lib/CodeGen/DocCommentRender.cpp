//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements doc-comment rendering for the C++, C#, and Go backends.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/DocCommentRender.h"

#include "llvm/ADT/SmallVector.h"

namespace llvmmeta
{
namespace
{

std::vector<std::string> splitLines(const llvm::StringRef text)
{
    llvm::SmallVector<llvm::StringRef, 8> parts;
    text.split(parts, '\n');
    std::vector<std::string> out;
    for (const auto part : parts)
    {
        out.push_back(part.rtrim().str());
    }
    return out;
}

void appendCommentLine(std::vector<std::string>& out, const llvm::StringRef prefix, const std::string& text)
{
    if (text.empty())
    {
        out.push_back(prefix.str());
        return;
    }
    out.push_back(prefix.str() + " " + text);
}

}  // namespace

std::string escapeXmlText(const llvm::StringRef text)
{
    std::string out;
    out.reserve(text.size());
    for (const char c : text)
    {
        switch (c)
        {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

std::vector<std::string> renderDocComment(const DocCommentStyle style, const Description& description)
{
    std::vector<std::string> out;
    if (description.empty())
    {
        return out;
    }

    switch (style)
    {
    case DocCommentStyle::Doxygen:
    {
        const auto summary = splitLines(description.summary);
        for (std::size_t i = 0; i < summary.size(); ++i)
        {
            appendCommentLine(out, "///", i == 0 ? "@brief " + summary[i] : summary[i]);
        }
        for (const auto& remark : description.remarks)
        {
            out.emplace_back("///");
            for (const auto& line : splitLines(remark))
            {
                appendCommentLine(out, "///", line);
            }
        }
        break;
    }
    case DocCommentStyle::CSharpXml:
    {
        out.emplace_back("/// <summary>");
        for (const auto& line : splitLines(description.summary))
        {
            appendCommentLine(out, "///", escapeXmlText(line));
        }
        out.emplace_back("/// </summary>");
        if (!description.remarks.empty())
        {
            out.emplace_back("/// <remarks>");
            for (const auto& remark : description.remarks)
            {
                out.emplace_back("/// <para>");
                for (const auto& line : splitLines(remark))
                {
                    appendCommentLine(out, "///", escapeXmlText(line));
                }
                out.emplace_back("/// </para>");
            }
            out.emplace_back("/// </remarks>");
        }
        break;
    }
    case DocCommentStyle::GoLine:
    {
        for (const auto& line : splitLines(description.summary))
        {
            appendCommentLine(out, "//", line);
        }
        for (const auto& remark : description.remarks)
        {
            out.emplace_back("//");
            for (const auto& line : splitLines(remark))
            {
                appendCommentLine(out, "//", line);
            }
        }
        break;
    }
    }
    return out;
}

}  // namespace llvmmeta
