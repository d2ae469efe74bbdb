//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements loading and lookup of implementation-specific fragments.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/SpecificImplementations.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace llvmmeta
{
namespace
{

bool readTextFile(const std::filesystem::path& path, std::string& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.good())
    {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

}  // namespace

std::string specificImplementationKey(const llvm::StringRef area,
                                      const llvm::StringRef direction,
                                      const llvm::StringRef typeName,
                                      const llvm::StringRef extension)
{
    return area.str() + "/" + direction.str() + "/" + typeName.str() + "." + extension.str();
}

llvm::Expected<SpecificImplementations> SpecificImplementations::loadFromDirectory(const std::string& directory)
{
    SpecificImplementations out;
    if (directory.empty())
    {
        return out;
    }

    std::error_code             ec;
    const std::filesystem::path root(directory);
    if (!std::filesystem::is_directory(root, ec) || ec)
    {
        return llvm::createStringError(ec ? ec : std::make_error_code(std::errc::not_a_directory),
                                       "snippets directory does not exist: %s",
                                       directory.c_str());
    }

    std::filesystem::recursive_directory_iterator it(root, ec);
    std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec))
    {
        if (!it->is_regular_file(ec) || ec)
        {
            continue;
        }
        const auto relative = it->path().lexically_relative(root).generic_string();
        std::string text;
        if (!readTextFile(it->path(), text))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "failed to read snippet file %s",
                                           it->path().string().c_str());
        }
        out.add(relative, std::move(text), it->path().lexically_normal().string());
    }
    if (ec)
    {
        return llvm::createStringError(ec, "failed to walk snippets directory %s", directory.c_str());
    }
    return out;
}

void SpecificImplementations::add(std::string key, std::string text, std::string sourcePath)
{
    fragments_.insert_or_assign(std::move(key), Fragment{std::move(text), std::move(sourcePath)});
}

const std::string* SpecificImplementations::find(const llvm::StringRef key) const
{
    const auto it = fragments_.find(key.str());
    if (it == fragments_.end())
    {
        return nullptr;
    }
    return &it->second.text;
}

std::string SpecificImplementations::sourcePath(const llvm::StringRef key) const
{
    const auto it = fragments_.find(key.str());
    if (it == fragments_.end())
    {
        return {};
    }
    return it->second.sourcePath;
}

}  // namespace llvmmeta
