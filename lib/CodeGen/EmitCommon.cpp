//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shared emission helpers for file-write policy, depfiles, and literal rendering.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/EmitCommon.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <system_error>

namespace llvmmeta
{

namespace
{

std::filesystem::perms permsFromMode(const std::uint32_t mode)
{
    using Perm = std::filesystem::perms;
    Perm out   = Perm::none;

    if ((mode & 0400U) != 0U)
    {
        out |= Perm::owner_read;
    }
    if ((mode & 0200U) != 0U)
    {
        out |= Perm::owner_write;
    }
    if ((mode & 0100U) != 0U)
    {
        out |= Perm::owner_exec;
    }
    if ((mode & 0040U) != 0U)
    {
        out |= Perm::group_read;
    }
    if ((mode & 0020U) != 0U)
    {
        out |= Perm::group_write;
    }
    if ((mode & 0010U) != 0U)
    {
        out |= Perm::group_exec;
    }
    if ((mode & 0004U) != 0U)
    {
        out |= Perm::others_read;
    }
    if ((mode & 0002U) != 0U)
    {
        out |= Perm::others_write;
    }
    if ((mode & 0001U) != 0U)
    {
        out |= Perm::others_exec;
    }

    return out;
}

std::string absoluteNormalizedPath(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto      absolute = std::filesystem::absolute(path, ec);
    if (ec)
    {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

void recordOutputPath(const std::filesystem::path& path, const EmitWritePolicy& policy)
{
    if (policy.recordedOutputs != nullptr)
    {
        policy.recordedOutputs->push_back(absoluteNormalizedPath(path));
    }
}

std::string escapeMakeToken(llvm::StringRef text)
{
    std::string out;
    out.reserve(text.size());

    for (const char c : text)
    {
        switch (c)
        {
        case '\\':
            out.append("\\\\");
            break;
        case ' ':
            out.append("\\ ");
            break;
        case '\t':
            out.push_back('\\');
            out.push_back('\t');
            break;
        case '#':
            out.append("\\#");
            break;
        case '$':
            out.append("$$");
            break;
        case ':':
            out.append("\\:");
            break;
        default:
            out.push_back(c);
            break;
        }
    }

    return out;
}

std::string renderMakeRuleFromPreparedDeps(llvm::StringRef target, const std::vector<std::string>& preparedDeps)
{
    std::string out;
    out += escapeMakeToken(target);
    out += ':';

    for (const auto& dep : preparedDeps)
    {
        out.push_back(' ');
        out += escapeMakeToken(dep);
    }
    out.push_back('\n');
    return out;
}

}  // namespace

void emitLine(std::ostringstream& out, const int indent, const std::string& line, const llvm::StringRef unit)
{
    if (line.empty())
    {
        out << '\n';
        return;
    }
    for (int i = 0; i < indent; ++i)
    {
        out << unit.str();
    }
    out << line << '\n';
}

std::string renderDoubleQuotedLiteral(const llvm::StringRef text)
{
    std::string out = "\"";
    for (const char c : text)
    {
        switch (c)
        {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20U)
            {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += buffer;
            }
            else
            {
                out.push_back(c);
            }
            break;
        }
    }
    out += "\"";
    return out;
}

std::string renderGeneratedBanner(const llvm::StringRef commentPrefix, const llvm::StringRef modelPath)
{
    const std::string fileName = std::filesystem::path(modelPath.str()).filename().string();
    std::string       out;
    out += commentPrefix.str() + " This code has been automatically generated by metac from " + fileName + ".\n";
    out += commentPrefix.str() + " Do NOT edit or append.\n\n";
    return out;
}

llvm::Expected<std::string> loadRuntimeFile(const llvm::StringRef relativePath)
{
    const std::filesystem::path runtimePath = std::filesystem::path(LLVMMETA_SOURCE_DIR) / "runtime" / relativePath.str();
    std::ifstream               in(runtimePath.string(), std::ios::binary);
    if (!in)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "failed to read runtime file %s",
                                       runtimePath.string().c_str());
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy)
{
    recordOutputPath(path, policy);

    if (policy.dryRun)
    {
        return llvm::Error::success();
    }

    std::error_code ec;

    const auto parent = path.parent_path();
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return llvm::createStringError(ec, "failed to create output directory %s", parent.string().c_str());
        }
    }

    const bool exists = std::filesystem::exists(path, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to stat output path %s", path.string().c_str());
    }
    if (exists)
    {
        if (policy.noOverwrite)
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "refusing to overwrite existing output file: %s",
                                           path.string().c_str());
        }
        const bool removed = std::filesystem::remove(path, ec);
        if (ec || !removed)
        {
            return llvm::createStringError(ec ? ec : llvm::inconvertibleErrorCode(),
                                           "failed to remove existing output file %s",
                                           path.string().c_str());
        }
    }

    llvm::raw_fd_ostream os(path.string(), ec, llvm::sys::fs::OF_Text);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to open %s", path.string().c_str());
    }
    os << content;
    os.close();
    if (os.has_error())
    {
        const std::error_code writeError = os.error();
        os.clear_error();
        return llvm::createStringError(writeError, "failed to write %s", path.string().c_str());
    }

    std::filesystem::permissions(path, permsFromMode(policy.fileMode), std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        return llvm::createStringError(ec, "failed to set mode on %s", path.string().c_str());
    }

    return llvm::Error::success();
}

std::string renderMakeDepfile(const std::string& target, const std::vector<std::string>& deps)
{
    std::vector<std::string> normalizedDeps = deps;
    std::sort(normalizedDeps.begin(), normalizedDeps.end());
    normalizedDeps.erase(std::unique(normalizedDeps.begin(), normalizedDeps.end()), normalizedDeps.end());
    return renderMakeRuleFromPreparedDeps(target, normalizedDeps);
}

llvm::Error writeDepfileForGeneratedOutput(const std::filesystem::path&    outputPath,
                                           const std::vector<std::string>& deps,
                                           const EmitWritePolicy&          policy)
{
    const std::filesystem::path depfilePath = outputPath.string() + ".d";

    std::vector<std::string> normalizedDeps;
    normalizedDeps.reserve(deps.size());
    for (const auto& dep : deps)
    {
        normalizedDeps.push_back(absoluteNormalizedPath(dep));
    }

    const std::string depfileContent = renderMakeDepfile(absoluteNormalizedPath(outputPath), normalizedDeps);
    return writeGeneratedFile(depfilePath, depfileContent, policy);
}

}  // namespace llvmmeta
