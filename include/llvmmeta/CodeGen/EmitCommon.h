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
#ifndef LLVMMETA_CODEGEN_EMITCOMMON_H
#define LLVMMETA_CODEGEN_EMITCOMMON_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace llvmmeta
{

/// @brief Output-file write policy shared by all code generators.
struct EmitWritePolicy final
{
    /// @brief Do not create or modify any files.
    bool dryRun{false};

    /// @brief Reject writes when destination file already exists.
    bool noOverwrite{false};

    /// @brief File mode applied after writing (POSIX-like bitmask).
    std::uint32_t fileMode{0444U};

    /// @brief Optional sink of absolute generated output paths.
    std::vector<std::string>* recordedOutputs{nullptr};
};

/// @brief Appends one indented line to a generated-source buffer.
/// @param[in,out] out Output buffer.
/// @param[in] indent Indentation depth.
/// @param[in] line Line text without newline.
/// @param[in] unit Text of one indentation level.
void emitLine(std::ostringstream& out, int indent, const std::string& line, llvm::StringRef unit = "    ");

/// @brief Renders text as a double-quoted literal valid in C++, C#, and Go.
/// @param[in] text Raw text.
/// @return Quoted and escaped literal.
std::string renderDoubleQuotedLiteral(llvm::StringRef text);

/// @brief Renders the do-not-edit banner placed at the top of generated files.
/// @param[in] commentPrefix Line-comment token of the target language.
/// @param[in] modelPath Model file the output was generated from.
/// @return Banner text ending with a blank line.
std::string renderGeneratedBanner(llvm::StringRef commentPrefix, llvm::StringRef modelPath);

/// @brief Reads one file shipped in the source tree under `runtime/`.
/// @param[in] relativePath Path relative to the `runtime/` directory.
/// @return File contents or an I/O error.
llvm::Expected<std::string> loadRuntimeFile(llvm::StringRef relativePath);

/// @brief Writes one generated file under a policy.
///
/// @details
/// When @ref EmitWritePolicy::dryRun is true, no filesystem mutation occurs.
/// In all modes, if @ref EmitWritePolicy::recordedOutputs is set, the resolved
/// absolute path is appended.
///
/// @param[in] path Destination file path.
/// @param[in] content File contents.
/// @param[in] policy Write policy.
/// @return Success or a descriptive I/O error.
llvm::Error writeGeneratedFile(const std::filesystem::path& path, llvm::StringRef content, const EmitWritePolicy& policy);

/// @brief Renders one make-style depfile body.
///
/// @details
/// The output format is: `<escaped_target>: <escaped_dep_1> <escaped_dep_2> ...\n`.
/// Dependency inputs are sorted and de-duplicated for deterministic output.
///
/// @param[in] target Make-rule target path.
/// @param[in] deps Dependency path list.
/// @return Rendered depfile text with trailing newline.
std::string renderMakeDepfile(const std::string& target, const std::vector<std::string>& deps);

/// @brief Writes `<outputPath>.d` make depfile for one generated output path.
///
/// @details
/// Dependency paths and target path are normalized to absolute lexical paths.
/// The write path obeys @ref EmitWritePolicy semantics (`dryRun`,
/// `noOverwrite`, `fileMode`, and `recordedOutputs`).
///
/// @param[in] outputPath Generated output path the depfile describes.
/// @param[in] deps Dependency path list.
/// @param[in] policy Write policy.
/// @return Success or a descriptive I/O error.
llvm::Error writeDepfileForGeneratedOutput(const std::filesystem::path&    outputPath,
                                           const std::vector<std::string>& deps,
                                           const EmitWritePolicy&          policy);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_EMITCOMMON_H
