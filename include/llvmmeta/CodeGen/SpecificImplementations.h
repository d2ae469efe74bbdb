//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Store of hand-written code fragments for implementation-specific classes.
///
/// Fragments are keyed by their path relative to the snippets directory,
/// `<area>/<direction>/<TypeName>.<ext>`, for example
/// `Jsonization/parse/Lang_string.cpp`.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_SPECIFIC_IMPLEMENTATIONS_H
#define LLVMMETA_CODEGEN_SPECIFIC_IMPLEMENTATIONS_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace llvmmeta
{

/// @brief Builds a fragment key.
/// @param[in] area Area directory, e.g. `Jsonization`.
/// @param[in] direction Direction directory, `parse` or `transform`.
/// @param[in] typeName Model name of the class.
/// @param[in] extension File extension of the target language without dot.
/// @return Key of the form `<area>/<direction>/<typeName>.<extension>`.
std::string specificImplementationKey(llvm::StringRef area,
                                      llvm::StringRef direction,
                                      llvm::StringRef typeName,
                                      llvm::StringRef extension);

/// @brief Immutable-after-load map from fragment keys to fragment text.
class SpecificImplementations final
{
public:
    /// @brief Reads every regular file below a directory.
    /// @param[in] directory Snippets root; an empty path yields an empty store.
    /// @return Loaded store or an I/O error.
    static llvm::Expected<SpecificImplementations> loadFromDirectory(const std::string& directory);

    /// @brief Adds or replaces one fragment.
    /// @param[in] key Fragment key.
    /// @param[in] text Fragment text.
    /// @param[in] sourcePath File the fragment was read from; empty for in-memory fragments.
    void add(std::string key, std::string text, std::string sourcePath = {});

    /// @brief Finds a fragment.
    /// @param[in] key Fragment key.
    /// @return Fragment text, or `nullptr` when missing.
    [[nodiscard]] const std::string* find(llvm::StringRef key) const;

    /// @brief Returns the source file of a fragment.
    /// @param[in] key Fragment key.
    /// @return Source path, empty for unknown or in-memory fragments.
    [[nodiscard]] std::string sourcePath(llvm::StringRef key) const;

    /// @brief Number of loaded fragments.
    /// @return Fragment count.
    [[nodiscard]] std::size_t size() const
    {
        return fragments_.size();
    }

private:
    struct Fragment final
    {
        std::string text;
        std::string sourcePath;
    };

    std::map<std::string, Fragment> fragments_;
};

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_SPECIFIC_IMPLEMENTATIONS_H
