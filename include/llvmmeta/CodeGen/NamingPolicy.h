//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Shared naming-policy helpers for wire names and backend code generation.
///
/// Model names are underscore-separated words (`Asset_information`,
/// `global_asset_id`). A word that starts with an upper-case letter is an
/// abbreviation or proper noun and keeps its spelling in every projection,
/// e.g. `URL_of_thing` becomes `URLOfThing` and `urlOfThing`.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_NAMING_POLICY_H
#define LLVMMETA_CODEGEN_NAMING_POLICY_H

#include <string>

#include "llvm/ADT/StringRef.h"

namespace llvmmeta
{

/// @brief Target language for identifier naming projection.
enum class CodegenNamingLanguage
{
    /// @brief C++ naming policy.
    Cpp,

    /// @brief C# naming policy.
    CSharp,

    /// @brief Go naming policy.
    Go,
};

/// @brief Returns true when an identifier is a keyword in the target language.
/// @param[in] language Naming language.
/// @param[in] name Candidate identifier.
/// @return True when the identifier is reserved.
bool codegenIsKeyword(CodegenNamingLanguage language, llvm::StringRef name);

/// @brief Sanitizes one identifier for the target language.
/// @param[in] language Naming language.
/// @param[in] name Candidate identifier.
/// @return Language-safe identifier.
std::string codegenSanitizeIdentifier(CodegenNamingLanguage language, llvm::StringRef name);

/// @brief Projects a model name into CapitalCamelCase, keeping abbreviations.
/// @param[in] name Model name.
/// @return Projected text, not sanitized.
std::string toCapitalCamelCase(llvm::StringRef name);

/// @brief Projects a model name into lowerCamelCase, lower-casing a leading abbreviation.
/// @param[in] name Model name.
/// @return Projected text, not sanitized.
std::string toLowerCamelCase(llvm::StringRef name);

/// @brief Projects a model name into lower snake_case.
/// @param[in] name Model name.
/// @return Projected text, not sanitized.
std::string toLowerSnakeCase(llvm::StringRef name);

/// @brief Projects a model name into CapitalCamelCase and sanitizes it for the target language.
/// @param[in] language Naming language.
/// @param[in] name Model name.
/// @return Language-safe identifier.
std::string codegenToCapitalCamelIdentifier(CodegenNamingLanguage language, llvm::StringRef name);

/// @brief Projects a model name into lowerCamelCase and sanitizes it for the target language.
/// @param[in] language Naming language.
/// @param[in] name Model name.
/// @return Language-safe identifier.
std::string codegenToLowerCamelIdentifier(CodegenNamingLanguage language, llvm::StringRef name);

/// @brief Projects a model name into snake_case and sanitizes it for the target language.
/// @param[in] language Naming language.
/// @param[in] name Model name.
/// @return Language-safe identifier.
std::string codegenToSnakeCaseIdentifier(CodegenNamingLanguage language, llvm::StringRef name);

/// @brief Returns the JSON key of a property (`global_asset_id` -> `globalAssetId`).
/// @param[in] propertyName Property name in model spelling.
/// @return JSON object key.
std::string jsonPropertyName(llvm::StringRef propertyName);

/// @brief Returns the discriminator value of a concrete class (`Asset_information` -> `AssetInformation`).
/// @param[in] className Class name in model spelling.
/// @return Discriminator string.
std::string jsonModelType(llvm::StringRef className);

/// @brief JSON key carrying the discriminator.
inline constexpr llvm::StringLiteral kModelTypeKey = "modelType";

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_NAMING_POLICY_H
