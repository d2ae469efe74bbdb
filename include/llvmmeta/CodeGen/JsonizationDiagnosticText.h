//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Canonical cause texts of the errors raised by generated jsonization code.
///
/// Every backend and the C++ runtime report the same causes; this interface
/// is the single source of those strings. Prefix helpers return the static
/// part of a message whose runtime value (a JSON kind, a key, a number) is
/// appended by the generated code.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_JSONIZATION_DIAGNOSTIC_TEXT_H
#define LLVMMETA_CODEGEN_JSONIZATION_DIAGNOSTIC_TEXT_H

#include <string>

namespace llvmmeta::jsonization_diagnostic_text
{

/// @brief Returns the prefix of the non-object node text; a JSON kind name follows.
/// @return Diagnostic prefix.
std::string expectedObjectPrefix();

/// @brief Returns the missing-discriminator text.
/// @return Diagnostic text.
std::string missingModelType();

/// @brief Returns the prefix of the non-string discriminator text; a JSON kind name follows.
/// @return Diagnostic prefix.
std::string modelTypeNotStringPrefix();

/// @brief Returns the prefix of the unknown-discriminator text; the discriminator value follows.
/// @param[in] interfaceName Interface name in model spelling.
/// @return Diagnostic prefix.
std::string unexpectedModelTypePrefix(const std::string& interfaceName);

/// @brief Returns the prefix of the unknown-key text; the key follows.
/// @return Diagnostic prefix.
std::string unexpectedPropertyPrefix();

/// @brief Returns the missing-required-property text.
/// @param[in] jsonName JSON key of the property.
/// @return Diagnostic text.
std::string requiredPropertyMissing(const std::string& jsonName);

/// @brief Returns the prefix of the non-array node text; a JSON kind name follows.
/// @return Diagnostic prefix.
std::string expectedArrayPrefix();

/// @brief Returns the null-list-item text.
/// @return Diagnostic text.
std::string nullItem();

/// @brief Returns the prefix of the non-boolean node text; a JSON kind name follows.
/// @return Diagnostic prefix.
std::string expectedBooleanPrefix();

/// @brief Returns the prefix of the non-number node text for integers; a JSON kind name follows.
/// @return Diagnostic prefix.
std::string expectedIntegerPrefix();

/// @brief Returns the prefix of the non-integral or out-of-range number text; the number follows.
/// @return Diagnostic prefix.
std::string integerConversionFailedPrefix();

/// @brief Returns the prefix of the non-number node text for floats; a JSON kind name follows.
/// @return Diagnostic prefix.
std::string expectedFloatPrefix();

/// @brief Returns the prefix of the non-string node text; a JSON kind name follows.
/// @return Diagnostic prefix.
std::string expectedStringPrefix();

/// @brief Returns the prefix of the Base64 decoding failure text; the decoder's reason follows.
/// @return Diagnostic prefix.
std::string invalidBase64Prefix();

/// @brief Returns the prefix of the unknown enumeration literal text; the offending text follows.
/// @param[in] enumerationName Enumeration name in model spelling.
/// @return Diagnostic prefix.
std::string invalidEnumerationLiteralPrefix(const std::string& enumerationName);

/// @brief Returns the prefix of the lossy-integer contract violation; the integer follows.
/// @return Diagnostic prefix.
std::string integerNotLosslessPrefix();

/// @brief Returns the JSON kind names used in the texts above, indexed null, boolean, number, string, array, object.
/// @param[in] index Kind index in the listed order.
/// @return Kind name.
const char* jsonKindName(unsigned index);

}  // namespace llvmmeta::jsonization_diagnostic_text

#endif  // LLVMMETA_CODEGEN_JSONIZATION_DIAGNOSTIC_TEXT_H
