//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements canonical cause texts of generated jsonization code.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/JsonizationDiagnosticText.h"

namespace llvmmeta::jsonization_diagnostic_text
{

std::string expectedObjectPrefix()
{
    return "Expected a JSON object, but got ";
}

std::string missingModelType()
{
    return "Expected a model type, but none is present";
}

std::string modelTypeNotStringPrefix()
{
    return "Expected the model type to be a string, but got ";
}

std::string unexpectedModelTypePrefix(const std::string& interfaceName)
{
    return "Unexpected model type for " + interfaceName + ": ";
}

std::string unexpectedPropertyPrefix()
{
    return "Unexpected property: ";
}

std::string requiredPropertyMissing(const std::string& jsonName)
{
    return "Required property \"" + jsonName + "\" is missing";
}

std::string expectedArrayPrefix()
{
    return "Expected a JSON array, but got ";
}

std::string nullItem()
{
    return "Expected a non-null item, but got a null";
}

std::string expectedBooleanPrefix()
{
    return "Expected a boolean, but got ";
}

std::string expectedIntegerPrefix()
{
    return "Expected a 64-bit integer, but got ";
}

std::string integerConversionFailedPrefix()
{
    return "Expected a 64-bit integer, but the conversion failed from ";
}

std::string expectedFloatPrefix()
{
    return "Expected a 64-bit float, but got ";
}

std::string expectedStringPrefix()
{
    return "Expected a string, but got ";
}

std::string invalidBase64Prefix()
{
    return "Expected Base64-encoded bytes, but the decoding failed: ";
}

std::string invalidEnumerationLiteralPrefix(const std::string& enumerationName)
{
    return "Not a valid JSON representation of " + enumerationName + ": ";
}

std::string integerNotLosslessPrefix()
{
    return "The number can not be losslessly represented in JSON: ";
}

const char* jsonKindName(const unsigned index)
{
    static const char* const kNames[] = {"null", "boolean", "number", "string", "array", "object"};
    if (index >= sizeof(kNames) / sizeof(kNames[0]))
    {
        return "value";
    }
    return kNames[index];
}

}  // namespace llvmmeta::jsonization_diagnostic_text
