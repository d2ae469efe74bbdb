//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements default-literal rendering shared by the code backends.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/DefaultLiteralRender.h"

#include "llvmmeta/CodeGen/EmitCommon.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/ErrorHandling.h"

#include <cstdint>
#include <cstdio>
#include <limits>

namespace llvmmeta
{
namespace
{

std::string renderInteger(const DefaultLiteralLanguage language, const std::int64_t value)
{
    std::string digits = std::to_string(value);
    if (value == std::numeric_limits<std::int64_t>::min() && language == DefaultLiteralLanguage::Cpp)
    {
        digits = "-9223372036854775807 - 1";
    }
    switch (language)
    {
    case DefaultLiteralLanguage::Cpp:
        return "std::int64_t{" + digits + "}";
    case DefaultLiteralLanguage::CSharp:
        return digits + "L";
    case DefaultLiteralLanguage::Go:
        return "int64(" + digits + ")";
    }
    return digits;
}

std::string renderFloat(const DefaultLiteralLanguage language, const double value)
{
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    std::string digits = buffer;
    if (digits.find_first_of(".eE") == std::string::npos)
    {
        digits += ".0";
    }
    if (language == DefaultLiteralLanguage::Go)
    {
        return "float64(" + digits + ")";
    }
    return digits;
}

}  // namespace

std::string renderDefaultLiteral(const DefaultLiteralLanguage language,
                                 const PrimitiveType          primitive,
                                 const llvm::json::Value&     value)
{
    switch (primitive)
    {
    case PrimitiveType::Bool:
        if (const auto boolean = value.getAsBoolean())
        {
            return *boolean ? "true" : "false";
        }
        break;
    case PrimitiveType::Int:
        if (const auto integer = value.getAsInteger())
        {
            return renderInteger(language, *integer);
        }
        break;
    case PrimitiveType::Float:
        if (const auto number = value.getAsNumber())
        {
            return renderFloat(language, *number);
        }
        break;
    case PrimitiveType::Str:
        if (const auto text = value.getAsString())
        {
            if (language == DefaultLiteralLanguage::Cpp)
            {
                return "std::string(" + renderDoubleQuotedLiteral(*text) + ")";
            }
            return renderDoubleQuotedLiteral(*text);
        }
        break;
    case PrimitiveType::Bytearray:
        break;
    }
    llvm::report_fatal_error(llvm::Twine("default value does not fit primitive '") + primitiveTypeName(primitive) +
                             "'");
}

}  // namespace llvmmeta
