//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "llvmmeta/CodeGen/DefaultLiteralRender.h"
#include "llvm/Support/JSON.h"

namespace
{

bool expectLiteral(const llvmmeta::DefaultLiteralLanguage language,
                   const llvmmeta::PrimitiveType          primitive,
                   const llvm::json::Value&               value,
                   const std::string&                     expected)
{
    const std::string rendered = llvmmeta::renderDefaultLiteral(language, primitive, value);
    if (rendered != expected)
    {
        std::cerr << "default literal mismatch: got '" << rendered << "', expected '" << expected << "'\n";
        return false;
    }
    return true;
}

}  // namespace

bool runDefaultLiteralRenderTests()
{
    using Lang = llvmmeta::DefaultLiteralLanguage;
    using llvmmeta::PrimitiveType;

    bool ok = true;
    ok      = expectLiteral(Lang::Cpp, PrimitiveType::Bool, true, "true") && ok;
    ok      = expectLiteral(Lang::Go, PrimitiveType::Bool, false, "false") && ok;

    ok = expectLiteral(Lang::Cpp, PrimitiveType::Int, 42, "std::int64_t{42}") && ok;
    ok = expectLiteral(Lang::CSharp, PrimitiveType::Int, -7, "-7L") && ok;
    ok = expectLiteral(Lang::Go, PrimitiveType::Int, 5, "int64(5)") && ok;
    ok = expectLiteral(Lang::Cpp,
                       PrimitiveType::Int,
                       std::numeric_limits<std::int64_t>::min(),
                       "std::int64_t{-9223372036854775807 - 1}") &&
         ok;

    ok = expectLiteral(Lang::Cpp, PrimitiveType::Float, 2.5, "2.5") && ok;
    ok = expectLiteral(Lang::CSharp, PrimitiveType::Float, 1.0, "1.0") && ok;
    ok = expectLiteral(Lang::Go, PrimitiveType::Float, 3, "float64(3.0)") && ok;
    ok = expectLiteral(Lang::Cpp, PrimitiveType::Float, 1e300, "1.0000000000000001e+300") && ok;

    ok = expectLiteral(Lang::Cpp, PrimitiveType::Str, "a\"b", "std::string(\"a\\\"b\")") && ok;
    ok = expectLiteral(Lang::CSharp, PrimitiveType::Str, "tab\there", "\"tab\\there\"") && ok;
    ok = expectLiteral(Lang::Go, PrimitiveType::Str, "", "\"\"") && ok;

    return ok;
}
