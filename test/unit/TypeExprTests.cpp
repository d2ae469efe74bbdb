//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "llvmmeta/Frontend/TypeExpr.h"
#include "llvmmeta/Semantics/Model.h"
#include "llvm/Support/Error.h"

bool runTypeExprTests()
{
    const std::vector<std::pair<std::string, std::string>> accepted = {
        {"int", "int"},
        {"  bytearray ", "bytearray"},
        {"Optional[List[str]]", "Optional[List[str]]"},
        {"List[ Shape ]", "List[Shape]"},
        {"Optional[Color_2]", "Optional[Color_2]"},
        // Nesting beyond the supported shapes still parses; the analyzer rejects it.
        {"List[Optional[int]]", "List[Optional[int]]"},
    };
    for (const auto& [text, rendered] : accepted)
    {
        auto parsed = llvmmeta::parseTypeExpression(text);
        if (!parsed)
        {
            std::cerr << "type expression '" << text << "' failed: " << llvm::toString(parsed.takeError()) << "\n";
            return false;
        }
        if (llvmmeta::renderTypeAnnotation(*parsed) != rendered)
        {
            std::cerr << "type expression '" << text << "' rendered as '" << llvmmeta::renderTypeAnnotation(*parsed)
                      << "'\n";
            return false;
        }
    }

    {
        auto parsed = llvmmeta::parseTypeExpression("Optional[float]");
        if (!parsed)
        {
            llvm::consumeError(parsed.takeError());
            std::cerr << "optional float failed to parse\n";
            return false;
        }
        const auto& beneath = llvmmeta::beneathOptional(*parsed);
        if (!llvmmeta::typeAnnotationEquals(beneath, llvmmeta::makePrimitiveAnnotation(llvmmeta::PrimitiveType::Float)))
        {
            std::cerr << "beneathOptional did not strip the Optional layer\n";
            return false;
        }
    }

    const std::vector<std::pair<std::string, std::string>> rejected = {
        {"", "expected a type name"},
        {"List", "expected '[' after List"},
        {"Optional[int", "expected ']' to close Optional"},
        {"int]", "unexpected trailing text"},
        {"List[]", "expected a type name"},
        {"1abc", "expected a type name"},
    };
    for (const auto& [text, reason] : rejected)
    {
        auto parsed = llvmmeta::parseTypeExpression(text);
        if (parsed)
        {
            std::cerr << "type expression '" << text << "' unexpectedly parsed\n";
            return false;
        }
        const std::string message = llvm::toString(parsed.takeError());
        if (message.find(reason) == std::string::npos || message.find("invalid type expression") == std::string::npos)
        {
            std::cerr << "type expression '" << text << "' gave unexpected error: " << message << "\n";
            return false;
        }
    }

    return true;
}
