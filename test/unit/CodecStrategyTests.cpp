//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "llvmmeta/CodeGen/CodecStrategy.h"
#include "llvmmeta/Frontend/ModelLoader.h"
#include "llvmmeta/Frontend/TypeExpr.h"
#include "llvmmeta/Semantics/Analyzer.h"
#include "llvmmeta/Semantics/SymbolTable.h"
#include "llvmmeta/Support/Diagnostics.h"
#include "llvm/Support/Error.h"

namespace
{

constexpr const char* kModelText = R"({
  "name": "strategies",
  "types": [
    {"kind": "enumeration", "name": "Mode", "literals": [{"name": "On", "value": "on"}]},
    {"kind": "constrained_primitive", "name": "Tag", "constrainee": "str"},
    {"kind": "abstract_class", "name": "Base", "properties": []},
    {"kind": "concrete_class", "name": "Leaf", "inheritances": ["Base"], "properties": []},
    {"kind": "concrete_class", "name": "Solo", "properties": []}
  ]
})";

}  // namespace

bool runCodecStrategyTests()
{
    llvmmeta::DiagnosticEngine diag;
    auto                       loaded = llvmmeta::loadModelFromText(kModelText, "strategies.json", diag);
    if (!loaded)
    {
        std::cerr << "codec strategy fixture failed to load: " << llvm::toString(loaded.takeError()) << "\n";
        return false;
    }
    auto model = llvmmeta::analyze(std::move(*loaded), diag);
    if (!model)
    {
        std::cerr << "codec strategy fixture failed analysis: " << llvm::toString(model.takeError()) << "\n";
        return false;
    }
    const llvmmeta::SymbolTable symbols(*model);

    const std::vector<std::pair<std::string, std::string>> rows = {
        {"int", "primitive int"},
        {"Tag", "primitive str"},
        {"Optional[Tag]", "optional primitive str"},
        {"Mode", "enumeration Mode"},
        {"List[Mode]", "list of enumeration Mode"},
        {"Base", "interface Base"},
        {"Optional[List[Base]]", "optional list of interface Base"},
        {"Leaf", "class Leaf"},
        {"List[Solo]", "list of class Solo"},
        {"Optional[bytearray]", "optional primitive bytearray"},
    };
    for (const auto& [text, expected] : rows)
    {
        auto annotation = llvmmeta::parseTypeExpression(text);
        if (!annotation)
        {
            std::cerr << "codec strategy annotation failed: " << llvm::toString(annotation.takeError()) << "\n";
            return false;
        }
        const auto strategy = llvmmeta::resolveCodecStrategy(*annotation, symbols);
        if (llvmmeta::describeCodecStrategy(strategy) != expected)
        {
            std::cerr << "codec strategy for '" << text << "' was '" << llvmmeta::describeCodecStrategy(strategy)
                      << "', expected '" << expected << "'\n";
            return false;
        }
    }

    {
        auto annotation = llvmmeta::parseTypeExpression("Optional[List[Tag]]");
        if (!annotation)
        {
            llvm::consumeError(annotation.takeError());
            std::cerr << "codec strategy annotation failed to parse\n";
            return false;
        }
        const auto strategy = llvmmeta::resolveCodecStrategy(*annotation, symbols);
        if (!strategy.optional || !strategy.list || llvmmeta::atomicCodecName(strategy.atomic) != "str")
        {
            std::cerr << "constrained primitive did not resolve to its constrainee\n";
            return false;
        }
    }

    return true;
}
