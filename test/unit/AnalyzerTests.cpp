//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "llvmmeta/Frontend/ModelLoader.h"
#include "llvmmeta/Semantics/Analyzer.h"
#include "llvmmeta/Semantics/Model.h"
#include "llvmmeta/Semantics/SymbolTable.h"
#include "llvmmeta/Support/Diagnostics.h"
#include "llvm/Support/Error.h"

namespace
{

llvm::Expected<llvmmeta::MetaModel> analyzeText(const std::string&              types,
                                                llvmmeta::DiagnosticEngine&     diag,
                                                const llvmmeta::AnalyzeOptions& options = {})
{
    auto loaded = llvmmeta::loadModelFromText("{\"name\": \"analyzed\", \"types\": [" + types + "]}", "analyzed.json", diag);
    if (!loaded)
    {
        return loaded.takeError();
    }
    return llvmmeta::analyze(std::move(*loaded), diag, options);
}

bool hasMessage(const llvmmeta::DiagnosticEngine& diag, const llvmmeta::DiagnosticLevel level, const std::string& fragment)
{
    return std::any_of(diag.diagnostics().begin(), diag.diagnostics().end(), [&](const llvmmeta::Diagnostic& d) {
        return d.level == level && d.message.find(fragment) != std::string::npos;
    });
}

bool expectRejected(const std::string& name, const std::string& types, const std::string& fragment)
{
    llvmmeta::DiagnosticEngine diag;
    auto                       model = analyzeText(types, diag);
    if (model)
    {
        std::cerr << name << ": analyzer accepted an invalid model\n";
        return false;
    }
    llvm::consumeError(model.takeError());
    if (!hasMessage(diag, llvmmeta::DiagnosticLevel::Error, fragment))
    {
        std::cerr << name << ": missing error containing '" << fragment << "'\n";
        for (const auto& d : diag.diagnostics())
        {
            std::cerr << "  " << d.location.str() << ": " << d.message << "\n";
        }
        return false;
    }
    return true;
}

}  // namespace

bool runAnalyzerTests()
{
    {
        const std::string types = R"(
            {"kind": "abstract_class", "name": "Node", "properties": [{"name": "id", "type": "str"}]},
            {"kind": "abstract_class", "name": "Container", "inheritances": ["Node"],
             "properties": [{"name": "id", "type": "str"}, {"name": "children", "type": "List[Node]"}]},
            {"kind": "concrete_class", "name": "Folder", "inheritances": ["Container"],
             "properties": [{"name": "id", "type": "str"}, {"name": "children", "type": "List[Node]"}]},
            {"kind": "concrete_class", "name": "File", "inheritances": ["Node"],
             "properties": [{"name": "id", "type": "str"}, {"name": "size", "type": "int"}],
             "constructor": [{"name": "id", "type": "str"}, {"name": "size", "type": "Optional[int]", "default": 0}]},
            {"kind": "concrete_class", "name": "Link", "inheritances": ["File"],
             "properties": [{"name": "id", "type": "str"}, {"name": "size", "type": "int"}]},
            {"kind": "concrete_class", "name": "Stamp", "properties": [{"name": "at", "type": "float"}]}
        )";
        llvmmeta::DiagnosticEngine diag;
        auto                       model = analyzeText(types, diag);
        if (!model)
        {
            std::cerr << "analyzer rejected a valid hierarchy: " << llvm::toString(model.takeError()) << "\n";
            return false;
        }
        const llvmmeta::SymbolTable symbols(*model);
        const auto*                 folder = symbols.findClass("Folder");
        const auto*                 node   = symbols.findClass("Node");
        const auto*                 file   = symbols.findClass("File");
        const auto*                 stamp  = symbols.findClass("Stamp");
        if (folder == nullptr || node == nullptr || file == nullptr || stamp == nullptr)
        {
            std::cerr << "symbol table is missing analyzed classes\n";
            return false;
        }
        if (folder->ancestors != std::vector<std::string>{"Node", "Container"} ||
            node->descendants != std::vector<std::string>{"Container", "Folder", "File", "Link"})
        {
            std::cerr << "ancestor/descendant resolution mismatch\n";
            return false;
        }

        const auto* nodeInterface = symbols.findInterface("Node");
        const auto* fileInterface = symbols.findInterface("File");
        if (nodeInterface == nullptr || fileInterface == nullptr || symbols.findInterface("Folder") != nullptr ||
            symbols.findInterface("Stamp") != nullptr)
        {
            std::cerr << "interface synthesis mismatch\n";
            return false;
        }
        if (nodeInterface->implementers != std::vector<std::string>{"Folder", "File", "Link"} ||
            fileInterface->implementers != std::vector<std::string>{"File", "Link"})
        {
            std::cerr << "interface implementers mismatch\n";
            return false;
        }
        if (!folder->withModelType || !file->withModelType || stamp->withModelType || !file->hasInterface)
        {
            std::cerr << "model-type requirement mismatch\n";
            return false;
        }
        if (symbols.find("Missing") != nullptr || symbols.findClass("Stamp") == nullptr)
        {
            std::cerr << "symbol lookup mismatch\n";
            return false;
        }
    }

    {
        const std::string types = R"(
            {"kind": "concrete_class", "name": "Tuned", "properties": [{"name": "gain", "type": "Optional[float]"}],
             "constructor": [{"name": "gain", "type": "Optional[float]", "default": 1.5}]}
        )";
        llvmmeta::DiagnosticEngine lenient;
        auto                       model = analyzeText(types, lenient);
        if (!model || !hasMessage(lenient, llvmmeta::DiagnosticLevel::Warning, "default value of argument 'gain' is ignored"))
        {
            if (!model)
            {
                llvm::consumeError(model.takeError());
            }
            std::cerr << "ignored default did not produce a warning\n";
            return false;
        }

        llvmmeta::DiagnosticEngine strict;
        auto                       rejected = analyzeText(types, strict, llvmmeta::AnalyzeOptions{true});
        if (rejected || !hasMessage(strict, llvmmeta::DiagnosticLevel::Error, "is ignored"))
        {
            if (!rejected)
            {
                llvm::consumeError(rejected.takeError());
            }
            std::cerr << "warnings-as-errors did not promote the ignored default\n";
            return false;
        }
    }

    bool ok = true;
    ok      = expectRejected("unknown reference",
                        R"({"kind": "concrete_class", "name": "A", "properties": [{"name": "b", "type": "List[B]"}]})",
                        "reference to unknown type 'B'") &&
         ok;
    ok = expectRejected("duplicate type",
                        R"({"kind": "constrained_primitive", "name": "A", "constrainee": "int"},
                           {"kind": "enumeration", "name": "A", "literals": [{"name": "X", "value": "x"}]})",
                        "duplicate named type 'A'") &&
         ok;
    ok = expectRejected("inheritance cycle",
                        R"({"kind": "abstract_class", "name": "A", "inheritances": ["B"], "properties": []},
                           {"kind": "abstract_class", "name": "B", "inheritances": ["A"], "properties": []})",
                        "inheritance cycle") &&
         ok;
    ok = expectRejected("inherit from enumeration",
                        R"({"kind": "enumeration", "name": "E", "literals": [{"name": "X", "value": "x"}]},
                           {"kind": "concrete_class", "name": "A", "inheritances": ["E"], "properties": []})",
                        "cannot inherit from enumeration 'E'") &&
         ok;
    ok = expectRejected("unsupported nesting",
                        R"({"kind": "concrete_class", "name": "A", "properties": [{"name": "v", "type": "List[Optional[int]]"}]})",
                        "unsupported type annotation 'List[Optional[int]]'") &&
         ok;
    ok = expectRejected("duplicate wire value",
                        R"({"kind": "enumeration", "name": "E",
                            "literals": [{"name": "X", "value": "x"}, {"name": "Y", "value": "x"}]})",
                        "share the wire value 'x'") &&
         ok;
    ok = expectRejected("empty enumeration",
                        R"({"kind": "enumeration", "name": "E", "literals": []})",
                        "enumeration 'E' has no literals") &&
         ok;
    ok = expectRejected("reserved key",
                        R"({"kind": "concrete_class", "name": "A", "properties": [{"name": "model_type", "type": "str"}]})",
                        "reserved JSON key 'modelType'") &&
         ok;
    ok = expectRejected("json key clash",
                        R"({"kind": "concrete_class", "name": "A",
                            "properties": [{"name": "is_set", "type": "bool"}, {"name": "Is_set", "type": "bool"}]})",
                        "both map to the JSON key 'isSet'") &&
         ok;
    ok = expectRejected("argument without property",
                        R"({"kind": "concrete_class", "name": "A", "properties": [{"name": "x", "type": "int"}],
                            "constructor": [{"name": "x", "type": "int"}, {"name": "y", "type": "int"}]})",
                        "does not correspond to any property") &&
         ok;
    ok = expectRejected("uninitialized property",
                        R"({"kind": "concrete_class", "name": "A",
                            "properties": [{"name": "x", "type": "int"}, {"name": "y", "type": "int"}],
                            "constructor": [{"name": "x", "type": "int"}]})",
                        "property 'y' of class 'A' is not initialized") &&
         ok;
    ok = expectRejected("argument type mismatch",
                        R"({"kind": "concrete_class", "name": "A", "properties": [{"name": "x", "type": "int"}],
                            "constructor": [{"name": "x", "type": "float"}]})",
                        "has type float, but property 'x' has type int") &&
         ok;
    ok = expectRejected("widened argument without default",
                        R"({"kind": "concrete_class", "name": "A", "properties": [{"name": "x", "type": "int"}],
                            "constructor": [{"name": "x", "type": "Optional[int]"}]})",
                        "a 'default' value is required") &&
         ok;
    ok = expectRejected("default of wrong kind",
                        R"({"kind": "concrete_class", "name": "A", "properties": [{"name": "x", "type": "int"}],
                            "constructor": [{"name": "x", "type": "Optional[int]", "default": "one"}]})",
                        "must be a 64-bit integer") &&
         ok;
    ok = expectRejected("default outside enumeration",
                        R"({"kind": "enumeration", "name": "E", "literals": [{"name": "X", "value": "x"}]},
                           {"kind": "concrete_class", "name": "A", "properties": [{"name": "e", "type": "E"}],
                            "constructor": [{"name": "e", "type": "Optional[E]", "default": "y"}]})",
                        "the wire value of a literal of 'E'") &&
         ok;
    ok = expectRejected("default for a list",
                        R"({"kind": "concrete_class", "name": "A", "properties": [{"name": "x", "type": "List[int]"}],
                            "constructor": [{"name": "x", "type": "Optional[List[int]]", "default": []}]})",
                        "only supported for primitive and enumeration properties") &&
         ok;
    ok = expectRejected("abstract implementation-specific",
                        R"({"kind": "abstract_class", "name": "A", "implementation_specific": true, "properties": []})",
                        "cannot be implementation-specific") &&
         ok;
    ok = expectRejected("projection clash",
                        R"({"kind": "constrained_primitive", "name": "user_id", "constrainee": "int"},
                           {"kind": "constrained_primitive", "name": "UserId", "constrainee": "int"})",
                        "both project to 'UserId'") &&
         ok;
    return ok;
}
