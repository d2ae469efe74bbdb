//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <variant>

#include "llvmmeta/Frontend/ModelLoader.h"
#include "llvmmeta/Semantics/Model.h"
#include "llvmmeta/Support/Diagnostics.h"
#include "llvm/Support/Error.h"

namespace
{

bool hasDiagnostic(const llvmmeta::DiagnosticEngine& diag,
                   const llvmmeta::DiagnosticLevel   level,
                   const std::string&                element,
                   const std::string&                fragment)
{
    for (const auto& d : diag.diagnostics())
    {
        if (d.level == level && d.location.element == element && d.message.find(fragment) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

void dumpDiagnostics(const llvmmeta::DiagnosticEngine& diag)
{
    for (const auto& d : diag.diagnostics())
    {
        std::cerr << "  " << llvmmeta::diagnosticLevelName(d.level).str() << " " << d.location.str() << ": "
                  << d.message << "\n";
    }
}

}  // namespace

bool runModelLoaderTests()
{
    {
        const std::string text = R"({
          "name": "shop",
          "description": {"summary": "Orders.", "remarks": ["First.", "Second."]},
          "types": [
            {"kind": "enumeration", "name": "State", "description": "Order state.",
             "literals": [{"name": "Open", "value": "open"}, {"name": "Closed", "value": "closed"}]},
            {"kind": "constrained_primitive", "name": "Sku", "constrainee": "str"},
            {"kind": "concrete_class", "name": "Order", "colour": "red",
             "properties": [{"name": "sku", "type": "Sku"}, {"name": "count", "type": "int"}],
             "constructor": [{"name": "count", "type": "Optional[int]", "default": 1}, {"name": "sku", "type": "Sku"}]},
            {"kind": "concrete_class", "name": "Note", "implementation_specific": true,
             "serialization": {"with_model_type": true},
             "properties": [{"name": "text", "type": "Optional[str]"}]}
          ]
        })";
        llvmmeta::DiagnosticEngine diag;
        auto                       model = llvmmeta::loadModelFromText(text, "shop.json", diag);
        if (!model)
        {
            std::cerr << "model loader rejected a valid document: " << llvm::toString(model.takeError()) << "\n";
            dumpDiagnostics(diag);
            return false;
        }
        if (model->name != "shop" || model->description.summary != "Orders." ||
            model->description.remarks.size() != 2 || model->types.size() != 4)
        {
            std::cerr << "model loader header mismatch\n";
            return false;
        }
        const auto* state = std::get_if<llvmmeta::Enumeration>(&model->types[0]);
        if (state == nullptr || state->literals.size() != 2 || state->literals[1].value != "closed" ||
            state->description.summary != "Order state.")
        {
            std::cerr << "model loader enumeration mismatch\n";
            return false;
        }
        const auto* sku = std::get_if<llvmmeta::ConstrainedPrimitive>(&model->types[1]);
        if (sku == nullptr || sku->constrainee != llvmmeta::PrimitiveType::Str)
        {
            std::cerr << "model loader constrained primitive mismatch\n";
            return false;
        }
        const auto* order = std::get_if<llvmmeta::ConcreteClass>(&model->types[2]);
        if (order == nullptr || order->constructor.size() != 2 || order->constructor[0].name != "count" ||
            !order->constructor[0].defaultValue || order->constructor[0].defaultValue->getAsInteger() != 1 ||
            llvmmeta::renderTypeAnnotation(order->constructor[0].type) != "Optional[int]")
        {
            std::cerr << "model loader constructor mismatch\n";
            return false;
        }
        if (!hasDiagnostic(diag, llvmmeta::DiagnosticLevel::Warning, "types[2]", "ignoring unknown key 'colour'"))
        {
            std::cerr << "model loader did not warn about an unknown key\n";
            dumpDiagnostics(diag);
            return false;
        }
        const auto* note = std::get_if<llvmmeta::ConcreteClass>(&model->types[3]);
        if (note == nullptr || !note->implementationSpecific || !note->explicitWithModelType ||
            note->constructor.size() != 1 || note->constructor[0].name != "text" ||
            llvmmeta::renderTypeAnnotation(note->constructor[0].type) != "Optional[str]")
        {
            std::cerr << "model loader did not derive the constructor from the properties\n";
            return false;
        }
    }

    {
        llvmmeta::DiagnosticEngine diag;
        auto                       model = llvmmeta::loadModelFromText("{\"name\": ", "broken.json", diag);
        if (model)
        {
            std::cerr << "model loader accepted malformed JSON\n";
            return false;
        }
        llvm::consumeError(model.takeError());
        if (!hasDiagnostic(diag, llvmmeta::DiagnosticLevel::Error, "", "malformed JSON"))
        {
            std::cerr << "model loader did not report malformed JSON\n";
            dumpDiagnostics(diag);
            return false;
        }
    }

    {
        const std::string text = R"({
          "name": "bad",
          "types": [
            {"kind": "struct", "name": "A"},
            {"kind": "concrete_class", "name": "B", "properties": [{"name": "x", "type": "List[int"}]},
            {"kind": "constrained_primitive", "name": "C", "constrainee": "decimal"},
            {"kind": "enumeration", "name": "D", "literals": [{"name": "E"}]},
            {"kind": "concrete_class", "name": "", "properties": []}
          ]
        })";
        llvmmeta::DiagnosticEngine diag;
        auto                       model = llvmmeta::loadModelFromText(text, "bad.json", diag);
        if (model)
        {
            std::cerr << "model loader accepted an invalid document\n";
            return false;
        }
        const std::string message = llvm::toString(model.takeError());
        if (message.find("meta-model loading failed with 5 error(s)") == std::string::npos ||
            !hasDiagnostic(diag, llvmmeta::DiagnosticLevel::Error, "types[0].kind", "unknown named-type kind 'struct'") ||
            !hasDiagnostic(diag, llvmmeta::DiagnosticLevel::Error, "types[1].properties[0].type", "expected ']'") ||
            !hasDiagnostic(diag, llvmmeta::DiagnosticLevel::Error, "types[2].constrainee", "primitive 'constrainee'") ||
            !hasDiagnostic(diag, llvmmeta::DiagnosticLevel::Error, "types[3].literals[0].value", "string 'value'") ||
            !hasDiagnostic(diag, llvmmeta::DiagnosticLevel::Error, "types[4].name", "non-empty string 'name'"))
        {
            std::cerr << "model loader error diagnostics mismatch: " << message << "\n";
            dumpDiagnostics(diag);
            return false;
        }
    }

    {
        llvmmeta::DiagnosticEngine diag;
        auto                       model = llvmmeta::loadModelFile("/nonexistent/llvmmeta/model.json", diag);
        if (model)
        {
            std::cerr << "model loader read a missing file\n";
            return false;
        }
        llvm::consumeError(model.takeError());
        if (!diag.hasErrors())
        {
            std::cerr << "model loader did not report a missing file\n";
            return false;
        }
    }

    return true;
}
