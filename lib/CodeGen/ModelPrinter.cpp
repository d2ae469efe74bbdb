//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the resolved meta-model pretty-printer.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/ModelPrinter.h"

#include "llvmmeta/CodeGen/CodecStrategy.h"
#include "llvmmeta/CodeGen/NamingPolicy.h"
#include "llvmmeta/Semantics/Model.h"
#include "llvmmeta/Semantics/SymbolTable.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FormatVariadic.h"

#include <sstream>
#include <type_traits>
#include <variant>

namespace llvmmeta
{
namespace
{

std::string nameList(const std::vector<std::string>& names)
{
    return "[" + llvm::join(names, ", ") + "]";
}

void printClass(std::ostringstream& out, const ClassDefinition& cls, const SymbolTable& symbols)
{
    out << " " << cls.name << " {\n";
    out << "    inheritances: " << nameList(cls.inheritances) << "\n";
    out << "    ancestors: " << nameList(cls.ancestors) << "\n";
    out << "    descendants: " << nameList(cls.descendants) << "\n";
    out << "    interface: " << (cls.hasInterface ? "I" + toCapitalCamelCase(cls.name) : std::string("none")) << "\n";
    out << "    with_model_type: " << (cls.withModelType ? "true" : "false") << "\n";
    if (cls.implementationSpecific)
    {
        out << "    implementation_specific: true\n";
    }
    for (const auto& property : cls.properties)
    {
        out << "    property " << property.name << " : " << renderTypeAnnotation(property.type) << " json \""
            << jsonPropertyName(property.name) << "\" codec "
            << describeCodecStrategy(resolveCodecStrategy(property.type, symbols)) << "\n";
    }
    for (const auto& argument : cls.constructor)
    {
        out << "    argument " << argument.name << " : " << renderTypeAnnotation(argument.type);
        if (argument.defaultValue)
        {
            out << " = " << llvm::formatv("{0}", *argument.defaultValue).str();
        }
        out << "\n";
    }
    out << "  }\n";
}

}  // namespace

std::string printModel(const MetaModel& model)
{
    const SymbolTable  symbols(model);
    std::ostringstream out;
    out << "model \"" << model.name << "\" {\n";
    for (const auto& type : model.types)
    {
        out << "  " << namedTypeKindName(type).str();
        std::visit(
            [&](const auto& item) {
                using T = std::decay_t<decltype(item)>;
                if constexpr (std::is_same_v<T, Enumeration>)
                {
                    out << " " << item.name << " {\n";
                    for (const auto& literal : item.literals)
                    {
                        out << "    literal " << literal.name << " = \"" << literal.value << "\"\n";
                    }
                    out << "  }\n";
                }
                else if constexpr (std::is_same_v<T, ConstrainedPrimitive>)
                {
                    out << " " << item.name << " : " << primitiveTypeName(item.constrainee).str() << "\n";
                }
                else if constexpr (std::is_same_v<T, AbstractClass> || std::is_same_v<T, ConcreteClass>)
                {
                    printClass(out, item, symbols);
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled named type");
                }
            },
            type);
    }
    for (const auto& iface : model.interfaces)
    {
        out << "  interface I" << toCapitalCamelCase(iface.name) << " {\n";
        for (const auto& implementer : iface.implementers)
        {
            out << "    implementer " << implementer << " model_type \"" << jsonModelType(implementer) << "\"\n";
        }
        out << "  }\n";
    }
    out << "}\n";
    return out.str();
}

}  // namespace llvmmeta
