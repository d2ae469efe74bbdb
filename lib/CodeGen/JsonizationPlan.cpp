//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the backend-neutral codec plan builder.
///
/// The builder walks the analyzed model once, planning the parse and the
/// serialize side of each class together so both stay isomorphic.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/JsonizationPlan.h"

#include "llvmmeta/CodeGen/NamingPolicy.h"

#include <utility>

namespace llvmmeta
{
namespace
{

ClassCodecPlan planClass(const ClassDefinition& cls, const SymbolTable& symbols, DiagnosticEngine& diagnostics)
{
    ClassCodecPlan out;
    out.className     = cls.name;
    out.modelType     = jsonModelType(cls.name);
    out.withModelType = cls.withModelType;

    for (const auto& property : cls.properties)
    {
        out.properties.push_back(
            PropertyEmission{property.name, jsonPropertyName(property.name), resolveCodecStrategy(property.type, symbols)});
    }

    for (const auto& argument : cls.constructor)
    {
        std::size_t propertyIndex = cls.properties.size();
        for (std::size_t i = 0; i < cls.properties.size(); ++i)
        {
            if (cls.properties[i].name == argument.name)
            {
                propertyIndex = i;
                break;
            }
        }
        if (propertyIndex == cls.properties.size())
        {
            diagnostics.error(argument.location,
                              "constructor argument '" + argument.name + "' of class '" + cls.name +
                                  "' has no property to plan against");
            continue;
        }

        ArgumentSlot slot;
        slot.argumentName  = argument.name;
        slot.jsonName      = out.properties[propertyIndex].jsonName;
        slot.strategy      = out.properties[propertyIndex].strategy;
        slot.required      = !std::holds_alternative<OptionalTypeAnnotation>(argument.type.node);
        slot.propertyIndex = propertyIndex;
        if (!slot.required && !slot.strategy.optional)
        {
            slot.defaultValue = argument.defaultValue;
        }
        out.slots.push_back(std::move(slot));
    }
    return out;
}

}  // namespace

llvm::Expected<JsonizationPlan> buildJsonizationPlan(const MetaModel&               model,
                                                     const SymbolTable&             symbols,
                                                     const SpecificImplementations& fragments,
                                                     const llvm::StringRef          fragmentExtension,
                                                     DiagnosticEngine&              diagnostics)
{
    const std::size_t errorsBefore = diagnostics.errorCount();
    JsonizationPlan   plan;

    const auto requireFragment = [&](const ClassDefinition& cls, llvm::StringRef direction) -> std::string {
        const auto  key  = specificImplementationKey("Jsonization", direction, cls.name, fragmentExtension);
        const auto* text = fragments.find(key);
        if (text == nullptr)
        {
            diagnostics.error(cls.location,
                              "missing implementation-specific fragment '" + key + "' for class '" + cls.name + "'");
            return {};
        }
        const auto source = fragments.sourcePath(key);
        if (!source.empty())
        {
            plan.fragmentSources.push_back(source);
        }
        return *text;
    };

    for (const auto& type : model.types)
    {
        if (const auto* enumeration = std::get_if<Enumeration>(&type))
        {
            EnumerationPlan entry;
            entry.enumerationName = enumeration->name;
            for (const auto& literal : enumeration->literals)
            {
                entry.cases.push_back(EnumerationCase{literal.name, literal.value});
            }
            plan.entries.emplace_back(std::move(entry));
            continue;
        }

        const ClassDefinition* cls = asClassDefinition(type);
        if (cls == nullptr)
        {
            continue;
        }

        if (const Interface* iface = symbols.findInterface(cls->name))
        {
            InterfaceDispatchPlan entry;
            entry.interfaceName = iface->name;
            for (const auto& implementer : iface->implementers)
            {
                entry.cases.push_back(DispatchCase{jsonModelType(implementer), implementer});
            }
            plan.entries.emplace_back(std::move(entry));
        }

        if (!std::holds_alternative<ConcreteClass>(type))
        {
            continue;
        }

        if (cls->implementationSpecific && !fragmentExtension.empty())
        {
            SpecificClassPlan entry;
            entry.className         = cls->name;
            entry.modelType         = jsonModelType(cls->name);
            entry.parseFragment     = requireFragment(*cls, "parse");
            entry.transformFragment = requireFragment(*cls, "transform");
            plan.entries.emplace_back(std::move(entry));
            continue;
        }
        plan.entries.emplace_back(planClass(*cls, symbols, diagnostics));
    }

    if (diagnostics.errorCount() != errorsBefore)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "jsonization planning failed with %zu error(s)",
                                       diagnostics.errorCount() - errorsBefore);
    }
    return plan;
}

const ClassCodecPlan* findClassCodecPlan(const JsonizationPlan& plan, const llvm::StringRef className)
{
    for (const auto& entry : plan.entries)
    {
        if (const auto* cls = std::get_if<ClassCodecPlan>(&entry); cls && cls->className == className)
        {
            return cls;
        }
    }
    return nullptr;
}

}  // namespace llvmmeta
