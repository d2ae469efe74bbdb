//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements semantic analysis of loaded meta-models.
///
/// Analysis resolves inheritance, synthesizes interfaces, and validates the
/// invariants the codec generators rely on. Every finding is reported; the
/// analysis fails only after the whole model has been visited.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/Semantics/Analyzer.h"

#include "llvmmeta/CodeGen/NamingPolicy.h"
#include "llvmmeta/Support/Diagnostics.h"

#include "llvm/ADT/StringSet.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace llvmmeta
{
namespace
{

bool isAtomicAnnotation(const TypeAnnotation& annotation)
{
    return std::holds_alternative<PrimitiveTypeAnnotation>(annotation.node) ||
           std::holds_alternative<OurTypeAnnotation>(annotation.node);
}

bool isListOfAtomic(const TypeAnnotation& annotation)
{
    const auto* list = std::get_if<ListTypeAnnotation>(&annotation.node);
    return list != nullptr && isAtomicAnnotation(*list->items);
}

ClassDefinition* asMutableClass(NamedType& type)
{
    if (auto* abstractClass = std::get_if<AbstractClass>(&type))
    {
        return abstractClass;
    }
    if (auto* concreteClass = std::get_if<ConcreteClass>(&type))
    {
        return concreteClass;
    }
    return nullptr;
}

void collectReferences(const TypeAnnotation& annotation, std::vector<std::string>& out)
{
    std::visit(
        [&out](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, PrimitiveTypeAnnotation>)
            {
            }
            else if constexpr (std::is_same_v<T, OurTypeAnnotation>)
            {
                out.push_back(node.name);
            }
            else if constexpr (std::is_same_v<T, ListTypeAnnotation>)
            {
                collectReferences(*node.items, out);
            }
            else
            {
                static_assert(std::is_same_v<T, OptionalTypeAnnotation>);
                collectReferences(*node.value, out);
            }
        },
        annotation.node);
}

class ModelAnalyzer final
{
public:
    ModelAnalyzer(MetaModel& model, DiagnosticEngine& diagnostics, const AnalyzeOptions& options)
        : model_(model)
        , diagnostics_(diagnostics)
        , options_(options)
    {
    }

    void run()
    {
        indexNames();
        checkInheritances();
        const bool acyclic = checkCycles();
        if (acyclic)
        {
            resolveHierarchy();
            synthesizeInterfaces();
        }
        for (const auto& type : model_.types)
        {
            if (const auto* enumeration = std::get_if<Enumeration>(&type))
            {
                checkEnumeration(*enumeration);
            }
            else if (const auto* cls = asClassDefinition(type))
            {
                checkClass(*cls, std::holds_alternative<AbstractClass>(type));
            }
        }
        checkProjectedNames();
    }

private:
    void warn(const SourceLocation& location, std::string message)
    {
        if (options_.warningsAsErrors)
        {
            diagnostics_.error(location, std::move(message));
        }
        else
        {
            diagnostics_.warning(location, std::move(message));
        }
    }

    void indexNames()
    {
        for (std::size_t i = 0; i < model_.types.size(); ++i)
        {
            const auto& name                = namedTypeName(model_.types[i]);
            const auto [it, inserted]       = index_.emplace(name, i);
            if (!inserted)
            {
                diagnostics_.error(namedTypeLocation(model_.types[i]),
                                   "duplicate named type '" + name + "' (first declared at " +
                                       namedTypeLocation(model_.types[it->second]).str() + ")");
            }
        }
    }

    const NamedType* lookup(const std::string& name) const
    {
        const auto it = index_.find(name);
        if (it == index_.end())
        {
            return nullptr;
        }
        return &model_.types[it->second];
    }

    void checkInheritances()
    {
        parents_.assign(model_.types.size(), {});
        for (std::size_t i = 0; i < model_.types.size(); ++i)
        {
            const auto* cls = asClassDefinition(model_.types[i]);
            if (cls == nullptr)
            {
                continue;
            }
            std::set<std::string> seen;
            for (std::size_t p = 0; p < cls->inheritances.size(); ++p)
            {
                const auto&          parentName = cls->inheritances[p];
                const SourceLocation location = cls->location.child(".inheritances[" + std::to_string(p) + "]");
                if (!seen.insert(parentName).second)
                {
                    diagnostics_.error(location, "class '" + cls->name + "' inherits from '" + parentName + "' twice");
                    continue;
                }
                const auto it = index_.find(parentName);
                if (it == index_.end())
                {
                    diagnostics_.error(location, "class '" + cls->name + "' inherits from unknown type '" + parentName + "'");
                    continue;
                }
                if (asClassDefinition(model_.types[it->second]) == nullptr)
                {
                    diagnostics_.error(location,
                                       "class '" + cls->name + "' cannot inherit from " +
                                           namedTypeKindName(model_.types[it->second]).str() + " '" + parentName +
                                           "'");
                    continue;
                }
                if (it->second == i)
                {
                    diagnostics_.error(location, "class '" + cls->name + "' inherits from itself");
                    continue;
                }
                parents_[i].push_back(it->second);
            }
        }
    }

    bool checkCycles()
    {
        enum class Mark : std::uint8_t
        {
            Unvisited,
            Active,
            Done,
        };
        std::vector<Mark> marks(model_.types.size(), Mark::Unvisited);
        bool              acyclic = true;

        const auto visit = [&](const auto& self, const std::size_t node) -> void {
            marks[node] = Mark::Active;
            for (const auto parent : parents_[node])
            {
                if (marks[parent] == Mark::Active)
                {
                    acyclic = false;
                    diagnostics_.error(namedTypeLocation(model_.types[node]),
                                       "inheritance cycle: '" + namedTypeName(model_.types[node]) +
                                           "' inherits from '" + namedTypeName(model_.types[parent]) +
                                           "', which is one of its own descendants");
                }
                else if (marks[parent] == Mark::Unvisited)
                {
                    self(self, parent);
                }
            }
            marks[node] = Mark::Done;
        };

        for (std::size_t i = 0; i < model_.types.size(); ++i)
        {
            if (marks[i] == Mark::Unvisited)
            {
                visit(visit, i);
            }
        }
        return acyclic;
    }

    void resolveHierarchy()
    {
        std::vector<std::set<std::size_t>> ancestors(model_.types.size());
        const auto collect = [&](const auto& self, const std::size_t node, std::set<std::size_t>& out) -> void {
            for (const auto parent : parents_[node])
            {
                if (out.insert(parent).second)
                {
                    self(self, parent, out);
                }
            }
        };
        for (std::size_t i = 0; i < model_.types.size(); ++i)
        {
            collect(collect, i, ancestors[i]);
        }

        for (std::size_t i = 0; i < model_.types.size(); ++i)
        {
            auto* cls = asMutableClass(model_.types[i]);
            if (cls == nullptr)
            {
                continue;
            }
            // std::set iterates in schema order because indices follow declaration order.
            for (const auto ancestor : ancestors[i])
            {
                cls->ancestors.push_back(namedTypeName(model_.types[ancestor]));
                asMutableClass(model_.types[ancestor])->descendants.push_back(cls->name);
            }
        }
    }

    void synthesizeInterfaces()
    {
        for (auto& type : model_.types)
        {
            auto* cls = asMutableClass(type);
            if (cls == nullptr)
            {
                continue;
            }
            const bool isAbstract = std::holds_alternative<AbstractClass>(type);
            if (isAbstract || !cls->descendants.empty())
            {
                Interface iface;
                iface.name = cls->name;
                if (!isAbstract)
                {
                    iface.implementers.push_back(cls->name);
                }
                for (const auto& descendant : cls->descendants)
                {
                    if (const auto* found = lookup(descendant); found && std::holds_alternative<ConcreteClass>(*found))
                    {
                        iface.implementers.push_back(descendant);
                    }
                }
                if (iface.implementers.empty())
                {
                    warn(cls->location,
                         "abstract class '" + cls->name + "' has no concrete descendants; values of this type can never be "
                                                          "deserialized");
                }
                cls->hasInterface = true;
                model_.interfaces.push_back(std::move(iface));
            }
            cls->withModelType = !cls->ancestors.empty() || cls->hasInterface || cls->explicitWithModelType;
        }
    }

    void checkEnumeration(const Enumeration& enumeration)
    {
        if (enumeration.literals.empty())
        {
            diagnostics_.error(enumeration.location, "enumeration '" + enumeration.name + "' has no literals");
        }
        std::map<std::string, std::string> names;
        std::map<std::string, std::string> values;
        for (std::size_t i = 0; i < enumeration.literals.size(); ++i)
        {
            const auto&          literal  = enumeration.literals[i];
            const SourceLocation location = enumeration.location.child(".literals[" + std::to_string(i) + "]");
            if (!names.emplace(literal.name, literal.name).second)
            {
                diagnostics_.error(location,
                                   "duplicate literal '" + literal.name + "' in enumeration '" + enumeration.name + "'");
            }
            const auto [it, inserted] = values.emplace(literal.value, literal.name);
            if (!inserted)
            {
                diagnostics_.error(location,
                                   "literals '" + it->second + "' and '" + literal.name + "' of enumeration '" +
                                       enumeration.name + "' share the wire value '" + literal.value + "'");
            }
        }
    }

    void checkAnnotation(const TypeAnnotation& annotation, const SourceLocation& location)
    {
        if (!isSupportedTypeAnnotation(annotation))
        {
            diagnostics_.error(location,
                               "unsupported type annotation '" + renderTypeAnnotation(annotation) +
                                   "' (expected T, List[T], Optional[T] or Optional[List[T]] with T a primitive or "
                                   "named type)");
        }
        std::vector<std::string> references;
        collectReferences(annotation, references);
        for (const auto& reference : references)
        {
            if (lookup(reference) == nullptr)
            {
                diagnostics_.error(location, "reference to unknown type '" + reference + "'");
            }
        }
    }

    void checkDefault(const Argument& argument, const Property& property)
    {
        const SourceLocation location = argument.location.child(".default");
        const auto&          value    = *argument.defaultValue;
        const auto           mismatch = [&](const std::string& expected) {
            diagnostics_.error(location,
                               "default value of argument '" + argument.name + "' must be " + expected);
        };

        if (!isAtomicAnnotation(property.type))
        {
            diagnostics_.error(location,
                               "default values are only supported for primitive and enumeration properties, but '" +
                                   property.name + "' is " + renderTypeAnnotation(property.type));
            return;
        }

        std::optional<PrimitiveType> primitive;
        if (const auto* prim = std::get_if<PrimitiveTypeAnnotation>(&property.type.node))
        {
            primitive = prim->primitive;
        }
        else
        {
            const auto* target = lookup(std::get<OurTypeAnnotation>(property.type.node).name);
            if (target == nullptr)
            {
                return;
            }
            if (const auto* constrained = std::get_if<ConstrainedPrimitive>(target))
            {
                primitive = constrained->constrainee;
            }
            else if (const auto* enumeration = std::get_if<Enumeration>(target))
            {
                const auto text = value.getAsString();
                bool       found = false;
                if (text)
                {
                    for (const auto& literal : enumeration->literals)
                    {
                        found = found || literal.value == *text;
                    }
                }
                if (!found)
                {
                    mismatch("the wire value of a literal of '" + enumeration->name + "'");
                }
                return;
            }
            else
            {
                diagnostics_.error(location,
                                   "default values are only supported for primitive and enumeration properties, but '" +
                                       property.name + "' is a class");
                return;
            }
        }

        switch (*primitive)
        {
        case PrimitiveType::Bool:
            if (!value.getAsBoolean())
            {
                mismatch("a boolean");
            }
            break;
        case PrimitiveType::Int:
            if (!value.getAsInteger())
            {
                mismatch("a 64-bit integer");
            }
            break;
        case PrimitiveType::Float:
            if (!value.getAsNumber())
            {
                mismatch("a number");
            }
            break;
        case PrimitiveType::Str:
            if (!value.getAsString())
            {
                mismatch("a string");
            }
            break;
        case PrimitiveType::Bytearray:
            diagnostics_.error(location, "default values are not supported for bytearray properties");
            break;
        }
    }

    void checkClass(const ClassDefinition& cls, const bool isAbstract)
    {
        if (isAbstract && cls.implementationSpecific)
        {
            diagnostics_.error(cls.location,
                               "abstract class '" + cls.name + "' cannot be implementation-specific; mark its concrete "
                                                               "descendants instead");
        }

        llvm::StringSet<>                  propertyNames;
        std::map<std::string, std::string> jsonNames;
        for (const auto& property : cls.properties)
        {
            checkAnnotation(property.type, property.location.child(".type"));
            if (!propertyNames.insert(property.name).second)
            {
                diagnostics_.error(property.location,
                                   "duplicate property '" + property.name + "' in class '" + cls.name + "'");
                continue;
            }
            const std::string jsonName = jsonPropertyName(property.name);
            if (jsonName == kModelTypeKey)
            {
                diagnostics_.error(property.location,
                                   "property '" + property.name + "' maps to the reserved JSON key '" +
                                       kModelTypeKey.str() + "'");
            }
            const auto [it, inserted] = jsonNames.emplace(jsonName, property.name);
            if (!inserted)
            {
                diagnostics_.error(property.location,
                                   "properties '" + it->second + "' and '" + property.name + "' of class '" + cls.name +
                                       "' both map to the JSON key '" + jsonName + "'");
            }
        }

        llvm::StringSet<> argumentNames;
        for (const auto& argument : cls.constructor)
        {
            checkAnnotation(argument.type, argument.location.child(".type"));
            if (!argumentNames.insert(argument.name).second)
            {
                diagnostics_.error(argument.location,
                                   "duplicate constructor argument '" + argument.name + "' in class '" + cls.name + "'");
                continue;
            }

            const Property* property = cls.findProperty(argument.name);
            if (property == nullptr)
            {
                diagnostics_.error(argument.location,
                                   "constructor argument '" + argument.name + "' of class '" + cls.name +
                                       "' does not correspond to any property");
                continue;
            }

            const bool exact = typeAnnotationEquals(argument.type, property->type);
            const bool widened =
                !exact && std::holds_alternative<OptionalTypeAnnotation>(argument.type.node) &&
                typeAnnotationEquals(beneathOptional(argument.type), property->type);
            if (!exact && !widened)
            {
                diagnostics_.error(argument.location,
                                   "constructor argument '" + argument.name + "' has type " +
                                       renderTypeAnnotation(argument.type) + ", but property '" + property->name +
                                       "' has type " + renderTypeAnnotation(property->type));
                continue;
            }
            if (widened && !argument.defaultValue)
            {
                diagnostics_.error(argument.location,
                                   "constructor argument '" + argument.name +
                                       "' is optional while its property is not; a 'default' value is required");
            }
            else if (widened)
            {
                checkDefault(argument, *property);
            }
            else if (argument.defaultValue)
            {
                warn(argument.location,
                     "default value of argument '" + argument.name + "' is ignored because the argument type equals "
                                                                     "the property type");
            }
        }

        for (const auto& property : cls.properties)
        {
            if (!argumentNames.contains(property.name))
            {
                diagnostics_.error(property.location,
                                   "property '" + property.name + "' of class '" + cls.name +
                                       "' is not initialized by any constructor argument");
            }
        }
    }

    void checkProjectedNames()
    {
        std::map<std::string, std::string> projected;
        for (const auto& type : model_.types)
        {
            const auto& name          = namedTypeName(type);
            const auto [it, inserted] = projected.emplace(jsonModelType(name), name);
            if (!inserted && it->second != name)
            {
                diagnostics_.error(namedTypeLocation(type),
                                   "named types '" + it->second + "' and '" + name + "' both project to '" + it->first +
                                       "', which is used as type identifier and discriminator");
            }
        }
    }

    MetaModel&                                   model_;
    DiagnosticEngine&                            diagnostics_;
    const AnalyzeOptions&                        options_;
    std::unordered_map<std::string, std::size_t> index_;
    std::vector<std::vector<std::size_t>>        parents_;
};

}  // namespace

bool isSupportedTypeAnnotation(const TypeAnnotation& annotation)
{
    if (isAtomicAnnotation(annotation) || isListOfAtomic(annotation))
    {
        return true;
    }
    if (const auto* optional = std::get_if<OptionalTypeAnnotation>(&annotation.node))
    {
        return isAtomicAnnotation(*optional->value) || isListOfAtomic(*optional->value);
    }
    return false;
}

llvm::Expected<MetaModel> analyze(MetaModel model, DiagnosticEngine& diagnostics)
{
    return analyze(std::move(model), diagnostics, AnalyzeOptions{});
}

llvm::Expected<MetaModel> analyze(MetaModel model, DiagnosticEngine& diagnostics, const AnalyzeOptions& options)
{
    const std::size_t errorsBefore = diagnostics.errorCount();
    model.interfaces.clear();

    ModelAnalyzer analyzer(model, diagnostics, options);
    analyzer.run();

    if (diagnostics.errorCount() != errorsBefore)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "semantic analysis failed with %zu error(s)",
                                       diagnostics.errorCount() - errorsBefore);
    }
    return model;
}

}  // namespace llvmmeta
