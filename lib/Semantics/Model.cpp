//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements meta-model helpers for type annotations and named types.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/Semantics/Model.h"

#include <type_traits>
#include <utility>

namespace llvmmeta
{

llvm::StringRef primitiveTypeName(const PrimitiveType primitive)
{
    switch (primitive)
    {
    case PrimitiveType::Bool:
        return "bool";
    case PrimitiveType::Int:
        return "int";
    case PrimitiveType::Float:
        return "float";
    case PrimitiveType::Str:
        return "str";
    case PrimitiveType::Bytearray:
        return "bytearray";
    }
    return "str";
}

std::optional<PrimitiveType> parsePrimitiveType(const llvm::StringRef text)
{
    if (text == "bool")
    {
        return PrimitiveType::Bool;
    }
    if (text == "int")
    {
        return PrimitiveType::Int;
    }
    if (text == "float")
    {
        return PrimitiveType::Float;
    }
    if (text == "str")
    {
        return PrimitiveType::Str;
    }
    if (text == "bytearray")
    {
        return PrimitiveType::Bytearray;
    }
    return std::nullopt;
}

TypeAnnotation makePrimitiveAnnotation(const PrimitiveType primitive)
{
    return TypeAnnotation{PrimitiveTypeAnnotation{primitive}};
}

TypeAnnotation makeOurTypeAnnotation(std::string name)
{
    return TypeAnnotation{OurTypeAnnotation{std::move(name)}};
}

TypeAnnotation makeListAnnotation(TypeAnnotation items)
{
    return TypeAnnotation{ListTypeAnnotation{std::make_shared<const TypeAnnotation>(std::move(items))}};
}

TypeAnnotation makeOptionalAnnotation(TypeAnnotation value)
{
    return TypeAnnotation{OptionalTypeAnnotation{std::make_shared<const TypeAnnotation>(std::move(value))}};
}

std::string renderTypeAnnotation(const TypeAnnotation& annotation)
{
    return std::visit(
        [](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, PrimitiveTypeAnnotation>)
            {
                return primitiveTypeName(node.primitive).str();
            }
            else if constexpr (std::is_same_v<T, OurTypeAnnotation>)
            {
                return node.name;
            }
            else if constexpr (std::is_same_v<T, ListTypeAnnotation>)
            {
                return "List[" + renderTypeAnnotation(*node.items) + "]";
            }
            else
            {
                static_assert(std::is_same_v<T, OptionalTypeAnnotation>);
                return "Optional[" + renderTypeAnnotation(*node.value) + "]";
            }
        },
        annotation.node);
}

bool typeAnnotationEquals(const TypeAnnotation& lhs, const TypeAnnotation& rhs)
{
    if (lhs.node.index() != rhs.node.index())
    {
        return false;
    }
    if (const auto* l = std::get_if<PrimitiveTypeAnnotation>(&lhs.node))
    {
        return l->primitive == std::get<PrimitiveTypeAnnotation>(rhs.node).primitive;
    }
    if (const auto* l = std::get_if<OurTypeAnnotation>(&lhs.node))
    {
        return l->name == std::get<OurTypeAnnotation>(rhs.node).name;
    }
    if (const auto* l = std::get_if<ListTypeAnnotation>(&lhs.node))
    {
        return typeAnnotationEquals(*l->items, *std::get<ListTypeAnnotation>(rhs.node).items);
    }
    return typeAnnotationEquals(*std::get<OptionalTypeAnnotation>(lhs.node).value,
                                *std::get<OptionalTypeAnnotation>(rhs.node).value);
}

const TypeAnnotation& beneathOptional(const TypeAnnotation& annotation)
{
    if (const auto* optional = std::get_if<OptionalTypeAnnotation>(&annotation.node))
    {
        return *optional->value;
    }
    return annotation;
}

const Property* ClassDefinition::findProperty(const llvm::StringRef propertyName) const
{
    for (const auto& property : properties)
    {
        if (property.name == propertyName)
        {
            return &property;
        }
    }
    return nullptr;
}

const std::string& namedTypeName(const NamedType& type)
{
    return std::visit([](const auto& t) -> const std::string& { return t.name; }, type);
}

const SourceLocation& namedTypeLocation(const NamedType& type)
{
    return std::visit([](const auto& t) -> const SourceLocation& { return t.location; }, type);
}

const Description& namedTypeDescription(const NamedType& type)
{
    return std::visit([](const auto& t) -> const Description& { return t.description; }, type);
}

const ClassDefinition* asClassDefinition(const NamedType& type)
{
    if (const auto* abstractClass = std::get_if<AbstractClass>(&type))
    {
        return abstractClass;
    }
    if (const auto* concreteClass = std::get_if<ConcreteClass>(&type))
    {
        return concreteClass;
    }
    return nullptr;
}

llvm::StringRef namedTypeKindName(const NamedType& type)
{
    return std::visit(
        [](const auto& t) -> llvm::StringRef {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, Enumeration>)
            {
                return "enumeration";
            }
            else if constexpr (std::is_same_v<T, ConstrainedPrimitive>)
            {
                return "constrained primitive";
            }
            else if constexpr (std::is_same_v<T, AbstractClass>)
            {
                return "abstract class";
            }
            else
            {
                static_assert(std::is_same_v<T, ConcreteClass>);
                return "concrete class";
            }
        },
        type);
}

}  // namespace llvmmeta
