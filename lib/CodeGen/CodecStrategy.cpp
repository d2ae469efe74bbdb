//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the type-annotation resolver.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/CodecStrategy.h"

#include "llvm/Support/ErrorHandling.h"

#include <type_traits>

namespace llvmmeta
{
namespace
{

AtomicCodec resolveAtomic(const TypeAnnotation& annotation, const SymbolTable& symbols)
{
    if (const auto* primitive = std::get_if<PrimitiveTypeAnnotation>(&annotation.node))
    {
        return PrimitiveCoercion{primitive->primitive};
    }

    const auto* ourType = std::get_if<OurTypeAnnotation>(&annotation.node);
    if (ourType == nullptr)
    {
        llvm::report_fatal_error(llvm::Twine("unsupported nesting reached the codec resolver: ") +
                                 renderTypeAnnotation(annotation));
    }
    const NamedType* target = symbols.find(ourType->name);
    if (target == nullptr)
    {
        llvm::report_fatal_error(llvm::Twine("unresolved type reached the codec resolver: ") + ourType->name);
    }

    return std::visit(
        [&symbols](const auto& type) -> AtomicCodec {
            using T = std::decay_t<decltype(type)>;
            if constexpr (std::is_same_v<T, Enumeration>)
            {
                return EnumerationRoutine{type.name};
            }
            else if constexpr (std::is_same_v<T, ConstrainedPrimitive>)
            {
                return PrimitiveCoercion{type.constrainee};
            }
            else if constexpr (std::is_same_v<T, AbstractClass> || std::is_same_v<T, ConcreteClass>)
            {
                if (symbols.findInterface(type.name) != nullptr)
                {
                    return InterfaceRoutine{type.name};
                }
                return ClassRoutine{type.name};
            }
            else
            {
                static_assert(sizeof(T) == 0, "unhandled named-type kind");
            }
        },
        *target);
}

}  // namespace

CodecStrategy resolveCodecStrategy(const TypeAnnotation& annotation, const SymbolTable& symbols)
{
    CodecStrategy         out{PrimitiveCoercion{}, false, false};
    const TypeAnnotation* current = &annotation;

    if (const auto* optional = std::get_if<OptionalTypeAnnotation>(&current->node))
    {
        out.optional = true;
        current      = optional->value.get();
    }
    if (const auto* list = std::get_if<ListTypeAnnotation>(&current->node))
    {
        out.list = true;
        current  = list->items.get();
    }
    out.atomic = resolveAtomic(*current, symbols);
    return out;
}

std::string atomicCodecName(const AtomicCodec& atomic)
{
    return std::visit(
        [](const auto& codec) -> std::string {
            using T = std::decay_t<decltype(codec)>;
            if constexpr (std::is_same_v<T, PrimitiveCoercion>)
            {
                return primitiveTypeName(codec.primitive).str();
            }
            else
            {
                return codec.name;
            }
        },
        atomic);
}

std::string describeCodecStrategy(const CodecStrategy& strategy)
{
    std::string out;
    if (strategy.optional)
    {
        out += "optional ";
    }
    if (strategy.list)
    {
        out += "list of ";
    }
    out += std::visit(
        [](const auto& codec) -> std::string {
            using T = std::decay_t<decltype(codec)>;
            if constexpr (std::is_same_v<T, PrimitiveCoercion>)
            {
                return "primitive " + primitiveTypeName(codec.primitive).str();
            }
            else if constexpr (std::is_same_v<T, EnumerationRoutine>)
            {
                return "enumeration " + codec.name;
            }
            else if constexpr (std::is_same_v<T, ClassRoutine>)
            {
                return "class " + codec.name;
            }
            else
            {
                static_assert(std::is_same_v<T, InterfaceRoutine>);
                return "interface " + codec.name;
            }
        },
        strategy.atomic);
    return out;
}

}  // namespace llvmmeta
