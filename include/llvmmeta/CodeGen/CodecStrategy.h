//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Type-annotation resolver: maps a property annotation to the codec strategy
/// every backend renders for it.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_CODEC_STRATEGY_H
#define LLVMMETA_CODEGEN_CODEC_STRATEGY_H

#include "llvmmeta/Semantics/Model.h"
#include "llvmmeta/Semantics/SymbolTable.h"

#include <string>
#include <variant>

namespace llvmmeta
{

/// @brief Direct coercion between a JSON scalar and a primitive.
struct PrimitiveCoercion final
{
    /// @brief Primitive kind (constrained primitives resolve to their constrainee).
    PrimitiveType primitive{PrimitiveType::Bool};
};

/// @brief Lookup through an enumeration's literal table.
struct EnumerationRoutine final
{
    /// @brief Enumeration name.
    std::string name;
};

/// @brief Call of the per-class routine of a class without descendants.
struct ClassRoutine final
{
    /// @brief Class name.
    std::string name;
};

/// @brief Discriminator dispatch over the implementers of an interface.
struct InterfaceRoutine final
{
    /// @brief Name of the class owning the interface.
    std::string name;
};

/// @brief Codec for one atomic value.
using AtomicCodec = std::variant<PrimitiveCoercion, EnumerationRoutine, ClassRoutine, InterfaceRoutine>;

/// @brief Complete codec strategy of one annotation.
struct CodecStrategy final
{
    /// @brief Codec of the atomic value or of each list item.
    AtomicCodec atomic;

    /// @brief True when the value is a list of atomic values.
    bool list{false};

    /// @brief True when the value may be absent.
    bool optional{false};
};

/// @brief Resolves the codec strategy of an annotation.
///
/// @details
/// The resolver is pure and total on analyzed models. An unknown reference or an
/// unsupported nesting means the caller bypassed semantic analysis; that is a
/// defect of the generator and aborts through `llvm::report_fatal_error`.
///
/// @param[in] annotation Property or argument annotation.
/// @param[in] symbols Index of the analyzed model.
/// @return Codec strategy.
CodecStrategy resolveCodecStrategy(const TypeAnnotation& annotation, const SymbolTable& symbols);

/// @brief Returns the type name an atomic codec refers to.
/// @param[in] atomic Atomic codec.
/// @return Named-type name, or the primitive spelling for coercions.
std::string atomicCodecName(const AtomicCodec& atomic);

/// @brief Renders a strategy for listings, e.g. `optional list of interface Shape`.
/// @param[in] strategy Strategy to render.
/// @return Human-readable description.
std::string describeCodecStrategy(const CodecStrategy& strategy);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_CODEC_STRATEGY_H
