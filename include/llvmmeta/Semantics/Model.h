//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Core meta-model declarations: named types, type annotations, and the
/// relationships resolved by semantic analysis.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_SEMANTICS_MODEL_H
#define LLVMMETA_SEMANTICS_MODEL_H

#include "llvmmeta/Frontend/SourceLocation.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace llvmmeta
{

/// @file
/// @brief Meta-model consumed by the analyzer and every code generator.

/// @brief Primitive value kinds understood by the codecs.
enum class PrimitiveType
{

    /// @brief Boolean.
    Bool,

    /// @brief 64-bit signed integer.
    Int,

    /// @brief 64-bit IEEE-754 float.
    Float,

    /// @brief UTF-8 text.
    Str,

    /// @brief Byte string, Base64 text on the wire.
    Bytearray,
};

/// @brief Returns the model spelling of a primitive (`bool`, `int`, ...).
/// @param[in] primitive Primitive kind.
/// @return Model spelling.
llvm::StringRef primitiveTypeName(PrimitiveType primitive);

/// @brief Parses the model spelling of a primitive.
/// @param[in] text Candidate spelling.
/// @return Primitive kind, or `std::nullopt` for non-primitive names.
std::optional<PrimitiveType> parsePrimitiveType(llvm::StringRef text);

struct TypeAnnotation;

/// @brief Annotation naming a primitive.
struct PrimitiveTypeAnnotation final
{
    /// @brief Primitive kind.
    PrimitiveType primitive{PrimitiveType::Bool};
};

/// @brief Annotation naming one of the model's own named types.
struct OurTypeAnnotation final
{
    /// @brief Referenced named-type name.
    std::string name;
};

/// @brief `List[items]` annotation.
struct ListTypeAnnotation final
{
    /// @brief Item annotation.
    std::shared_ptr<const TypeAnnotation> items;
};

/// @brief `Optional[value]` annotation.
struct OptionalTypeAnnotation final
{
    /// @brief Wrapped annotation.
    std::shared_ptr<const TypeAnnotation> value;
};

/// @brief Type annotation of a property or constructor argument.
struct TypeAnnotation final
{
    /// @brief Annotation node.
    std::variant<PrimitiveTypeAnnotation, OurTypeAnnotation, ListTypeAnnotation, OptionalTypeAnnotation> node;
};

/// @brief Creates a primitive annotation.
/// @param[in] primitive Primitive kind.
/// @return Annotation value.
TypeAnnotation makePrimitiveAnnotation(PrimitiveType primitive);

/// @brief Creates a named-type annotation.
/// @param[in] name Named-type name.
/// @return Annotation value.
TypeAnnotation makeOurTypeAnnotation(std::string name);

/// @brief Creates a `List[items]` annotation.
/// @param[in] items Item annotation.
/// @return Annotation value.
TypeAnnotation makeListAnnotation(TypeAnnotation items);

/// @brief Creates an `Optional[value]` annotation.
/// @param[in] value Wrapped annotation.
/// @return Annotation value.
TypeAnnotation makeOptionalAnnotation(TypeAnnotation value);

/// @brief Renders an annotation in model syntax, e.g. `Optional[List[Point]]`.
/// @param[in] annotation Annotation to render.
/// @return Rendered text.
std::string renderTypeAnnotation(const TypeAnnotation& annotation);

/// @brief Structural equality of two annotations.
/// @param[in] lhs Left annotation.
/// @param[in] rhs Right annotation.
/// @return True when both describe the same type.
bool typeAnnotationEquals(const TypeAnnotation& lhs, const TypeAnnotation& rhs);

/// @brief Strips one `Optional` layer when present.
/// @param[in] annotation Annotation to inspect.
/// @return The wrapped annotation for `Optional[T]`, otherwise @p annotation.
const TypeAnnotation& beneathOptional(const TypeAnnotation& annotation);

/// @brief Human-facing documentation attached to a model element.
struct Description final
{
    /// @brief One-line summary.
    std::string summary;

    /// @brief Additional paragraphs.
    std::vector<std::string> remarks;

    /// @brief Indicates whether no documentation is present.
    /// @return True when summary and remarks are both empty.
    [[nodiscard]] bool empty() const
    {
        return summary.empty() && remarks.empty();
    }
};

/// @brief One literal of an enumeration.
struct EnumerationLiteral final
{
    /// @brief Literal identifier.
    std::string name;

    /// @brief Wire value written to and read from JSON.
    std::string value;

    /// @brief Attached documentation.
    Description description;
};

/// @brief Closed set of string-valued literals.
struct Enumeration final
{
    /// @brief Type name.
    std::string name;

    /// @brief Literals in declaration order.
    std::vector<EnumerationLiteral> literals;

    /// @brief Attached documentation.
    Description description;

    /// @brief Declaration location.
    SourceLocation location;
};

/// @brief Primitive with constraints the codecs do not enforce.
struct ConstrainedPrimitive final
{
    /// @brief Type name.
    std::string name;

    /// @brief Underlying primitive.
    PrimitiveType constrainee{PrimitiveType::Str};

    /// @brief Attached documentation.
    Description description;

    /// @brief Declaration location.
    SourceLocation location;
};

/// @brief Property of a class.
struct Property final
{
    /// @brief Property name in model spelling.
    std::string name;

    /// @brief Property type.
    TypeAnnotation type;

    /// @brief Attached documentation.
    Description description;

    /// @brief Declaration location.
    SourceLocation location;
};

/// @brief Constructor argument of a class.
struct Argument final
{
    /// @brief Argument name; matches one property name.
    std::string name;

    /// @brief Argument type; equals the property type or `Optional` of it.
    TypeAnnotation type;

    /// @brief Value used when an optional argument covers a non-optional property.
    std::optional<llvm::json::Value> defaultValue;

    /// @brief Declaration location.
    SourceLocation location;
};

/// @brief Fields shared by abstract and concrete classes.
struct ClassDefinition
{
    /// @brief Type name.
    std::string name;

    /// @brief Direct parents in declaration order.
    std::vector<std::string> inheritances;

    /// @brief All properties, inherited ones included, in declaration order.
    std::vector<Property> properties;

    /// @brief Constructor arguments in call order.
    std::vector<Argument> constructor;

    /// @brief Codec supplied externally through specific-implementation fragments.
    bool implementationSpecific{false};

    /// @brief Explicit request to serialize the discriminator.
    bool explicitWithModelType{false};

    /// @brief Attached documentation.
    Description description;

    /// @brief Declaration location.
    SourceLocation location;

    /// @brief Transitive ancestors in schema order (resolved by analysis).
    std::vector<std::string> ancestors;

    /// @brief Transitive descendants in schema order (resolved by analysis).
    std::vector<std::string> descendants;

    /// @brief True when an interface was synthesized for this class (resolved by analysis).
    bool hasInterface{false};

    /// @brief True when the class reads and writes the discriminator (resolved by analysis).
    bool withModelType{false};

    /// @brief Finds a property by name.
    /// @param[in] propertyName Property name.
    /// @return Matching property or `nullptr`.
    [[nodiscard]] const Property* findProperty(llvm::StringRef propertyName) const;
};

/// @brief Class that cannot be instantiated.
struct AbstractClass final : ClassDefinition
{
};

/// @brief Instantiable class.
struct ConcreteClass final : ClassDefinition
{
};

/// @brief Any named type of the model.
using NamedType = std::variant<Enumeration, ConstrainedPrimitive, AbstractClass, ConcreteClass>;

/// @brief Returns the name of a named type.
/// @param[in] type Named type.
/// @return Type name.
const std::string& namedTypeName(const NamedType& type);

/// @brief Returns the declaration location of a named type.
/// @param[in] type Named type.
/// @return Declaration location.
const SourceLocation& namedTypeLocation(const NamedType& type);

/// @brief Returns the documentation of a named type.
/// @param[in] type Named type.
/// @return Attached documentation.
const Description& namedTypeDescription(const NamedType& type);

/// @brief Returns the class part of a named type.
/// @param[in] type Named type.
/// @return Class definition, or `nullptr` for enumerations and constrained primitives.
const ClassDefinition* asClassDefinition(const NamedType& type);

/// @brief Returns a human label for the kind of a named type.
/// @param[in] type Named type.
/// @return `enumeration`, `constrained primitive`, `abstract class`, or `concrete class`.
llvm::StringRef namedTypeKindName(const NamedType& type);

/// @brief Interface synthesized for a class with descendants.
struct Interface final
{
    /// @brief Name of the class owning the interface.
    std::string name;

    /// @brief Concrete implementers in schema order; the base comes first when concrete.
    std::vector<std::string> implementers;
};

/// @brief Whole meta-model.
struct MetaModel final
{
    /// @brief Model name.
    std::string name;

    /// @brief Model-level documentation.
    Description description;

    /// @brief Path of the file the model was loaded from.
    std::string sourcePath;

    /// @brief Named types in schema order.
    std::vector<NamedType> types;

    /// @brief Synthesized interfaces in schema order (resolved by analysis).
    std::vector<Interface> interfaces;
};

}  // namespace llvmmeta

#endif  // LLVMMETA_SEMANTICS_MODEL_H
