//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements C++ backend source emission.
///
/// The backend renders class hierarchies as abstract interfaces with virtual
/// inheritance, and renders the codec plan as free functions over
/// `llvm::json::Value` that share the header-only `llvmmeta_runtime.hpp`.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/CppEmitter.h"

#include "llvmmeta/CodeGen/CodecStrategy.h"
#include "llvmmeta/CodeGen/DefaultLiteralRender.h"
#include "llvmmeta/CodeGen/DocCommentRender.h"
#include "llvmmeta/CodeGen/JsonizationDiagnosticText.h"
#include "llvmmeta/CodeGen/JsonizationPlan.h"
#include "llvmmeta/CodeGen/NamingPolicy.h"
#include "llvmmeta/Semantics/Model.h"
#include "llvmmeta/Semantics/SymbolTable.h"
#include "llvmmeta/Support/Diagnostics.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/ErrorHandling.h"

#include <cctype>
#include <filesystem>
#include <functional>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace llvmmeta
{
namespace
{

constexpr CodegenNamingLanguage kCpp = CodegenNamingLanguage::Cpp;

std::vector<std::string> splitNamespace(const std::string& cppNamespace)
{
    llvm::SmallVector<llvm::StringRef, 4> parts;
    llvm::StringRef(cppNamespace).split(parts, "::");
    std::vector<std::string> out;
    for (const auto part : parts)
    {
        out.push_back(part.str());
    }
    return out;
}

bool isPlainIdentifier(const std::string& text)
{
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())))
    {
        return false;
    }
    for (const char c : text)
    {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_')
        {
            return false;
        }
    }
    return true;
}

std::string headerGuard(const std::string& cppNamespace, const std::string& fileStem)
{
    std::string out;
    for (const char c : cppNamespace + "_" + fileStem + "_hpp")
    {
        out.push_back(c == ':' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

void emitDoc(std::ostringstream& out, const int indent, const Description& description)
{
    for (const auto& line : renderDocComment(DocCommentStyle::Doxygen, description))
    {
        emitLine(out, indent, line);
    }
}

/// Resolves generated C++ identifiers and spells types and expressions.
class EmitterContext final
{
public:
    EmitterContext(const MetaModel& model, const SymbolTable& symbols, std::string cppNamespace)
        : model_(model)
        , symbols_(symbols)
        , cppNamespace_(std::move(cppNamespace))
    {
    }

    const MetaModel& model() const
    {
        return model_;
    }

    const SymbolTable& symbols() const
    {
        return symbols_;
    }

    const std::string& cppNamespace() const
    {
        return cppNamespace_;
    }

    std::string className(const std::string& name) const
    {
        return codegenToCapitalCamelIdentifier(kCpp, name);
    }

    std::string interfaceName(const std::string& name) const
    {
        return "I" + toCapitalCamelCase(name);
    }

    std::string literalName(const std::string& name) const
    {
        return "k" + toCapitalCamelCase(name);
    }

    std::string getterName(const std::string& propertyName) const
    {
        std::string out = codegenToSnakeCaseIdentifier(kCpp, propertyName);
        if (out == "model_type")
        {
            out += "_";
        }
        return out;
    }

    std::string memberName(const std::string& propertyName) const
    {
        return getterName(propertyName) + "_";
    }

    std::string setterName(const std::string& propertyName) const
    {
        return "set_" + getterName(propertyName);
    }

    std::string variableName(const std::string& argumentName) const
    {
        return "the_" + toLowerSnakeCase(argumentName);
    }

    std::string primitiveType(const PrimitiveType primitive) const
    {
        switch (primitive)
        {
        case PrimitiveType::Bool:
            return "bool";
        case PrimitiveType::Int:
            return "std::int64_t";
        case PrimitiveType::Float:
            return "double";
        case PrimitiveType::Str:
            return "std::string";
        case PrimitiveType::Bytearray:
            return "std::vector<std::uint8_t>";
        }
        llvm::report_fatal_error("unhandled primitive type");
    }

    std::string atomicType(const AtomicCodec& atomic) const
    {
        return std::visit(
            [&](const auto& codec) -> std::string {
                using T = std::decay_t<decltype(codec)>;
                if constexpr (std::is_same_v<T, PrimitiveCoercion>)
                {
                    return primitiveType(codec.primitive);
                }
                else if constexpr (std::is_same_v<T, EnumerationRoutine>)
                {
                    return "types::" + className(codec.name);
                }
                else if constexpr (std::is_same_v<T, ClassRoutine> || std::is_same_v<T, InterfaceRoutine>)
                {
                    return "std::shared_ptr<types::" + interfaceName(codec.name) + ">";
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled atomic codec");
                }
            },
            atomic);
    }

    /// Type of a present value: the atomic type or a vector of it.
    std::string valueType(const CodecStrategy& strategy) const
    {
        const std::string atomic = atomicType(strategy.atomic);
        return strategy.list ? "std::vector<" + atomic + ">" : atomic;
    }

    /// Declared type including the optional wrapper.
    std::string declaredType(const CodecStrategy& strategy) const
    {
        const std::string value = valueType(strategy);
        return strategy.optional ? "std::optional<" + value + ">" : value;
    }

    /// Declared type with the `types::` qualifier dropped for use inside the types namespace.
    std::string declaredTypeInTypes(const CodecStrategy& strategy) const
    {
        std::string out = declaredType(strategy);
        std::string::size_type pos = 0;
        while ((pos = out.find("types::", pos)) != std::string::npos)
        {
            out.erase(pos, 7);
        }
        return out;
    }

    std::string parseAtomicExpr(const AtomicCodec& atomic, const std::string& node) const
    {
        return std::visit(
            [&](const auto& codec) -> std::string {
                using T = std::decay_t<decltype(codec)>;
                if constexpr (std::is_same_v<T, PrimitiveCoercion>)
                {
                    switch (codec.primitive)
                    {
                    case PrimitiveType::Bool:
                        return "runtime::bool_from(" + node + ")";
                    case PrimitiveType::Int:
                        return "runtime::int64_from(" + node + ")";
                    case PrimitiveType::Float:
                        return "runtime::double_from(" + node + ")";
                    case PrimitiveType::Str:
                        return "runtime::string_from(" + node + ")";
                    case PrimitiveType::Bytearray:
                        return "runtime::bytes_from(" + node + ")";
                    }
                    llvm::report_fatal_error("unhandled primitive type");
                }
                else if constexpr (std::is_same_v<T, EnumerationRoutine>)
                {
                    return className(codec.name) + "From(" + node + ")";
                }
                else if constexpr (std::is_same_v<T, ClassRoutine>)
                {
                    return "runtime::upcast<types::" + interfaceName(codec.name) + ">(" + className(codec.name) +
                           "From(" + node + "))";
                }
                else if constexpr (std::is_same_v<T, InterfaceRoutine>)
                {
                    return interfaceName(codec.name) + "From(" + node + ")";
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled atomic codec");
                }
            },
            atomic);
    }

    std::string parseValueExpr(const CodecStrategy& strategy, const std::string& node) const
    {
        if (!strategy.list)
        {
            return parseAtomicExpr(strategy.atomic, node);
        }
        return "runtime::list_from<" + atomicType(strategy.atomic) + ">(" + node +
               ", [](const llvm::json::Value& item) { return " + parseAtomicExpr(strategy.atomic, "item") + "; })";
    }

    std::string serializeAtomicExpr(const AtomicCodec& atomic, const std::string& value) const
    {
        return std::visit(
            [&](const auto& codec) -> std::string {
                using T = std::decay_t<decltype(codec)>;
                if constexpr (std::is_same_v<T, PrimitiveCoercion>)
                {
                    switch (codec.primitive)
                    {
                    case PrimitiveType::Int:
                        return "runtime::serialize_int64(" + value + ")";
                    case PrimitiveType::Bytearray:
                        return "runtime::serialize_bytes(" + value + ")";
                    case PrimitiveType::Bool:
                    case PrimitiveType::Float:
                    case PrimitiveType::Str:
                        return value;
                    }
                    llvm::report_fatal_error("unhandled primitive type");
                }
                else if constexpr (std::is_same_v<T, EnumerationRoutine>)
                {
                    return "stringification::to_string(" + value + ")";
                }
                else if constexpr (std::is_same_v<T, ClassRoutine> || std::is_same_v<T, InterfaceRoutine>)
                {
                    return "transform(*" + value + ")";
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled atomic codec");
                }
            },
            atomic);
    }

    std::string defaultExpr(const CodecStrategy& strategy, const llvm::json::Value& value) const
    {
        if (const auto* coercion = std::get_if<PrimitiveCoercion>(&strategy.atomic))
        {
            return renderDefaultLiteral(DefaultLiteralLanguage::Cpp, coercion->primitive, value);
        }
        if (const auto* routine = std::get_if<EnumerationRoutine>(&strategy.atomic))
        {
            const auto* type = symbols_.find(routine->name);
            const auto  text = value.getAsString();
            if (type != nullptr && text)
            {
                if (const auto* enumeration = std::get_if<Enumeration>(type))
                {
                    for (const auto& literal : enumeration->literals)
                    {
                        if (literal.value == *text)
                        {
                            return "types::" + className(enumeration->name) + "::" + literalName(literal.name);
                        }
                    }
                }
            }
        }
        llvm::report_fatal_error("default value does not resolve against the property type");
    }

private:
    const MetaModel&   model_;
    const SymbolTable& symbols_;
    std::string        cppNamespace_;
};

/// Orders classes so that every class follows all of its parents.
std::vector<const ClassDefinition*> classesParentsFirst(const EmitterContext& ctx)
{
    std::vector<const ClassDefinition*> out;
    std::set<std::string>               visited;

    std::function<void(const ClassDefinition&)> visit = [&](const ClassDefinition& cls) {
        if (!visited.insert(cls.name).second)
        {
            return;
        }
        for (const auto& parent : cls.inheritances)
        {
            if (const auto* parentClass = ctx.symbols().findClass(parent))
            {
                visit(*parentClass);
            }
        }
        out.push_back(&cls);
    };

    for (const auto& type : ctx.model().types)
    {
        if (const auto* cls = asClassDefinition(type))
        {
            visit(*cls);
        }
    }
    return out;
}

void emitNamespaceOpen(std::ostringstream& out, const std::string& ns)
{
    emitLine(out, 0, "namespace " + ns);
    emitLine(out, 0, "{");
}

void emitNamespaceClose(std::ostringstream& out, const std::string& ns)
{
    emitLine(out, 0, "}  // namespace " + ns);
}

//===----------------------------------------------------------------------===//
// types.hpp
//===----------------------------------------------------------------------===//

void emitEnumeration(std::ostringstream& out, const EmitterContext& ctx, const Enumeration& enumeration)
{
    emitDoc(out, 0, enumeration.description);
    emitLine(out, 0, "enum class " + ctx.className(enumeration.name) + " : std::uint32_t");
    emitLine(out, 0, "{");
    for (std::size_t i = 0; i < enumeration.literals.size(); ++i)
    {
        const auto& literal = enumeration.literals[i];
        emitDoc(out, 1, literal.description);
        emitLine(out, 1, ctx.literalName(literal.name) + " = " + std::to_string(i) + ",");
    }
    emitLine(out, 0, "};");
    out << "\n";
}

void emitInterface(std::ostringstream& out, const EmitterContext& ctx, const ClassDefinition& cls)
{
    std::vector<std::string> bases;
    for (const auto& parent : cls.inheritances)
    {
        bases.push_back("virtual public " + ctx.interfaceName(parent));
    }
    if (bases.empty())
    {
        bases.push_back("virtual public IClass");
    }

    emitDoc(out, 0, cls.description);
    emitLine(out, 0, "class " + ctx.interfaceName(cls.name) + " : " + llvm::join(bases, ", "));
    emitLine(out, 0, "{");
    emitLine(out, 0, "public:");
    for (const auto& property : cls.properties)
    {
        const auto type = ctx.declaredTypeInTypes(resolveCodecStrategy(property.type, ctx.symbols()));
        emitDoc(out, 1, property.description);
        emitLine(out, 1, "virtual const " + type + "& " + ctx.getterName(property.name) + "() const = 0;");
        emitLine(out, 1, "virtual void " + ctx.setterName(property.name) + "(" + type + " value) = 0;");
        out << "\n";
    }
    emitLine(out, 1, "~" + ctx.interfaceName(cls.name) + "() override = default;");
    emitLine(out, 0, "};");
    out << "\n";
}

void emitConcreteClass(std::ostringstream& out, const EmitterContext& ctx, const ConcreteClass& cls)
{
    const auto name = ctx.className(cls.name);

    std::vector<std::string> parameters;
    for (const auto& argument : cls.constructor)
    {
        const auto* property = cls.findProperty(argument.name);
        if (property == nullptr)
        {
            continue;
        }
        parameters.push_back(ctx.declaredTypeInTypes(resolveCodecStrategy(property->type, ctx.symbols())) + " " +
                             ctx.getterName(argument.name));
    }

    std::vector<std::string> initializers;
    for (const auto& property : cls.properties)
    {
        initializers.push_back(ctx.memberName(property.name) + "(std::move(" + ctx.getterName(property.name) + "))");
    }

    emitDoc(out, 0, cls.description);
    emitLine(out, 0, "class " + name + " final : public " + ctx.interfaceName(cls.name));
    emitLine(out, 0, "{");
    emitLine(out, 0, "public:");
    if (parameters.empty())
    {
        emitLine(out, 1, name + "() = default;");
    }
    else
    {
        emitLine(out, 1, (parameters.size() == 1 ? "explicit " : "") + name + "(" + llvm::join(parameters, ", ") + ")");
        emitLine(out, 2, ": " + llvm::join(initializers, "\n        , "));
        emitLine(out, 1, "{");
        emitLine(out, 1, "}");
    }
    out << "\n";
    emitLine(out, 1, "ModelType model_type() const override");
    emitLine(out, 1, "{");
    emitLine(out, 2, "return ModelType::" + ctx.literalName(cls.name) + ";");
    emitLine(out, 1, "}");
    for (const auto& property : cls.properties)
    {
        const auto type = ctx.declaredTypeInTypes(resolveCodecStrategy(property.type, ctx.symbols()));
        out << "\n";
        emitLine(out, 1, "const " + type + "& " + ctx.getterName(property.name) + "() const override");
        emitLine(out, 1, "{");
        emitLine(out, 2, "return " + ctx.memberName(property.name) + ";");
        emitLine(out, 1, "}");
        out << "\n";
        emitLine(out, 1, "void " + ctx.setterName(property.name) + "(" + type + " value) override");
        emitLine(out, 1, "{");
        emitLine(out, 2, ctx.memberName(property.name) + " = std::move(value);");
        emitLine(out, 1, "}");
    }
    if (!cls.properties.empty())
    {
        out << "\n";
        emitLine(out, 0, "private:");
        for (const auto& property : cls.properties)
        {
            const auto type = ctx.declaredTypeInTypes(resolveCodecStrategy(property.type, ctx.symbols()));
            emitLine(out, 1, type + " " + ctx.memberName(property.name) + ";");
        }
    }
    emitLine(out, 0, "};");
    out << "\n";
}

std::string renderTypesHeader(const EmitterContext& ctx)
{
    std::ostringstream out;
    const auto         guard = headerGuard(ctx.cppNamespace(), "types");

    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitLine(out, 0, "#ifndef " + guard);
    emitLine(out, 0, "#define " + guard);
    out << "\n";
    emitLine(out, 0, "#include <cstdint>");
    emitLine(out, 0, "#include <memory>");
    emitLine(out, 0, "#include <optional>");
    emitLine(out, 0, "#include <string>");
    emitLine(out, 0, "#include <utility>");
    emitLine(out, 0, "#include <vector>");
    out << "\n";
    emitDoc(out, 0, ctx.model().description);
    emitNamespaceOpen(out, ctx.cppNamespace() + "::types");
    out << "\n";

    for (const auto& type : ctx.model().types)
    {
        if (const auto* enumeration = std::get_if<Enumeration>(&type))
        {
            emitEnumeration(out, ctx, *enumeration);
        }
    }

    emitLine(out, 0, "/// @brief Concrete kind of an instance, one literal per concrete class.");
    emitLine(out, 0, "enum class ModelType : std::uint32_t");
    emitLine(out, 0, "{");
    std::size_t concreteIndex = 0;
    for (const auto& type : ctx.model().types)
    {
        if (const auto* cls = std::get_if<ConcreteClass>(&type))
        {
            emitLine(out, 1, ctx.literalName(cls->name) + " = " + std::to_string(concreteIndex++) + ",");
        }
    }
    emitLine(out, 0, "};");
    out << "\n";

    emitLine(out, 0, "/// @brief Root of every model class.");
    emitLine(out, 0, "class IClass");
    emitLine(out, 0, "{");
    emitLine(out, 0, "public:");
    emitLine(out, 1, "virtual ModelType model_type() const = 0;");
    emitLine(out, 1, "virtual ~IClass() = default;");
    emitLine(out, 0, "};");
    out << "\n";

    const auto ordered = classesParentsFirst(ctx);
    for (const auto* cls : ordered)
    {
        emitLine(out, 0, "class " + ctx.interfaceName(cls->name) + ";");
    }
    if (!ordered.empty())
    {
        out << "\n";
    }
    for (const auto* cls : ordered)
    {
        emitInterface(out, ctx, *cls);
    }
    for (const auto& type : ctx.model().types)
    {
        if (const auto* cls = std::get_if<ConcreteClass>(&type))
        {
            emitConcreteClass(out, ctx, *cls);
        }
    }

    emitNamespaceClose(out, ctx.cppNamespace() + "::types");
    out << "\n";
    emitLine(out, 0, "#endif  // " + guard);
    return out.str();
}

//===----------------------------------------------------------------------===//
// stringification.hpp / stringification.cpp
//===----------------------------------------------------------------------===//

std::string renderStringificationHeader(const EmitterContext& ctx)
{
    std::ostringstream out;
    const auto         guard = headerGuard(ctx.cppNamespace(), "stringification");

    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitLine(out, 0, "#ifndef " + guard);
    emitLine(out, 0, "#define " + guard);
    out << "\n";
    emitLine(out, 0, "#include \"types.hpp\"");
    out << "\n";
    emitLine(out, 0, "#include <optional>");
    emitLine(out, 0, "#include <string>");
    out << "\n";
    emitNamespaceOpen(out, ctx.cppNamespace() + "::stringification");
    for (const auto& type : ctx.model().types)
    {
        const auto* enumeration = std::get_if<Enumeration>(&type);
        if (enumeration == nullptr)
        {
            continue;
        }
        const auto name = ctx.className(enumeration->name);
        out << "\n";
        emitLine(out, 0, "/// @brief Parses the wire value of a " + name + " literal.");
        emitLine(out, 0, "std::optional<types::" + name + "> " + name + "FromString(const std::string& text);");
        out << "\n";
        emitLine(out, 0, "/// @brief Returns the wire value of a " + name + " literal.");
        emitLine(out, 0, "std::string to_string(types::" + name + " value);");
    }
    out << "\n";
    emitNamespaceClose(out, ctx.cppNamespace() + "::stringification");
    out << "\n";
    emitLine(out, 0, "#endif  // " + guard);
    return out.str();
}

std::string renderStringificationSource(const EmitterContext& ctx, const JsonizationPlan& plan)
{
    std::ostringstream out;
    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitLine(out, 0, "#include \"stringification.hpp\"");
    out << "\n";
    emitLine(out, 0, "#include \"llvm/ADT/Twine.h\"");
    emitLine(out, 0, "#include \"llvm/Support/ErrorHandling.h\"");
    out << "\n";
    emitLine(out, 0, "#include <cstring>");
    emitLine(out, 0, "#include <utility>");
    out << "\n";
    emitNamespaceOpen(out, ctx.cppNamespace() + "::stringification");

    std::vector<const EnumerationPlan*> enumerations;
    for (const auto& entry : plan.entries)
    {
        if (const auto* enumeration = std::get_if<EnumerationPlan>(&entry))
        {
            enumerations.push_back(enumeration);
        }
    }

    if (!enumerations.empty())
    {
        emitLine(out, 0, "namespace");
        emitLine(out, 0, "{");
        for (const auto* enumeration : enumerations)
        {
            const auto name = ctx.className(enumeration->enumerationName);
            out << "\n";
            emitLine(out, 0, "constexpr std::pair<types::" + name + ", const char*> k" + name + "Literals[] = {");
            for (const auto& literal : enumeration->cases)
            {
                emitLine(out,
                         1,
                         "{types::" + name + "::" + ctx.literalName(literal.literalName) + ", " +
                             renderDoubleQuotedLiteral(literal.wireValue) + "},");
            }
            emitLine(out, 0, "};");
        }
        out << "\n";
        emitLine(out, 0, "}  // namespace");
    }

    for (const auto* enumeration : enumerations)
    {
        const auto name  = ctx.className(enumeration->enumerationName);
        const auto table = "k" + name + "Literals";
        out << "\n";
        emitLine(out, 0, "std::optional<types::" + name + "> " + name + "FromString(const std::string& text)");
        emitLine(out, 0, "{");
        emitLine(out, 1, "for (const auto& literal : " + table + ")");
        emitLine(out, 1, "{");
        emitLine(out, 2, "if (text == literal.second)");
        emitLine(out, 2, "{");
        emitLine(out, 3, "return literal.first;");
        emitLine(out, 2, "}");
        emitLine(out, 1, "}");
        emitLine(out, 1, "return std::nullopt;");
        emitLine(out, 0, "}");
        out << "\n";
        emitLine(out, 0, "std::string to_string(const types::" + name + " value)");
        emitLine(out, 0, "{");
        emitLine(out, 1, "for (const auto& literal : " + table + ")");
        emitLine(out, 1, "{");
        emitLine(out, 2, "if (value == literal.first)");
        emitLine(out, 2, "{");
        emitLine(out, 3, "return literal.second;");
        emitLine(out, 2, "}");
        emitLine(out, 1, "}");
        emitLine(out,
                 1,
                 "llvm::report_fatal_error(llvm::Twine(\"invalid literal of " + name +
                     ": \") + llvm::Twine(static_cast<unsigned>(value)));");
        emitLine(out, 0, "}");
    }

    out << "\n";
    emitNamespaceClose(out, ctx.cppNamespace() + "::stringification");
    return out.str();
}

//===----------------------------------------------------------------------===//
// jsonization.hpp / jsonization.cpp
//===----------------------------------------------------------------------===//

/// Return type and routine name of the parse routine behind one plan entry.
std::pair<std::string, std::string> parseRoutineSignature(const EmitterContext& ctx, const JsonizationEntry& entry)
{
    return std::visit(
        [&](const auto& item) -> std::pair<std::string, std::string> {
            using T = std::decay_t<decltype(item)>;
            if constexpr (std::is_same_v<T, EnumerationPlan>)
            {
                const auto name = ctx.className(item.enumerationName);
                return {"types::" + name, name + "From"};
            }
            else if constexpr (std::is_same_v<T, InterfaceDispatchPlan>)
            {
                const auto name = ctx.interfaceName(item.interfaceName);
                return {"std::shared_ptr<types::" + name + ">", name + "From"};
            }
            else if constexpr (std::is_same_v<T, ClassCodecPlan> || std::is_same_v<T, SpecificClassPlan>)
            {
                const auto name = ctx.className(item.className);
                return {"std::shared_ptr<types::" + name + ">", name + "From"};
            }
            else
            {
                static_assert(!sizeof(T*), "unhandled jsonization entry");
            }
        },
        entry);
}

std::string renderJsonizationHeader(const EmitterContext& ctx, const JsonizationPlan& plan)
{
    std::ostringstream out;
    const auto         guard = headerGuard(ctx.cppNamespace(), "jsonization");

    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitLine(out, 0, "#ifndef " + guard);
    emitLine(out, 0, "#define " + guard);
    out << "\n";
    emitLine(out, 0, "#include \"llvmmeta_runtime.hpp\"");
    emitLine(out, 0, "#include \"types.hpp\"");
    out << "\n";
    emitLine(out, 0, "#include \"llvm/Support/Error.h\"");
    emitLine(out, 0, "#include \"llvm/Support/JSON.h\"");
    out << "\n";
    emitLine(out, 0, "#include <memory>");
    out << "\n";
    emitNamespaceOpen(out, ctx.cppNamespace() + "::jsonization");
    out << "\n";
    emitLine(out, 0, "namespace runtime = ::llvmmeta::runtime;");
    out << "\n";
    emitLine(out, 0, "/// @brief Path-annotated parse routines; the facade below converts their results.");
    emitLine(out, 0, "namespace detail");
    emitLine(out, 0, "{");
    for (const auto& entry : plan.entries)
    {
        const auto [type, routine] = parseRoutineSignature(ctx, entry);
        emitLine(out, 0, "runtime::DeserializeResult<" + type + "> " + routine + "(const llvm::json::Value& node);");
    }
    emitLine(out, 0, "}  // namespace detail");
    for (const auto& entry : plan.entries)
    {
        const auto [type, routine] = parseRoutineSignature(ctx, entry);
        out << "\n";
        emitLine(out, 0, "/// @brief Deserializes " + type + " from JSON.");
        emitLine(out, 0, "/// @param[in] node JSON node.");
        emitLine(out, 0, "/// @return Instance, or a `runtime::JsonizationError` with the path and the cause.");
        emitLine(out, 0, "llvm::Expected<" + type + "> " + routine + "(const llvm::json::Value& node);");
    }
    out << "\n";
    emitLine(out, 0, "/// @brief Serializes an instance of any model class.");
    emitLine(out, 0, "llvm::json::Value serialize(const types::IClass& that);");
    for (const auto& entry : plan.entries)
    {
        if (const auto* enumeration = std::get_if<EnumerationPlan>(&entry))
        {
            out << "\n";
            emitLine(out, 0, "/// @brief Serializes a literal as its wire value.");
            emitLine(out,
                     0,
                     "llvm::json::Value serialize(types::" + ctx.className(enumeration->enumerationName) +
                         " that);");
        }
    }
    out << "\n";
    emitNamespaceClose(out, ctx.cppNamespace() + "::jsonization");
    out << "\n";
    emitLine(out, 0, "#endif  // " + guard);
    return out.str();
}

void emitErrorReturn(std::ostringstream& out, const int indent, const std::string& message)
{
    emitLine(out, indent, "return runtime::Error(" + message + ");");
}

void emitEnumerationParse(std::ostringstream& out, const EmitterContext& ctx, const EnumerationPlan& plan)
{
    const auto name = ctx.className(plan.enumerationName);
    emitLine(out, 0, "runtime::DeserializeResult<types::" + name + "> " + name + "From(const llvm::json::Value& node)");
    emitLine(out, 0, "{");
    emitLine(out, 1, "auto text = runtime::string_from(node);");
    emitLine(out, 1, "if (!text.ok())");
    emitLine(out, 1, "{");
    emitLine(out, 2, "return text.take_error();");
    emitLine(out, 1, "}");
    emitLine(out,
             1,
             "const std::optional<types::" + name + "> literal = stringification::" + name +
                 "FromString(text.value());");
    emitLine(out, 1, "if (!literal.has_value())");
    emitLine(out, 1, "{");
    emitErrorReturn(out,
                    2,
                    renderDoubleQuotedLiteral(jsonization_diagnostic_text::invalidEnumerationLiteralPrefix(name)) +
                        " + text.value()");
    emitLine(out, 1, "}");
    emitLine(out, 1, "return *literal;");
    emitLine(out, 0, "}");
}

void emitObjectCheck(std::ostringstream& out)
{
    emitLine(out, 1, "const llvm::json::Object* object = node.getAsObject();");
    emitLine(out, 1, "if (object == nullptr)");
    emitLine(out, 1, "{");
    emitErrorReturn(out,
                    2,
                    renderDoubleQuotedLiteral(jsonization_diagnostic_text::expectedObjectPrefix()) +
                        " + std::string(runtime::kind_name(node))");
    emitLine(out, 1, "}");
}

void emitInterfaceDispatch(std::ostringstream& out, const EmitterContext& ctx, const InterfaceDispatchPlan& plan)
{
    const auto name = ctx.interfaceName(plan.interfaceName);
    emitLine(out,
             0,
             "runtime::DeserializeResult<std::shared_ptr<types::" + name + ">> " + name +
                 "From(const llvm::json::Value& node)");
    emitLine(out, 0, "{");
    emitObjectCheck(out);
    out << "\n";
    emitLine(out,
             1,
             "const llvm::json::Value* model_type_node = object->get(" +
                 renderDoubleQuotedLiteral(kModelTypeKey) + ");");
    emitLine(out, 1, "if (model_type_node == nullptr)");
    emitLine(out, 1, "{");
    emitErrorReturn(out, 2, renderDoubleQuotedLiteral(jsonization_diagnostic_text::missingModelType()));
    emitLine(out, 1, "}");
    emitLine(out, 1, "const auto model_type = model_type_node->getAsString();");
    emitLine(out, 1, "if (!model_type)");
    emitLine(out, 1, "{");
    emitErrorReturn(out,
                    2,
                    renderDoubleQuotedLiteral(jsonization_diagnostic_text::modelTypeNotStringPrefix()) +
                        " + std::string(runtime::kind_name(*model_type_node))");
    emitLine(out, 1, "}");
    out << "\n";
    for (const auto& dispatchCase : plan.cases)
    {
        emitLine(out, 1, "if (*model_type == " + renderDoubleQuotedLiteral(dispatchCase.modelType) + ")");
        emitLine(out, 1, "{");
        emitLine(out,
                 2,
                 "return runtime::upcast<types::" + name + ">(" + ctx.className(dispatchCase.className) +
                     "From(node));");
        emitLine(out, 1, "}");
    }
    emitErrorReturn(out,
                    1,
                    renderDoubleQuotedLiteral(jsonization_diagnostic_text::unexpectedModelTypePrefix(name)) +
                        " + model_type->str()");
    emitLine(out, 0, "}");
}

void emitClassParse(std::ostringstream& out, const EmitterContext& ctx, const ClassCodecPlan& plan)
{
    const auto name = ctx.className(plan.className);
    emitLine(out,
             0,
             "runtime::DeserializeResult<std::shared_ptr<types::" + name + ">> " + name +
                 "From(const llvm::json::Value& node)");
    emitLine(out, 0, "{");
    emitObjectCheck(out);
    out << "\n";

    for (const auto& slot : plan.slots)
    {
        emitLine(out,
                 1,
                 "std::optional<" + ctx.valueType(slot.strategy) + "> " + ctx.variableName(slot.argumentName) + ";");
    }
    if (!plan.slots.empty())
    {
        out << "\n";
    }

    emitLine(out, 1, "for (const auto& [key, value] : runtime::sorted_members(*object))");
    emitLine(out, 1, "{");
    bool first = true;
    for (const auto& slot : plan.slots)
    {
        const auto variable = ctx.variableName(slot.argumentName);
        const auto jsonKey  = renderDoubleQuotedLiteral(slot.jsonName);
        emitLine(out, 2, std::string(first ? "if" : "else if") + " (key == " + jsonKey + ")");
        emitLine(out, 2, "{");
        emitLine(out, 3, "if (runtime::is_null(*value))");
        emitLine(out, 3, "{");
        emitLine(out, 4, "continue;");
        emitLine(out, 3, "}");
        emitLine(out, 3, "auto parsed = " + ctx.parseValueExpr(slot.strategy, "*value") + ";");
        emitLine(out, 3, "if (!parsed.ok())");
        emitLine(out, 3, "{");
        emitLine(out, 4, "runtime::Error error = parsed.take_error();");
        emitLine(out, 4, "error.prepend_name(" + jsonKey + ");");
        emitLine(out, 4, "return error;");
        emitLine(out, 3, "}");
        emitLine(out, 3, variable + " = parsed.take_value();");
        emitLine(out, 2, "}");
        first = false;
    }
    if (plan.withModelType)
    {
        emitLine(out, 2, std::string(first ? "if" : "else if") + " (key == " + renderDoubleQuotedLiteral(kModelTypeKey) + ")");
        emitLine(out, 2, "{");
        emitLine(out, 3, "continue;");
        emitLine(out, 2, "}");
        first = false;
    }
    if (first)
    {
        emitErrorReturn(out, 2, renderDoubleQuotedLiteral(jsonization_diagnostic_text::unexpectedPropertyPrefix()) + " + key.str()");
    }
    else
    {
        emitLine(out, 2, "else");
        emitLine(out, 2, "{");
        emitErrorReturn(out, 3, renderDoubleQuotedLiteral(jsonization_diagnostic_text::unexpectedPropertyPrefix()) + " + key.str()");
        emitLine(out, 2, "}");
    }
    emitLine(out, 1, "}");

    for (const auto& slot : plan.slots)
    {
        if (!slot.required)
        {
            continue;
        }
        out << "\n";
        emitLine(out, 1, "if (!" + ctx.variableName(slot.argumentName) + ".has_value())");
        emitLine(out, 1, "{");
        emitErrorReturn(out, 2, renderDoubleQuotedLiteral(jsonization_diagnostic_text::requiredPropertyMissing(slot.jsonName)));
        emitLine(out, 1, "}");
    }

    std::vector<std::string> arguments;
    for (const auto& slot : plan.slots)
    {
        const auto variable = ctx.variableName(slot.argumentName);
        if (slot.required)
        {
            arguments.push_back("std::move(*" + variable + ")");
        }
        else if (slot.strategy.optional)
        {
            arguments.push_back("std::move(" + variable + ")");
        }
        else if (slot.defaultValue)
        {
            arguments.push_back("std::move(" + variable + ").value_or(" +
                                ctx.defaultExpr(slot.strategy, *slot.defaultValue) + ")");
        }
        else
        {
            llvm::report_fatal_error(llvm::Twine("argument '") + slot.argumentName + "' of class '" + plan.className +
                                     "' widens its property without a default");
        }
    }
    out << "\n";
    emitLine(out, 1, "return std::make_shared<types::" + name + ">(" + llvm::join(arguments, ", ") + ");");
    emitLine(out, 0, "}");
}

void emitClassTransform(std::ostringstream& out, const EmitterContext& ctx, const ClassCodecPlan& plan)
{
    const auto name = ctx.className(plan.className);
    emitLine(out, 0, "llvm::json::Value Transform" + name + "(const types::" + ctx.interfaceName(plan.className) + "& that)");
    emitLine(out, 0, "{");
    emitLine(out, 1, "llvm::json::Object result;");
    for (const auto& property : plan.properties)
    {
        const auto getter = "that." + ctx.getterName(property.propertyName) + "()";
        const auto key    = "result[" + renderDoubleQuotedLiteral(property.jsonName) + "]";
        int        indent = 1;
        std::string value = getter;
        out << "\n";
        if (property.strategy.optional)
        {
            emitLine(out, 1, "if (" + getter + ".has_value())");
            emitLine(out, 1, "{");
            indent = 2;
            value  = "(*" + getter + ")";
        }
        if (property.strategy.list)
        {
            if (!property.strategy.optional)
            {
                emitLine(out, 1, "{");
                indent = 2;
            }
            emitLine(out, indent, "llvm::json::Array array;");
            emitLine(out, indent, "array.reserve(" + value + ".size());");
            emitLine(out, indent, "for (const auto& item : " + value + ")");
            emitLine(out, indent, "{");
            emitLine(out, indent + 1, "array.push_back(" + ctx.serializeAtomicExpr(property.strategy.atomic, "item") + ");");
            emitLine(out, indent, "}");
            emitLine(out, indent, key + " = std::move(array);");
            if (!property.strategy.optional)
            {
                emitLine(out, 1, "}");
            }
        }
        else
        {
            emitLine(out, indent, key + " = " + ctx.serializeAtomicExpr(property.strategy.atomic, value) + ";");
        }
        if (property.strategy.optional)
        {
            emitLine(out, 1, "}");
        }
    }
    if (plan.withModelType)
    {
        out << "\n";
        emitLine(out,
                 1,
                 "result[" + renderDoubleQuotedLiteral(kModelTypeKey) + "] = " +
                     renderDoubleQuotedLiteral(plan.modelType) + ";");
    }
    out << "\n";
    emitLine(out, 1, "return result;");
    emitLine(out, 0, "}");
}

std::string renderJsonizationSource(const EmitterContext& ctx, const JsonizationPlan& plan)
{
    std::ostringstream out;
    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitLine(out, 0, "#include \"jsonization.hpp\"");
    emitLine(out, 0, "#include \"stringification.hpp\"");
    out << "\n";
    emitLine(out, 0, "#include \"llvm/Support/ErrorHandling.h\"");
    out << "\n";
    emitLine(out, 0, "#include <optional>");
    emitLine(out, 0, "#include <string>");
    emitLine(out, 0, "#include <utility>");
    emitLine(out, 0, "#include <vector>");
    out << "\n";
    emitNamespaceOpen(out, ctx.cppNamespace() + "::jsonization");
    out << "\n";

    emitLine(out, 0, "namespace detail");
    emitLine(out, 0, "{");
    for (const auto& entry : plan.entries)
    {
        out << "\n";
        std::visit(
            [&](const auto& item) {
                using T = std::decay_t<decltype(item)>;
                if constexpr (std::is_same_v<T, EnumerationPlan>)
                {
                    emitEnumerationParse(out, ctx, item);
                }
                else if constexpr (std::is_same_v<T, InterfaceDispatchPlan>)
                {
                    emitInterfaceDispatch(out, ctx, item);
                }
                else if constexpr (std::is_same_v<T, ClassCodecPlan>)
                {
                    emitClassParse(out, ctx, item);
                }
                else if constexpr (std::is_same_v<T, SpecificClassPlan>)
                {
                    out << item.parseFragment;
                    if (!llvm::StringRef(item.parseFragment).ends_with("\n"))
                    {
                        out << "\n";
                    }
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled jsonization entry");
                }
            },
            entry);
    }
    out << "\n";
    emitLine(out, 0, "}  // namespace detail");
    out << "\n";

    emitLine(out, 0, "namespace");
    emitLine(out, 0, "{");
    out << "\n";
    emitLine(out, 0, "llvm::json::Value transform(const types::IClass& that);");
    for (const auto& entry : plan.entries)
    {
        if (const auto* cls = std::get_if<ClassCodecPlan>(&entry))
        {
            out << "\n";
            emitClassTransform(out, ctx, *cls);
        }
        else if (const auto* specific = std::get_if<SpecificClassPlan>(&entry))
        {
            out << "\n" << specific->transformFragment;
            if (!llvm::StringRef(specific->transformFragment).ends_with("\n"))
            {
                out << "\n";
            }
        }
    }
    out << "\n";
    emitLine(out, 0, "llvm::json::Value transform(const types::IClass& that)");
    emitLine(out, 0, "{");
    emitLine(out, 1, "switch (that.model_type())");
    emitLine(out, 1, "{");
    for (const auto& entry : plan.entries)
    {
        std::string className;
        if (const auto* cls = std::get_if<ClassCodecPlan>(&entry))
        {
            className = cls->className;
        }
        else if (const auto* specific = std::get_if<SpecificClassPlan>(&entry))
        {
            className = specific->className;
        }
        else
        {
            continue;
        }
        emitLine(out, 1, "case types::ModelType::" + ctx.literalName(className) + ":");
        emitLine(out,
                 2,
                 "return Transform" + ctx.className(className) + "(dynamic_cast<const types::" +
                     ctx.interfaceName(className) + "&>(that));");
    }
    emitLine(out, 1, "}");
    emitLine(out, 1, "llvm::report_fatal_error(\"unexpected model type\");");
    emitLine(out, 0, "}");
    out << "\n";
    emitLine(out, 0, "}  // namespace");

    for (const auto& entry : plan.entries)
    {
        const auto [type, routine] = parseRoutineSignature(ctx, entry);
        out << "\n";
        emitLine(out, 0, "llvm::Expected<" + type + "> " + routine + "(const llvm::json::Value& node)");
        emitLine(out, 0, "{");
        emitLine(out, 1, "return runtime::into_expected(detail::" + routine + "(node));");
        emitLine(out, 0, "}");
    }
    out << "\n";
    emitLine(out, 0, "llvm::json::Value serialize(const types::IClass& that)");
    emitLine(out, 0, "{");
    emitLine(out, 1, "return transform(that);");
    emitLine(out, 0, "}");
    for (const auto& entry : plan.entries)
    {
        if (const auto* enumeration = std::get_if<EnumerationPlan>(&entry))
        {
            out << "\n";
            emitLine(out,
                     0,
                     "llvm::json::Value serialize(const types::" + ctx.className(enumeration->enumerationName) +
                         " that)");
            emitLine(out, 0, "{");
            emitLine(out, 1, "return stringification::to_string(that);");
            emitLine(out, 0, "}");
        }
    }
    out << "\n";
    emitNamespaceClose(out, ctx.cppNamespace() + "::jsonization");
    return out.str();
}

llvm::Error checkNamespace(const std::string& cppNamespace)
{
    for (const auto& component : splitNamespace(cppNamespace))
    {
        if (!isPlainIdentifier(component) || codegenIsKeyword(kCpp, component))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "invalid C++ namespace '%s'",
                                           cppNamespace.c_str());
        }
    }
    return llvm::Error::success();
}

}  // namespace

std::string defaultCppNamespace(const MetaModel& model)
{
    return codegenToSnakeCaseIdentifier(kCpp, model.name);
}

llvm::Error emitCpp(const MetaModel&       model,
                    const JsonizationPlan& plan,
                    const CppEmitOptions&  options,
                    DiagnosticEngine&      diagnostics)
{
    if (options.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output directory is required");
    }
    const std::string cppNamespace = options.cppNamespace.empty() ? defaultCppNamespace(model) : options.cppNamespace;
    if (auto err = checkNamespace(cppNamespace))
    {
        return err;
    }

    const SymbolTable    symbols(model);
    const EmitterContext ctx(model, symbols, cppNamespace);

    auto runtime = loadRuntimeFile("cpp/llvmmeta_runtime.hpp");
    if (!runtime)
    {
        return runtime.takeError();
    }

    const std::filesystem::path outRoot(options.outDir);
    const std::vector<std::pair<std::string, std::string>> files = {
        {"types.hpp", renderTypesHeader(ctx)},
        {"stringification.hpp", renderStringificationHeader(ctx)},
        {"stringification.cpp", renderStringificationSource(ctx, plan)},
        {"jsonization.hpp", renderJsonizationHeader(ctx, plan)},
        {"jsonization.cpp", renderJsonizationSource(ctx, plan)},
        {"llvmmeta_runtime.hpp", *runtime},
    };
    for (const auto& [fileName, content] : files)
    {
        if (auto err = writeGeneratedFile(outRoot / fileName, content, options.writePolicy))
        {
            return err;
        }
        diagnostics.note(SourceLocation{model.sourcePath, {}}, "generated C++ file " + fileName);
    }
    return llvm::Error::success();
}

}  // namespace llvmmeta
