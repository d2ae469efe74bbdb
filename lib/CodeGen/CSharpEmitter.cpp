//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements C# backend source emission.
///
/// Classes become interfaces plus sealed implementations visited through
/// `ITransformer<T>`; the codec plan becomes `System.Text.Json.Nodes` routines
/// reporting failures through the shared `Reporting.cs` runtime.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/CSharpEmitter.h"

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
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/ErrorHandling.h"

#include <cctype>
#include <filesystem>
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

constexpr CodegenNamingLanguage kCSharp = CodegenNamingLanguage::CSharp;

void emitDoc(std::ostringstream& out, const int indent, const Description& description)
{
    for (const auto& line : renderDocComment(DocCommentStyle::CSharpXml, description))
    {
        emitLine(out, indent, line);
    }
}

/// Resolves generated C# identifiers and spells types and expressions.
class EmitterContext final
{
public:
    EmitterContext(const MetaModel& model, const SymbolTable& symbols, std::string csharpNamespace)
        : model_(model)
        , symbols_(symbols)
        , csharpNamespace_(std::move(csharpNamespace))
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

    const std::string& csharpNamespace() const
    {
        return csharpNamespace_;
    }

    std::string className(const std::string& name) const
    {
        return codegenToCapitalCamelIdentifier(kCSharp, name);
    }

    std::string interfaceName(const std::string& name) const
    {
        return "I" + toCapitalCamelCase(name);
    }

    std::string propertyName(const std::string& name) const
    {
        return codegenToCapitalCamelIdentifier(kCSharp, name);
    }

    std::string parameterName(const std::string& name) const
    {
        return codegenToLowerCamelIdentifier(kCSharp, name);
    }

    std::string variableName(const std::string& name) const
    {
        return "the" + toCapitalCamelCase(name);
    }

    std::string atomicType(const AtomicCodec& atomic) const
    {
        return std::visit(
            [&](const auto& codec) -> std::string {
                using T = std::decay_t<decltype(codec)>;
                if constexpr (std::is_same_v<T, PrimitiveCoercion>)
                {
                    switch (codec.primitive)
                    {
                    case PrimitiveType::Bool:
                        return "bool";
                    case PrimitiveType::Int:
                        return "long";
                    case PrimitiveType::Float:
                        return "double";
                    case PrimitiveType::Str:
                        return "string";
                    case PrimitiveType::Bytearray:
                        return "byte[]";
                    }
                    llvm::report_fatal_error("unhandled primitive type");
                }
                else if constexpr (std::is_same_v<T, EnumerationRoutine>)
                {
                    return className(codec.name);
                }
                else if constexpr (std::is_same_v<T, ClassRoutine> || std::is_same_v<T, InterfaceRoutine>)
                {
                    return interfaceName(codec.name);
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled atomic codec");
                }
            },
            atomic);
    }

    /// True when the atomic C# type is a struct, so `T?` means `Nullable<T>`.
    bool isAtomicValueType(const AtomicCodec& atomic) const
    {
        if (const auto* coercion = std::get_if<PrimitiveCoercion>(&atomic))
        {
            return coercion->primitive == PrimitiveType::Bool || coercion->primitive == PrimitiveType::Int ||
                   coercion->primitive == PrimitiveType::Float;
        }
        return std::holds_alternative<EnumerationRoutine>(atomic);
    }

    bool isValueType(const CodecStrategy& strategy) const
    {
        return !strategy.list && isAtomicValueType(strategy.atomic);
    }

    std::string valueType(const CodecStrategy& strategy) const
    {
        const auto atomic = atomicType(strategy.atomic);
        return strategy.list ? "List<" + atomic + ">" : atomic;
    }

    std::string declaredType(const CodecStrategy& strategy) const
    {
        return valueType(strategy) + (strategy.optional ? "?" : "");
    }

    std::string parseAtomicCall(const AtomicCodec& atomic, const std::string& node) const
    {
        return std::visit(
            [&](const auto& codec) -> std::string {
                using T = std::decay_t<decltype(codec)>;
                if constexpr (std::is_same_v<T, PrimitiveCoercion>)
                {
                    switch (codec.primitive)
                    {
                    case PrimitiveType::Bool:
                        return "BoolFrom(" + node + ", out error)";
                    case PrimitiveType::Int:
                        return "LongFrom(" + node + ", out error)";
                    case PrimitiveType::Float:
                        return "DoubleFrom(" + node + ", out error)";
                    case PrimitiveType::Str:
                        return "StringFrom(" + node + ", out error)";
                    case PrimitiveType::Bytearray:
                        return "BytesFrom(" + node + ", out error)";
                    }
                    llvm::report_fatal_error("unhandled primitive type");
                }
                else if constexpr (std::is_same_v<T, EnumerationRoutine> || std::is_same_v<T, ClassRoutine>)
                {
                    return className(codec.name) + "From(" + node + ", out error)";
                }
                else if constexpr (std::is_same_v<T, InterfaceRoutine>)
                {
                    return interfaceName(codec.name) + "From(" + node + ", out error)";
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled atomic codec");
                }
            },
            atomic);
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
                        return "LongToJsonValue(" + value + ")";
                    case PrimitiveType::Bytearray:
                        return "Nodes.JsonValue.Create(System.Convert.ToBase64String(" + value + "))";
                    case PrimitiveType::Bool:
                    case PrimitiveType::Float:
                    case PrimitiveType::Str:
                        return "Nodes.JsonValue.Create(" + value + ")";
                    }
                    llvm::report_fatal_error("unhandled primitive type");
                }
                else if constexpr (std::is_same_v<T, EnumerationRoutine>)
                {
                    return "Serialize.ToJsonValue(" + value + ")";
                }
                else if constexpr (std::is_same_v<T, ClassRoutine> || std::is_same_v<T, InterfaceRoutine>)
                {
                    return "Transform(" + value + ")";
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
            return renderDefaultLiteral(DefaultLiteralLanguage::CSharp, coercion->primitive, value);
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
                            return className(enumeration->name) + "." + propertyName(literal.name);
                        }
                    }
                }
            }
        }
        llvm::report_fatal_error("default value does not resolve against the property type");
    }

    /// Properties a class introduces itself, without those declared by an ancestor.
    std::vector<const Property*> ownProperties(const ClassDefinition& cls) const
    {
        std::set<std::string> inherited;
        for (const auto& ancestor : cls.ancestors)
        {
            if (const auto* ancestorClass = symbols_.findClass(ancestor))
            {
                for (const auto& property : ancestorClass->properties)
                {
                    inherited.insert(property.name);
                }
            }
        }
        std::vector<const Property*> out;
        for (const auto& property : cls.properties)
        {
            if (!inherited.count(property.name))
            {
                out.push_back(&property);
            }
        }
        return out;
    }

private:
    const MetaModel&   model_;
    const SymbolTable& symbols_;
    std::string        csharpNamespace_;
};

//===----------------------------------------------------------------------===//
// Types.cs
//===----------------------------------------------------------------------===//

std::string renderTypes(const EmitterContext& ctx)
{
    std::ostringstream out;
    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitLine(out, 0, "#nullable enable");
    out << "\n";
    emitLine(out, 0, "using System.Collections.Generic;");
    out << "\n";
    emitDoc(out, 0, ctx.model().description);
    emitLine(out, 0, "namespace " + ctx.csharpNamespace());
    emitLine(out, 0, "{");
    emitLine(out, 1, "/// <summary>Root of every model class.</summary>");
    emitLine(out, 1, "public interface IClass");
    emitLine(out, 1, "{");
    emitLine(out, 2, "/// <summary>Dispatches to the transformer method of the concrete class.</summary>");
    emitLine(out, 2, "public T Transform<T>(ITransformer<T> transformer);");
    emitLine(out, 1, "}");
    out << "\n";
    emitLine(out, 1, "/// <summary>Produces one value per concrete class.</summary>");
    emitLine(out, 1, "public interface ITransformer<out T>");
    emitLine(out, 1, "{");
    emitLine(out, 2, "public T Transform(IClass that);");
    for (const auto& type : ctx.model().types)
    {
        if (const auto* cls = std::get_if<ConcreteClass>(&type))
        {
            const auto name = ctx.className(cls->name);
            emitLine(out, 2, "public T Transform" + name + "(" + name + " that);");
        }
    }
    emitLine(out, 1, "}");

    for (const auto& type : ctx.model().types)
    {
        if (const auto* enumeration = std::get_if<Enumeration>(&type))
        {
            out << "\n";
            emitDoc(out, 1, enumeration->description);
            emitLine(out, 1, "public enum " + ctx.className(enumeration->name));
            emitLine(out, 1, "{");
            for (const auto& literal : enumeration->literals)
            {
                emitDoc(out, 2, literal.description);
                emitLine(out, 2, ctx.propertyName(literal.name) + ",");
            }
            emitLine(out, 1, "}");
        }
    }

    for (const auto& type : ctx.model().types)
    {
        const auto* cls = asClassDefinition(type);
        if (cls == nullptr)
        {
            continue;
        }
        std::vector<std::string> bases;
        for (const auto& parent : cls->inheritances)
        {
            bases.push_back(ctx.interfaceName(parent));
        }
        if (bases.empty())
        {
            bases.emplace_back("IClass");
        }
        out << "\n";
        emitDoc(out, 1, cls->description);
        emitLine(out, 1, "public interface " + ctx.interfaceName(cls->name) + " : " + llvm::join(bases, ", "));
        emitLine(out, 1, "{");
        for (const auto* property : ctx.ownProperties(*cls))
        {
            emitDoc(out, 2, property->description);
            emitLine(out,
                     2,
                     "public " + ctx.declaredType(resolveCodecStrategy(property->type, ctx.symbols())) + " " +
                         ctx.propertyName(property->name) + " { get; set; }");
        }
        emitLine(out, 1, "}");
    }

    for (const auto& type : ctx.model().types)
    {
        const auto* cls = std::get_if<ConcreteClass>(&type);
        if (cls == nullptr)
        {
            continue;
        }
        const auto name = ctx.className(cls->name);
        out << "\n";
        emitDoc(out, 1, cls->description);
        emitLine(out, 1, "public sealed class " + name + " : " + ctx.interfaceName(cls->name));
        emitLine(out, 1, "{");
        for (const auto& property : cls->properties)
        {
            emitDoc(out, 2, property.description);
            emitLine(out,
                     2,
                     "public " + ctx.declaredType(resolveCodecStrategy(property.type, ctx.symbols())) + " " +
                         ctx.propertyName(property.name) + " { get; set; }");
            out << "\n";
        }
        emitLine(out, 2, "public T Transform<T>(ITransformer<T> transformer)");
        emitLine(out, 2, "{");
        emitLine(out, 3, "return transformer.Transform" + name + "(this);");
        emitLine(out, 2, "}");
        out << "\n";

        std::vector<std::string> parameters;
        for (const auto& argument : cls->constructor)
        {
            if (const auto* property = cls->findProperty(argument.name))
            {
                parameters.push_back(ctx.declaredType(resolveCodecStrategy(property->type, ctx.symbols())) + " " +
                                     ctx.parameterName(argument.name));
            }
        }
        emitLine(out, 2, "public " + name + "(" + llvm::join(parameters, ", ") + ")");
        emitLine(out, 2, "{");
        for (const auto& argument : cls->constructor)
        {
            emitLine(out, 3, ctx.propertyName(argument.name) + " = " + ctx.parameterName(argument.name) + ";");
        }
        emitLine(out, 2, "}");
        emitLine(out, 1, "}");
    }
    emitLine(out, 0, "}");
    return out.str();
}

//===----------------------------------------------------------------------===//
// Stringification.cs
//===----------------------------------------------------------------------===//

std::string renderStringification(const EmitterContext& ctx, const JsonizationPlan& plan)
{
    std::ostringstream out;
    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitLine(out, 0, "#nullable enable");
    out << "\n";
    emitLine(out, 0, "using System.Collections.Generic;");
    emitLine(out, 0, "using System.Linq;");
    out << "\n";
    emitLine(out, 0, "namespace " + ctx.csharpNamespace());
    emitLine(out, 0, "{");
    emitLine(out, 1, "/// <summary>Conversions between enumeration literals and their wire values.</summary>");
    emitLine(out, 1, "public static class Stringification");
    emitLine(out, 1, "{");
    bool first = true;
    for (const auto& entry : plan.entries)
    {
        const auto* enumeration = std::get_if<EnumerationPlan>(&entry);
        if (enumeration == nullptr)
        {
            continue;
        }
        const auto name    = ctx.className(enumeration->enumerationName);
        const auto toTable = "_" + toLowerCamelCase(enumeration->enumerationName) + "ToString";
        const auto frTable = "_" + toLowerCamelCase(enumeration->enumerationName) + "FromString";
        if (!first)
        {
            out << "\n";
        }
        first = false;
        emitLine(out,
                 2,
                 "private static readonly Dictionary<" + name + ", string> " + toTable + " = new Dictionary<" + name +
                     ", string>()");
        emitLine(out, 2, "{");
        for (const auto& literal : enumeration->cases)
        {
            emitLine(out,
                     3,
                     "{ " + name + "." + ctx.propertyName(literal.literalName) + ", " +
                         renderDoubleQuotedLiteral(literal.wireValue) + " },");
        }
        emitLine(out, 2, "};");
        out << "\n";
        emitLine(out,
                 2,
                 "private static readonly Dictionary<string, " + name + "> " + frTable + " = " + toTable +
                     ".ToDictionary(pair => pair.Value, pair => pair.Key);");
        out << "\n";
        emitLine(out, 2, "/// <summary>Returns the wire value of a literal, or null for an invalid value.</summary>");
        emitLine(out, 2, "public static string? ToString(" + name + " that)");
        emitLine(out, 2, "{");
        emitLine(out, 3, "return " + toTable + ".TryGetValue(that, out string? value) ? value : null;");
        emitLine(out, 2, "}");
        out << "\n";
        emitLine(out, 2, "/// <summary>Parses a wire value, or returns null for an unknown text.</summary>");
        emitLine(out, 2, "public static " + name + "? " + name + "FromString(string text)");
        emitLine(out, 2, "{");
        emitLine(out, 3, "if (" + frTable + ".TryGetValue(text, out " + name + " value))");
        emitLine(out, 3, "{");
        emitLine(out, 4, "return value;");
        emitLine(out, 3, "}");
        emitLine(out, 3, "return null;");
        emitLine(out, 2, "}");
    }
    emitLine(out, 1, "}");
    emitLine(out, 0, "}");
    return out.str();
}

//===----------------------------------------------------------------------===//
// Jsonization.cs
//===----------------------------------------------------------------------===//

void emitNewError(std::ostringstream& out, const int indent, const std::string& message)
{
    emitLine(out, indent, "error = new Reporting.Error(" + message + ");");
}

void emitPrimitiveParsers(std::ostringstream& out)
{
    namespace text = jsonization_diagnostic_text;
    const auto lit = [](const std::string& s) { return renderDoubleQuotedLiteral(s); };

    emitLine(out, 3, "internal static string KindName(Nodes.JsonNode? node)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "switch (node)");
    emitLine(out, 4, "{");
    emitLine(out, 5, "case null:");
    emitLine(out, 6, "return \"null\";");
    emitLine(out, 5, "case Nodes.JsonObject:");
    emitLine(out, 6, "return \"object\";");
    emitLine(out, 5, "case Nodes.JsonArray:");
    emitLine(out, 6, "return \"array\";");
    emitLine(out, 4, "}");
    emitLine(out, 4, "var value = (Nodes.JsonValue)node;");
    emitLine(out, 4, "if (value.TryGetValue<bool>(out _))");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return \"boolean\";");
    emitLine(out, 4, "}");
    emitLine(out, 4, "if (value.TryGetValue<string>(out _))");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return \"string\";");
    emitLine(out, 4, "}");
    emitLine(out, 4, "return \"number\";");
    emitLine(out, 3, "}");
    out << "\n";

    emitLine(out, 3, "internal static bool? BoolFrom(Nodes.JsonNode node, out Reporting.Error? error)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "error = null;");
    emitLine(out, 4, "if (node is Nodes.JsonValue value && value.TryGetValue<bool>(out bool result))");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return result;");
    emitLine(out, 4, "}");
    emitNewError(out, 4, lit(text::expectedBooleanPrefix()) + " + KindName(node)");
    emitLine(out, 4, "return null;");
    emitLine(out, 3, "}");
    out << "\n";

    emitLine(out, 3, "internal static long? LongFrom(Nodes.JsonNode node, out Reporting.Error? error)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "error = null;");
    emitLine(out, 4, "if (KindName(node) != \"number\")");
    emitLine(out, 4, "{");
    emitNewError(out, 5, lit(text::expectedIntegerPrefix()) + " + KindName(node)");
    emitLine(out, 5, "return null;");
    emitLine(out, 4, "}");
    emitLine(out, 4, "var value = (Nodes.JsonValue)node;");
    emitLine(out, 4, "if (value.TryGetValue<long>(out long result))");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return result;");
    emitLine(out, 4, "}");
    emitLine(out,
             4,
             "if (value.TryGetValue<double>(out double number) && System.Math.Floor(number) == number"
             " && number >= -9223372036854775808.0 && number < 9223372036854775808.0)");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return (long)number;");
    emitLine(out, 4, "}");
    emitNewError(out, 4, lit(text::integerConversionFailedPrefix()) + " + value.ToJsonString()");
    emitLine(out, 4, "return null;");
    emitLine(out, 3, "}");
    out << "\n";

    emitLine(out, 3, "internal static double? DoubleFrom(Nodes.JsonNode node, out Reporting.Error? error)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "error = null;");
    emitLine(out, 4, "if (KindName(node) == \"number\" && ((Nodes.JsonValue)node).TryGetValue<double>(out double result))");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return result;");
    emitLine(out, 4, "}");
    emitNewError(out, 4, lit(text::expectedFloatPrefix()) + " + KindName(node)");
    emitLine(out, 4, "return null;");
    emitLine(out, 3, "}");
    out << "\n";

    emitLine(out, 3, "internal static string? StringFrom(Nodes.JsonNode node, out Reporting.Error? error)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "error = null;");
    emitLine(out, 4, "if (node is Nodes.JsonValue value && value.TryGetValue<string>(out string? result))");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return result;");
    emitLine(out, 4, "}");
    emitNewError(out, 4, lit(text::expectedStringPrefix()) + " + KindName(node)");
    emitLine(out, 4, "return null;");
    emitLine(out, 3, "}");
    out << "\n";

    emitLine(out, 3, "internal static byte[]? BytesFrom(Nodes.JsonNode node, out Reporting.Error? error)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "string? text = StringFrom(node, out error);");
    emitLine(out, 4, "if (error != null || text == null)");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return null;");
    emitLine(out, 4, "}");
    emitLine(out, 4, "try");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return System.Convert.FromBase64String(text);");
    emitLine(out, 4, "}");
    emitLine(out, 4, "catch (System.FormatException exception)");
    emitLine(out, 4, "{");
    emitNewError(out, 5, lit(text::invalidBase64Prefix()) + " + exception.Message");
    emitLine(out, 5, "return null;");
    emitLine(out, 4, "}");
    emitLine(out, 3, "}");
}

void emitEnumerationParse(std::ostringstream& out, const EmitterContext& ctx, const EnumerationPlan& plan)
{
    const auto name = ctx.className(plan.enumerationName);
    emitLine(out, 3, "internal static " + name + "? " + name + "From(Nodes.JsonNode node, out Reporting.Error? error)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "string? text = StringFrom(node, out error);");
    emitLine(out, 4, "if (error != null || text == null)");
    emitLine(out, 4, "{");
    emitLine(out, 5, "return null;");
    emitLine(out, 4, "}");
    emitLine(out, 4, name + "? result = Stringification." + name + "FromString(text);");
    emitLine(out, 4, "if (result == null)");
    emitLine(out, 4, "{");
    emitNewError(out,
                 5,
                 renderDoubleQuotedLiteral(jsonization_diagnostic_text::invalidEnumerationLiteralPrefix(name)) +
                     " + text");
    emitLine(out, 4, "}");
    emitLine(out, 4, "return result;");
    emitLine(out, 3, "}");
}

void emitObjectCheck(std::ostringstream& out)
{
    emitLine(out, 4, "error = null;");
    emitLine(out, 4, "Nodes.JsonObject? obj = node as Nodes.JsonObject;");
    emitLine(out, 4, "if (obj == null)");
    emitLine(out, 4, "{");
    emitNewError(out,
                 5,
                 renderDoubleQuotedLiteral(jsonization_diagnostic_text::expectedObjectPrefix()) + " + KindName(node)");
    emitLine(out, 5, "return null;");
    emitLine(out, 4, "}");
}

void emitInterfaceDispatch(std::ostringstream& out, const EmitterContext& ctx, const InterfaceDispatchPlan& plan)
{
    namespace text = jsonization_diagnostic_text;
    const auto name = ctx.interfaceName(plan.interfaceName);
    emitLine(out, 3, "internal static " + name + "? " + name + "From(Nodes.JsonNode node, out Reporting.Error? error)");
    emitLine(out, 3, "{");
    emitObjectCheck(out);
    out << "\n";
    emitLine(out,
             4,
             "if (!obj.TryGetPropertyValue(" + renderDoubleQuotedLiteral(kModelTypeKey) +
                 ", out Nodes.JsonNode? modelTypeNode))");
    emitLine(out, 4, "{");
    emitNewError(out, 5, renderDoubleQuotedLiteral(text::missingModelType()));
    emitLine(out, 5, "return null;");
    emitLine(out, 4, "}");
    emitLine(out, 4, "string? modelType = null;");
    emitLine(out, 4, "if (modelTypeNode is Nodes.JsonValue modelTypeValue)");
    emitLine(out, 4, "{");
    emitLine(out, 5, "modelTypeValue.TryGetValue<string>(out modelType);");
    emitLine(out, 4, "}");
    emitLine(out, 4, "if (modelType == null)");
    emitLine(out, 4, "{");
    emitNewError(out, 5, renderDoubleQuotedLiteral(text::modelTypeNotStringPrefix()) + " + KindName(modelTypeNode)");
    emitLine(out, 5, "return null;");
    emitLine(out, 4, "}");
    out << "\n";
    emitLine(out, 4, "switch (modelType)");
    emitLine(out, 4, "{");
    for (const auto& dispatchCase : plan.cases)
    {
        emitLine(out, 5, "case " + renderDoubleQuotedLiteral(dispatchCase.modelType) + ":");
        emitLine(out, 6, "return " + ctx.className(dispatchCase.className) + "From(node, out error);");
    }
    emitLine(out, 5, "default:");
    emitNewError(out, 6, renderDoubleQuotedLiteral(text::unexpectedModelTypePrefix(name)) + " + modelType");
    emitLine(out, 6, "return null;");
    emitLine(out, 4, "}");
    emitLine(out, 3, "}");
}

void emitSlotParse(std::ostringstream& out, const EmitterContext& ctx, const ArgumentSlot& slot)
{
    namespace text = jsonization_diagnostic_text;
    const auto variable = ctx.variableName(slot.argumentName);
    const auto jsonKey  = renderDoubleQuotedLiteral(slot.jsonName);
    const auto prependName = "error.PrependSegment(new Reporting.NameSegment(" + jsonKey + "));";

    if (!slot.strategy.list)
    {
        emitLine(out, 7, variable + " = " + ctx.parseAtomicCall(slot.strategy.atomic, "keyValue.Value") + ";");
        emitLine(out, 7, "if (error != null)");
        emitLine(out, 7, "{");
        emitLine(out, 8, prependName);
        emitLine(out, 8, "return null;");
        emitLine(out, 7, "}");
        return;
    }

    const auto itemType = ctx.atomicType(slot.strategy.atomic);
    const auto array    = "array" + toCapitalCamelCase(slot.argumentName);
    const auto index    = "index" + toCapitalCamelCase(slot.argumentName);
    emitLine(out, 7, "Nodes.JsonArray? " + array + " = keyValue.Value as Nodes.JsonArray;");
    emitLine(out, 7, "if (" + array + " == null)");
    emitLine(out, 7, "{");
    emitNewError(out, 8, renderDoubleQuotedLiteral(text::expectedArrayPrefix()) + " + KindName(keyValue.Value)");
    emitLine(out, 8, prependName);
    emitLine(out, 8, "return null;");
    emitLine(out, 7, "}");
    emitLine(out, 7, variable + " = new List<" + itemType + ">(" + array + ".Count);");
    emitLine(out, 7, "int " + index + " = 0;");
    emitLine(out, 7, "foreach (Nodes.JsonNode? item in " + array + ")");
    emitLine(out, 7, "{");
    emitLine(out, 8, "if (item == null)");
    emitLine(out, 8, "{");
    emitNewError(out, 9, renderDoubleQuotedLiteral(text::nullItem()));
    emitLine(out, 9, "error.PrependSegment(new Reporting.IndexSegment(" + index + "));");
    emitLine(out, 9, prependName);
    emitLine(out, 9, "return null;");
    emitLine(out, 8, "}");
    emitLine(out, 8, itemType + "? parsedItem = " + ctx.parseAtomicCall(slot.strategy.atomic, "item") + ";");
    emitLine(out, 8, "if (error != null)");
    emitLine(out, 8, "{");
    emitLine(out, 9, "error.PrependSegment(new Reporting.IndexSegment(" + index + "));");
    emitLine(out, 9, prependName);
    emitLine(out, 9, "return null;");
    emitLine(out, 8, "}");
    emitLine(out,
             8,
             variable + ".Add(parsedItem ?? throw new System.InvalidOperationException("
                        "\"Unexpected result null when error is null\"));");
    emitLine(out, 8, index + "++;");
    emitLine(out, 7, "}");
}

void emitClassParse(std::ostringstream& out, const EmitterContext& ctx, const ClassCodecPlan& plan)
{
    const auto name = ctx.className(plan.className);
    emitLine(out, 3, "internal static " + name + "? " + name + "From(Nodes.JsonNode node, out Reporting.Error? error)");
    emitLine(out, 3, "{");
    emitObjectCheck(out);
    out << "\n";
    for (const auto& slot : plan.slots)
    {
        emitLine(out, 4, ctx.valueType(slot.strategy) + "? " + ctx.variableName(slot.argumentName) + " = null;");
    }
    if (!plan.slots.empty())
    {
        out << "\n";
    }
    emitLine(out, 4, "foreach (var keyValue in obj.OrderBy(pair => pair.Key, System.StringComparer.Ordinal))");
    emitLine(out, 4, "{");
    emitLine(out, 5, "switch (keyValue.Key)");
    emitLine(out, 5, "{");
    for (const auto& slot : plan.slots)
    {
        emitLine(out, 6, "case " + renderDoubleQuotedLiteral(slot.jsonName) + ":");
        emitLine(out, 6, "{");
        emitLine(out, 7, "if (keyValue.Value == null)");
        emitLine(out, 7, "{");
        emitLine(out, 8, "continue;");
        emitLine(out, 7, "}");
        emitSlotParse(out, ctx, slot);
        emitLine(out, 7, "break;");
        emitLine(out, 6, "}");
    }
    if (plan.withModelType)
    {
        emitLine(out, 6, "case " + renderDoubleQuotedLiteral(kModelTypeKey) + ":");
        emitLine(out, 7, "continue;");
    }
    emitLine(out, 6, "default:");
    emitNewError(out,
                 7,
                 renderDoubleQuotedLiteral(jsonization_diagnostic_text::unexpectedPropertyPrefix()) + " + keyValue.Key");
    emitLine(out, 7, "return null;");
    emitLine(out, 5, "}");
    emitLine(out, 4, "}");

    for (const auto& slot : plan.slots)
    {
        if (!slot.required)
        {
            continue;
        }
        out << "\n";
        emitLine(out, 4, "if (" + ctx.variableName(slot.argumentName) + " == null)");
        emitLine(out, 4, "{");
        emitNewError(out,
                     5,
                     renderDoubleQuotedLiteral(jsonization_diagnostic_text::requiredPropertyMissing(slot.jsonName)));
        emitLine(out, 5, "return null;");
        emitLine(out, 4, "}");
    }

    std::vector<std::string> arguments;
    for (const auto& slot : plan.slots)
    {
        const auto variable = ctx.variableName(slot.argumentName);
        if (slot.required)
        {
            arguments.push_back(ctx.isValueType(slot.strategy) ? variable + ".Value" : variable);
        }
        else if (slot.strategy.optional)
        {
            arguments.push_back(variable);
        }
        else if (slot.defaultValue)
        {
            arguments.push_back(variable + " ?? " + ctx.defaultExpr(slot.strategy, *slot.defaultValue));
        }
        else
        {
            llvm::report_fatal_error(llvm::Twine("argument '") + slot.argumentName + "' of class '" + plan.className +
                                     "' widens its property without a default");
        }
    }
    out << "\n";
    emitLine(out, 4, "return new " + name + "(" + llvm::join(arguments, ", ") + ");");
    emitLine(out, 3, "}");
}

void emitClassTransform(std::ostringstream& out, const EmitterContext& ctx, const ClassCodecPlan& plan)
{
    const auto name = ctx.className(plan.className);
    emitLine(out, 3, "public Nodes.JsonObject Transform" + name + "(" + name + " that)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "var result = new Nodes.JsonObject();");
    for (const auto& property : plan.properties)
    {
        const auto access = "that." + ctx.propertyName(property.propertyName);
        const auto key    = "result[" + renderDoubleQuotedLiteral(property.jsonName) + "]";
        int        indent = 4;
        std::string value = access;
        out << "\n";
        if (property.strategy.optional)
        {
            emitLine(out, 4, "if (" + access + " != null)");
            emitLine(out, 4, "{");
            indent = 5;
            if (ctx.isValueType(property.strategy))
            {
                value = access + ".Value";
            }
        }
        if (property.strategy.list)
        {
            const auto array = "array" + toCapitalCamelCase(property.propertyName);
            emitLine(out, indent, "var " + array + " = new Nodes.JsonArray();");
            emitLine(out, indent, "foreach (var item in " + value + ")");
            emitLine(out, indent, "{");
            emitLine(out, indent + 1, array + ".Add(" + ctx.serializeAtomicExpr(property.strategy.atomic, "item") + ");");
            emitLine(out, indent, "}");
            emitLine(out, indent, key + " = " + array + ";");
        }
        else
        {
            emitLine(out, indent, key + " = " + ctx.serializeAtomicExpr(property.strategy.atomic, value) + ";");
        }
        if (property.strategy.optional)
        {
            emitLine(out, 4, "}");
        }
    }
    if (plan.withModelType)
    {
        out << "\n";
        emitLine(out,
                 4,
                 "result[" + renderDoubleQuotedLiteral(kModelTypeKey) + "] = " + renderDoubleQuotedLiteral(plan.modelType) +
                     ";");
    }
    out << "\n";
    emitLine(out, 4, "return result;");
    emitLine(out, 3, "}");
}

void emitFragment(std::ostringstream& out, const std::string& fragment)
{
    out << fragment;
    if (!llvm::StringRef(fragment).ends_with("\n"))
    {
        out << "\n";
    }
}

std::string renderJsonization(const EmitterContext& ctx, const JsonizationPlan& plan)
{
    std::ostringstream out;
    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitLine(out, 0, "#nullable enable");
    out << "\n";
    emitLine(out, 0, "using System.Collections.Generic;");
    emitLine(out, 0, "using System.Linq;");
    emitLine(out, 0, "using Nodes = System.Text.Json.Nodes;");
    emitLine(out, 0, "using Reporting = LlvmMeta.Runtime.Reporting;");
    out << "\n";
    emitLine(out, 0, "namespace " + ctx.csharpNamespace());
    emitLine(out, 0, "{");
    emitLine(out, 1, "/// <summary>Deserialization from and serialization to JSON nodes.</summary>");
    emitLine(out, 1, "public static class Jsonization");
    emitLine(out, 1, "{");
    emitLine(out, 2, "/// <summary>Path-annotated parse routines; the facade converts their errors into exceptions.</summary>");
    emitLine(out, 2, "internal static class DeserializeImplementation");
    emitLine(out, 2, "{");
    emitPrimitiveParsers(out);
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
                    emitFragment(out, item.parseFragment);
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled jsonization entry");
                }
            },
            entry);
    }
    emitLine(out, 2, "}");
    out << "\n";

    emitLine(out, 2, "/// <summary>Raised when a JSON node does not represent an instance.</summary>");
    emitLine(out, 2, "public class Exception : System.Exception");
    emitLine(out, 2, "{");
    emitLine(out, 3, "public readonly string Path;");
    emitLine(out, 3, "public readonly string Cause;");
    out << "\n";
    emitLine(out, 3, "public Exception(string path, string cause)");
    emitLine(out, 4, ": base($\"{path}: {cause}\")");
    emitLine(out, 3, "{");
    emitLine(out, 4, "Path = path;");
    emitLine(out, 4, "Cause = cause;");
    emitLine(out, 3, "}");
    emitLine(out, 2, "}");
    out << "\n";

    emitLine(out, 2, "/// <summary>Deserialization facade throwing <see cref=\"Exception\" /> on failure.</summary>");
    emitLine(out, 2, "public static class Deserialize");
    emitLine(out, 2, "{");
    bool first = true;
    for (const auto& entry : plan.entries)
    {
        std::string typeName;
        if (const auto* enumeration = std::get_if<EnumerationPlan>(&entry))
        {
            typeName = ctx.className(enumeration->enumerationName);
        }
        else if (const auto* dispatch = std::get_if<InterfaceDispatchPlan>(&entry))
        {
            typeName = ctx.interfaceName(dispatch->interfaceName);
        }
        else if (const auto* cls = std::get_if<ClassCodecPlan>(&entry))
        {
            typeName = ctx.className(cls->className);
        }
        else if (const auto* specific = std::get_if<SpecificClassPlan>(&entry))
        {
            typeName = ctx.className(specific->className);
        }
        if (!first)
        {
            out << "\n";
        }
        first = false;
        emitLine(out, 3, "public static " + typeName + " " + typeName + "From(Nodes.JsonNode node)");
        emitLine(out, 3, "{");
        emitLine(out,
                 4,
                 typeName + "? result = DeserializeImplementation." + typeName +
                     "From(node, out Reporting.Error? error);");
        emitLine(out, 4, "if (error != null)");
        emitLine(out, 4, "{");
        emitLine(out,
                 5,
                 "throw new Jsonization.Exception(Reporting.GenerateJsonPath(error.PathSegments), error.Cause);");
        emitLine(out, 4, "}");
        emitLine(out,
                 4,
                 "return result ?? throw new System.InvalidOperationException("
                 "\"Unexpected output null when error is null\");");
        emitLine(out, 3, "}");
    }
    emitLine(out, 2, "}");
    out << "\n";

    emitLine(out, 2, "/// <summary>Serializes instances into JSON objects.</summary>");
    emitLine(out, 2, "internal class Transformer : ITransformer<Nodes.JsonObject>");
    emitLine(out, 2, "{");
    emitLine(out, 3, "internal static Nodes.JsonValue LongToJsonValue(long value)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "double widened = value;");
    emitLine(out, 4, "if (widened >= 9223372036854775808.0 || (long)widened != value)");
    emitLine(out, 4, "{");
    emitLine(out,
             5,
             "throw new System.ArgumentException(" +
                 renderDoubleQuotedLiteral(jsonization_diagnostic_text::integerNotLosslessPrefix()) + " + value);");
    emitLine(out, 4, "}");
    emitLine(out, 4, "return Nodes.JsonValue.Create(value);");
    emitLine(out, 3, "}");
    out << "\n";
    emitLine(out, 3, "public Nodes.JsonObject Transform(IClass that)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "return that.Transform(this);");
    emitLine(out, 3, "}");
    for (const auto& entry : plan.entries)
    {
        if (const auto* cls = std::get_if<ClassCodecPlan>(&entry))
        {
            out << "\n";
            emitClassTransform(out, ctx, *cls);
        }
        else if (const auto* specific = std::get_if<SpecificClassPlan>(&entry))
        {
            out << "\n";
            emitFragment(out, specific->transformFragment);
        }
    }
    emitLine(out, 2, "}");
    out << "\n";

    emitLine(out, 2, "/// <summary>Serialization facade.</summary>");
    emitLine(out, 2, "public static class Serialize");
    emitLine(out, 2, "{");
    emitLine(out, 3, "private static readonly Transformer _transformer = new Transformer();");
    out << "\n";
    emitLine(out, 3, "public static Nodes.JsonObject ToJsonObject(IClass that)");
    emitLine(out, 3, "{");
    emitLine(out, 4, "return _transformer.Transform(that);");
    emitLine(out, 3, "}");
    for (const auto& entry : plan.entries)
    {
        if (const auto* enumeration = std::get_if<EnumerationPlan>(&entry))
        {
            const auto name = ctx.className(enumeration->enumerationName);
            out << "\n";
            emitLine(out, 3, "public static Nodes.JsonValue ToJsonValue(" + name + " that)");
            emitLine(out, 3, "{");
            emitLine(out, 4, "string? text = Stringification.ToString(that);");
            emitLine(out, 4, "if (text == null)");
            emitLine(out, 4, "{");
            emitLine(out,
                     5,
                     "throw new System.ArgumentException($\"Invalid literal of " + name + ": {that}\");");
            emitLine(out, 4, "}");
            emitLine(out, 4, "return Nodes.JsonValue.Create(text);");
            emitLine(out, 3, "}");
        }
    }
    emitLine(out, 2, "}");
    emitLine(out, 1, "}");
    emitLine(out, 0, "}");
    return out.str();
}

llvm::Error checkNamespace(const std::string& csharpNamespace)
{
    llvm::SmallVector<llvm::StringRef, 4> parts;
    llvm::StringRef(csharpNamespace).split(parts, '.');
    for (const auto part : parts)
    {
        bool valid = !part.empty() && !std::isdigit(static_cast<unsigned char>(part.front()));
        for (const char c : part)
        {
            valid = valid && (std::isalnum(static_cast<unsigned char>(c)) || c == '_');
        }
        if (!valid || codegenIsKeyword(kCSharp, part))
        {
            return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                           "invalid C# namespace '%s'",
                                           csharpNamespace.c_str());
        }
    }
    return llvm::Error::success();
}

}  // namespace

std::string defaultCSharpNamespace(const MetaModel& model)
{
    return codegenToCapitalCamelIdentifier(kCSharp, model.name);
}

llvm::Error emitCSharp(const MetaModel&         model,
                       const JsonizationPlan&   plan,
                       const CSharpEmitOptions& options,
                       DiagnosticEngine&        diagnostics)
{
    if (options.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output directory is required");
    }
    const std::string csharpNamespace =
        options.csharpNamespace.empty() ? defaultCSharpNamespace(model) : options.csharpNamespace;
    if (auto err = checkNamespace(csharpNamespace))
    {
        return err;
    }

    const SymbolTable    symbols(model);
    const EmitterContext ctx(model, symbols, csharpNamespace);

    auto reporting = loadRuntimeFile("csharp/Reporting.cs");
    if (!reporting)
    {
        return reporting.takeError();
    }

    const std::filesystem::path                              outRoot(options.outDir);
    const std::vector<std::pair<std::string, std::string>> files = {
        {"Types.cs", renderTypes(ctx)},
        {"Stringification.cs", renderStringification(ctx, plan)},
        {"Jsonization.cs", renderJsonization(ctx, plan)},
        {"Reporting.cs", *reporting},
    };
    for (const auto& [fileName, content] : files)
    {
        if (auto err = writeGeneratedFile(outRoot / fileName, content, options.writePolicy))
        {
            return err;
        }
        diagnostics.note(SourceLocation{model.sourcePath, {}}, "generated C# file " + fileName);
    }
    return llvm::Error::success();
}

}  // namespace llvmmeta
