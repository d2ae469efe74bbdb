//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements Go backend source emission.
///
/// Classes become interfaces plus struct implementations with accessor
/// methods; the codec plan becomes routines over the `encoding/json` generic
/// value model (`map[string]interface{}`, `[]interface{}`, scalars).
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/GoEmitter.h"

#include "llvmmeta/CodeGen/CodecStrategy.h"
#include "llvmmeta/CodeGen/DefaultLiteralRender.h"
#include "llvmmeta/CodeGen/DocCommentRender.h"
#include "llvmmeta/CodeGen/JsonizationDiagnosticText.h"
#include "llvmmeta/CodeGen/JsonizationPlan.h"
#include "llvmmeta/CodeGen/NamingPolicy.h"
#include "llvmmeta/Semantics/Model.h"
#include "llvmmeta/Semantics/SymbolTable.h"
#include "llvmmeta/Support/Diagnostics.h"

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

constexpr CodegenNamingLanguage kGo = CodegenNamingLanguage::Go;

void emitDoc(std::ostringstream& out, const int indent, const Description& description)
{
    for (const auto& line : renderDocComment(DocCommentStyle::GoLine, description))
    {
        emitLine(out, indent, line, "\t");
    }
}

/// Emits one tab-indented Go line.
void emitGoLine(std::ostringstream& out, const int indent, const std::string& line)
{
    emitLine(out, indent, line, "\t");
}

class EmitterContext final
{
public:
    EmitterContext(const MetaModel& model, const SymbolTable& symbols, std::string moduleName)
        : model_(model)
        , symbols_(symbols)
        , moduleName_(std::move(moduleName))
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

    const std::string& moduleName() const
    {
        return moduleName_;
    }

    bool hasEnumerations() const
    {
        for (const auto& type : model_.types)
        {
            if (std::holds_alternative<Enumeration>(type))
            {
                return true;
            }
        }
        return false;
    }

    std::string typeName(const std::string& name) const
    {
        return codegenToCapitalCamelIdentifier(kGo, name);
    }

    std::string interfaceName(const std::string& name) const
    {
        return "I" + toCapitalCamelCase(name);
    }

    std::string literalName(const std::string& enumerationName, const std::string& literal) const
    {
        return typeName(enumerationName) + toCapitalCamelCase(literal);
    }

    std::string modelTypeLiteral(const std::string& className) const
    {
        return "ModelType" + toCapitalCamelCase(className);
    }

    std::string getterName(const std::string& property) const
    {
        auto name = toCapitalCamelCase(property);
        return name == "ModelType" ? name + "_" : name;
    }

    std::string setterName(const std::string& property) const
    {
        return "Set" + toCapitalCamelCase(property);
    }

    std::string fieldName(const std::string& property) const
    {
        return codegenToLowerCamelIdentifier(kGo, property);
    }

    std::string variableName(const std::string& name) const
    {
        return "the" + toCapitalCamelCase(name);
    }

    std::string foundName(const std::string& name) const
    {
        return "found" + toCapitalCamelCase(name);
    }

    /// Name of the package-private parse routine of an entry.
    std::string parseRoutine(const std::string& goTypeName) const
    {
        std::string out = goTypeName;
        if (!out.empty())
        {
            out.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(out.front())));
        }
        return out + "FromJsonable";
    }

    /// Name of the package-private serialization routine of a class.
    std::string toMapRoutine(const std::string& className) const
    {
        return toLowerCamelCase(className) + "ToMap";
    }

    std::string atomicType(const AtomicCodec& atomic, const bool qualified) const
    {
        const std::string prefix = qualified ? "types." : "";
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
                        return "int64";
                    case PrimitiveType::Float:
                        return "float64";
                    case PrimitiveType::Str:
                        return "string";
                    case PrimitiveType::Bytearray:
                        return "[]byte";
                    }
                    llvm::report_fatal_error("unhandled primitive type");
                }
                else if constexpr (std::is_same_v<T, EnumerationRoutine>)
                {
                    return prefix + typeName(codec.name);
                }
                else if constexpr (std::is_same_v<T, ClassRoutine> || std::is_same_v<T, InterfaceRoutine>)
                {
                    return prefix + interfaceName(codec.name);
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled atomic codec");
                }
            },
            atomic);
    }

    /// True when an optional value of the strategy is spelled as a pointer.
    bool isPointerOptional(const CodecStrategy& strategy) const
    {
        if (!strategy.optional || strategy.list)
        {
            return false;
        }
        if (const auto* coercion = std::get_if<PrimitiveCoercion>(&strategy.atomic))
        {
            return coercion->primitive != PrimitiveType::Bytearray;
        }
        return std::holds_alternative<EnumerationRoutine>(strategy.atomic);
    }

    std::string declaredType(const CodecStrategy& strategy, const bool qualified) const
    {
        const auto atomic = atomicType(strategy.atomic, qualified);
        if (strategy.list)
        {
            return "[]" + atomic;
        }
        return isPointerOptional(strategy) ? "*" + atomic : atomic;
    }

    std::string parseAtomicCall(const AtomicCodec& atomic, const std::string& value) const
    {
        return std::visit(
            [&](const auto& codec) -> std::string {
                using T = std::decay_t<decltype(codec)>;
                if constexpr (std::is_same_v<T, PrimitiveCoercion>)
                {
                    switch (codec.primitive)
                    {
                    case PrimitiveType::Bool:
                        return "boolFromJsonable(" + value + ")";
                    case PrimitiveType::Int:
                        return "int64FromJsonable(" + value + ")";
                    case PrimitiveType::Float:
                        return "float64FromJsonable(" + value + ")";
                    case PrimitiveType::Str:
                        return "stringFromJsonable(" + value + ")";
                    case PrimitiveType::Bytearray:
                        return "bytesFromJsonable(" + value + ")";
                    }
                    llvm::report_fatal_error("unhandled primitive type");
                }
                else if constexpr (std::is_same_v<T, EnumerationRoutine> || std::is_same_v<T, ClassRoutine>)
                {
                    return parseRoutine(typeName(codec.name)) + "(" + value + ")";
                }
                else if constexpr (std::is_same_v<T, InterfaceRoutine>)
                {
                    return parseRoutine(interfaceName(codec.name)) + "(" + value + ")";
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
                        return "int64ToJsonable(" + value + ")";
                    case PrimitiveType::Bytearray:
                        return "base64.StdEncoding.EncodeToString(" + value + ")";
                    case PrimitiveType::Bool:
                    case PrimitiveType::Float:
                    case PrimitiveType::Str:
                        return value;
                    }
                    llvm::report_fatal_error("unhandled primitive type");
                }
                else if constexpr (std::is_same_v<T, EnumerationRoutine>)
                {
                    return typeName(codec.name) + "ToJsonable(" + value + ")";
                }
                else if constexpr (std::is_same_v<T, ClassRoutine> || std::is_same_v<T, InterfaceRoutine>)
                {
                    return "ToJsonable(" + value + ")";
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
            return renderDefaultLiteral(DefaultLiteralLanguage::Go, coercion->primitive, value);
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
                            return "types." + literalName(enumeration->name, literal.name);
                        }
                    }
                }
            }
        }
        llvm::report_fatal_error("default value does not resolve against the property type");
    }

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
    std::string        moduleName_;
};

//===----------------------------------------------------------------------===//
// types/types.go
//===----------------------------------------------------------------------===//

std::string renderTypes(const EmitterContext& ctx)
{
    std::ostringstream out;
    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitDoc(out, 0, ctx.model().description);
    emitGoLine(out, 0, "package types");
    out << "\n";
    emitGoLine(out, 0, "// ModelType enumerates the concrete classes.");
    emitGoLine(out, 0, "type ModelType int");
    out << "\n";
    emitGoLine(out, 0, "const (");
    bool first = true;
    for (const auto& type : ctx.model().types)
    {
        if (const auto* cls = std::get_if<ConcreteClass>(&type))
        {
            emitGoLine(out, 1, ctx.modelTypeLiteral(cls->name) + (first ? " ModelType = iota" : ""));
            first = false;
        }
    }
    emitGoLine(out, 0, ")");

    for (const auto& type : ctx.model().types)
    {
        const auto* enumeration = std::get_if<Enumeration>(&type);
        if (enumeration == nullptr)
        {
            continue;
        }
        const auto name = ctx.typeName(enumeration->name);
        out << "\n";
        emitDoc(out, 0, enumeration->description);
        emitGoLine(out, 0, "type " + name + " int");
        out << "\n";
        emitGoLine(out, 0, "const (");
        bool firstLiteral = true;
        for (const auto& literal : enumeration->literals)
        {
            emitDoc(out, 1, literal.description);
            emitGoLine(out,
                       1,
                       ctx.literalName(enumeration->name, literal.name) + (firstLiteral ? " " + name + " = iota" : ""));
            firstLiteral = false;
        }
        emitGoLine(out, 0, ")");
    }

    out << "\n";
    emitGoLine(out, 0, "// IClass is implemented by every model class.");
    emitGoLine(out, 0, "type IClass interface {");
    emitGoLine(out, 1, "ModelType() ModelType");
    emitGoLine(out, 0, "}");

    for (const auto& type : ctx.model().types)
    {
        const auto* cls = asClassDefinition(type);
        if (cls == nullptr)
        {
            continue;
        }
        out << "\n";
        emitDoc(out, 0, cls->description);
        emitGoLine(out, 0, "type " + ctx.interfaceName(cls->name) + " interface {");
        if (cls->inheritances.empty())
        {
            emitGoLine(out, 1, "IClass");
        }
        for (const auto& parent : cls->inheritances)
        {
            emitGoLine(out, 1, ctx.interfaceName(parent));
        }
        for (const auto* property : ctx.ownProperties(*cls))
        {
            const auto type = ctx.declaredType(resolveCodecStrategy(property->type, ctx.symbols()), false);
            out << "\n";
            emitDoc(out, 1, property->description);
            emitGoLine(out, 1, ctx.getterName(property->name) + "() " + type);
            emitGoLine(out, 1, ctx.setterName(property->name) + "(value " + type + ")");
        }
        emitGoLine(out, 0, "}");
    }

    for (const auto& type : ctx.model().types)
    {
        const auto* cls = std::get_if<ConcreteClass>(&type);
        if (cls == nullptr)
        {
            continue;
        }
        const auto name = ctx.typeName(cls->name);
        out << "\n";
        emitDoc(out, 0, cls->description);
        emitGoLine(out, 0, "type " + name + " struct {");
        for (const auto& property : cls->properties)
        {
            emitGoLine(out,
                       1,
                       ctx.fieldName(property.name) + " " +
                           ctx.declaredType(resolveCodecStrategy(property.type, ctx.symbols()), false));
        }
        emitGoLine(out, 0, "}");
        out << "\n";
        emitGoLine(out, 0, "func (that *" + name + ") ModelType() ModelType {");
        emitGoLine(out, 1, "return " + ctx.modelTypeLiteral(cls->name));
        emitGoLine(out, 0, "}");
        for (const auto& property : cls->properties)
        {
            const auto type  = ctx.declaredType(resolveCodecStrategy(property.type, ctx.symbols()), false);
            const auto field = ctx.fieldName(property.name);
            out << "\n";
            emitGoLine(out, 0, "func (that *" + name + ") " + ctx.getterName(property.name) + "() " + type + " {");
            emitGoLine(out, 1, "return that." + field);
            emitGoLine(out, 0, "}");
            out << "\n";
            emitGoLine(out, 0, "func (that *" + name + ") " + ctx.setterName(property.name) + "(value " + type + ") {");
            emitGoLine(out, 1, "that." + field + " = value");
            emitGoLine(out, 0, "}");
        }

        std::vector<std::string> parameters;
        std::vector<std::string> initializers;
        for (const auto& argument : cls->constructor)
        {
            const auto* property = cls->findProperty(argument.name);
            if (property == nullptr)
            {
                continue;
            }
            const auto field = ctx.fieldName(argument.name);
            parameters.push_back(field + " " +
                                 ctx.declaredType(resolveCodecStrategy(property->type, ctx.symbols()), false));
            initializers.push_back(field + ": " + field);
        }
        out << "\n";
        emitGoLine(out, 0, "// New" + name + " creates a " + name + " from its constructor arguments.");
        emitGoLine(out, 0, "func New" + name + "(" + llvm::join(parameters, ", ") + ") *" + name + " {");
        emitGoLine(out, 1, "return &" + name + "{" + llvm::join(initializers, ", ") + "}");
        emitGoLine(out, 0, "}");
    }
    return out.str();
}

//===----------------------------------------------------------------------===//
// stringification/stringification.go
//===----------------------------------------------------------------------===//

std::string renderStringification(const EmitterContext& ctx, const JsonizationPlan& plan)
{
    std::ostringstream out;
    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitGoLine(out, 0, "// Package stringification converts enumeration literals to and from wire values.");
    emitGoLine(out, 0, "package stringification");
    if (ctx.hasEnumerations())
    {
        out << "\n";
        emitGoLine(out, 0, "import \"" + ctx.moduleName() + "/types\"");
    }
    for (const auto& entry : plan.entries)
    {
        const auto* enumeration = std::get_if<EnumerationPlan>(&entry);
        if (enumeration == nullptr)
        {
            continue;
        }
        const auto name   = ctx.typeName(enumeration->enumerationName);
        const auto prefix = toLowerCamelCase(enumeration->enumerationName);
        out << "\n";
        emitGoLine(out, 0, "var " + prefix + "ToString = map[types." + name + "]string{");
        for (const auto& literal : enumeration->cases)
        {
            emitGoLine(out,
                       1,
                       "types." + ctx.literalName(enumeration->enumerationName, literal.literalName) + ": " +
                           renderDoubleQuotedLiteral(literal.wireValue) + ",");
        }
        emitGoLine(out, 0, "}");
        out << "\n";
        emitGoLine(out, 0, "var " + prefix + "FromString = map[string]types." + name + "{");
        for (const auto& literal : enumeration->cases)
        {
            emitGoLine(out,
                       1,
                       renderDoubleQuotedLiteral(literal.wireValue) + ": types." +
                           ctx.literalName(enumeration->enumerationName, literal.literalName) + ",");
        }
        emitGoLine(out, 0, "}");
        out << "\n";
        emitGoLine(out, 0, "// " + name + "ToString returns the wire value of a literal; ok is false for invalid values.");
        emitGoLine(out, 0, "func " + name + "ToString(that types." + name + ") (result string, ok bool) {");
        emitGoLine(out, 1, "result, ok = " + prefix + "ToString[that]");
        emitGoLine(out, 1, "return");
        emitGoLine(out, 0, "}");
        out << "\n";
        emitGoLine(out, 0, "// " + name + "FromString parses a wire value; ok is false for unknown texts.");
        emitGoLine(out, 0, "func " + name + "FromString(text string) (result types." + name + ", ok bool) {");
        emitGoLine(out, 1, "result, ok = " + prefix + "FromString[text]");
        emitGoLine(out, 1, "return");
        emitGoLine(out, 0, "}");
    }
    return out.str();
}

//===----------------------------------------------------------------------===//
// jsonization/jsonization.go
//===----------------------------------------------------------------------===//

std::string lit(const std::string& text)
{
    return renderDoubleQuotedLiteral(text);
}

void emitHelpers(std::ostringstream& out)
{
    namespace text = jsonization_diagnostic_text;
    const char* helpers = R"(func kindName(jsonable interface{}) string {
	switch jsonable.(type) {
	case nil:
		return "null"
	case bool:
		return "boolean"
	case float64, json.Number, int, int64:
		return "number"
	case string:
		return "string"
	case []interface{}:
		return "array"
	case map[string]interface{}:
		return "object"
	}
	return fmt.Sprintf("%T", jsonable)
}

func sortedKeys(m map[string]interface{}) []string {
	keys := make([]string, 0, len(m))
	for key := range m {
		keys = append(keys, key)
	}
	sort.Strings(keys)
	return keys
}
)";
    out << helpers << "\n";

    emitGoLine(out, 0, "func boolFromJsonable(jsonable interface{}) (result bool, err *reporting.Error) {");
    emitGoLine(out, 1, "value, ok := jsonable.(bool)");
    emitGoLine(out, 1, "if !ok {");
    emitGoLine(out, 2, "err = reporting.NewError(" + lit(text::expectedBooleanPrefix()) + " + kindName(jsonable))");
    emitGoLine(out, 2, "return");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "result = value");
    emitGoLine(out, 1, "return");
    emitGoLine(out, 0, "}");
    out << "\n";

    emitGoLine(out, 0, "func int64FromJsonable(jsonable interface{}) (result int64, err *reporting.Error) {");
    emitGoLine(out, 1, "switch number := jsonable.(type) {");
    emitGoLine(out, 1, "case int64:");
    emitGoLine(out, 2, "result = number");
    emitGoLine(out, 1, "case int:");
    emitGoLine(out, 2, "result = int64(number)");
    emitGoLine(out, 1, "case json.Number:");
    emitGoLine(out, 2, "parsed, parseErr := number.Int64()");
    emitGoLine(out, 2, "if parseErr != nil {");
    emitGoLine(out, 3, "err = reporting.NewError(" + lit(text::integerConversionFailedPrefix()) + " + number.String())");
    emitGoLine(out, 3, "return");
    emitGoLine(out, 2, "}");
    emitGoLine(out, 2, "result = parsed");
    emitGoLine(out, 1, "case float64:");
    emitGoLine(out,
               2,
               "if math.Trunc(number) != number || number < -9223372036854775808.0 || number >= 9223372036854775808.0 {");
    emitGoLine(out,
               3,
               "err = reporting.NewError(" + lit(text::integerConversionFailedPrefix()) +
                   " + strconv.FormatFloat(number, 'g', -1, 64))");
    emitGoLine(out, 3, "return");
    emitGoLine(out, 2, "}");
    emitGoLine(out, 2, "result = int64(number)");
    emitGoLine(out, 1, "default:");
    emitGoLine(out, 2, "err = reporting.NewError(" + lit(text::expectedIntegerPrefix()) + " + kindName(jsonable))");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "return");
    emitGoLine(out, 0, "}");
    out << "\n";

    emitGoLine(out, 0, "func float64FromJsonable(jsonable interface{}) (result float64, err *reporting.Error) {");
    emitGoLine(out, 1, "switch number := jsonable.(type) {");
    emitGoLine(out, 1, "case float64:");
    emitGoLine(out, 2, "result = number");
    emitGoLine(out, 1, "case int64:");
    emitGoLine(out, 2, "result = float64(number)");
    emitGoLine(out, 1, "case int:");
    emitGoLine(out, 2, "result = float64(number)");
    emitGoLine(out, 1, "case json.Number:");
    emitGoLine(out, 2, "parsed, parseErr := number.Float64()");
    emitGoLine(out, 2, "if parseErr != nil {");
    emitGoLine(out, 3, "err = reporting.NewError(" + lit(text::expectedFloatPrefix()) + " + number.String())");
    emitGoLine(out, 3, "return");
    emitGoLine(out, 2, "}");
    emitGoLine(out, 2, "result = parsed");
    emitGoLine(out, 1, "default:");
    emitGoLine(out, 2, "err = reporting.NewError(" + lit(text::expectedFloatPrefix()) + " + kindName(jsonable))");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "return");
    emitGoLine(out, 0, "}");
    out << "\n";

    emitGoLine(out, 0, "func stringFromJsonable(jsonable interface{}) (result string, err *reporting.Error) {");
    emitGoLine(out, 1, "value, ok := jsonable.(string)");
    emitGoLine(out, 1, "if !ok {");
    emitGoLine(out, 2, "err = reporting.NewError(" + lit(text::expectedStringPrefix()) + " + kindName(jsonable))");
    emitGoLine(out, 2, "return");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "result = value");
    emitGoLine(out, 1, "return");
    emitGoLine(out, 0, "}");
    out << "\n";

    emitGoLine(out, 0, "func bytesFromJsonable(jsonable interface{}) (result []byte, err *reporting.Error) {");
    emitGoLine(out, 1, "text, textErr := stringFromJsonable(jsonable)");
    emitGoLine(out, 1, "if textErr != nil {");
    emitGoLine(out, 2, "err = textErr");
    emitGoLine(out, 2, "return");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "decoded, decodeErr := base64.StdEncoding.DecodeString(text)");
    emitGoLine(out, 1, "if decodeErr != nil {");
    emitGoLine(out, 2, "err = reporting.NewError(" + lit(text::invalidBase64Prefix()) + " + decodeErr.Error())");
    emitGoLine(out, 2, "return");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "result = decoded");
    emitGoLine(out, 1, "return");
    emitGoLine(out, 0, "}");
    out << "\n";

    emitGoLine(out, 0, "func int64ToJsonable(value int64) interface{} {");
    emitGoLine(out, 1, "widened := float64(value)");
    emitGoLine(out, 1, "if widened >= 9223372036854775808.0 || int64(widened) != value {");
    emitGoLine(out, 2, "panic(" + lit(text::integerNotLosslessPrefix()) + " + strconv.FormatInt(value, 10))");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "return value");
    emitGoLine(out, 0, "}");
}

void emitObjectCheck(std::ostringstream& out)
{
    emitGoLine(out, 1, "m, ok := jsonable.(map[string]interface{})");
    emitGoLine(out, 1, "if !ok {");
    emitGoLine(out,
               2,
               "err = reporting.NewError(" + lit(jsonization_diagnostic_text::expectedObjectPrefix()) +
                   " + kindName(jsonable))");
    emitGoLine(out, 2, "return");
    emitGoLine(out, 1, "}");
}

void emitEnumerationParse(std::ostringstream& out, const EmitterContext& ctx, const EnumerationPlan& plan)
{
    const auto name = ctx.typeName(plan.enumerationName);
    emitGoLine(out,
               0,
               "func " + ctx.parseRoutine(name) + "(jsonable interface{}) (result types." + name +
                   ", err *reporting.Error) {");
    emitGoLine(out, 1, "text, textErr := stringFromJsonable(jsonable)");
    emitGoLine(out, 1, "if textErr != nil {");
    emitGoLine(out, 2, "err = textErr");
    emitGoLine(out, 2, "return");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "literal, ok := stringification." + name + "FromString(text)");
    emitGoLine(out, 1, "if !ok {");
    emitGoLine(out,
               2,
               "err = reporting.NewError(" +
                   lit(jsonization_diagnostic_text::invalidEnumerationLiteralPrefix(name)) + " + text)");
    emitGoLine(out, 2, "return");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "result = literal");
    emitGoLine(out, 1, "return");
    emitGoLine(out, 0, "}");
}

void emitInterfaceDispatch(std::ostringstream& out, const EmitterContext& ctx, const InterfaceDispatchPlan& plan)
{
    namespace text = jsonization_diagnostic_text;
    const auto name = ctx.interfaceName(plan.interfaceName);
    emitGoLine(out,
               0,
               "func " + ctx.parseRoutine(name) + "(jsonable interface{}) (result types." + name +
                   ", err *reporting.Error) {");
    emitObjectCheck(out);
    out << "\n";
    emitGoLine(out, 1, "modelTypeJsonable, ok := m[" + lit(std::string(kModelTypeKey)) + "]");
    emitGoLine(out, 1, "if !ok {");
    emitGoLine(out, 2, "err = reporting.NewError(" + lit(text::missingModelType()) + ")");
    emitGoLine(out, 2, "return");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "modelType, ok := modelTypeJsonable.(string)");
    emitGoLine(out, 1, "if !ok {");
    emitGoLine(out,
               2,
               "err = reporting.NewError(" + lit(text::modelTypeNotStringPrefix()) + " + kindName(modelTypeJsonable))");
    emitGoLine(out, 2, "return");
    emitGoLine(out, 1, "}");
    out << "\n";
    emitGoLine(out, 1, "switch modelType {");
    for (const auto& dispatchCase : plan.cases)
    {
        emitGoLine(out, 1, "case " + lit(dispatchCase.modelType) + ":");
        emitGoLine(out, 2, "parsed, parseErr := " + ctx.parseRoutine(ctx.typeName(dispatchCase.className)) + "(jsonable)");
        emitGoLine(out, 2, "if parseErr != nil {");
        emitGoLine(out, 3, "err = parseErr");
        emitGoLine(out, 3, "return");
        emitGoLine(out, 2, "}");
        emitGoLine(out, 2, "result = parsed");
    }
    emitGoLine(out, 1, "default:");
    emitGoLine(out, 2, "err = reporting.NewError(" + lit(text::unexpectedModelTypePrefix(name)) + " + modelType)");
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "return");
    emitGoLine(out, 0, "}");
}

bool needsFoundFlag(const ArgumentSlot& slot)
{
    return slot.required || (!slot.strategy.optional && slot.defaultValue);
}

void emitSlotParse(std::ostringstream& out, const EmitterContext& ctx, const ArgumentSlot& slot)
{
    namespace text = jsonization_diagnostic_text;
    const auto variable = ctx.variableName(slot.argumentName);
    const auto jsonKey  = lit(slot.jsonName);

    if (!slot.strategy.list)
    {
        emitGoLine(out, 2, "parsed, parseErr := " + ctx.parseAtomicCall(slot.strategy.atomic, "value"));
        emitGoLine(out, 2, "if parseErr != nil {");
        emitGoLine(out, 3, "parseErr.PrependName(" + jsonKey + ")");
        emitGoLine(out, 3, "err = parseErr");
        emitGoLine(out, 3, "return");
        emitGoLine(out, 2, "}");
        emitGoLine(out, 2, variable + " = " + (ctx.isPointerOptional(slot.strategy) ? "&parsed" : "parsed"));
    }
    else
    {
        emitGoLine(out, 2, "array, isArray := value.([]interface{})");
        emitGoLine(out, 2, "if !isArray {");
        emitGoLine(out,
                   3,
                   "arrayErr := reporting.NewError(" + lit(text::expectedArrayPrefix()) + " + kindName(value))");
        emitGoLine(out, 3, "arrayErr.PrependName(" + jsonKey + ")");
        emitGoLine(out, 3, "err = arrayErr");
        emitGoLine(out, 3, "return");
        emitGoLine(out, 2, "}");
        emitGoLine(out, 2, "items := make(" + ctx.declaredType(slot.strategy, true) + ", 0, len(array))");
        emitGoLine(out, 2, "for index, item := range array {");
        emitGoLine(out, 3, "if item == nil {");
        emitGoLine(out, 4, "itemErr := reporting.NewError(" + lit(text::nullItem()) + ")");
        emitGoLine(out, 4, "itemErr.PrependIndex(index)");
        emitGoLine(out, 4, "itemErr.PrependName(" + jsonKey + ")");
        emitGoLine(out, 4, "err = itemErr");
        emitGoLine(out, 4, "return");
        emitGoLine(out, 3, "}");
        emitGoLine(out, 3, "parsedItem, itemErr := " + ctx.parseAtomicCall(slot.strategy.atomic, "item"));
        emitGoLine(out, 3, "if itemErr != nil {");
        emitGoLine(out, 4, "itemErr.PrependIndex(index)");
        emitGoLine(out, 4, "itemErr.PrependName(" + jsonKey + ")");
        emitGoLine(out, 4, "err = itemErr");
        emitGoLine(out, 4, "return");
        emitGoLine(out, 3, "}");
        emitGoLine(out, 3, "items = append(items, parsedItem)");
        emitGoLine(out, 2, "}");
        emitGoLine(out, 2, variable + " = items");
    }
    if (needsFoundFlag(slot))
    {
        emitGoLine(out, 2, ctx.foundName(slot.argumentName) + " = true");
    }
}

void emitClassParse(std::ostringstream& out, const EmitterContext& ctx, const ClassCodecPlan& plan)
{
    namespace text  = jsonization_diagnostic_text;
    const auto name = ctx.typeName(plan.className);
    emitGoLine(out,
               0,
               "func " + ctx.parseRoutine(name) + "(jsonable interface{}) (result *types." + name +
                   ", err *reporting.Error) {");
    emitObjectCheck(out);
    out << "\n";
    for (const auto& slot : plan.slots)
    {
        emitGoLine(out,
                   1,
                   "var " + ctx.variableName(slot.argumentName) + " " + ctx.declaredType(slot.strategy, true));
        if (needsFoundFlag(slot))
        {
            emitGoLine(out, 1, ctx.foundName(slot.argumentName) + " := false");
        }
    }
    if (!plan.slots.empty())
    {
        out << "\n";
    }
    emitGoLine(out, 1, "for _, key := range sortedKeys(m) {");
    if (!plan.slots.empty())
    {
        emitGoLine(out, 1, "\tvalue := m[key]");
    }
    emitGoLine(out, 1, "\tswitch key {");
    for (const auto& slot : plan.slots)
    {
        emitGoLine(out, 1, "\tcase " + lit(slot.jsonName) + ":");
        emitGoLine(out, 2, "\tif value == nil {");
        emitGoLine(out, 3, "\tcontinue");
        emitGoLine(out, 2, "\t}");
        std::ostringstream body;
        emitSlotParse(body, ctx, slot);
        std::istringstream lines(body.str());
        std::string        line;
        while (std::getline(lines, line))
        {
            out << "\t" << line << "\n";
        }
    }
    if (plan.withModelType)
    {
        emitGoLine(out, 1, "\tcase " + lit(std::string(kModelTypeKey)) + ":");
    }
    emitGoLine(out, 1, "\tdefault:");
    emitGoLine(out, 2, "\terr = reporting.NewError(" + lit(text::unexpectedPropertyPrefix()) + " + key)");
    emitGoLine(out, 2, "\treturn");
    emitGoLine(out, 1, "\t}");
    emitGoLine(out, 1, "}");

    for (const auto& slot : plan.slots)
    {
        if (slot.required)
        {
            out << "\n";
            emitGoLine(out, 1, "if !" + ctx.foundName(slot.argumentName) + " {");
            emitGoLine(out, 2, "err = reporting.NewError(" + lit(text::requiredPropertyMissing(slot.jsonName)) + ")");
            emitGoLine(out, 2, "return");
            emitGoLine(out, 1, "}");
        }
        else if (!slot.strategy.optional)
        {
            if (!slot.defaultValue)
            {
                llvm::report_fatal_error(llvm::Twine("argument '") + slot.argumentName + "' of class '" +
                                         plan.className + "' widens its property without a default");
            }
            out << "\n";
            emitGoLine(out, 1, "if !" + ctx.foundName(slot.argumentName) + " {");
            emitGoLine(out,
                       2,
                       ctx.variableName(slot.argumentName) + " = " + ctx.defaultExpr(slot.strategy, *slot.defaultValue));
            emitGoLine(out, 1, "}");
        }
    }

    std::vector<std::string> arguments;
    for (const auto& slot : plan.slots)
    {
        arguments.push_back(ctx.variableName(slot.argumentName));
    }
    out << "\n";
    emitGoLine(out, 1, "result = types.New" + name + "(" + llvm::join(arguments, ", ") + ")");
    emitGoLine(out, 1, "return");
    emitGoLine(out, 0, "}");
}

void emitListSerialization(std::ostringstream& out,
                           const EmitterContext&   ctx,
                           const int               indent,
                           const PropertyEmission& property,
                           const std::string&      value)
{
    emitGoLine(out, indent, "array := make([]interface{}, 0, len(" + value + "))");
    emitGoLine(out, indent, "for _, item := range " + value + " {");
    emitGoLine(out, indent + 1, "array = append(array, " + ctx.serializeAtomicExpr(property.strategy.atomic, "item") + ")");
    emitGoLine(out, indent, "}");
    emitGoLine(out, indent, "result[" + lit(property.jsonName) + "] = array");
}

void emitClassToMap(std::ostringstream& out, const EmitterContext& ctx, const ClassCodecPlan& plan)
{
    emitGoLine(out,
               0,
               "func " + ctx.toMapRoutine(plan.className) + "(that types." + ctx.interfaceName(plan.className) +
                   ") map[string]interface{} {");
    emitGoLine(out, 1, "result := make(map[string]interface{})");
    for (const auto& property : plan.properties)
    {
        const auto getter = "that." + ctx.getterName(property.propertyName) + "()";
        const auto key    = "result[" + lit(property.jsonName) + "]";
        out << "\n";
        if (property.strategy.optional)
        {
            emitGoLine(out, 1, "if value := " + getter + "; value != nil {");
            if (property.strategy.list)
            {
                emitListSerialization(out, ctx, 2, property, "value");
            }
            else
            {
                const auto deref = ctx.isPointerOptional(property.strategy) ? "*value" : "value";
                emitGoLine(out, 2, key + " = " + ctx.serializeAtomicExpr(property.strategy.atomic, deref));
            }
            emitGoLine(out, 1, "}");
        }
        else if (property.strategy.list)
        {
            emitGoLine(out, 1, "{");
            emitGoLine(out, 2, "value := " + getter);
            emitListSerialization(out, ctx, 2, property, "value");
            emitGoLine(out, 1, "}");
        }
        else
        {
            emitGoLine(out, 1, key + " = " + ctx.serializeAtomicExpr(property.strategy.atomic, getter));
        }
    }
    if (plan.withModelType)
    {
        out << "\n";
        emitGoLine(out, 1, "result[" + lit(std::string(kModelTypeKey)) + "] = " + lit(plan.modelType));
    }
    emitGoLine(out, 1, "return result");
    emitGoLine(out, 0, "}");
}

void emitFragment(std::ostringstream& out, const std::string& fragment)
{
    out << fragment;
    if (!llvm::StringRef(fragment).ends_with("\n"))
    {
        out << "\n";
    }
}

/// Public name and Go result type of the deserialization facade for an entry.
std::pair<std::string, std::string> facadeSignature(const EmitterContext& ctx, const JsonizationEntry& entry)
{
    if (const auto* enumeration = std::get_if<EnumerationPlan>(&entry))
    {
        const auto name = ctx.typeName(enumeration->enumerationName);
        return {name, "types." + name};
    }
    if (const auto* dispatch = std::get_if<InterfaceDispatchPlan>(&entry))
    {
        const auto name = ctx.interfaceName(dispatch->interfaceName);
        return {name, "types." + name};
    }
    if (const auto* cls = std::get_if<ClassCodecPlan>(&entry))
    {
        const auto name = ctx.typeName(cls->className);
        return {name, "*types." + name};
    }
    const auto name = ctx.typeName(std::get<SpecificClassPlan>(entry).className);
    return {name, "*types." + name};
}

std::string renderJsonization(const EmitterContext& ctx, const JsonizationPlan& plan)
{
    std::ostringstream out;
    out << renderGeneratedBanner("//", ctx.model().sourcePath);
    emitGoLine(out, 0, "// Package jsonization parses and serializes model instances as generic JSON values.");
    emitGoLine(out, 0, "package jsonization");
    out << "\n";
    emitGoLine(out, 0, "import (");
    for (const char* package : {"encoding/base64", "encoding/json", "fmt", "math", "sort", "strconv"})
    {
        emitGoLine(out, 1, "\"" + std::string(package) + "\"");
    }
    out << "\n";
    emitGoLine(out, 1, "\"" + ctx.moduleName() + "/reporting\"");
    if (ctx.hasEnumerations())
    {
        emitGoLine(out, 1, "\"" + ctx.moduleName() + "/stringification\"");
    }
    emitGoLine(out, 1, "\"" + ctx.moduleName() + "/types\"");
    emitGoLine(out, 0, ")");
    out << "\n";

    emitGoLine(out, 0, "// DeserializationError reports where and why a JSON value does not represent an instance.");
    emitGoLine(out, 0, "type DeserializationError struct {");
    emitGoLine(out, 1, "Path    string");
    emitGoLine(out, 1, "Message string");
    emitGoLine(out, 0, "}");
    out << "\n";
    emitGoLine(out, 0, "func (e *DeserializationError) Error() string {");
    emitGoLine(out, 1, "return e.Path + \": \" + e.Message");
    emitGoLine(out, 0, "}");
    out << "\n";
    emitHelpers(out);

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

    for (const auto& entry : plan.entries)
    {
        const auto [name, resultType] = facadeSignature(ctx, entry);
        out << "\n";
        emitGoLine(out, 0, "// " + name + "FromJsonable parses a " + name + " from a generic JSON value.");
        emitGoLine(out,
                   0,
                   "func " + name + "FromJsonable(jsonable interface{}) (result " + resultType + ", err error) {");
        emitGoLine(out, 1, "parsed, parseErr := " + ctx.parseRoutine(name) + "(jsonable)");
        emitGoLine(out, 1, "if parseErr != nil {");
        emitGoLine(out, 2, "err = &DeserializationError{");
        emitGoLine(out, 3, "Path:    reporting.GenerateJSONPath(parseErr.PathSegments()),");
        emitGoLine(out, 3, "Message: parseErr.Cause,");
        emitGoLine(out, 2, "}");
        emitGoLine(out, 2, "return");
        emitGoLine(out, 1, "}");
        emitGoLine(out, 1, "result = parsed");
        emitGoLine(out, 1, "return");
        emitGoLine(out, 0, "}");
    }

    for (const auto& entry : plan.entries)
    {
        if (const auto* enumeration = std::get_if<EnumerationPlan>(&entry))
        {
            const auto name = ctx.typeName(enumeration->enumerationName);
            out << "\n";
            emitGoLine(out, 0, "// " + name + "ToJsonable returns the wire value of a literal.");
            emitGoLine(out, 0, "func " + name + "ToJsonable(that types." + name + ") string {");
            emitGoLine(out, 1, "text, ok := stringification." + name + "ToString(that)");
            emitGoLine(out, 1, "if !ok {");
            emitGoLine(out, 2, "panic(fmt.Sprintf(\"Invalid literal of " + name + ": %d\", int(that)))");
            emitGoLine(out, 1, "}");
            emitGoLine(out, 1, "return text");
            emitGoLine(out, 0, "}");
        }
        else if (const auto* cls = std::get_if<ClassCodecPlan>(&entry))
        {
            out << "\n";
            emitClassToMap(out, ctx, *cls);
        }
        else if (const auto* specific = std::get_if<SpecificClassPlan>(&entry))
        {
            out << "\n";
            emitFragment(out, specific->transformFragment);
        }
    }

    out << "\n";
    emitGoLine(out, 0, "// ToJsonable serializes an instance into a generic JSON object.");
    emitGoLine(out, 0, "func ToJsonable(that types.IClass) map[string]interface{} {");
    emitGoLine(out, 1, "switch that.ModelType() {");
    for (const auto& type : ctx.model().types)
    {
        if (const auto* cls = std::get_if<ConcreteClass>(&type))
        {
            emitGoLine(out, 1, "case types." + ctx.modelTypeLiteral(cls->name) + ":");
            emitGoLine(out,
                       2,
                       "return " + ctx.toMapRoutine(cls->name) + "(that.(types." + ctx.interfaceName(cls->name) + "))");
        }
    }
    emitGoLine(out, 1, "}");
    emitGoLine(out, 1, "panic(fmt.Sprintf(\"Unexpected model type: %d\", int(that.ModelType())))");
    emitGoLine(out, 0, "}");
    return out.str();
}

std::string renderGoMod(const std::string& moduleName)
{
    std::ostringstream out;
    out << "module " << moduleName << "\n\n";
    out << "go 1.22\n";
    return out.str();
}

llvm::Error checkModuleName(const std::string& moduleName)
{
    bool valid = !moduleName.empty() && moduleName.front() != '/' && moduleName.back() != '/';
    for (const char c : moduleName)
    {
        valid = valid && (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.' || c == '/');
    }
    if (!valid)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid Go module path '%s'",
                                       moduleName.c_str());
    }
    return llvm::Error::success();
}

}  // namespace

std::string defaultGoModule(const MetaModel& model)
{
    return toLowerSnakeCase(model.name);
}

llvm::Error emitGo(const MetaModel&       model,
                   const JsonizationPlan& plan,
                   const GoEmitOptions&   options,
                   DiagnosticEngine&      diagnostics)
{
    if (options.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output directory is required");
    }
    const std::string moduleName = options.moduleName.empty() ? defaultGoModule(model) : options.moduleName;
    if (auto err = checkModuleName(moduleName))
    {
        return err;
    }

    const SymbolTable    symbols(model);
    const EmitterContext ctx(model, symbols, moduleName);

    auto reporting = loadRuntimeFile("go/reporting.go");
    if (!reporting)
    {
        return reporting.takeError();
    }

    const std::filesystem::path                            outRoot(options.outDir);
    std::vector<std::pair<std::string, std::string>> files = {
        {"types/types.go", renderTypes(ctx)},
        {"stringification/stringification.go", renderStringification(ctx, plan)},
        {"reporting/reporting.go", *reporting},
        {"jsonization/jsonization.go", renderJsonization(ctx, plan)},
    };
    if (options.emitGoMod)
    {
        files.emplace_back("go.mod", renderGoMod(moduleName));
    }
    for (const auto& [fileName, content] : files)
    {
        if (auto err = writeGeneratedFile(outRoot / fileName, content, options.writePolicy))
        {
            return err;
        }
        diagnostics.note(SourceLocation{model.sourcePath, {}}, "generated Go file " + fileName);
    }
    return llvm::Error::success();
}

}  // namespace llvmmeta
