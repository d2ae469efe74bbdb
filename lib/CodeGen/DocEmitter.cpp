//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the Markdown API documentation backend.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/DocEmitter.h"

#include "llvmmeta/CodeGen/NamingPolicy.h"
#include "llvmmeta/Semantics/Model.h"
#include "llvmmeta/Semantics/SymbolTable.h"
#include "llvmmeta/Support/Diagnostics.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FormatVariadic.h"

#include <filesystem>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace llvmmeta
{
namespace
{

/// Escapes text for use inside a Markdown table cell.
std::string tableCell(const llvm::StringRef text)
{
    std::string out;
    for (const char c : text)
    {
        if (c == '|')
        {
            out += "\\|";
        }
        else if (c == '\n' || c == '\r')
        {
            out.push_back(' ');
        }
        else
        {
            out.push_back(c);
        }
    }
    return out;
}

std::string anchorOf(const llvm::StringRef name)
{
    return llvm::StringRef(name).lower();
}

std::string linkTo(const llvm::StringRef name)
{
    return "[" + name.str() + "](#" + anchorOf(name) + ")";
}

void renderDescription(std::ostringstream& out, const Description& description)
{
    if (!description.summary.empty())
    {
        out << description.summary << "\n\n";
    }
    for (const auto& remark : description.remarks)
    {
        out << remark << "\n\n";
    }
}

const Argument* findArgument(const ClassDefinition& cls, const std::string& name)
{
    for (const auto& argument : cls.constructor)
    {
        if (argument.name == name)
        {
            return &argument;
        }
    }
    return nullptr;
}

void renderEnumeration(std::ostringstream& out, const Enumeration& enumeration)
{
    out << "*Enumeration*\n\n";
    renderDescription(out, enumeration.description);
    out << "| Literal | Wire value | Description |\n";
    out << "|---|---|---|\n";
    for (const auto& literal : enumeration.literals)
    {
        out << "| " << tableCell(literal.name) << " | `" << tableCell(literal.value) << "` | "
            << tableCell(literal.description.summary) << " |\n";
    }
    out << "\n";
}

void renderClass(std::ostringstream& out, const ClassDefinition& cls, const bool isAbstract, const SymbolTable& symbols)
{
    out << (isAbstract ? "*Abstract class*" : "*Concrete class*");
    if (cls.implementationSpecific)
    {
        out << ", implementation-specific";
    }
    out << "\n\n";
    renderDescription(out, cls.description);

    if (!cls.ancestors.empty())
    {
        std::vector<std::string> links;
        for (const auto& ancestor : cls.ancestors)
        {
            links.push_back(linkTo(ancestor));
        }
        out << "Ancestors: " << llvm::join(links, ", ") << "\n\n";
    }
    if (!isAbstract && cls.withModelType)
    {
        out << "Model type: `" << jsonModelType(cls.name) << "`\n\n";
    }
    if (const auto* iface = symbols.findInterface(cls.name))
    {
        out << "Interface `I" << toCapitalCamelCase(cls.name) << "` is implemented by:\n\n";
        out << "| Class | Model type |\n";
        out << "|---|---|\n";
        for (const auto& implementer : iface->implementers)
        {
            out << "| " << linkTo(implementer) << " | `" << jsonModelType(implementer) << "` |\n";
        }
        out << "\n";
    }
    if (cls.properties.empty())
    {
        return;
    }
    out << "| JSON name | Type | Required | Default | Description |\n";
    out << "|---|---|---|---|---|\n";
    for (const auto& property : cls.properties)
    {
        const auto* argument = findArgument(cls, property.name);
        const bool  required =
            argument != nullptr && !std::holds_alternative<OptionalTypeAnnotation>(argument->type.node);
        std::string defaultText;
        if (argument != nullptr && argument->defaultValue)
        {
            defaultText = "`" + tableCell(llvm::formatv("{0}", *argument->defaultValue).str()) + "`";
        }
        out << "| `" << jsonPropertyName(property.name) << "` | `" << tableCell(renderTypeAnnotation(property.type))
            << "` | " << (required ? "yes" : "no") << " | " << defaultText << " | "
            << tableCell(property.description.summary) << " |\n";
    }
    out << "\n";
}

}  // namespace

std::string renderModelMarkdown(const MetaModel& model)
{
    const SymbolTable  symbols(model);
    std::ostringstream out;
    out << "# " << model.name << "\n\n";
    renderDescription(out, model.description);

    if (!model.types.empty())
    {
        out << "## Contents\n\n";
        for (const auto& type : model.types)
        {
            out << "- " << linkTo(namedTypeName(type)) << " (" << namedTypeKindName(type).str() << ")\n";
        }
        out << "\n";
    }

    for (const auto& type : model.types)
    {
        out << "## " << namedTypeName(type) << "\n\n";
        std::visit(
            [&](const auto& item) {
                using T = std::decay_t<decltype(item)>;
                if constexpr (std::is_same_v<T, Enumeration>)
                {
                    renderEnumeration(out, item);
                }
                else if constexpr (std::is_same_v<T, ConstrainedPrimitive>)
                {
                    out << "*Constrained primitive* of `" << primitiveTypeName(item.constrainee).str() << "`\n\n";
                    renderDescription(out, item.description);
                }
                else if constexpr (std::is_same_v<T, AbstractClass>)
                {
                    renderClass(out, item, true, symbols);
                }
                else if constexpr (std::is_same_v<T, ConcreteClass>)
                {
                    renderClass(out, item, false, symbols);
                }
                else
                {
                    static_assert(!sizeof(T*), "unhandled named type");
                }
            },
            type);
    }
    return out.str();
}

llvm::Error emitDocs(const MetaModel& model, const DocEmitOptions& options, DiagnosticEngine& diagnostics)
{
    if (options.outDir.empty())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "output directory is required");
    }
    const auto fileName = toLowerSnakeCase(model.name) + ".md";
    if (auto err = writeGeneratedFile(std::filesystem::path(options.outDir) / fileName,
                                      renderModelMarkdown(model),
                                      options.writePolicy))
    {
        return err;
    }
    diagnostics.note(SourceLocation{model.sourcePath, {}}, "generated documentation file " + fileName);
    return llvm::Error::success();
}

}  // namespace llvmmeta
