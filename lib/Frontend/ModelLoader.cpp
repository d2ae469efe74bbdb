//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON meta-model loading.
///
/// Every element is decoded independently; malformed elements are reported
/// with their element path and skipped so that the rest of the document is
/// still checked.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/Frontend/ModelLoader.h"

#include "llvmmeta/Frontend/TypeExpr.h"

#include "llvm/ADT/StringSet.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

namespace llvmmeta
{
namespace
{

std::string indexed(llvm::StringRef key, const std::size_t index)
{
    return "." + key.str() + "[" + std::to_string(index) + "]";
}

class ModelDecoder final
{
public:
    ModelDecoder(const std::string& sourcePath, DiagnosticEngine& diagnostics)
        : diagnostics_(diagnostics)
        , root_{sourcePath, ""}
    {
    }

    MetaModel decode(const llvm::json::Value& document)
    {
        MetaModel model;
        model.sourcePath = root_.file;

        const auto* object = document.getAsObject();
        if (!object)
        {
            diagnostics_.error(root_, "meta-model document must be a JSON object");
            return model;
        }
        warnUnknownKeys(*object, {"name", "description", "types"}, root_);

        if (const auto name = object->getString("name"))
        {
            model.name = name->str();
        }
        else
        {
            diagnostics_.error(root_.child(".name"), "model name must be a string");
        }
        model.description = decodeDescription(object->get("description"), root_.child(".description"));

        const auto* types = object->getArray("types");
        if (!types)
        {
            diagnostics_.error(root_.child(".types"), "model must list its named types in a 'types' array");
            return model;
        }
        for (std::size_t i = 0; i < types->size(); ++i)
        {
            const SourceLocation location = root_.child(indexed("types", i));
            if (auto type = decodeNamedType((*types)[i], location))
            {
                model.types.push_back(std::move(*type));
            }
        }
        return model;
    }

private:
    void warnUnknownKeys(const llvm::json::Object&              object,
                         std::initializer_list<llvm::StringRef> known,
                         const SourceLocation&                  location)
    {
        llvm::StringSet<> knownSet;
        for (const auto key : known)
        {
            knownSet.insert(key);
        }
        std::vector<std::string> unknown;
        for (const auto& entry : object)
        {
            const llvm::StringRef key = entry.first;
            if (!knownSet.contains(key))
            {
                unknown.push_back(key.str());
            }
        }
        std::sort(unknown.begin(), unknown.end());
        for (const auto& key : unknown)
        {
            diagnostics_.warning(location, "ignoring unknown key '" + key + "'");
        }
    }

    Description decodeDescription(const llvm::json::Value* value, const SourceLocation& location)
    {
        Description out;
        if (value == nullptr || value->kind() == llvm::json::Value::Null)
        {
            return out;
        }
        if (const auto summary = value->getAsString())
        {
            out.summary = summary->str();
            return out;
        }
        const auto* object = value->getAsObject();
        if (!object)
        {
            diagnostics_.error(location, "description must be a string or an object");
            return out;
        }
        warnUnknownKeys(*object, {"summary", "remarks"}, location);
        if (const auto summary = object->getString("summary"))
        {
            out.summary = summary->str();
        }
        if (const auto* remarksValue = object->get("remarks"))
        {
            const auto* remarks = remarksValue->getAsArray();
            if (!remarks)
            {
                diagnostics_.error(location.child(".remarks"), "remarks must be an array of strings");
                return out;
            }
            for (std::size_t i = 0; i < remarks->size(); ++i)
            {
                if (const auto remark = (*remarks)[i].getAsString())
                {
                    out.remarks.push_back(remark->str());
                }
                else
                {
                    diagnostics_.error(location.child(indexed("remarks", i)), "remark must be a string");
                }
            }
        }
        return out;
    }

    std::optional<std::string> requireName(const llvm::json::Object& object, const SourceLocation& location)
    {
        const auto name = object.getString("name");
        if (!name || name->empty())
        {
            diagnostics_.error(location.child(".name"), "element requires a non-empty string 'name'");
            return std::nullopt;
        }
        return name->str();
    }

    std::optional<TypeAnnotation> decodeType(const llvm::json::Object& object, const SourceLocation& location)
    {
        const auto text = object.getString("type");
        if (!text)
        {
            diagnostics_.error(location.child(".type"), "element requires a string 'type' expression");
            return std::nullopt;
        }
        auto parsed = parseTypeExpression(*text);
        if (!parsed)
        {
            diagnostics_.error(location.child(".type"), llvm::toString(parsed.takeError()));
            return std::nullopt;
        }
        return std::move(*parsed);
    }

    std::optional<NamedType> decodeNamedType(const llvm::json::Value& value, const SourceLocation& location)
    {
        const auto* object = value.getAsObject();
        if (!object)
        {
            diagnostics_.error(location, "named type must be a JSON object");
            return std::nullopt;
        }
        const auto kind = object->getString("kind");
        if (!kind)
        {
            diagnostics_.error(location.child(".kind"), "named type requires a string 'kind'");
            return std::nullopt;
        }
        auto name = requireName(*object, location);
        if (!name)
        {
            return std::nullopt;
        }

        if (*kind == "enumeration")
        {
            warnUnknownKeys(*object, {"kind", "name", "description", "literals"}, location);
            Enumeration out;
            out.name        = std::move(*name);
            out.location    = location;
            out.description = decodeDescription(object->get("description"), location.child(".description"));
            decodeLiterals(*object, location, out);
            return NamedType{std::move(out)};
        }
        if (*kind == "constrained_primitive")
        {
            warnUnknownKeys(*object, {"kind", "name", "description", "constrainee"}, location);
            ConstrainedPrimitive out;
            out.name        = std::move(*name);
            out.location    = location;
            out.description = decodeDescription(object->get("description"), location.child(".description"));
            const auto constrainee = object->getString("constrainee");
            const auto primitive   = constrainee ? parsePrimitiveType(*constrainee) : std::nullopt;
            if (!primitive)
            {
                diagnostics_.error(location.child(".constrainee"),
                                   "constrained primitive requires a primitive 'constrainee' "
                                   "(bool, int, float, str or bytearray)");
                return std::nullopt;
            }
            out.constrainee = *primitive;
            return NamedType{std::move(out)};
        }
        if (*kind == "abstract_class")
        {
            AbstractClass out;
            out.name = std::move(*name);
            if (!decodeClass(*object, location, out))
            {
                return std::nullopt;
            }
            return NamedType{std::move(out)};
        }
        if (*kind == "concrete_class")
        {
            ConcreteClass out;
            out.name = std::move(*name);
            if (!decodeClass(*object, location, out))
            {
                return std::nullopt;
            }
            return NamedType{std::move(out)};
        }

        diagnostics_.error(location.child(".kind"),
                           "unknown named-type kind '" + kind->str() +
                               "' (expected enumeration, constrained_primitive, abstract_class or concrete_class)");
        return std::nullopt;
    }

    void decodeLiterals(const llvm::json::Object& object, const SourceLocation& location, Enumeration& out)
    {
        const auto* literals = object.getArray("literals");
        if (!literals)
        {
            diagnostics_.error(location.child(".literals"), "enumeration requires a 'literals' array");
            return;
        }
        for (std::size_t i = 0; i < literals->size(); ++i)
        {
            const SourceLocation literalLocation = location.child(indexed("literals", i));
            const auto*          literal         = (*literals)[i].getAsObject();
            if (!literal)
            {
                diagnostics_.error(literalLocation, "enumeration literal must be a JSON object");
                continue;
            }
            warnUnknownKeys(*literal, {"name", "value", "description"}, literalLocation);
            auto name = requireName(*literal, literalLocation);
            if (!name)
            {
                continue;
            }
            const auto value = literal->getString("value");
            if (!value)
            {
                diagnostics_.error(literalLocation.child(".value"), "enumeration literal requires a string 'value'");
                continue;
            }
            out.literals.push_back(
                EnumerationLiteral{std::move(*name),
                                   value->str(),
                                   decodeDescription(literal->get("description"), literalLocation.child(".description"))});
        }
    }

    bool decodeClass(const llvm::json::Object& object, const SourceLocation& location, ClassDefinition& out)
    {
        warnUnknownKeys(object,
                        {"kind",
                         "name",
                         "description",
                         "inheritances",
                         "properties",
                         "constructor",
                         "implementation_specific",
                         "serialization"},
                        location);
        const std::size_t errorsBefore = diagnostics_.errorCount();
        out.location                   = location;
        out.description = decodeDescription(object.get("description"), location.child(".description"));

        if (const auto* inheritancesValue = object.get("inheritances"))
        {
            const auto* inheritances = inheritancesValue->getAsArray();
            if (!inheritances)
            {
                diagnostics_.error(location.child(".inheritances"), "inheritances must be an array of type names");
            }
            else
            {
                for (std::size_t i = 0; i < inheritances->size(); ++i)
                {
                    if (const auto parent = (*inheritances)[i].getAsString())
                    {
                        out.inheritances.push_back(parent->str());
                    }
                    else
                    {
                        diagnostics_.error(location.child(indexed("inheritances", i)), "parent must be a type name");
                    }
                }
            }
        }

        if (const auto* specificValue = object.get("implementation_specific"))
        {
            if (const auto specific = specificValue->getAsBoolean())
            {
                out.implementationSpecific = *specific;
            }
            else
            {
                diagnostics_.error(location.child(".implementation_specific"), "implementation_specific must be a boolean");
            }
        }

        if (const auto* serializationValue = object.get("serialization"))
        {
            bool        decoded       = false;
            const auto* serialization = serializationValue->getAsObject();
            if (serialization != nullptr)
            {
                if (const auto withModelType = serialization->getBoolean("with_model_type"))
                {
                    out.explicitWithModelType = *withModelType;
                    decoded                   = true;
                }
            }
            if (!decoded)
            {
                diagnostics_.error(location.child(".serialization"),
                                   "serialization must be an object with a boolean 'with_model_type'");
            }
        }

        const auto* properties = object.getArray("properties");
        if (!properties)
        {
            diagnostics_.error(location.child(".properties"), "class requires a 'properties' array");
        }
        else
        {
            for (std::size_t i = 0; i < properties->size(); ++i)
            {
                const SourceLocation propertyLocation = location.child(indexed("properties", i));
                const auto*          property         = (*properties)[i].getAsObject();
                if (!property)
                {
                    diagnostics_.error(propertyLocation, "property must be a JSON object");
                    continue;
                }
                warnUnknownKeys(*property, {"name", "type", "description"}, propertyLocation);
                auto name = requireName(*property, propertyLocation);
                auto type = decodeType(*property, propertyLocation);
                if (!name || !type)
                {
                    continue;
                }
                out.properties.push_back(Property{
                    std::move(*name),
                    std::move(*type),
                    decodeDescription(property->get("description"), propertyLocation.child(".description")),
                    propertyLocation});
            }
        }

        const auto* constructor = object.getArray("constructor");
        if (constructor == nullptr && object.get("constructor") != nullptr)
        {
            diagnostics_.error(location.child(".constructor"), "constructor must be an array of arguments");
        }
        else if (constructor == nullptr)
        {
            for (const auto& property : out.properties)
            {
                out.constructor.push_back(Argument{property.name, property.type, std::nullopt, property.location});
            }
        }
        else
        {
            for (std::size_t i = 0; i < constructor->size(); ++i)
            {
                const SourceLocation argumentLocation = location.child(indexed("constructor", i));
                const auto*          argument         = (*constructor)[i].getAsObject();
                if (!argument)
                {
                    diagnostics_.error(argumentLocation, "constructor argument must be a JSON object");
                    continue;
                }
                warnUnknownKeys(*argument, {"name", "type", "default"}, argumentLocation);
                auto name = requireName(*argument, argumentLocation);
                auto type = decodeType(*argument, argumentLocation);
                if (!name || !type)
                {
                    continue;
                }
                std::optional<llvm::json::Value> defaultValue;
                if (const auto* rawDefault = argument->get("default"))
                {
                    defaultValue = *rawDefault;
                }
                out.constructor.push_back(
                    Argument{std::move(*name), std::move(*type), std::move(defaultValue), argumentLocation});
            }
        }

        return diagnostics_.errorCount() == errorsBefore;
    }

    DiagnosticEngine& diagnostics_;
    SourceLocation    root_;
};

}  // namespace

llvm::Expected<MetaModel> loadModelFromText(const llvm::StringRef text,
                                            const std::string&    sourcePath,
                                            DiagnosticEngine&     diagnostics)
{
    auto document = llvm::json::parse(text);
    if (!document)
    {
        diagnostics.error({sourcePath, ""}, "malformed JSON: " + llvm::toString(document.takeError()));
        return llvm::createStringError(llvm::inconvertibleErrorCode(), "failed to parse meta-model document");
    }

    const std::size_t errorsBefore = diagnostics.errorCount();
    ModelDecoder      decoder(sourcePath, diagnostics);
    MetaModel         model = decoder.decode(*document);
    if (diagnostics.errorCount() != errorsBefore)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "meta-model loading failed with %zu error(s)",
                                       diagnostics.errorCount() - errorsBefore);
    }
    return model;
}

llvm::Expected<MetaModel> loadModelFile(const std::string& path, DiagnosticEngine& diagnostics)
{
    auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!buffer)
    {
        diagnostics.error({path, ""}, "failed to read meta-model file: " + buffer.getError().message());
        return llvm::createStringError(buffer.getError(), "failed to read meta-model file %s", path.c_str());
    }
    return loadModelFromText((*buffer)->getBuffer(), path, diagnostics);
}

}  // namespace llvmmeta
