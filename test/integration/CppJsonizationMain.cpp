//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Exercises the C++ codecs generated from the integration fixture model.
///
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "jsonization.hpp"
#include "stringification.hpp"
#include "types.hpp"

#include "llvm/Support/Base64.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"

namespace
{

namespace jsonization = fixture::jsonization;
namespace types       = fixture::types;

struct Failure final
{
    std::string path;
    std::string cause;
};

llvm::json::Value parseJson(llvm::StringRef text)
{
    return llvm::cantFail(llvm::json::parse(text));
}

std::string base64Failure(llvm::StringRef encoded)
{
    std::vector<char> scratch;
    return "Expected Base64-encoded bytes, but the decoding failed: " +
           llvm::toString(llvm::decodeBase64(encoded, scratch));
}

std::string render(const llvm::json::Value& value)
{
    return llvm::formatv("{0}", value).str();
}

template <typename T>
std::optional<Failure> failureOf(llvm::Expected<T> result)
{
    if (result)
    {
        return std::nullopt;
    }
    Failure failure;
    llvm::handleAllErrors(
        result.takeError(),
        [&](const llvmmeta::runtime::JsonizationError& error) {
            failure.path  = error.path();
            failure.cause = error.cause();
        },
        [&](const llvm::ErrorInfoBase& error) { failure.cause = "unexpected error kind: " + error.message(); });
    return failure;
}

template <typename T>
bool expectFailure(const std::string& name, llvm::Expected<T> result, const std::string& path, const std::string& cause)
{
    const auto failure = failureOf(std::move(result));
    if (!failure)
    {
        std::cerr << name << ": expected a deserialization failure\n";
        return false;
    }
    if (failure->path != path || failure->cause != cause)
    {
        std::cerr << name << ": got '" << failure->path << "' / '" << failure->cause << "', expected '" << path
                  << "' / '" << cause << "'\n";
        return false;
    }
    return true;
}

bool expectJson(const std::string& name, const llvm::json::Value& actual, llvm::StringRef expected)
{
    if (actual != parseJson(expected))
    {
        std::cerr << name << ": serialized " << render(actual) << ", expected " << expected.str() << "\n";
        return false;
    }
    return true;
}

bool runPointExample()
{
    auto point = jsonization::PointFrom(parseJson(R"({"x": 3})"));
    if (!point)
    {
        std::cerr << "point: " << llvm::toString(point.takeError()) << "\n";
        return false;
    }
    if ((*point)->x() != 3 || (*point)->y().has_value())
    {
        std::cerr << "point: unexpected field values\n";
        return false;
    }
    bool ok = expectJson("point serialize", jsonization::serialize(**point), R"({"x": 3})");
    ok      = expectFailure("point unexpected property",
                       jsonization::PointFrom(parseJson(R"({"x": 3, "y": 4, "z": 9})")),
                       "$",
                       "Unexpected property: z") &&
         ok;
    ok = expectFailure("point missing required",
                       jsonization::PointFrom(parseJson(R"({"y": 4})")),
                       "$",
                       "Required property \"x\" is missing") &&
         ok;
    ok = expectFailure("point model type is not a property",
                       jsonization::PointFrom(parseJson(R"({"x": 3, "modelType": "Point"})")),
                       "$",
                       "Unexpected property: modelType") &&
         ok;
    ok = expectFailure("point wrong kind",
                       jsonization::PointFrom(parseJson(R"([1, 2])")),
                       "$",
                       "Expected a JSON object, but got array") &&
         ok;
    ok = expectFailure("point fractional integer",
                       jsonization::PointFrom(parseJson(R"({"x": 1.5})")),
                       "$.x",
                       "Expected a 64-bit integer, but the conversion failed from 1.5") &&
         ok;
    for (const char* text : {R"({"x": 9223372036854775808.0})",
                             R"({"x": 9.223372036854775807e18})",
                             R"({"x": -9223372036854775809.0})"})
    {
        const auto document = parseJson(text);
        ok                  = expectFailure("point integer out of range",
                           jsonization::PointFrom(document),
                           "$.x",
                           "Expected a 64-bit integer, but the conversion failed from " +
                               render(*document.getAsObject()->get("x"))) &&
             ok;
    }
    return ok;
}

bool runNullVersusAbsent()
{
    auto point = jsonization::PointFrom(parseJson(R"({"x": 3, "y": null})"));
    if (!point || (*point)->y().has_value())
    {
        if (!point)
        {
            llvm::consumeError(point.takeError());
        }
        std::cerr << "null optional: expected an absent y\n";
        return false;
    }
    return expectFailure("null required",
                         jsonization::PointFrom(parseJson(R"({"x": null})")),
                         "$",
                         "Required property \"x\" is missing");
}

bool runDispatch()
{
    auto shape = jsonization::IShapeFrom(parseJson(R"({"modelType": "Circle", "center": {"x": 1}, "radius": 2.5})"));
    if (!shape)
    {
        std::cerr << "dispatch: " << llvm::toString(shape.takeError()) << "\n";
        return false;
    }
    const auto* circle = dynamic_cast<const types::Circle*>(shape->get());
    if (circle == nullptr || circle->radius() != 2.5 || circle->center()->x() != 1 ||
        circle->color() != types::Color::kRed || circle->label().has_value())
    {
        std::cerr << "dispatch: expected a red unlabeled circle\n";
        return false;
    }
    bool ok = expectJson("circle serialize",
                         jsonization::serialize(**shape),
                         R"({"center": {"x": 1}, "radius": 2.5, "color": "red", "modelType": "Circle"})");
    ok      = expectFailure("unknown model type",
                       jsonization::IShapeFrom(parseJson(R"({"modelType": "Square"})")),
                       "$",
                       "Unexpected model type for IShape: Square") &&
         ok;
    ok = expectFailure("missing model type",
                       jsonization::IShapeFrom(parseJson(R"({"radius": 1.0})")),
                       "$",
                       "Expected a model type, but none is present") &&
         ok;
    ok = expectFailure("model type of wrong kind",
                       jsonization::IShapeFrom(parseJson(R"({"modelType": 7})")),
                       "$",
                       "Expected the model type to be a string, but got number") &&
         ok;
    ok = expectFailure("enumeration literal",
                       jsonization::IShapeFrom(parseJson(
                           R"({"modelType": "Circle", "center": {"x": 1}, "radius": 1, "color": "blue"})")),
                       "$.color",
                       "Not a valid JSON representation of Color: blue") &&
         ok;
    return ok;
}

bool runConcreteParentDispatch()
{
    auto marker = jsonization::IMarkerFrom(parseJson(R"({"modelType": "Marker", "name": "gate"})"));
    if (!marker)
    {
        std::cerr << "marker dispatch: " << llvm::toString(marker.takeError()) << "\n";
        return false;
    }
    if ((*marker)->model_type() != types::ModelType::kMarker || (*marker)->name() != "gate")
    {
        std::cerr << "marker dispatch: expected the parent class itself\n";
        return false;
    }

    auto pin = jsonization::IMarkerFrom(parseJson(R"({"modelType": "Pin", "name": "north", "height": 2.0})"));
    if (!pin)
    {
        std::cerr << "pin dispatch: " << llvm::toString(pin.takeError()) << "\n";
        return false;
    }
    const auto* concrete = dynamic_cast<const types::Pin*>(pin->get());
    if ((*pin)->model_type() != types::ModelType::kPin || concrete == nullptr || concrete->name() != "north" ||
        concrete->height() != 2.0)
    {
        std::cerr << "pin dispatch: expected a pin of height 2\n";
        return false;
    }

    bool ok = expectJson("marker serialize", jsonization::serialize(**marker), R"({"name": "gate", "modelType": "Marker"})");
    ok      = expectJson("pin serialize",
                    jsonization::serialize(**pin),
                    R"({"name": "north", "height": 2.0, "modelType": "Pin"})") &&
         ok;
    ok = expectFailure("marker unknown model type",
                       jsonization::IMarkerFrom(parseJson(R"({"modelType": "Circle", "name": "x"})")),
                       "$",
                       "Unexpected model type for IMarker: Circle") &&
         ok;
    ok = expectFailure("marker missing model type",
                       jsonization::IMarkerFrom(parseJson(R"({"name": "gate"})")),
                       "$",
                       "Expected a model type, but none is present") &&
         ok;

    auto direct = jsonization::MarkerFrom(parseJson(R"({"name": "gate", "modelType": "Marker"})"));
    if (!direct || (*direct)->name() != "gate")
    {
        if (!direct)
        {
            llvm::consumeError(direct.takeError());
        }
        std::cerr << "marker class codec must accept its own model type\n";
        ok = false;
    }
    return ok;
}

bool runNestedPaths()
{
    bool ok = expectFailure("list item path",
                            jsonization::DrawingFrom(parseJson(R"({
                                "shapes": [
                                    {"modelType": "Circle", "center": {"x": 0}, "radius": 1},
                                    {"modelType": "Polygon", "vertices": [{"x": "a"}]}
                                ],
                                "isVisible": true
                            })")),
                            "$.shapes[1].vertices[0].x",
                            "Expected a 64-bit integer, but got string");
    ok      = expectFailure("null list item",
                       jsonization::PolygonFrom(parseJson(R"({"vertices": [{"x": 1}, null]})")),
                       "$.vertices[1]",
                       "Expected a non-null item, but got a null") &&
         ok;
    ok = expectFailure("list of wrong kind",
                       jsonization::PolygonFrom(parseJson(R"({"vertices": {"x": 1}})")),
                       "$.vertices",
                       "Expected a JSON array, but got object") &&
         ok;
    ok = expectFailure("first failure in key order",
                       jsonization::DrawingFrom(parseJson(R"({"title": 5, "isVisible": "yes", "shapes": []})")),
                       "$.isVisible",
                       "Expected a boolean, but got string") &&
         ok;
    return ok;
}

bool runRoundTrip()
{
    const llvm::StringRef text = R"({
        "shapes": [
            {"modelType": "Polygon", "vertices": [{"x": 0, "y": 0}, {"x": 4, "y": -2}],
             "tags": ["closed"], "label": "quad", "color": "light-blue"},
            {"modelType": "Circle", "center": {"x": -9007199254740991}, "radius": 0.125, "color": "red"}
        ],
        "title": "sketch",
        "blob": {"payload": "AQID", "modelType": "Blob"},
        "isVisible": false,
        "scale": 2.5
    })";
    auto drawing = jsonization::DrawingFrom(parseJson(text));
    if (!drawing)
    {
        std::cerr << "round trip: " << llvm::toString(drawing.takeError()) << "\n";
        return false;
    }
    const auto& blob = (*drawing)->blob();
    if (!blob || (*blob)->payload() != std::vector<std::uint8_t>{1, 2, 3})
    {
        std::cerr << "round trip: blob payload mismatch\n";
        return false;
    }
    bool ok = expectJson("round trip", jsonization::serialize(**drawing), text);

    auto defaults = jsonization::DrawingFrom(parseJson(R"({"shapes": [], "isVisible": true})"));
    if (!defaults)
    {
        std::cerr << "defaults: " << llvm::toString(defaults.takeError()) << "\n";
        return false;
    }
    if ((*defaults)->scale() != 1.0 || (*defaults)->title().has_value() || (*defaults)->blob())
    {
        std::cerr << "defaults: expected the default scale and absent optionals\n";
        ok = false;
    }
    ok = expectJson("optional omission",
                    jsonization::serialize(**defaults),
                    R"({"shapes": [], "isVisible": true, "scale": 1.0})") &&
         ok;
    return ok;
}

bool runImplementationSpecific()
{
    bool ok = expectFailure("blob fragment",
                            jsonization::BlobFrom(parseJson(R"({"payload": ""})")),
                            "$.payload",
                            "Expected a non-empty blob payload");
    ok      = expectFailure("blob base64",
                       jsonization::BlobFrom(parseJson(R"({"payload": "A!=="})")),
                       "$.payload",
                       base64Failure("A!==")) &&
         ok;
    const types::Blob blob(std::vector<std::uint8_t>{0xFF});
    ok = expectJson("blob serialize", jsonization::serialize(blob), R"({"payload": "/w==", "modelType": "Blob"})") &&
         ok;
    return ok;
}

bool runEnumerations()
{
    auto literal = jsonization::ColorFrom(llvm::json::Value("light-blue"));
    if (!literal || *literal != types::Color::kLightBlue)
    {
        if (!literal)
        {
            llvm::consumeError(literal.takeError());
        }
        std::cerr << "enumeration: expected light-blue\n";
        return false;
    }
    if (fixture::stringification::to_string(types::Color::kRed) != "red" ||
        fixture::stringification::ColorFromString("red") != types::Color::kRed ||
        fixture::stringification::ColorFromString("Red").has_value())
    {
        std::cerr << "enumeration: stringification table mismatch\n";
        return false;
    }
    return expectJson("enumeration serialize", jsonization::serialize(types::Color::kLightBlue), R"("light-blue")");
}

}  // namespace

int main()
{
    bool ok = true;
    ok      = runPointExample() && ok;
    ok      = runNullVersusAbsent() && ok;
    ok      = runDispatch() && ok;
    ok      = runConcreteParentDispatch() && ok;
    ok      = runNestedPaths() && ok;
    ok      = runRoundTrip() && ok;
    ok      = runImplementationSpecific() && ok;
    ok      = runEnumerations() && ok;
    if (!ok)
    {
        std::cerr << "C++ jsonization integration failed\n";
        return 1;
    }
    std::cout << "C++ jsonization integration passed\n";
    return 0;
}
