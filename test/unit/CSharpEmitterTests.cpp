//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "llvmmeta/CodeGen/CSharpEmitter.h"
#include "llvmmeta/CodeGen/JsonizationPlan.h"
#include "llvmmeta/CodeGen/SpecificImplementations.h"
#include "llvmmeta/Frontend/ModelLoader.h"
#include "llvmmeta/Semantics/Analyzer.h"
#include "llvmmeta/Semantics/SymbolTable.h"
#include "llvmmeta/Support/Diagnostics.h"
#include "llvm/Support/Error.h"

namespace
{

constexpr const char* kZooModel = R"({
  "name": "zoo_keeper",
  "types": [
    {"kind": "enumeration", "name": "Diet",
     "literals": [{"name": "Herbivore", "value": "herb"}, {"name": "Meat_eater", "value": "meat"}]},
    {"kind": "abstract_class", "name": "Animal", "description": "Anything kept in the zoo.",
     "properties": [{"name": "name", "type": "str"}, {"name": "diet", "type": "Diet"}],
     "constructor": [{"name": "name", "type": "str"}, {"name": "diet", "type": "Optional[Diet]", "default": "herb"}]},
    {"kind": "concrete_class", "name": "Zebra", "inheritances": ["Animal"],
     "properties": [{"name": "name", "type": "str"}, {"name": "diet", "type": "Diet"},
                    {"name": "stripe_count", "type": "Optional[int]"}],
     "constructor": [{"name": "name", "type": "str"}, {"name": "diet", "type": "Optional[Diet]", "default": "herb"},
                     {"name": "stripe_count", "type": "Optional[int]"}]},
    {"kind": "concrete_class", "name": "Enclosure",
     "properties": [{"name": "animals", "type": "List[Animal]"}, {"name": "is_open", "type": "bool"},
                    {"name": "photo", "type": "Optional[bytearray]"}]},
    {"kind": "concrete_class", "name": "Tracker", "implementation_specific": true,
     "properties": [{"name": "code", "type": "str"}]}
  ]
})";

std::filesystem::path makeUniqueTempDir()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("llvmmeta-csharp-emitter-tests-" + std::to_string(now));
}

std::string readTextFile(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return {};
    }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

bool expectContains(const std::string& fileName, const std::string& text, const std::vector<std::string>& needles)
{
    for (const auto& needle : needles)
    {
        if (text.find(needle) == std::string::npos)
        {
            std::cerr << fileName << " is missing: " << needle << "\n";
            return false;
        }
    }
    return true;
}

}  // namespace

bool runCSharpEmitterTests()
{
    llvmmeta::DiagnosticEngine diag;
    auto                       loaded = llvmmeta::loadModelFromText(kZooModel, "/models/zoo.json", diag);
    if (!loaded)
    {
        std::cerr << "C# emitter fixture failed to load: " << llvm::toString(loaded.takeError()) << "\n";
        return false;
    }
    auto model = llvmmeta::analyze(std::move(*loaded), diag);
    if (!model)
    {
        std::cerr << "C# emitter fixture failed analysis: " << llvm::toString(model.takeError()) << "\n";
        return false;
    }
    const llvmmeta::SymbolTable symbols(*model);

    llvmmeta::SpecificImplementations fragments;
    fragments.add(llvmmeta::specificImplementationKey("Jsonization", "parse", "Tracker", "cs"),
                  "// hand-written Tracker parser\n");
    fragments.add(llvmmeta::specificImplementationKey("Jsonization", "transform", "Tracker", "cs"),
                  "// hand-written Tracker transform\n");
    auto plan = llvmmeta::buildJsonizationPlan(*model, symbols, fragments, "cs", diag);
    if (!plan)
    {
        std::cerr << "C# emitter plan failed: " << llvm::toString(plan.takeError()) << "\n";
        return false;
    }

    if (llvmmeta::defaultCSharpNamespace(*model) != "ZooKeeper")
    {
        std::cerr << "default C# namespace mismatch\n";
        return false;
    }

    const std::filesystem::path outDir = makeUniqueTempDir();
    std::error_code             ec;
    auto                        fail = [&](const std::string& message) {
        std::cerr << message << "\n";
        std::filesystem::remove_all(outDir, ec);
        return false;
    };

    llvmmeta::CSharpEmitOptions options;
    options.outDir          = outDir.string();
    options.csharpNamespace = "Zoo.Gen";
    if (auto err = llvmmeta::emitCSharp(*model, *plan, options, diag))
    {
        return fail("C# emission failed: " + llvm::toString(std::move(err)));
    }

    const std::string types           = readTextFile(outDir / "Types.cs");
    const std::string stringification = readTextFile(outDir / "Stringification.cs");
    const std::string jsonization     = readTextFile(outDir / "Jsonization.cs");
    const std::string reporting       = readTextFile(outDir / "Reporting.cs");

    bool ok = expectContains("Types.cs",
                             types,
                             {"namespace Zoo.Gen",
                              "public enum Diet",
                              "MeatEater,",
                              "public interface IAnimal : IClass",
                              "public string Name { get; set; }",
                              "public interface IZebra : IAnimal",
                              "public long? StripeCount { get; set; }",
                              "public sealed class Zebra : IZebra",
                              "public Zebra(string name, Diet diet, long? stripeCount)",
                              "public List<IAnimal> Animals { get; set; }",
                              "public byte[]? Photo { get; set; }",
                              "public T TransformEnclosure(Enclosure that);",
                              "return transformer.TransformTracker(this);"});
    ok      = expectContains("Stringification.cs",
                        stringification,
                        {"public static string? ToString(Diet that)",
                         "public static Diet? DietFromString(string text)",
                         "\"meat\""}) &&
         ok;
    ok = expectContains("Jsonization.cs",
                        jsonization,
                        {"using Reporting = LlvmMeta.Runtime.Reporting;",
                         "internal static class DeserializeImplementation",
                         "obj.OrderBy(pair => pair.Key, System.StringComparer.Ordinal)",
                         "case \"modelType\":",
                         "// hand-written Tracker parser",
                         "// hand-written Tracker transform",
                         "public class Exception : System.Exception",
                         "public static Enclosure EnclosureFrom(Nodes.JsonNode node)",
                         "public Nodes.JsonObject TransformEnclosure(Enclosure that)",
                         "public static Nodes.JsonObject ToJsonObject(IClass that)",
                         "public static Nodes.JsonValue ToJsonValue(Diet that)"}) &&
         ok;
    ok = expectContains("Reporting.cs", reporting, {"namespace LlvmMeta.Runtime"}) && ok;

    std::size_t notes = 0;
    for (const auto& d : diag.diagnostics())
    {
        notes += d.level == llvmmeta::DiagnosticLevel::Note ? 1U : 0U;
    }
    if (notes != 4)
    {
        ok = fail("expected one note per generated C# file");
    }

    {
        llvmmeta::CSharpEmitOptions dryOptions;
        std::vector<std::string>    recorded;
        dryOptions.outDir                      = (outDir / "dry").string();
        dryOptions.writePolicy.dryRun          = true;
        dryOptions.writePolicy.recordedOutputs = &recorded;
        if (auto err = llvmmeta::emitCSharp(*model, *plan, dryOptions, diag))
        {
            return fail("dry-run C# emission failed: " + llvm::toString(std::move(err)));
        }
        if (recorded.size() != 4 || std::filesystem::exists(outDir / "dry", ec))
        {
            ok = fail("dry-run C# emission must record four outputs and write none");
        }
    }

    for (const char* badNamespace : {"Zoo.class", "Zoo..Gen", "9Zoo"})
    {
        llvmmeta::CSharpEmitOptions badOptions;
        badOptions.outDir          = (outDir / "bad").string();
        badOptions.csharpNamespace = badNamespace;
        auto err                   = llvmmeta::emitCSharp(*model, *plan, badOptions, diag);
        if (!err)
        {
            ok = fail(std::string("namespace must be rejected: ") + badNamespace);
        }
        else if (llvm::toString(std::move(err)).find("invalid C# namespace '" + std::string(badNamespace) + "'") ==
                 std::string::npos)
        {
            ok = fail(std::string("invalid namespace error text mismatch for ") + badNamespace);
        }
    }

    std::filesystem::remove_all(outDir, ec);
    return ok;
}
