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

#include "llvmmeta/CodeGen/GoEmitter.h"
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
    return std::filesystem::temp_directory_path() / ("llvmmeta-go-emitter-tests-" + std::to_string(now));
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

bool runGoEmitterTests()
{
    llvmmeta::DiagnosticEngine diag;
    auto                       loaded = llvmmeta::loadModelFromText(kZooModel, "/models/zoo.json", diag);
    if (!loaded)
    {
        std::cerr << "Go emitter fixture failed to load: " << llvm::toString(loaded.takeError()) << "\n";
        return false;
    }
    auto model = llvmmeta::analyze(std::move(*loaded), diag);
    if (!model)
    {
        std::cerr << "Go emitter fixture failed analysis: " << llvm::toString(model.takeError()) << "\n";
        return false;
    }
    const llvmmeta::SymbolTable symbols(*model);

    llvmmeta::SpecificImplementations fragments;
    fragments.add(llvmmeta::specificImplementationKey("Jsonization", "parse", "Tracker", "go"),
                  "// hand-written Tracker parser\n");
    fragments.add(llvmmeta::specificImplementationKey("Jsonization", "transform", "Tracker", "go"),
                  "// hand-written Tracker transform\n");
    auto plan = llvmmeta::buildJsonizationPlan(*model, symbols, fragments, "go", diag);
    if (!plan)
    {
        std::cerr << "Go emitter plan failed: " << llvm::toString(plan.takeError()) << "\n";
        return false;
    }

    if (llvmmeta::defaultGoModule(*model) != "zoo_keeper")
    {
        std::cerr << "default Go module mismatch\n";
        return false;
    }

    const std::filesystem::path outDir = makeUniqueTempDir();
    std::error_code             ec;
    auto                        fail = [&](const std::string& message) {
        std::cerr << message << "\n";
        std::filesystem::remove_all(outDir, ec);
        return false;
    };

    llvmmeta::GoEmitOptions options;
    options.outDir     = outDir.string();
    options.moduleName = "example.com/zoo";
    if (auto err = llvmmeta::emitGo(*model, *plan, options, diag))
    {
        return fail("Go emission failed: " + llvm::toString(std::move(err)));
    }

    const std::string types           = readTextFile(outDir / "types" / "types.go");
    const std::string stringification = readTextFile(outDir / "stringification" / "stringification.go");
    const std::string jsonization     = readTextFile(outDir / "jsonization" / "jsonization.go");
    const std::string reporting       = readTextFile(outDir / "reporting" / "reporting.go");
    const std::string goMod           = readTextFile(outDir / "go.mod");

    bool ok = expectContains("types.go",
                             types,
                             {"package types",
                              "type ModelType int",
                              "ModelTypeZebra ModelType = iota",
                              "type Diet int",
                              "DietHerbivore Diet = iota",
                              "DietMeatEater",
                              "type IClass interface {",
                              "type IAnimal interface {\n\tIClass\n",
                              "\tName() string\n",
                              "\tSetDiet(value Diet)\n",
                              "type IZebra interface {\n\tIAnimal\n",
                              "\tStripeCount() *int64\n",
                              "type Zebra struct {",
                              "\tstripeCount *int64\n",
                              "func (that *Zebra) ModelType() ModelType {",
                              "return ModelTypeZebra",
                              "func NewZebra(name string, diet Diet, stripeCount *int64) *Zebra {",
                              "\tanimals []IAnimal\n",
                              "\tphoto []byte\n",
                              "func (that *Enclosure) SetIsOpen(value bool) {"});
    ok      = expectContains("stringification.go",
                        stringification,
                        {"package stringification",
                         "import \"example.com/zoo/types\"",
                         "func DietToString(that types.Diet) (result string, ok bool) {",
                         "func DietFromString(text string) (result types.Diet, ok bool) {",
                         "\"meat\""}) &&
         ok;
    ok = expectContains("jsonization.go",
                        jsonization,
                        {"package jsonization",
                         "\t\"example.com/zoo/reporting\"\n",
                         "\t\"example.com/zoo/stringification\"\n",
                         "\t\"example.com/zoo/types\"\n",
                         "type DeserializationError struct {",
                         "func boolFromJsonable(jsonable interface{}) (result bool, err *reporting.Error) {",
                         "for _, key := range sortedKeys(m) {",
                         "// hand-written Tracker parser",
                         "// hand-written Tracker transform",
                         "func EnclosureFromJsonable(jsonable interface{}) (result ",
                         "result[\"modelType\"] = \"Zebra\"",
                         "func ToJsonable(that types.IClass) map[string]interface{} {"}) &&
         ok;
    ok = expectContains("reporting.go", reporting, {"package reporting"}) && ok;
    if (goMod != "module example.com/zoo\n\ngo 1.22\n")
    {
        ok = fail("go.mod content mismatch:\n" + goMod);
    }

    std::size_t notes = 0;
    for (const auto& d : diag.diagnostics())
    {
        notes += d.level == llvmmeta::DiagnosticLevel::Note ? 1U : 0U;
    }
    if (notes != 5)
    {
        ok = fail("expected one note per generated Go file");
    }

    {
        llvmmeta::GoEmitOptions  noModOptions;
        std::vector<std::string> recorded;
        noModOptions.outDir                      = (outDir / "nomod").string();
        noModOptions.emitGoMod                   = false;
        noModOptions.writePolicy.dryRun          = true;
        noModOptions.writePolicy.recordedOutputs = &recorded;
        if (auto err = llvmmeta::emitGo(*model, *plan, noModOptions, diag))
        {
            return fail("dry-run Go emission failed: " + llvm::toString(std::move(err)));
        }
        if (recorded.size() != 4 || std::filesystem::exists(outDir / "nomod", ec))
        {
            ok = fail("dry-run Go emission without go.mod must record four outputs and write none");
        }
    }

    for (const char* badModule : {"/rooted", "trailing/", "has space"})
    {
        llvmmeta::GoEmitOptions badOptions;
        badOptions.outDir     = (outDir / "bad").string();
        badOptions.moduleName = badModule;
        auto err              = llvmmeta::emitGo(*model, *plan, badOptions, diag);
        if (!err)
        {
            ok = fail(std::string("module path must be rejected: ") + badModule);
        }
        else if (llvm::toString(std::move(err)).find("invalid Go module path '" + std::string(badModule) + "'") ==
                 std::string::npos)
        {
            ok = fail(std::string("invalid module error text mismatch for ") + badModule);
        }
    }

    std::filesystem::remove_all(outDir, ec);
    return ok;
}
