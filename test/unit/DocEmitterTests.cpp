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

#include "llvmmeta/CodeGen/DocEmitter.h"
#include "llvmmeta/CodeGen/ModelPrinter.h"
#include "llvmmeta/Frontend/ModelLoader.h"
#include "llvmmeta/Semantics/Analyzer.h"
#include "llvmmeta/Support/Diagnostics.h"
#include "llvm/Support/Error.h"

namespace
{

constexpr const char* kZooModel = R"({
  "name": "zoo_keeper",
  "description": {"summary": "Keeps track of zoo animals.", "remarks": ["Every animal lives in an enclosure."]},
  "types": [
    {"kind": "enumeration", "name": "Diet",
     "literals": [{"name": "Herbivore", "value": "herb", "description": "plants | leaves"},
                  {"name": "Meat_eater", "value": "meat"}]},
    {"kind": "constrained_primitive", "name": "Tag", "constrainee": "str", "description": "Short label."},
    {"kind": "abstract_class", "name": "Animal", "description": "Anything kept in the zoo.",
     "properties": [{"name": "name", "type": "str", "description": "Given name."}, {"name": "diet", "type": "Diet"}],
     "constructor": [{"name": "name", "type": "str"}, {"name": "diet", "type": "Optional[Diet]", "default": "herb"}]},
    {"kind": "concrete_class", "name": "Zebra", "inheritances": ["Animal"],
     "properties": [{"name": "name", "type": "str"}, {"name": "diet", "type": "Diet"},
                    {"name": "stripe_count", "type": "Optional[int]"}],
     "constructor": [{"name": "name", "type": "str"}, {"name": "diet", "type": "Optional[Diet]", "default": "herb"},
                     {"name": "stripe_count", "type": "Optional[int]"}]},
    {"kind": "concrete_class", "name": "Enclosure",
     "properties": [{"name": "animals", "type": "List[Animal]"}, {"name": "is_open", "type": "bool"}]},
    {"kind": "concrete_class", "name": "Tracker", "implementation_specific": true,
     "properties": [{"name": "code", "type": "str"}]}
  ]
})";

std::filesystem::path makeUniqueTempDir()
{
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() / ("llvmmeta-doc-emitter-tests-" + std::to_string(now));
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

bool expectContains(const std::string& what, const std::string& text, const std::vector<std::string>& needles)
{
    for (const auto& needle : needles)
    {
        if (text.find(needle) == std::string::npos)
        {
            std::cerr << what << " is missing: " << needle << "\n";
            return false;
        }
    }
    return true;
}

bool checkMarkdown(const std::string& markdown)
{
    bool ok = expectContains("markdown",
                             markdown,
                             {"# zoo_keeper\n\nKeeps track of zoo animals.\n\nEvery animal lives in an enclosure.\n\n",
                              "## Contents\n\n",
                              "- [Diet](#diet) (enumeration)\n",
                              "- [Tag](#tag) (constrained primitive)\n",
                              "- [Animal](#animal) (abstract class)\n",
                              "- [Enclosure](#enclosure) (concrete class)\n",
                              "## Diet\n\n*Enumeration*\n\n",
                              "| Literal | Wire value | Description |\n",
                              "| Herbivore | `herb` | plants \\| leaves |\n",
                              "| Meat_eater | `meat` |  |\n",
                              "## Tag\n\n*Constrained primitive* of `str`\n\nShort label.\n\n",
                              "## Animal\n\n*Abstract class*\n\nAnything kept in the zoo.\n\n",
                              "Interface `IAnimal` is implemented by:\n\n",
                              "| [Zebra](#zebra) | `Zebra` |\n",
                              "| `name` | `str` | yes |  | Given name. |\n",
                              "| `diet` | `Diet` | no | `\"herb\"` |  |\n",
                              "Ancestors: [Animal](#animal)\n\n",
                              "Model type: `Zebra`\n\n",
                              "| `stripeCount` | `Optional[int]` | no |  |  |\n",
                              "| `animals` | `List[Animal]` | yes |  |  |\n",
                              "| `isOpen` | `bool` | yes |  |  |\n",
                              "## Tracker\n\n*Concrete class*, implementation-specific\n\n"});

    const auto enclosure = markdown.find("## Enclosure");
    if (enclosure != std::string::npos && markdown.find("Model type:", enclosure) < markdown.find("## Tracker"))
    {
        std::cerr << "a class without a discriminator must not list a model type\n";
        ok = false;
    }
    return ok;
}

bool checkPrintedModel(const std::string& printed)
{
    bool ok = expectContains("printed model",
                             printed,
                             {"model \"zoo_keeper\" {\n",
                              "  enumeration Diet {\n    literal Herbivore = \"herb\"\n",
                              "  constrained primitive Tag : str\n",
                              "  abstract class Animal {\n",
                              "    interface: IAnimal\n",
                              "    descendants: [Zebra]\n",
                              "    argument diet : Optional[Diet] = \"herb\"\n",
                              "    property stripe_count : Optional[int] json \"stripeCount\" codec ",
                              "    implementation_specific: true\n",
                              "  interface IAnimal {\n    implementer Zebra model_type \"Zebra\"\n  }\n"});
    if (printed.empty() || printed.back() != '\n' || printed.rfind("}\n") != printed.size() - 2)
    {
        std::cerr << "printed model must end with a closing brace\n";
        ok = false;
    }
    return ok;
}

}  // namespace

bool runDocEmitterTests()
{
    llvmmeta::DiagnosticEngine diag;
    auto                       loaded = llvmmeta::loadModelFromText(kZooModel, "/models/zoo.json", diag);
    if (!loaded)
    {
        std::cerr << "doc emitter fixture failed to load: " << llvm::toString(loaded.takeError()) << "\n";
        return false;
    }
    auto model = llvmmeta::analyze(std::move(*loaded), diag);
    if (!model)
    {
        std::cerr << "doc emitter fixture failed analysis: " << llvm::toString(model.takeError()) << "\n";
        return false;
    }

    const std::string markdown = llvmmeta::renderModelMarkdown(*model);
    bool              ok       = checkMarkdown(markdown);
    ok                         = checkPrintedModel(llvmmeta::printModel(*model)) && ok;

    const std::filesystem::path outDir = makeUniqueTempDir();
    std::error_code             ec;

    llvmmeta::DocEmitOptions options;
    options.outDir = outDir.string();
    if (auto err = llvmmeta::emitDocs(*model, options, diag))
    {
        std::cerr << "doc emission failed: " << llvm::toString(std::move(err)) << "\n";
        std::filesystem::remove_all(outDir, ec);
        return false;
    }
    if (readTextFile(outDir / "zoo_keeper.md") != markdown)
    {
        std::cerr << "emitted documentation must match the rendered Markdown\n";
        ok = false;
    }

    llvmmeta::DocEmitOptions missingDir;
    if (auto err = llvmmeta::emitDocs(*model, missingDir, diag))
    {
        llvm::consumeError(std::move(err));
    }
    else
    {
        std::cerr << "doc emission without an output directory must fail\n";
        ok = false;
    }

    std::filesystem::remove_all(outDir, ec);
    return ok;
}
