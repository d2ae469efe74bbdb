//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `metac` command-line meta-model compiler.
///
/// This tool loads a JSON meta-model, runs semantic analysis, builds the
/// backend-neutral codec plan, and dispatches to language backends (C++, C#,
/// Go), the Markdown documentation backend, or the `model` listing.
///
//===----------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "llvmmeta/CodeGen/CSharpEmitter.h"
#include "llvmmeta/CodeGen/CppEmitter.h"
#include "llvmmeta/CodeGen/DocEmitter.h"
#include "llvmmeta/CodeGen/EmitCommon.h"
#include "llvmmeta/CodeGen/GoEmitter.h"
#include "llvmmeta/CodeGen/JsonizationPlan.h"
#include "llvmmeta/CodeGen/ModelPrinter.h"
#include "llvmmeta/CodeGen/SpecificImplementations.h"
#include "llvmmeta/Frontend/ModelLoader.h"
#include "llvmmeta/Frontend/SourceLocation.h"
#include "llvmmeta/Semantics/Analyzer.h"
#include "llvmmeta/Semantics/SymbolTable.h"
#include "llvmmeta/Support/Diagnostics.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/raw_ostream.h"

namespace
{

/// @brief Checks whether a command token is implemented by `metac`.
///
/// @param[in] command Command token from argv.
/// @return `true` if the command is one of the supported subcommands.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "model" || command == "docs" || command == "cpp" || command == "csharp" || command == "go";
}

/// @brief Checks whether a token is a help switch.
///
/// @param[in] arg Argument token from argv.
/// @return `true` when the argument is `--help` or `-h`.
bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: metac <model|docs|cpp|csharp|go> --model <file> [options]\n"
                 << "Try: metac --help\n";
}

/// @brief Prints the full help text and optional command-focused details.
///
/// @param[in] selectedCommand Optional command name used for focused help.
void printHelp(const std::string& selectedCommand = "")
{
    llvm::errs()
        << "NAME\n"
        << "  metac - meta-model compiler generating JSON codecs and API documentation\n\n"
        << "SYNOPSIS\n"
        << "  metac <command> --model <file> [options]\n"
        << "  metac --help\n"
        << "  metac <command> --help\n\n"
        << "DESCRIPTION\n"
        << "  metac loads a JSON meta-model, validates it, and generates bidirectional JSON codecs\n"
        << "  (parse with path-annotated errors, discriminator dispatch on \"modelType\", serialize)\n"
        << "  for C++, C#, and Go, or Markdown documentation.\n\n"
        << "COMMANDS\n"
        << "  model   Print the resolved model (types, interfaces, codec strategies) to stdout.\n"
        << "  docs    Write <model>.md into --out-dir.\n"
        << "  cpp     Write types.hpp, stringification, jsonization and llvmmeta_runtime.hpp.\n"
        << "  csharp  Write Types.cs, Stringification.cs, Jsonization.cs and Reporting.cs.\n"
        << "  go      Write the types, stringification, reporting and jsonization packages.\n\n"
        << "COMMON OPTIONS\n"
        << "  --model <file>\n"
        << "      Meta-model JSON document (required).\n"
        << "  --out-dir <dir>\n"
        << "      Output root (required for docs, cpp, csharp, go).\n"
        << "  --snippets-dir <dir>\n"
        << "      Root of implementation-specific fragments, keyed\n"
        << "      Jsonization/<parse|transform>/<TypeName>.<cpp|cs|go>.\n"
        << "  --dry-run\n"
        << "      Run every stage but write no files.\n"
        << "  --no-overwrite\n"
        << "      Fail instead of replacing existing output files.\n"
        << "  --depfile\n"
        << "      Write <primary output>.d listing the model and every fragment read.\n"
        << "  --warnings-as-errors\n"
        << "      Fail the run on analyzer warnings.\n"
        << "  --verbose\n"
        << "      Print note-level progress diagnostics.\n\n"
        << "BACKEND OPTIONS\n"
        << "  --cpp-namespace <ns>\n"
        << "      C++ namespace, '::'-separated (default: snake-case model name).\n"
        << "  --csharp-namespace <ns>\n"
        << "      C# namespace, '.'-separated (default: capital-camel model name).\n"
        << "  --go-module <path>\n"
        << "      Go module path written to go.mod (default: snake-case model name).\n\n"
        << "EXAMPLES\n"
        << "  metac model --model shapes.json\n"
        << "  metac cpp --model shapes.json --snippets-dir snippets --out-dir build/shapes-cpp\n"
        << "  metac go --model shapes.json --go-module example.com/shapes --out-dir build/shapes-go\n";

    if (!selectedCommand.empty())
    {
        llvm::errs() << "\nCOMMAND DETAILS (" << selectedCommand << ")\n";
        if (selectedCommand == "model")
        {
            llvm::errs() << "  Writes to stdout. Ignores --out-dir.\n";
        }
        else if (selectedCommand == "docs")
        {
            llvm::errs() << "  Requires --out-dir.\n";
        }
        else if (selectedCommand == "cpp")
        {
            llvm::errs() << "  Requires --out-dir. Honors --cpp-namespace and --snippets-dir (.cpp fragments).\n";
        }
        else if (selectedCommand == "csharp")
        {
            llvm::errs() << "  Requires --out-dir. Honors --csharp-namespace and --snippets-dir (.cs fragments).\n";
        }
        else if (selectedCommand == "go")
        {
            llvm::errs() << "  Requires --out-dir. Honors --go-module and --snippets-dir (.go fragments).\n";
        }
    }
}

/// @brief Emits collected diagnostics to stderr.
///
/// @param[in] diag Diagnostic engine containing accumulated diagnostics.
/// @param[in] verbose Includes note-level diagnostics when true.
void printDiagnostics(const llvmmeta::DiagnosticEngine& diag, const bool verbose)
{
    for (const auto& d : diag.diagnostics())
    {
        if (d.level == llvmmeta::DiagnosticLevel::Note && !verbose)
        {
            continue;
        }
        llvm::errs() << d.location.str() << ": " << llvmmeta::diagnosticLevelName(d.level) << ": " << d.message
                     << "\n";
    }
}

/// @brief Resolves a path to an absolute output-root string when possible.
///
/// @param[in] root Requested output directory.
/// @return Absolute path string when resolution succeeds; otherwise the original
///         input string (or `"stdout"` for empty input).
std::string resolveOutputRoot(const std::string& root)
{
    if (root.empty())
    {
        return "stdout";
    }
    std::error_code ec;
    const auto      abs = std::filesystem::absolute(root, ec);
    if (!ec)
    {
        return abs.string();
    }
    return root;
}

/// @brief Prints the post-run command summary.
///
/// @param[in] command Executed top-level command.
/// @param[in] outputRoot Resolved output root description.
/// @param[in] generatedFiles Number of generated files.
/// @param[in] elapsed Wall-clock execution duration.
void printRunSummary(llvm::StringRef                           command,
                     llvm::StringRef                           outputRoot,
                     const std::uint64_t                       generatedFiles,
                     const std::chrono::steady_clock::duration elapsed)
{
    const auto elapsedMs         = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    const auto elapsedWholeSec   = elapsedMs / 1000;
    const auto elapsedFractionMs = elapsedMs % 1000;
    llvm::errs() << "Run summary:\n"
                 << "  command: " << command << "\n"
                 << "  output root: " << outputRoot << "\n"
                 << "  files generated: " << generatedFiles << "\n"
                 << "  elapsed: " << elapsedWholeSec << ".";
    if (elapsedFractionMs < 100)
    {
        llvm::errs() << "0";
    }
    if (elapsedFractionMs < 10)
    {
        llvm::errs() << "0";
    }
    llvm::errs() << elapsedFractionMs << "s\n";
}

/// @brief Returns the fragment file extension consumed by a code backend.
///
/// @param[in] command Code backend command.
/// @return File extension without the dot.
llvm::StringRef fragmentExtensionFor(llvm::StringRef command)
{
    if (command == "csharp")
    {
        return "cs";
    }
    if (command == "go")
    {
        return "go";
    }
    return "cpp";
}

}  // namespace

/// @brief Program entry point for `metac`.
///
/// @param[in] argc Argument count.
/// @param[in] argv Argument vector.
/// @return Zero on success, non-zero on CLI, load, semantic, planning, or
///         code-generation failure.
int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (isHelpToken(command) || command == "help")
    {
        printHelp();
        return 0;
    }
    if (!isKnownCommand(command))
    {
        llvm::errs() << "Unknown command: " << command << "\n";
        printUsage();
        return 1;
    }

    std::string modelPath;
    std::string outDir;
    std::string snippetsDir;
    std::string cppNamespace;
    std::string csharpNamespace;
    std::string goModuleName;
    bool        helpRequested    = false;
    bool        dryRun           = false;
    bool        noOverwrite      = false;
    bool        writeDepfile     = false;
    bool        warningsAsErrors = false;
    bool        verbose          = false;

    for (int i = 2; i < argc; ++i)
    {
        const std::string arg          = argv[i];
        auto              requireValue = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc)
            {
                llvm::errs() << "Missing value for " << name << "\n";
                printUsage();
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--model")
        {
            modelPath = requireValue(arg);
        }
        else if (arg == "--out-dir")
        {
            outDir = requireValue(arg);
        }
        else if (arg == "--snippets-dir")
        {
            snippetsDir = requireValue(arg);
        }
        else if (arg == "--cpp-namespace")
        {
            cppNamespace = requireValue(arg);
        }
        else if (arg == "--csharp-namespace")
        {
            csharpNamespace = requireValue(arg);
        }
        else if (arg == "--go-module")
        {
            goModuleName = requireValue(arg);
        }
        else if (arg == "--dry-run")
        {
            dryRun = true;
        }
        else if (arg == "--no-overwrite")
        {
            noOverwrite = true;
        }
        else if (arg == "--depfile")
        {
            writeDepfile = true;
        }
        else if (arg == "--warnings-as-errors")
        {
            warningsAsErrors = true;
        }
        else if (arg == "--verbose")
        {
            verbose = true;
        }
        else if (isHelpToken(arg))
        {
            helpRequested = true;
        }
        else
        {
            llvm::errs() << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (helpRequested)
    {
        printHelp(command);
        return 0;
    }

    if (modelPath.empty())
    {
        llvm::errs() << "--model is required\n";
        return 1;
    }
    if (command != "model" && outDir.empty())
    {
        llvm::errs() << "--out-dir is required for '" << command << "' command\n";
        return 1;
    }

    const auto                 startTime = std::chrono::steady_clock::now();
    llvmmeta::DiagnosticEngine diagnostics;
    std::vector<std::string>   generatedOutputs;
    auto                       finish = [&](const std::string& outputRoot) -> int {
        printDiagnostics(diagnostics, verbose);
        printRunSummary(command,
                        outputRoot,
                        static_cast<std::uint64_t>(generatedOutputs.size()),
                        std::chrono::steady_clock::now() - startTime);
        return diagnostics.hasErrors() ? 1 : 0;
    };
    auto fail = [&](llvm::Error err) -> int {
        if (err)
        {
            llvm::errs() << llvm::toString(std::move(err)) << "\n";
        }
        printDiagnostics(diagnostics, verbose);
        return 1;
    };

    auto loaded = llvmmeta::loadModelFile(modelPath, diagnostics);
    if (!loaded)
    {
        return fail(loaded.takeError());
    }
    diagnostics.note(llvmmeta::SourceLocation{modelPath, {}},
                     "loaded " + std::to_string(loaded->types.size()) + " named types");

    llvmmeta::AnalyzeOptions analyzeOptions;
    analyzeOptions.warningsAsErrors = warningsAsErrors;
    auto model = llvmmeta::analyze(std::move(*loaded), diagnostics, analyzeOptions);
    if (!model)
    {
        return fail(model.takeError());
    }
    diagnostics.note(llvmmeta::SourceLocation{modelPath, {}},
                     "analysis synthesized " + std::to_string(model->interfaces.size()) + " interfaces");

    if (command == "model")
    {
        llvm::outs() << llvmmeta::printModel(*model);
        return finish("stdout");
    }

    llvmmeta::EmitWritePolicy writePolicy;
    writePolicy.dryRun          = dryRun;
    writePolicy.noOverwrite     = noOverwrite;
    writePolicy.recordedOutputs = &generatedOutputs;

    std::vector<std::string> dependencies{modelPath};

    if (command == "docs")
    {
        llvmmeta::DocEmitOptions options;
        options.outDir      = outDir;
        options.writePolicy = writePolicy;
        if (llvm::Error err = llvmmeta::emitDocs(*model, options, diagnostics))
        {
            return fail(std::move(err));
        }
    }
    else
    {
        auto fragments = llvmmeta::SpecificImplementations::loadFromDirectory(snippetsDir);
        if (!fragments)
        {
            return fail(fragments.takeError());
        }
        const llvmmeta::SymbolTable symbols(*model);
        auto plan = llvmmeta::buildJsonizationPlan(*model, symbols, *fragments, fragmentExtensionFor(command), diagnostics);
        if (!plan)
        {
            return fail(plan.takeError());
        }
        diagnostics.note(llvmmeta::SourceLocation{modelPath, {}},
                         "codec plan holds " + std::to_string(plan->entries.size()) + " entries");
        dependencies.insert(dependencies.end(), plan->fragmentSources.begin(), plan->fragmentSources.end());

        auto emit = [&]() -> llvm::Error {
            if (command == "cpp")
            {
                llvmmeta::CppEmitOptions options;
                options.outDir       = outDir;
                options.cppNamespace = cppNamespace;
                options.writePolicy  = writePolicy;
                return llvmmeta::emitCpp(*model, *plan, options, diagnostics);
            }
            if (command == "csharp")
            {
                llvmmeta::CSharpEmitOptions options;
                options.outDir          = outDir;
                options.csharpNamespace = csharpNamespace;
                options.writePolicy     = writePolicy;
                return llvmmeta::emitCSharp(*model, *plan, options, diagnostics);
            }
            llvmmeta::GoEmitOptions options;
            options.outDir      = outDir;
            options.moduleName  = goModuleName;
            options.writePolicy = writePolicy;
            return llvmmeta::emitGo(*model, *plan, options, diagnostics);
        };
        if (llvm::Error err = emit())
        {
            return fail(std::move(err));
        }
    }

    if (writeDepfile && !generatedOutputs.empty())
    {
        const std::filesystem::path primaryOutput(generatedOutputs.front());
        if (llvm::Error err = llvmmeta::writeDepfileForGeneratedOutput(primaryOutput, dependencies, writePolicy))
        {
            return fail(std::move(err));
        }
    }

    return finish(resolveOutputRoot(outDir));
}
