//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements shared naming-policy helpers for wire names and backend code generation.
///
/// The implementation provides language keyword tables, identifier sanitation,
/// and the camel/snake projections of underscore-separated model names.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/CodeGen/NamingPolicy.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringSet.h"

namespace llvmmeta
{
namespace
{

const llvm::StringSet<>& keywordSet(const CodegenNamingLanguage language)
{
    static const llvm::StringSet<> cppKeywords = {"alignas",
                                                  "alignof",
                                                  "and",
                                                  "and_eq",
                                                  "asm",
                                                  "atomic_cancel",
                                                  "atomic_commit",
                                                  "atomic_noexcept",
                                                  "auto",
                                                  "bitand",
                                                  "bitor",
                                                  "bool",
                                                  "break",
                                                  "case",
                                                  "catch",
                                                  "char",
                                                  "char8_t",
                                                  "char16_t",
                                                  "char32_t",
                                                  "class",
                                                  "compl",
                                                  "concept",
                                                  "const",
                                                  "consteval",
                                                  "constexpr",
                                                  "constinit",
                                                  "const_cast",
                                                  "continue",
                                                  "co_await",
                                                  "co_return",
                                                  "co_yield",
                                                  "decltype",
                                                  "default",
                                                  "delete",
                                                  "do",
                                                  "double",
                                                  "dynamic_cast",
                                                  "else",
                                                  "enum",
                                                  "explicit",
                                                  "export",
                                                  "extern",
                                                  "false",
                                                  "float",
                                                  "for",
                                                  "friend",
                                                  "goto",
                                                  "if",
                                                  "inline",
                                                  "int",
                                                  "long",
                                                  "mutable",
                                                  "namespace",
                                                  "new",
                                                  "noexcept",
                                                  "not",
                                                  "not_eq",
                                                  "nullptr",
                                                  "operator",
                                                  "or",
                                                  "or_eq",
                                                  "private",
                                                  "protected",
                                                  "public",
                                                  "register",
                                                  "reinterpret_cast",
                                                  "requires",
                                                  "return",
                                                  "short",
                                                  "signed",
                                                  "sizeof",
                                                  "static",
                                                  "static_assert",
                                                  "static_cast",
                                                  "struct",
                                                  "switch",
                                                  "template",
                                                  "this",
                                                  "thread_local",
                                                  "throw",
                                                  "true",
                                                  "try",
                                                  "typedef",
                                                  "typeid",
                                                  "typename",
                                                  "union",
                                                  "unsigned",
                                                  "using",
                                                  "virtual",
                                                  "void",
                                                  "volatile",
                                                  "wchar_t",
                                                  "while",
                                                  "xor",
                                                  "xor_eq"};

    static const llvm::StringSet<> csharpKeywords =
        {"abstract", "as",       "base",      "bool",      "break",    "byte",     "case",     "catch",
         "char",     "checked",  "class",     "const",     "continue", "decimal",  "default",  "delegate",
         "do",       "double",   "else",      "enum",      "event",    "explicit", "extern",   "false",
         "finally",  "fixed",    "float",     "for",       "foreach",  "goto",     "if",       "implicit",
         "in",       "int",      "interface", "internal",  "is",       "lock",     "long",     "namespace",
         "new",      "null",     "object",    "operator",  "out",      "override", "params",   "private",
         "protected", "public",  "readonly",  "ref",       "return",   "sbyte",    "sealed",   "short",
         "sizeof",   "stackalloc", "static",  "string",    "struct",   "switch",   "this",     "throw",
         "true",     "try",      "typeof",    "uint",      "ulong",    "unchecked", "unsafe",  "ushort",
         "using",    "virtual",  "void",      "volatile",  "while"};

    static const llvm::StringSet<> goKeywords = {"break",    "default",     "func",   "interface", "select",
                                                 "case",     "defer",       "go",     "map",       "struct",
                                                 "chan",     "else",        "goto",   "package",   "switch",
                                                 "const",    "fallthrough", "if",     "range",     "type",
                                                 "continue", "for",         "import", "return",    "var"};

    switch (language)
    {
    case CodegenNamingLanguage::Cpp:
        return cppKeywords;
    case CodegenNamingLanguage::CSharp:
        return csharpKeywords;
    case CodegenNamingLanguage::Go:
        return goKeywords;
    }
    return cppKeywords;
}

std::vector<std::string> splitWords(llvm::StringRef name)
{
    llvm::SmallVector<llvm::StringRef, 8> parts;
    name.split(parts, '_', /*MaxSplit=*/-1, /*KeepEmpty=*/false);

    std::vector<std::string> out;
    out.reserve(parts.size());
    for (const auto part : parts)
    {
        out.push_back(part.str());
    }
    return out;
}

bool startsUpper(const std::string& word)
{
    return !word.empty() && std::isupper(static_cast<unsigned char>(word.front()));
}

std::string capitalized(std::string word)
{
    if (!word.empty())
    {
        word.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(word.front())));
    }
    return word;
}

std::string lowered(std::string word)
{
    for (char& c : word)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return word;
}

std::string normalizeSnakeCase(llvm::StringRef name)
{
    std::string out;
    out.reserve(name.size() + 8);

    bool prevUnderscore = false;
    for (std::size_t i = 0; i < name.size(); ++i)
    {
        const char c    = name[i];
        const char prev = (i > 0) ? name[i - 1] : '\0';
        const char next = (i + 1 < name.size()) ? name[i + 1] : '\0';
        if (!std::isalnum(static_cast<unsigned char>(c)))
        {
            if (!out.empty() && !prevUnderscore)
            {
                out.push_back('_');
                prevUnderscore = true;
            }
            continue;
        }

        if (std::isupper(static_cast<unsigned char>(c)))
        {
            const bool boundary =
                std::islower(static_cast<unsigned char>(prev)) ||
                (std::isupper(static_cast<unsigned char>(prev)) && std::islower(static_cast<unsigned char>(next)));
            if (!out.empty() && !prevUnderscore && boundary)
            {
                out.push_back('_');
            }
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            prevUnderscore = false;
        }
        else
        {
            out.push_back(c);
            prevUnderscore = false;
        }
    }
    while (!out.empty() && out.back() == '_')
    {
        out.pop_back();
    }
    return out;
}

}  // namespace

bool codegenIsKeyword(const CodegenNamingLanguage language, const llvm::StringRef name)
{
    return keywordSet(language).contains(name);
}

std::string codegenSanitizeIdentifier(const CodegenNamingLanguage language, llvm::StringRef name)
{
    std::string out = name.str();
    if (out.empty())
    {
        return "_";
    }
    for (char& c : out)
    {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_'))
        {
            c = '_';
        }
    }
    if (std::isdigit(static_cast<unsigned char>(out.front())))
    {
        out.insert(out.begin(), '_');
    }
    if (codegenIsKeyword(language, out))
    {
        out += "_";
    }
    return out;
}

std::string toCapitalCamelCase(const llvm::StringRef name)
{
    std::string out;
    for (auto& word : splitWords(name))
    {
        out += startsUpper(word) ? word : capitalized(word);
    }
    return out;
}

std::string toLowerCamelCase(const llvm::StringRef name)
{
    const auto  words = splitWords(name);
    std::string out;
    for (std::size_t i = 0; i < words.size(); ++i)
    {
        if (i == 0)
        {
            out += lowered(words[i]);
        }
        else
        {
            out += startsUpper(words[i]) ? words[i] : capitalized(words[i]);
        }
    }
    return out;
}

std::string toLowerSnakeCase(const llvm::StringRef name)
{
    return normalizeSnakeCase(name);
}

std::string codegenToCapitalCamelIdentifier(const CodegenNamingLanguage language, const llvm::StringRef name)
{
    auto out = toCapitalCamelCase(name);
    if (out.empty())
    {
        out = "X";
    }
    return codegenSanitizeIdentifier(language, out);
}

std::string codegenToLowerCamelIdentifier(const CodegenNamingLanguage language, const llvm::StringRef name)
{
    auto out = toLowerCamelCase(name);
    if (out.empty())
    {
        out = "x";
    }
    return codegenSanitizeIdentifier(language, out);
}

std::string codegenToSnakeCaseIdentifier(const CodegenNamingLanguage language, const llvm::StringRef name)
{
    auto out = toLowerSnakeCase(name);
    if (out.empty())
    {
        out = "_";
    }
    return codegenSanitizeIdentifier(language, out);
}

std::string jsonPropertyName(const llvm::StringRef propertyName)
{
    return toLowerCamelCase(propertyName);
}

std::string jsonModelType(const llvm::StringRef className)
{
    return toCapitalCamelCase(className);
}

}  // namespace llvmmeta
