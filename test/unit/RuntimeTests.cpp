//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "llvmmeta_runtime.hpp"
#include "llvm/Support/Base64.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"

namespace
{

namespace runtime = llvmmeta::runtime;

template <typename T>
bool expectError(const char* name, runtime::DeserializeResult<T> result, const std::string& path, const std::string& cause)
{
    if (result.ok())
    {
        std::cerr << name << ": expected an error\n";
        return false;
    }
    const auto& error = result.error();
    if (error.path() != path || error.cause() != cause)
    {
        std::cerr << name << ": got '" << error.path() << "' / '" << error.cause() << "'\n";
        return false;
    }
    return true;
}

std::string base64Failure(llvm::StringRef encoded)
{
    std::vector<char> scratch;
    return "Expected Base64-encoded bytes, but the decoding failed: " +
           llvm::toString(llvm::decodeBase64(encoded, scratch));
}

std::string integerFailure(const llvm::json::Value& number)
{
    return "Expected a 64-bit integer, but the conversion failed from " + llvm::formatv("{0}", number).str();
}

struct Animal
{
    virtual ~Animal() = default;
};

struct Cat final : Animal
{
};

}  // namespace

bool runRuntimeTests()
{
    {
        runtime::Error error("boom");
        error.prepend_name("odd key");
        error.prepend_index(3);
        error.prepend_name("items");
        error.prepend_name("o'k");
        if (error.path() != "$['o\\'k'].items[3]['odd key']" || error.cause() != "boom")
        {
            std::cerr << "JSON path rendering mismatch: " << error.path() << "\n";
            return false;
        }
        if (runtime::Error("root").path() != "$")
        {
            std::cerr << "root path rendering mismatch\n";
            return false;
        }
    }

    bool ok = true;
    ok      = expectError("bool", runtime::bool_from(llvm::json::Value(1)), "$", "Expected a boolean, but got number") && ok;
    ok      = expectError("int kind", runtime::int64_from(llvm::json::Value("1")), "$", "Expected a 64-bit integer, but got string") &&
         ok;
    ok = expectError("int fraction",
                     runtime::int64_from(llvm::json::Value(0.5)),
                     "$",
                     "Expected a 64-bit integer, but the conversion failed from 0.5") &&
         ok;
    ok = expectError("float", runtime::double_from(llvm::json::Value(nullptr)), "$", "Expected a 64-bit float, but got null") &&
         ok;
    ok = expectError("string", runtime::string_from(llvm::json::Array{}), "$", "Expected a string, but got array") && ok;
    ok = expectError("bytes length", runtime::bytes_from(llvm::json::Value("abc")), "$", base64Failure("abc")) && ok;
    ok = expectError("bytes alphabet", runtime::bytes_from(llvm::json::Value("A!==")), "$", base64Failure("A!==")) &&
         ok;
    ok = expectError("int at two to the 63",
                     runtime::int64_from(llvm::json::Value(9223372036854775808.0)),
                     "$",
                     integerFailure(llvm::json::Value(9223372036854775808.0))) &&
         ok;
    {
        const auto rounded = llvm::cantFail(llvm::json::parse("9.223372036854775807e18"));
        ok = expectError("int rounding onto two to the 63", runtime::int64_from(rounded), "$", integerFailure(rounded)) &&
             ok;
        const auto below = llvm::cantFail(llvm::json::parse("-9223372036854775809.0"));
        ok = expectError("int below the signed range", runtime::int64_from(below), "$", integerFailure(below)) && ok;
        const auto far = llvm::json::Value(-1.0e19);
        ok = expectError("int far below the signed range", runtime::int64_from(far), "$", integerFailure(far)) && ok;
    }
    {
        auto largest  = runtime::int64_from(llvm::cantFail(llvm::json::parse("9223372036854775807")));
        auto smallest = runtime::int64_from(llvm::cantFail(llvm::json::parse("-9223372036854775808")));
        auto nearTop  = runtime::int64_from(llvm::cantFail(llvm::json::parse("9223372036854775000")));
        if (!largest.ok() || largest.value() != INT64_MAX || !smallest.ok() || smallest.value() != INT64_MIN ||
            !nearTop.ok() || nearTop.value() != 9223372036854775000LL)
        {
            std::cerr << "exact integers at the signed range bounds must be accepted\n";
            ok = false;
        }
    }

    {
        auto number = runtime::double_from(llvm::json::Value(7));
        auto bytes  = runtime::bytes_from(llvm::json::Value("aGk="));
        if (!number.ok() || number.value() != 7.0 || !bytes.ok() || bytes.value() != std::vector<std::uint8_t>{'h', 'i'})
        {
            std::cerr << "primitive coercion success mismatch\n";
            return false;
        }
    }

    {
        const auto parseInt = [](const llvm::json::Value& item) { return runtime::int64_from(item); };
        auto       parsed   = runtime::list_from<std::int64_t>(llvm::json::Array{1, 2, 3}, parseInt);
        if (!parsed.ok() || parsed.value() != std::vector<std::int64_t>{1, 2, 3})
        {
            std::cerr << "list coercion success mismatch\n";
            return false;
        }
        ok = expectError("null item",
                         runtime::list_from<std::int64_t>(llvm::json::Array{1, nullptr}, parseInt),
                         "$[1]",
                         "Expected a non-null item, but got a null") &&
             ok;
        ok = expectError("bad item",
                         runtime::list_from<std::int64_t>(llvm::json::Array{1, 2, true}, parseInt),
                         "$[2]",
                         "Expected a 64-bit integer, but got boolean") &&
             ok;
        ok = expectError("not a list",
                         runtime::list_from<std::int64_t>(llvm::json::Object{}, parseInt),
                         "$",
                         "Expected a JSON array, but got object") &&
             ok;
    }

    {
        const llvm::json::Object object{{"b", 1}, {"a", 2}, {"C", 3}};
        const auto               members = runtime::sorted_members(object);
        if (members.size() != 3 || members[0].first != "C" || members[1].first != "a" || members[2].first != "b")
        {
            std::cerr << "sorted members must use ordinal key order\n";
            return false;
        }
    }

    {
        runtime::DeserializeResult<std::shared_ptr<Cat>> cat = std::make_shared<Cat>();
        auto                                             animal = runtime::upcast<Animal>(std::move(cat));
        if (!animal.ok() || dynamic_cast<Cat*>(animal.value().get()) == nullptr)
        {
            std::cerr << "upcast lost the concrete value\n";
            return false;
        }
    }

    {
        runtime::Error error("Unexpected property: z");
        error.prepend_name("point");
        auto expected = runtime::into_expected(runtime::DeserializeResult<int>(std::move(error)));
        if (expected)
        {
            std::cerr << "into_expected dropped the error\n";
            return false;
        }
        std::string path;
        std::string cause;
        llvm::handleAllErrors(expected.takeError(), [&](const runtime::JsonizationError& failure) {
            path  = failure.path();
            cause = failure.cause();
        });
        if (path != "$.point" || cause != "Unexpected property: z")
        {
            std::cerr << "jsonization error payload mismatch\n";
            return false;
        }

        auto value = runtime::into_expected(runtime::DeserializeResult<int>(5));
        if (!value || *value != 5)
        {
            if (!value)
            {
                llvm::consumeError(value.takeError());
            }
            std::cerr << "into_expected lost the value\n";
            return false;
        }
    }

    if (runtime::serialize_bytes({0xFB, 0xFF}) != llvm::json::Value("+/8=") ||
        runtime::serialize_int64(-9007199254740992) != llvm::json::Value(-9007199254740992LL))
    {
        std::cerr << "serialization helper mismatch\n";
        return false;
    }

    return ok;
}
