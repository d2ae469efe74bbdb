//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Header-only runtime shared by generated C++ jsonization code.
///
/// Provides the error-path model, the two-case deserialization result, the
/// primitive coercions between `llvm::json::Value` and C++ values, and the
/// conversion of internal results into `llvm::Expected` at the facade.
///
//===----------------------------------------------------------------------===//

#ifndef LLVMMETA_CPP_RUNTIME_HPP
#define LLVMMETA_CPP_RUNTIME_HPP

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Base64.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace llvmmeta
{
namespace runtime
{

/// @brief Canonical cause texts raised by the runtime coercions.
namespace text
{
inline constexpr const char* kExpectedObjectPrefix          = "Expected a JSON object, but got ";
inline constexpr const char* kExpectedArrayPrefix           = "Expected a JSON array, but got ";
inline constexpr const char* kNullItem                      = "Expected a non-null item, but got a null";
inline constexpr const char* kExpectedBooleanPrefix         = "Expected a boolean, but got ";
inline constexpr const char* kExpectedIntegerPrefix         = "Expected a 64-bit integer, but got ";
inline constexpr const char* kIntegerConversionFailedPrefix = "Expected a 64-bit integer, but the conversion failed from ";
inline constexpr const char* kExpectedFloatPrefix           = "Expected a 64-bit float, but got ";
inline constexpr const char* kExpectedStringPrefix          = "Expected a string, but got ";
inline constexpr const char* kInvalidBase64Prefix           = "Expected Base64-encoded bytes, but the decoding failed: ";
inline constexpr const char* kIntegerNotLosslessPrefix      = "The number can not be losslessly represented in JSON: ";
}  // namespace text

/// @brief Path segment naming an object property.
struct NameSegment final
{
    /// @brief JSON key.
    std::string name;
};

/// @brief Path segment naming a list item.
struct IndexSegment final
{
    /// @brief Zero-based item index.
    std::size_t index{0};
};

/// @brief One step of an error path.
using PathSegment = std::variant<NameSegment, IndexSegment>;

/// @brief Renders segments root-first as a JSONPath, e.g. `$.items[2].name`.
/// @param[in] segments Path segments, outermost first.
/// @return Rendered path; `$` for an empty path.
inline std::string generate_json_path(const std::deque<PathSegment>& segments)
{
    std::string out = "$";
    for (const auto& segment : segments)
    {
        if (const auto* index = std::get_if<IndexSegment>(&segment))
        {
            out += "[" + std::to_string(index->index) + "]";
            continue;
        }
        const std::string& name = std::get<NameSegment>(segment).name;

        bool plain = !name.empty() && !std::isdigit(static_cast<unsigned char>(name.front()));
        for (const char c : name)
        {
            plain = plain && (std::isalnum(static_cast<unsigned char>(c)) || c == '_');
        }
        if (plain)
        {
            out += "." + name;
            continue;
        }
        out += "['";
        for (const char c : name)
        {
            if (c == '\'' || c == '\\')
            {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        out += "']";
    }
    return out;
}

/// @brief Deserialization failure: the cause plus the path to the failing node.
///
/// Created at the first failure with an empty path; every enclosing routine
/// prepends its own segment while the error travels outward.
class Error final
{
public:
    /// @brief Creates an error at the current node.
    /// @param[in] cause Human-readable cause.
    explicit Error(std::string cause)
        : cause_(std::move(cause))
    {
    }

    /// @brief Prepends a property segment.
    /// @param[in] name JSON key.
    void prepend_name(std::string name)
    {
        segments_.push_front(NameSegment{std::move(name)});
    }

    /// @brief Prepends a list-item segment.
    /// @param[in] index Item index.
    void prepend_index(const std::size_t index)
    {
        segments_.push_front(IndexSegment{index});
    }

    /// @brief Returns the segments, outermost first.
    /// @return Segment list.
    const std::deque<PathSegment>& segments() const
    {
        return segments_;
    }

    /// @brief Returns the cause.
    /// @return Cause text.
    const std::string& cause() const
    {
        return cause_;
    }

    /// @brief Renders the path.
    /// @return JSONPath text.
    std::string path() const
    {
        return generate_json_path(segments_);
    }

private:
    std::deque<PathSegment> segments_;
    std::string             cause_;
};

/// @brief Either a deserialized value or an @ref Error, never both.
template <typename T>
class DeserializeResult final
{
public:
    /// @brief Wraps a value.
    /// @param[in] value Deserialized value.
    DeserializeResult(T value)  // NOLINT(google-explicit-constructor)
        : state_(std::in_place_index<0>, std::move(value))
    {
    }

    /// @brief Wraps an error.
    /// @param[in] error Deserialization failure.
    DeserializeResult(Error error)  // NOLINT(google-explicit-constructor)
        : state_(std::in_place_index<1>, std::move(error))
    {
    }

    /// @brief Indicates success.
    /// @return True when a value is held.
    [[nodiscard]] bool ok() const
    {
        return state_.index() == 0;
    }

    /// @brief Returns the value; only valid when @ref ok.
    /// @return Held value.
    T& value()
    {
        return std::get<0>(state_);
    }

    /// @brief Returns the error; only valid when not @ref ok.
    /// @return Held error.
    Error& error()
    {
        return std::get<1>(state_);
    }

    /// @brief Moves the value out; only valid when @ref ok.
    /// @return Held value.
    T take_value()
    {
        return std::move(std::get<0>(state_));
    }

    /// @brief Moves the error out; only valid when not @ref ok.
    /// @return Held error.
    Error take_error()
    {
        return std::move(std::get<1>(state_));
    }

private:
    std::variant<T, Error> state_;
};

/// @brief Public error of the generated facade, carrying the rendered path and the cause.
class JsonizationError final : public llvm::ErrorInfo<JsonizationError>
{
public:
    /// @brief LLVM RTTI anchor.
    static char ID;

    /// @brief Creates the error.
    /// @param[in] path Rendered JSONPath of the failing node.
    /// @param[in] cause Cause text.
    JsonizationError(std::string path, std::string cause)
        : path_(std::move(path))
        , cause_(std::move(cause))
    {
    }

    /// @brief Returns the rendered JSONPath.
    /// @return Path text.
    const std::string& path() const
    {
        return path_;
    }

    /// @brief Returns the cause.
    /// @return Cause text.
    const std::string& cause() const
    {
        return cause_;
    }

    void log(llvm::raw_ostream& os) const override
    {
        os << path_ << ": " << cause_;
    }

    std::error_code convertToErrorCode() const override
    {
        return llvm::inconvertibleErrorCode();
    }

private:
    std::string path_;
    std::string cause_;
};

inline char JsonizationError::ID = 0;

/// @brief Converts an internal result into the facade convention.
/// @param[in] result Internal result.
/// @return The value, or a @ref JsonizationError.
template <typename T>
llvm::Expected<T> into_expected(DeserializeResult<T> result)
{
    if (result.ok())
    {
        return result.take_value();
    }
    const Error error = result.take_error();
    return llvm::make_error<JsonizationError>(error.path(), error.cause());
}

/// @brief Returns the JSON kind name of a node (`null`, `boolean`, ...).
/// @param[in] node JSON node.
/// @return Kind name.
inline const char* kind_name(const llvm::json::Value& node)
{
    switch (node.kind())
    {
    case llvm::json::Value::Null:
        return "null";
    case llvm::json::Value::Boolean:
        return "boolean";
    case llvm::json::Value::Number:
        return "number";
    case llvm::json::Value::String:
        return "string";
    case llvm::json::Value::Array:
        return "array";
    case llvm::json::Value::Object:
        return "object";
    }
    return "value";
}

/// @brief Indicates whether a node is JSON null.
/// @param[in] node JSON node.
/// @return True for null.
inline bool is_null(const llvm::json::Value& node)
{
    return node.kind() == llvm::json::Value::Null;
}

/// @brief Returns the members of an object ordered by key.
/// @param[in] object JSON object.
/// @return Key/value pairs in ascending key order.
inline std::vector<std::pair<llvm::StringRef, const llvm::json::Value*>> sorted_members(const llvm::json::Object& object)
{
    std::vector<std::pair<llvm::StringRef, const llvm::json::Value*>> out;
    out.reserve(object.size());
    for (const auto& member : object)
    {
        out.emplace_back(llvm::StringRef(member.first), &member.second);
    }
    std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
    return out;
}

/// @brief Parses a boolean node.
/// @param[in] node JSON node.
/// @return Value or error.
inline DeserializeResult<bool> bool_from(const llvm::json::Value& node)
{
    if (const auto value = node.getAsBoolean())
    {
        return *value;
    }
    return Error(text::kExpectedBooleanPrefix + std::string(kind_name(node)));
}

/// @brief Parses a 64-bit integer node; non-integral and out-of-range numbers fail.
///
/// Numbers held as doubles must lie strictly between -2^63 and 2^63, so a
/// double that rounded onto a bound is rejected rather than wrapped.
///
/// @param[in] node JSON node.
/// @return Value or error.
inline DeserializeResult<std::int64_t> int64_from(const llvm::json::Value& node)
{
    if (node.kind() != llvm::json::Value::Number)
    {
        return Error(text::kExpectedIntegerPrefix + std::string(kind_name(node)));
    }
    std::string              rendered;
    llvm::raw_string_ostream os(rendered);
    os << node;
    os.flush();

    const double number = *node.getAsNumber();
    if (number >= 9223372036854775808.0 || number <= -9223372036854775808.0)
    {
        // llvm::json prints doubles of this magnitude in exponent form and
        // exact integers as plain digits.
        if (rendered.find_first_of(".eE") == std::string::npos)
        {
            if (const auto exact = node.getAsInteger())
            {
                return static_cast<std::int64_t>(*exact);
            }
        }
        return Error(text::kIntegerConversionFailedPrefix + rendered);
    }
    if (const auto value = node.getAsInteger())
    {
        return static_cast<std::int64_t>(*value);
    }
    return Error(text::kIntegerConversionFailedPrefix + rendered);
}

/// @brief Parses a floating-point node; integers are widened.
/// @param[in] node JSON node.
/// @return Value or error.
inline DeserializeResult<double> double_from(const llvm::json::Value& node)
{
    if (const auto value = node.getAsNumber())
    {
        return *value;
    }
    return Error(text::kExpectedFloatPrefix + std::string(kind_name(node)));
}

/// @brief Parses a string node.
/// @param[in] node JSON node.
/// @return Value or error.
inline DeserializeResult<std::string> string_from(const llvm::json::Value& node)
{
    if (const auto value = node.getAsString())
    {
        return value->str();
    }
    return Error(text::kExpectedStringPrefix + std::string(kind_name(node)));
}

/// @brief Parses a Base64 string node into bytes.
/// @param[in] node JSON node.
/// @return Value or error.
inline DeserializeResult<std::vector<std::uint8_t>> bytes_from(const llvm::json::Value& node)
{
    const auto encoded = node.getAsString();
    if (!encoded)
    {
        return Error(text::kExpectedStringPrefix + std::string(kind_name(node)));
    }
    std::vector<char> decoded;
    if (auto err = llvm::decodeBase64(*encoded, decoded))
    {
        return Error(text::kInvalidBase64Prefix + llvm::toString(std::move(err)));
    }
    return std::vector<std::uint8_t>(decoded.begin(), decoded.end());
}

/// @brief Parses a JSON array item by item.
///
/// A null item and every item failure are attributed to the item index.
///
/// @param[in] node JSON node.
/// @param[in] parse_item Callable mapping an item node to `DeserializeResult<T>`.
/// @return Items or error.
template <typename T, typename ItemParser>
DeserializeResult<std::vector<T>> list_from(const llvm::json::Value& node, ItemParser&& parse_item)
{
    const llvm::json::Array* array = node.getAsArray();
    if (array == nullptr)
    {
        return Error(text::kExpectedArrayPrefix + std::string(kind_name(node)));
    }
    std::vector<T> out;
    out.reserve(array->size());
    for (std::size_t i = 0; i < array->size(); ++i)
    {
        const llvm::json::Value& item = (*array)[i];
        if (is_null(item))
        {
            Error error(text::kNullItem);
            error.prepend_index(i);
            return error;
        }
        DeserializeResult<T> parsed = parse_item(item);
        if (!parsed.ok())
        {
            Error error = parsed.take_error();
            error.prepend_index(i);
            return error;
        }
        out.push_back(parsed.take_value());
    }
    return out;
}

/// @brief Widens a parsed concrete instance to one of its interfaces.
/// @param[in] result Result of a concrete-class routine.
/// @return The same instance seen through @p To, or the same error.
template <typename To, typename From>
DeserializeResult<std::shared_ptr<To>> upcast(DeserializeResult<std::shared_ptr<From>> result)
{
    if (!result.ok())
    {
        return result.take_error();
    }
    return std::shared_ptr<To>(result.take_value());
}

/// @brief Serializes a 64-bit integer.
///
/// Integers that an IEEE double cannot hold exactly violate the serialization
/// contract and terminate the process through `llvm::report_fatal_error`.
///
/// @param[in] value Integer to serialize.
/// @return JSON number.
inline llvm::json::Value serialize_int64(const std::int64_t value)
{
    const double widened = static_cast<double>(value);
    if (widened >= 9223372036854775808.0 || static_cast<std::int64_t>(widened) != value)
    {
        llvm::report_fatal_error(llvm::Twine(text::kIntegerNotLosslessPrefix) + llvm::Twine(value),
                                 /*gen_crash_diag=*/false);
    }
    return value;
}

/// @brief Serializes bytes as standard padded Base64 text.
/// @param[in] bytes Bytes to serialize.
/// @return JSON string.
inline llvm::json::Value serialize_bytes(const std::vector<std::uint8_t>& bytes)
{
    return llvm::encodeBase64(bytes);
}

}  // namespace runtime
}  // namespace llvmmeta

#endif  // LLVMMETA_CPP_RUNTIME_HPP
