//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the recursive-descent type-expression parser.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/Frontend/TypeExpr.h"

#include <cctype>
#include <cstddef>
#include <string>
#include <utility>

namespace llvmmeta
{
namespace
{

class TypeExprParser final
{
public:
    explicit TypeExprParser(llvm::StringRef text)
        : text_(text)
    {
    }

    llvm::Expected<TypeAnnotation> parse()
    {
        auto out = parseExpr();
        if (!out)
        {
            return out.takeError();
        }
        skipBlanks();
        if (pos_ != text_.size())
        {
            return fail("unexpected trailing text");
        }
        return out;
    }

private:
    llvm::Expected<TypeAnnotation> parseExpr()
    {
        skipBlanks();
        const std::string name = parseIdentifier();
        if (name.empty())
        {
            return fail("expected a type name");
        }
        skipBlanks();

        if (name == "List" || name == "Optional")
        {
            if (!consume('['))
            {
                return fail("expected '[' after " + name);
            }
            auto inner = parseExpr();
            if (!inner)
            {
                return inner.takeError();
            }
            skipBlanks();
            if (!consume(']'))
            {
                return fail("expected ']' to close " + name);
            }
            if (name == "List")
            {
                return makeListAnnotation(std::move(*inner));
            }
            return makeOptionalAnnotation(std::move(*inner));
        }

        if (const auto primitive = parsePrimitiveType(name))
        {
            return makePrimitiveAnnotation(*primitive);
        }
        return makeOurTypeAnnotation(name);
    }

    std::string parseIdentifier()
    {
        const std::size_t begin = pos_;
        while (pos_ < text_.size())
        {
            const auto c = static_cast<unsigned char>(text_[pos_]);
            if (!(std::isalnum(c) || c == '_'))
            {
                break;
            }
            if (pos_ == begin && std::isdigit(c))
            {
                break;
            }
            ++pos_;
        }
        return text_.slice(begin, pos_).str();
    }

    void skipBlanks()
    {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])))
        {
            ++pos_;
        }
    }

    bool consume(const char expected)
    {
        if (pos_ < text_.size() && text_[pos_] == expected)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    llvm::Error fail(const std::string& message) const
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "invalid type expression '%s' at offset %zu: %s",
                                       text_.str().c_str(),
                                       pos_,
                                       message.c_str());
    }

    llvm::StringRef text_;
    std::size_t     pos_{0};
};

}  // namespace

llvm::Expected<TypeAnnotation> parseTypeExpression(const llvm::StringRef text)
{
    TypeExprParser parser(text);
    return parser.parse();
}

}  // namespace llvmmeta
