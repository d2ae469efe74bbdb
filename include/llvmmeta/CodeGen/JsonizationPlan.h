//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Backend-neutral codec plan: what every generated parse, serialize, and
/// dispatch routine must do, derived once from an analyzed model.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_CODEGEN_JSONIZATION_PLAN_H
#define LLVMMETA_CODEGEN_JSONIZATION_PLAN_H

#include "llvmmeta/CodeGen/CodecStrategy.h"
#include "llvmmeta/CodeGen/SpecificImplementations.h"
#include "llvmmeta/Semantics/Model.h"
#include "llvmmeta/Semantics/SymbolTable.h"
#include "llvmmeta/Support/Diagnostics.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace llvmmeta
{

/// @file
/// @brief Codec plan shared by the C++, C#, and Go backends.

/// @brief One constructor argument as seen by the parse routine.
struct ArgumentSlot final
{
    /// @brief Argument (and property) name in model spelling.
    std::string argumentName;

    /// @brief JSON key.
    std::string jsonName;

    /// @brief Codec of the property value; `optional` mirrors the property type.
    CodecStrategy strategy;

    /// @brief True when an absent key is a parse error.
    bool required{true};

    /// @brief Value substituted when an optional argument covers a non-optional property.
    std::optional<llvm::json::Value> defaultValue;

    /// @brief Index of the property in the class property list.
    std::size_t propertyIndex{0};
};

/// @brief One property as seen by the serialize routine.
struct PropertyEmission final
{
    /// @brief Property name in model spelling.
    std::string propertyName;

    /// @brief JSON key.
    std::string jsonName;

    /// @brief Codec of the property value.
    CodecStrategy strategy;
};

/// @brief Parse and serialize plan of a generated concrete class codec.
struct ClassCodecPlan final
{
    /// @brief Class name in model spelling.
    std::string className;

    /// @brief Discriminator value.
    std::string modelType;

    /// @brief True when the discriminator is written and tolerated on input.
    bool withModelType{false};

    /// @brief Constructor slots in call order.
    std::vector<ArgumentSlot> slots;

    /// @brief Properties in emission order.
    std::vector<PropertyEmission> properties;
};

/// @brief Plan of a concrete class whose codec comes from fragments.
struct SpecificClassPlan final
{
    /// @brief Class name in model spelling.
    std::string className;

    /// @brief Discriminator value.
    std::string modelType;

    /// @brief Fragment replacing the parse routine.
    std::string parseFragment;

    /// @brief Fragment replacing the serialize routine.
    std::string transformFragment;
};

/// @brief One discriminator branch of an interface dispatcher.
struct DispatchCase final
{
    /// @brief Discriminator value.
    std::string modelType;

    /// @brief Concrete class parsed for this value.
    std::string className;
};

/// @brief Discriminator dispatch over the implementers of an interface.
struct InterfaceDispatchPlan final
{
    /// @brief Name of the class owning the interface.
    std::string interfaceName;

    /// @brief Branches in implementer order.
    std::vector<DispatchCase> cases;
};

/// @brief One enumeration literal and its wire value.
struct EnumerationCase final
{
    /// @brief Literal name in model spelling.
    std::string literalName;

    /// @brief Wire string.
    std::string wireValue;
};

/// @brief Static literal table of an enumeration.
struct EnumerationPlan final
{
    /// @brief Enumeration name in model spelling.
    std::string enumerationName;

    /// @brief Literals in declaration order.
    std::vector<EnumerationCase> cases;
};

/// @brief One planned routine group.
using JsonizationEntry = std::variant<EnumerationPlan, InterfaceDispatchPlan, ClassCodecPlan, SpecificClassPlan>;

/// @brief Complete codec plan of one model.
struct JsonizationPlan final
{
    /// @brief Entries in schema order; an interface entry precedes the entry of its own class.
    std::vector<JsonizationEntry> entries;

    /// @brief Files the used fragments were read from, for depfiles.
    std::vector<std::string> fragmentSources;
};

/// @brief Builds the codec plan of an analyzed model.
///
/// @details
/// Implementation-specific classes take their routines from @p fragments under
/// `Jsonization/parse/<Class>.<ext>` and `Jsonization/transform/<Class>.<ext>`.
/// Every missing fragment is reported before the build fails. With an empty
/// @p fragmentExtension no fragments are looked up, which suits backends that
/// emit no code.
///
/// @param[in] model Analyzed model.
/// @param[in] symbols Index of @p model.
/// @param[in] fragments Fragment store.
/// @param[in] fragmentExtension Target-language file extension without dot.
/// @param[in,out] diagnostics Diagnostic sink.
/// @return Plan, or an error when any fragment is missing.
llvm::Expected<JsonizationPlan> buildJsonizationPlan(const MetaModel&               model,
                                                     const SymbolTable&             symbols,
                                                     const SpecificImplementations& fragments,
                                                     llvm::StringRef                fragmentExtension,
                                                     DiagnosticEngine&              diagnostics);

/// @brief Finds the class plan of a class.
/// @param[in] plan Codec plan.
/// @param[in] className Class name in model spelling.
/// @return Plan entry, or `nullptr`.
const ClassCodecPlan* findClassCodecPlan(const JsonizationPlan& plan, llvm::StringRef className);

}  // namespace llvmmeta

#endif  // LLVMMETA_CODEGEN_JSONIZATION_PLAN_H
