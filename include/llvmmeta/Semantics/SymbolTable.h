//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Name-keyed lookup index over named types and synthesized interfaces.
///
//===----------------------------------------------------------------------===//
#ifndef LLVMMETA_SEMANTICS_SYMBOL_TABLE_H
#define LLVMMETA_SEMANTICS_SYMBOL_TABLE_H

#include <string>
#include <unordered_map>

#include "llvmmeta/Semantics/Model.h"

#include "llvm/ADT/StringRef.h"

namespace llvmmeta
{

/// @brief Lookup index for named types of one model.
///
/// @details
/// The index stores pointers into the indexed model, which must outlive it.
/// When a name is declared twice, the first declaration wins.
class SymbolTable final
{
public:
    /// @brief Builds an index for a model.
    /// @param[in] model Model to index.
    explicit SymbolTable(const MetaModel& model);

    /// @brief Finds a named type by name.
    /// @param[in] name Type name.
    /// @return Matching type, or `nullptr` when missing.
    [[nodiscard]] const NamedType* find(llvm::StringRef name) const;

    /// @brief Finds a class by name.
    /// @param[in] name Type name.
    /// @return Matching class, or `nullptr` when missing or not a class.
    [[nodiscard]] const ClassDefinition* findClass(llvm::StringRef name) const;

    /// @brief Finds the interface synthesized for a class.
    /// @param[in] name Class name.
    /// @return Matching interface, or `nullptr` when the class has none.
    [[nodiscard]] const Interface* findInterface(llvm::StringRef name) const;

private:
    std::unordered_map<std::string, const NamedType*> types_;
    std::unordered_map<std::string, const Interface*> interfaces_;
};

}  // namespace llvmmeta

#endif  // LLVMMETA_SEMANTICS_SYMBOL_TABLE_H
