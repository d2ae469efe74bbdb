//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the named-type lookup index.
///
//===----------------------------------------------------------------------===//

#include "llvmmeta/Semantics/SymbolTable.h"

namespace llvmmeta
{

SymbolTable::SymbolTable(const MetaModel& model)
{
    for (const auto& type : model.types)
    {
        types_.emplace(namedTypeName(type), &type);
    }
    for (const auto& iface : model.interfaces)
    {
        interfaces_.emplace(iface.name, &iface);
    }
}

const NamedType* SymbolTable::find(const llvm::StringRef name) const
{
    const auto it = types_.find(name.str());
    if (it == types_.end())
    {
        return nullptr;
    }
    return it->second;
}

const ClassDefinition* SymbolTable::findClass(const llvm::StringRef name) const
{
    const auto* type = find(name);
    if (type == nullptr)
    {
        return nullptr;
    }
    return asClassDefinition(*type);
}

const Interface* SymbolTable::findInterface(const llvm::StringRef name) const
{
    const auto it = interfaces_.find(name.str());
    if (it == interfaces_.end())
    {
        return nullptr;
    }
    return it->second;
}

}  // namespace llvmmeta
