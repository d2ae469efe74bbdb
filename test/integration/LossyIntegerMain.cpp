//===----------------------------------------------------------------------===//
//
// Part of the llvm-metajson project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Serializes an integer that an IEEE double cannot hold. The runtime must
/// terminate with a fatal error, so CTest expects this driver to fail.
///
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <iostream>

#include "llvmmeta_runtime.hpp"

#include "llvm/Support/FormatVariadic.h"

int main()
{
    const std::int64_t lossy = 9007199254740993;
    const auto         value = llvmmeta::runtime::serialize_int64(lossy);
    std::cout << "serialized without a contract violation: " << llvm::formatv("{0}", value).str() << "\n";
    return 0;
}
