//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/enums/function_kind.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

//! The ordinal doubles as the wire tag, do not renumber
enum class FunctionKind : uint8_t { SCALAR = 0, AGGREGATE = 1, TABLE = 2, WINDOW = 3 };

string FunctionKindToString(FunctionKind kind);
//! Reads a function kind from its wire tag, throws a SerializationException for unknown tags
FunctionKind FunctionKindFromTag(uint8_t tag, idx_t position);

} // namespace tessera
