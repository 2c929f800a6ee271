//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/enums/symbol_type.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

//===--------------------------------------------------------------------===//
// Symbol Types
//===--------------------------------------------------------------------===//
//! The one-byte tag that precedes every symbol on the wire
enum class SymbolType : uint8_t { INVALID = 0, LITERAL = 1, REFERENCE = 2, PARAMETER = 3, FUNCTION = 4 };

string SymbolTypeToString(SymbolType type);

} // namespace tessera
