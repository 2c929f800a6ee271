//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/enums/function_syntax.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

//! The rendering shape of a function call, derived from the function name. The order of the entries is the order
//! in which names are matched.
enum class FunctionSyntax : uint8_t {
	MATCH_PREDICATE,
	SUBSCRIPT,
	SUBSCRIPT_RECORD,
	CURRENT_USER,
	SESSION_USER,
	CURRENT_SCHEMAS,
	CURRENT_SCHEMA,
	IS_NULL,
	NOT,
	COUNT,
	CURRENT_TIMESTAMP,
	ANY_OPERATOR,
	CAST,
	OPERATOR,
	EXTRACT,
	ARITHMETIC,
	GENERIC
};

string FunctionSyntaxToString(FunctionSyntax syntax);

} // namespace tessera
