#include "tessera/common/enums/function_syntax.hpp"

#include "tessera/common/exception.hpp"

namespace tessera {

string FunctionSyntaxToString(FunctionSyntax syntax) {
	switch (syntax) {
	case FunctionSyntax::MATCH_PREDICATE:
		return "MATCH_PREDICATE";
	case FunctionSyntax::SUBSCRIPT:
		return "SUBSCRIPT";
	case FunctionSyntax::SUBSCRIPT_RECORD:
		return "SUBSCRIPT_RECORD";
	case FunctionSyntax::CURRENT_USER:
		return "CURRENT_USER";
	case FunctionSyntax::SESSION_USER:
		return "SESSION_USER";
	case FunctionSyntax::CURRENT_SCHEMAS:
		return "CURRENT_SCHEMAS";
	case FunctionSyntax::CURRENT_SCHEMA:
		return "CURRENT_SCHEMA";
	case FunctionSyntax::IS_NULL:
		return "IS_NULL";
	case FunctionSyntax::NOT:
		return "NOT";
	case FunctionSyntax::COUNT:
		return "COUNT";
	case FunctionSyntax::CURRENT_TIMESTAMP:
		return "CURRENT_TIMESTAMP";
	case FunctionSyntax::ANY_OPERATOR:
		return "ANY_OPERATOR";
	case FunctionSyntax::CAST:
		return "CAST";
	case FunctionSyntax::OPERATOR:
		return "OPERATOR";
	case FunctionSyntax::EXTRACT:
		return "EXTRACT";
	case FunctionSyntax::ARITHMETIC:
		return "ARITHMETIC";
	case FunctionSyntax::GENERIC:
		return "GENERIC";
	default:
		throw InternalException("Unrecognized function syntax %d", static_cast<uint8_t>(syntax));
	}
}

} // namespace tessera
