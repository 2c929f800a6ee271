//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/function/builtin_functions.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/function/signature.hpp"

namespace tessera {

class FunctionRegistry;

//! Names of the functions the analyzer and the renderer know about, and the registration of their overloads
class BuiltinFunctions {
public:
	//! Registers all builtin overloads
	static void RegisterAll(FunctionRegistry &registry);

	static void RegisterOperators(FunctionRegistry &registry);
	static void RegisterArithmetic(FunctionRegistry &registry);
	static void RegisterArrayFunctions(FunctionRegistry &registry);
	static void RegisterExtractFunctions(FunctionRegistry &registry);
	static void RegisterSystemFunctions(FunctionRegistry &registry);
	static void RegisterAggregates(FunctionRegistry &registry);
	static void RegisterScalarFunctions(FunctionRegistry &registry);

	//! The signature of one of the cast functions (_cast, cast, try_cast)
	static Signature CastSignature(const string &name);

public:
	static constexpr const char *MATCH = "match";
	static constexpr const char *SUBSCRIPT = "subscript";
	static constexpr const char *SUBSCRIPT_OBJ = "subscript_obj";
	static constexpr const char *SUBSCRIPT_RECORD = "_subscript_record";
	static constexpr const char *CURRENT_USER = "current_user";
	static constexpr const char *SESSION_USER = "session_user";
	static constexpr const char *CURRENT_SCHEMAS = "current_schemas";
	static constexpr const char *CURRENT_SCHEMA = "current_schema";
	static constexpr const char *IS_NULL = "op_isnull";
	static constexpr const char *NOT = "op_not";
	static constexpr const char *COUNT = "count";
	static constexpr const char *CURRENT_TIMESTAMP = "current_timestamp";
	static constexpr const char *ARRAY = "_array";

	static constexpr const char *IMPLICIT_CAST = "_cast";
	static constexpr const char *EXPLICIT_CAST = "cast";
	static constexpr const char *TRY_CAST = "try_cast";

	static constexpr const char *ANY_OPERATOR_PREFIX = "any_";
	static constexpr const char *OPERATOR_PREFIX = "op_";
	static constexpr const char *EXTRACT_PREFIX = "extract_";

	static constexpr const char *ADD = "add";
	static constexpr const char *SUBTRACT = "subtract";
	static constexpr const char *MULTIPLY = "multiply";
	static constexpr const char *DIVIDE = "divide";
	static constexpr const char *MOD = "mod";
	static constexpr const char *MODULUS = "modulus";
};

} // namespace tessera
