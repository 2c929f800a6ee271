#include "tessera/function/builtin_functions.hpp"

#include "tessera/common/exception.hpp"
#include "tessera/function/function_registry.hpp"

namespace tessera {

constexpr const char *BuiltinFunctions::MATCH;
constexpr const char *BuiltinFunctions::SUBSCRIPT;
constexpr const char *BuiltinFunctions::SUBSCRIPT_OBJ;
constexpr const char *BuiltinFunctions::SUBSCRIPT_RECORD;
constexpr const char *BuiltinFunctions::CURRENT_USER;
constexpr const char *BuiltinFunctions::SESSION_USER;
constexpr const char *BuiltinFunctions::CURRENT_SCHEMAS;
constexpr const char *BuiltinFunctions::CURRENT_SCHEMA;
constexpr const char *BuiltinFunctions::IS_NULL;
constexpr const char *BuiltinFunctions::NOT;
constexpr const char *BuiltinFunctions::COUNT;
constexpr const char *BuiltinFunctions::CURRENT_TIMESTAMP;
constexpr const char *BuiltinFunctions::ARRAY;
constexpr const char *BuiltinFunctions::IMPLICIT_CAST;
constexpr const char *BuiltinFunctions::EXPLICIT_CAST;
constexpr const char *BuiltinFunctions::TRY_CAST;
constexpr const char *BuiltinFunctions::ANY_OPERATOR_PREFIX;
constexpr const char *BuiltinFunctions::OPERATOR_PREFIX;
constexpr const char *BuiltinFunctions::EXTRACT_PREFIX;
constexpr const char *BuiltinFunctions::ADD;
constexpr const char *BuiltinFunctions::SUBTRACT;
constexpr const char *BuiltinFunctions::MULTIPLY;
constexpr const char *BuiltinFunctions::DIVIDE;
constexpr const char *BuiltinFunctions::MOD;
constexpr const char *BuiltinFunctions::MODULUS;

static vector<LogicalType> NumericTypes() {
	return {LogicalType::SMALLINT, LogicalType::INTEGER, LogicalType::BIGINT, LogicalType::REAL,
	        LogicalType::DOUBLE};
}

//===--------------------------------------------------------------------===//
// Return type binding
//===--------------------------------------------------------------------===//
//! An array of the first argument with a known type
static LogicalType BindArrayReturnType(const Signature &signature, const vector<LogicalType> &argument_types) {
	for (auto &type : argument_types) {
		if (type.id() != LogicalTypeId::UNDEFINED) {
			return LogicalType::ARRAY(type);
		}
	}
	return LogicalType::ARRAY(LogicalType::UNDEFINED);
}

static LogicalType BindSubscriptReturnType(const Signature &signature, const vector<LogicalType> &argument_types) {
	D_ASSERT(!argument_types.empty());
	auto &base = argument_types[0];
	if (!base.IsArray()) {
		return LogicalType::UNDEFINED;
	}
	return base.ChildType();
}

static LogicalType BindFirstArgumentType(const Signature &signature, const vector<LogicalType> &argument_types) {
	D_ASSERT(!argument_types.empty());
	return argument_types[0];
}

static LogicalType BindSumReturnType(const Signature &signature, const vector<LogicalType> &argument_types) {
	D_ASSERT(argument_types.size() == 1);
	auto &input = argument_types[0];
	if (input.IsIntegral() || input.id() == LogicalTypeId::UNDEFINED) {
		return LogicalType::BIGINT;
	}
	if (input.IsNumeric()) {
		return LogicalType::DOUBLE;
	}
	throw ResolutionException("sum is not defined for arguments of type %s", input.ToString());
}

//===--------------------------------------------------------------------===//
// Registration
//===--------------------------------------------------------------------===//
void BuiltinFunctions::RegisterAll(FunctionRegistry &registry) {
	RegisterOperators(registry);
	RegisterArithmetic(registry);
	RegisterArrayFunctions(registry);
	RegisterExtractFunctions(registry);
	RegisterSystemFunctions(registry);
	RegisterAggregates(registry);
	RegisterScalarFunctions(registry);
}

void BuiltinFunctions::RegisterOperators(FunctionRegistry &registry) {
	FunctionFeatures comparison_features {FunctionFeature::DETERMINISTIC, FunctionFeature::COMPARISON_REPLACEMENT};
	for (auto op : {"=", "<>", "<", ">", "<=", ">="}) {
		registry.Register(Signature::Scalar(FunctionName(string(OPERATOR_PREFIX) + op),
		                                    {LogicalType::ANY, LogicalType::ANY}, LogicalType::BOOLEAN,
		                                    comparison_features));
	}
	for (auto op : {"and", "or"}) {
		registry.Register(Signature::Scalar(FunctionName(string(OPERATOR_PREFIX) + op),
		                                    {LogicalType::BOOLEAN, LogicalType::BOOLEAN}, LogicalType::BOOLEAN));
	}
	registry.Register(Signature::Scalar(FunctionName(IS_NULL), {LogicalType::ANY}, LogicalType::BOOLEAN,
	                                    {FunctionFeature::DETERMINISTIC, FunctionFeature::NON_NULLABLE}));
	registry.Register(Signature::Scalar(FunctionName(NOT), {LogicalType::BOOLEAN}, LogicalType::BOOLEAN));
	registry.Register(Signature::Scalar(FunctionName(string(OPERATOR_PREFIX) + "like"),
	                                    {LogicalType::TEXT, LogicalType::TEXT}, LogicalType::BOOLEAN));

	for (auto op : {"=", "<>", "like", "not_like"}) {
		registry.Register(Signature::Scalar(FunctionName(string(ANY_OPERATOR_PREFIX) + op),
		                                    {LogicalType::ANY, LogicalType::ARRAY(LogicalType::ANY)},
		                                    LogicalType::BOOLEAN));
	}
}

void BuiltinFunctions::RegisterArithmetic(FunctionRegistry &registry) {
	for (auto name : {ADD, SUBTRACT, MULTIPLY, DIVIDE, MOD, MODULUS}) {
		for (auto &type : NumericTypes()) {
			registry.Register(Signature::Scalar(FunctionName(name), {type, type}, type));
		}
	}
}

void BuiltinFunctions::RegisterArrayFunctions(FunctionRegistry &registry) {
	registry.Register(Signature(FunctionName(ARRAY), FunctionKind::SCALAR, {LogicalType::ANY},
	                            LogicalType::ARRAY(LogicalType::ANY), {FunctionFeature::DETERMINISTIC}, true),
	                  BindArrayReturnType);
	registry.Register(Signature::Scalar(FunctionName(SUBSCRIPT),
	                                    {LogicalType::ARRAY(LogicalType::ANY), LogicalType::INTEGER},
	                                    LogicalType::ANY),
	                  BindSubscriptReturnType);
	registry.Register(Signature::Scalar(FunctionName(SUBSCRIPT_OBJ), {LogicalType::OBJECT, LogicalType::TEXT},
	                                    LogicalType::UNDEFINED));
	registry.Register(Signature::Scalar(FunctionName(SUBSCRIPT_RECORD), {LogicalType::OBJECT, LogicalType::TEXT},
	                                    LogicalType::UNDEFINED));
	registry.Register(Signature::Scalar(FunctionName("array_cat"),
	                                    {LogicalType::ARRAY(LogicalType::ANY), LogicalType::ARRAY(LogicalType::ANY)},
	                                    LogicalType::ARRAY(LogicalType::ANY)),
	                  BindFirstArgumentType);
}

void BuiltinFunctions::RegisterExtractFunctions(FunctionRegistry &registry) {
	for (auto &type : {LogicalType(LogicalType::TIMESTAMP), LogicalType(LogicalType::TIMESTAMP_TZ)}) {
		for (auto field : {"year", "month", "day", "hour", "minute", "second"}) {
			registry.Register(Signature::Scalar(FunctionName(string(EXTRACT_PREFIX) + field), {type},
			                                    LogicalType::INTEGER));
		}
		registry.Register(Signature::Scalar(FunctionName(string(EXTRACT_PREFIX) + "epoch"), {type},
		                                    LogicalType::DOUBLE));
	}
}

void BuiltinFunctions::RegisterSystemFunctions(FunctionRegistry &registry) {
	// these depend on the session and the clock
	FunctionFeatures features;
	registry.Register(Signature::Scalar(FunctionName(CURRENT_USER), {}, LogicalType::TEXT, features));
	registry.Register(Signature::Scalar(FunctionName(SESSION_USER), {}, LogicalType::TEXT, features));
	registry.Register(Signature::Scalar(FunctionName(DEFAULT_FUNCTION_SCHEMA, CURRENT_SCHEMA), {}, LogicalType::TEXT,
	                                    features));
	registry.Register(Signature::Scalar(FunctionName(DEFAULT_FUNCTION_SCHEMA, CURRENT_SCHEMAS),
	                                    {LogicalType::BOOLEAN}, LogicalType::ARRAY(LogicalType::TEXT), features));
	registry.Register(Signature::Scalar(FunctionName(CURRENT_TIMESTAMP), {}, LogicalType::TIMESTAMP_TZ, features));
	registry.Register(
	    Signature::Scalar(FunctionName(CURRENT_TIMESTAMP), {LogicalType::INTEGER}, LogicalType::TIMESTAMP_TZ, features));
}

void BuiltinFunctions::RegisterAggregates(FunctionRegistry &registry) {
	registry.Register(Signature::Aggregate(FunctionName(COUNT), {}, LogicalType::BIGINT,
	                                       {FunctionFeature::DETERMINISTIC, FunctionFeature::NON_NULLABLE}));
	registry.Register(Signature::Aggregate(FunctionName(COUNT), {LogicalType::ANY}, LogicalType::BIGINT,
	                                       {FunctionFeature::DETERMINISTIC, FunctionFeature::NON_NULLABLE}));
	registry.Register(Signature::Aggregate(FunctionName("sum"), {LogicalType::ANY}, LogicalType::ANY),
	                  BindSumReturnType);
}

void BuiltinFunctions::RegisterScalarFunctions(FunctionRegistry &registry) {
	for (auto &type : NumericTypes()) {
		registry.Register(Signature::Scalar(FunctionName("abs"), {type}, type));
	}
	registry.Register(Signature(FunctionName("concat"), FunctionKind::SCALAR, {LogicalType::TEXT}, LogicalType::TEXT,
	                            {FunctionFeature::DETERMINISTIC}, true));
	registry.Register(Signature::Scalar(FunctionName(MATCH),
	                                    {LogicalType::OBJECT, LogicalType::TEXT, LogicalType::TEXT, LogicalType::OBJECT},
	                                    LogicalType::BOOLEAN));
	registry.Register(Signature::Scalar(FunctionName("random"), {}, LogicalType::DOUBLE, FunctionFeatures()));
}

Signature BuiltinFunctions::CastSignature(const string &name) {
	if (name != IMPLICIT_CAST && name != EXPLICIT_CAST && name != TRY_CAST) {
		throw InternalException("%s is not a cast function", name);
	}
	return Signature::Scalar(FunctionName(name), {LogicalType::ANY, LogicalType::ANY}, LogicalType::ANY);
}

} // namespace tessera
