#include "catch.hpp"
#include "symbol_helper.hpp"

using namespace tessera;

static string Print(const Symbol &symbol) {
	return symbol.ToString(RenderStyle::UNQUALIFIED);
}

static shared_ptr<Symbol> X() {
	return ColumnRef("x", LogicalType::INTEGER);
}

static shared_ptr<Symbol> GreaterThanZero() {
	return CreateCall("op_>", {X(), IntegerLiteral(0)}, LogicalType::BOOLEAN);
}

TEST_CASE("Test operators", "[printer]") {
	REQUIRE(Print(*CreateCall("op_+", {IntegerLiteral(1), IntegerLiteral(2)}, LogicalType::INTEGER)) == "(1 + 2)");
	REQUIRE(Print(*GreaterThanZero()) == "(x > 0)");
	REQUIRE(Print(*CreateCall("op_and",
	                          {ColumnRef("a", LogicalType::BOOLEAN), ColumnRef("b", LogicalType::BOOLEAN)},
	                          LogicalType::BOOLEAN)) == "(a AND b)");
	REQUIRE(Print(*CreateCall("op_like", {ColumnRef("name", LogicalType::TEXT), TextLiteral("a%")},
	                          LogicalType::BOOLEAN)) == "(name LIKE 'a%')");
	REQUIRE(Print(*CreateCall("op_isnull", {X()}, LogicalType::BOOLEAN)) == "(x IS NULL)");
	REQUIRE(Print(*CreateCall("op_not", {ColumnRef("b", LogicalType::BOOLEAN)}, LogicalType::BOOLEAN)) ==
	        "(NOT b)");
}

TEST_CASE("Test operators require two arguments", "[printer]") {
	REQUIRE_THROWS_AS(Print(*CreateCall("op_-", {IntegerLiteral(1)}, LogicalType::INTEGER)), InternalException);
	REQUIRE_THROWS_AS(Print(*CreateCall("subtract", {IntegerLiteral(1)}, LogicalType::INTEGER)), InternalException);
	REQUIRE_THROWS_AS(Print(*CreateCall("any_=", {X()}, LogicalType::BOOLEAN)), InternalException);
}

TEST_CASE("Test arithmetic functions", "[printer]") {
	REQUIRE(Print(*CreateCall("add", {X(), IntegerLiteral(1)}, LogicalType::INTEGER)) == "(x + 1)");
	REQUIRE(Print(*CreateCall("subtract", {X(), IntegerLiteral(1)}, LogicalType::INTEGER)) == "(x - 1)");
	REQUIRE(Print(*CreateCall("multiply", {X(), IntegerLiteral(2)}, LogicalType::INTEGER)) == "(x * 2)");
	REQUIRE(Print(*CreateCall("divide", {X(), IntegerLiteral(2)}, LogicalType::INTEGER)) == "(x / 2)");
	REQUIRE(Print(*CreateCall("mod", {X(), IntegerLiteral(2)}, LogicalType::INTEGER)) == "(x % 2)");
	REQUIRE(Print(*CreateCall("modulus", {X(), IntegerLiteral(2)}, LogicalType::INTEGER)) == "(x % 2)");

	auto product = CreateCall("multiply", {IntegerLiteral(1), IntegerLiteral(2)}, LogicalType::INTEGER);
	auto abs = CreateCall("abs", {X()}, LogicalType::INTEGER);
	REQUIRE(Print(*CreateCall("add", {abs, product}, LogicalType::INTEGER)) == "(abs(x) + (1 * 2))");
}

TEST_CASE("Test count", "[printer]") {
	auto count_star = CreateCall("count", {}, LogicalType::BIGINT, nullptr, FunctionKind::AGGREGATE);
	REQUIRE(Print(*count_star) == "count(*)");
	auto filtered = CreateCall("count", {}, LogicalType::BIGINT, GreaterThanZero(), FunctionKind::AGGREGATE);
	REQUIRE(Print(*filtered) == "count(*) FILTER (WHERE (x > 0))");

	auto count = CreateCall("count", {X()}, LogicalType::BIGINT, nullptr, FunctionKind::AGGREGATE);
	REQUIRE(Print(*count) == "count(x)");
	filtered = CreateCall("count", {X()}, LogicalType::BIGINT, GreaterThanZero(), FunctionKind::AGGREGATE);
	REQUIRE(Print(*filtered) == "count(x) FILTER (WHERE (x > 0))");
}

TEST_CASE("Test any operators", "[printer]") {
	auto arr = ColumnRef("arr", LogicalType::ARRAY(LogicalType::INTEGER));
	REQUIRE(Print(*CreateCall("any_=", {X(), arr}, LogicalType::BOOLEAN)) == "(x = ANY(arr))");
	REQUIRE(Print(*CreateCall("any_<>", {X(), arr}, LogicalType::BOOLEAN)) == "(x <> ANY(arr))");
	REQUIRE(Print(*CreateCall("any_not_like", {TextLiteral("a"), arr}, LogicalType::BOOLEAN)) ==
	        "('a' NOT LIKE ANY(arr))");
}

TEST_CASE("Test extract", "[printer]") {
	auto ts = ColumnRef("ts", LogicalType::TIMESTAMP_TZ);
	REQUIRE(Print(*CreateCall("extract_year", {ts}, LogicalType::INTEGER)) == "extract(year FROM ts)");
	REQUIRE(Print(*CreateCall("extract_epoch", {ts}, LogicalType::DOUBLE)) == "extract(epoch FROM ts)");
}

TEST_CASE("Test pseudo functions", "[printer]") {
	REQUIRE(Print(*CreateCall("current_user", {}, LogicalType::TEXT)) == "CURRENT_USER");
	REQUIRE(Print(*CreateCall("session_user", {}, LogicalType::TEXT)) == "SESSION_USER");
	// only the lower case names are keywords
	REQUIRE(Print(*CreateCall("CURRENT_USER", {}, LogicalType::TEXT)) == "CURRENT_USER()");

	REQUIRE(Print(*CreateCall("current_schema", {}, LogicalType::TEXT)) == "current_schema");
	REQUIRE(Print(*CreateCall("current_schemas", {Literal::Create(Value::BOOLEAN(true))},
	                          LogicalType::ARRAY(LogicalType::TEXT))) == "current_schemas");

	REQUIRE(Print(*CreateCall("current_timestamp", {}, LogicalType::TIMESTAMP_TZ)) == "CURRENT_TIMESTAMP");
	REQUIRE(Print(*CreateCall("current_timestamp", {IntegerLiteral(3)}, LogicalType::TIMESTAMP_TZ)) ==
	        "current_timestamp(3)");
}

TEST_CASE("Test cast functions", "[printer]") {
	auto bigint_null = Literal::Null(LogicalType::BIGINT);
	REQUIRE(Print(*CreateCall("cast", {X(), bigint_null}, LogicalType::BIGINT)) == "cast(x AS bigint)");
	REQUIRE(Print(*CreateCall("try_cast", {X(), bigint_null}, LogicalType::BIGINT)) == "try_cast(x AS bigint)");
	REQUIRE(Print(*CreateCall("_cast", {X(), TextLiteral("bigint")}, LogicalType::BIGINT)) == "_cast(x, 'bigint')");
	// cast names are matched case insensitively
	REQUIRE(Print(*CreateCall("CAST", {X(), bigint_null}, LogicalType::BIGINT)) == "CAST(x AS bigint)");
	REQUIRE(Print(*CreateCall("_Cast", {X(), TextLiteral("bigint")}, LogicalType::BIGINT)) == "_Cast(x, 'bigint')");
	REQUIRE(Print(*CreateCall("cast", {X(), Literal::Null(LogicalType::ARRAY(LogicalType::TEXT))},
	                          LogicalType::ARRAY(LogicalType::TEXT))) == "cast(x AS array(text))");
}

TEST_CASE("Test subscripts", "[printer]") {
	auto tags = ColumnRef("tags", LogicalType::ARRAY(LogicalType::TEXT));
	auto subscript = CreateCall("subscript", {tags, IntegerLiteral(1)}, LogicalType::TEXT);
	REQUIRE(Print(*subscript) == "tags[1]");
	REQUIRE(subscript->ToString(RenderStyle::QUALIFIED) == "doc.t1.tags[1]");

	// an array nested in an object column
	auto nested = ColumnRef("o", LogicalType::ARRAY(LogicalType::INTEGER), {"arr"});
	REQUIRE(Print(*CreateCall("subscript", {nested, IntegerLiteral(2)}, LogicalType::INTEGER)) == "o[2]['arr']");

	auto object = ColumnRef("o", LogicalType::OBJECT);
	REQUIRE(Print(*CreateCall("subscript_obj", {object, TextLiteral("a")}, LogicalType::UNDEFINED)) == "o['a']");
	// the base of a subscript does not need to be a column
	auto array = CreateCall("_array", {IntegerLiteral(1)}, LogicalType::ARRAY(LogicalType::INTEGER));
	REQUIRE(Print(*CreateCall("subscript", {array, IntegerLiteral(1)}, LogicalType::INTEGER)) == "_array(1)[1]");

	auto record = CreateCall("_subscript_record", {object, TextLiteral("a")}, LogicalType::UNDEFINED);
	REQUIRE(Print(*record) == "(o).'a'");
}

TEST_CASE("Test match predicates", "[printer]") {
	auto columns = Literal::Create(
	    Value::OBJECT({"name", "body"}, {Value(LogicalType::DOUBLE), Value::DOUBLE(2.5)}));
	auto options = Literal::Create(Value::OBJECT({"fuzziness", "operator"}, {Value::INTEGER(2), Value("and")}));
	auto match = CreateCall("match", {columns, TextLiteral("foo"), TextLiteral("best_fields"), options},
	                        LogicalType::BOOLEAN);
	REQUIRE(Print(*match) == "MATCH((name, body 2.5), 'foo') USING best_fields WITH (fuzziness = 2, operator = 'and')");

	auto no_options = Literal::Create(Value::OBJECT({}, {}));
	match = CreateCall("match", {columns, TextLiteral("foo"), TextLiteral("phrase"), no_options},
	                   LogicalType::BOOLEAN);
	REQUIRE(Print(*match) == "MATCH((name, body 2.5), 'foo') USING phrase");
}

TEST_CASE("Test generic calls", "[printer]") {
	REQUIRE(Print(*CreateCall("abs", {X()}, LogicalType::INTEGER)) == "abs(x)");
	REQUIRE(Print(*CreateCall("random", {}, LogicalType::DOUBLE)) == "random()");
	REQUIRE(Print(*CreateCall("concat", {TextLiteral("a"), TextLiteral("b"), TextLiteral("c")}, LogicalType::TEXT)) ==
	        "concat('a', 'b', 'c')");
	auto sum = CreateCall("sum", {X()}, LogicalType::BIGINT, GreaterThanZero(), FunctionKind::AGGREGATE);
	REQUIRE(Print(*sum) == "sum(x) FILTER (WHERE (x > 0))");

	Function qualified(Signature::Scalar(FunctionName(DEFAULT_FUNCTION_SCHEMA, "abs"), {LogicalType::INTEGER},
	                                     LogicalType::INTEGER),
	                   {X()}, LogicalType::INTEGER);
	REQUIRE(qualified.ToString(RenderStyle::UNQUALIFIED) == "abs(x)");
	REQUIRE(qualified.ToString(RenderStyle::QUALIFIED) == "pg_catalog.abs(doc.t1.x)");
}

TEST_CASE("Test rendering uses the legacy descriptor", "[printer]") {
	auto call = CreateCall("extract_year", {ColumnRef("ts", LogicalType::TIMESTAMP)}, LogicalType::INTEGER);
	Function legacy(call->Info(), nullptr, call->Arguments(), call->ValueType(), nullptr);
	REQUIRE(Print(legacy) == Print(*call));
	REQUIRE(legacy.Syntax() == FunctionSyntax::EXTRACT);
}

TEST_CASE("Test rendering is idempotent", "[printer]") {
	auto filtered = CreateCall("count", {}, LogicalType::BIGINT, GreaterThanZero(), FunctionKind::AGGREGATE);
	for (auto style : {RenderStyle::UNQUALIFIED, RenderStyle::QUALIFIED}) {
		auto first = filtered->ToString(style);
		REQUIRE(filtered->ToString(style) == first);
	}
}

TEST_CASE("Test syntax classification order", "[printer]") {
	REQUIRE(Function::ClassifySyntax("match") == FunctionSyntax::MATCH_PREDICATE);
	REQUIRE(Function::ClassifySyntax("subscript") == FunctionSyntax::SUBSCRIPT);
	REQUIRE(Function::ClassifySyntax("subscript_obj") == FunctionSyntax::SUBSCRIPT);
	REQUIRE(Function::ClassifySyntax("_subscript_record") == FunctionSyntax::SUBSCRIPT_RECORD);
	REQUIRE(Function::ClassifySyntax("current_user") == FunctionSyntax::CURRENT_USER);
	REQUIRE(Function::ClassifySyntax("session_user") == FunctionSyntax::SESSION_USER);
	REQUIRE(Function::ClassifySyntax("current_schemas") == FunctionSyntax::CURRENT_SCHEMAS);
	REQUIRE(Function::ClassifySyntax("current_schema") == FunctionSyntax::CURRENT_SCHEMA);
	// the named operators win over the operator prefix
	REQUIRE(Function::ClassifySyntax("op_isnull") == FunctionSyntax::IS_NULL);
	REQUIRE(Function::ClassifySyntax("op_not") == FunctionSyntax::NOT);
	REQUIRE(Function::ClassifySyntax("count") == FunctionSyntax::COUNT);
	REQUIRE(Function::ClassifySyntax("current_timestamp") == FunctionSyntax::CURRENT_TIMESTAMP);
	REQUIRE(Function::ClassifySyntax("any_like") == FunctionSyntax::ANY_OPERATOR);
	REQUIRE(Function::ClassifySyntax("Try_Cast") == FunctionSyntax::CAST);
	REQUIRE(Function::ClassifySyntax("op_=") == FunctionSyntax::OPERATOR);
	REQUIRE(Function::ClassifySyntax("extract_day") == FunctionSyntax::EXTRACT);
	REQUIRE(Function::ClassifySyntax("modulus") == FunctionSyntax::ARITHMETIC);
	REQUIRE(Function::ClassifySyntax("Add") == FunctionSyntax::GENERIC);
	REQUIRE(Function::ClassifySyntax("format") == FunctionSyntax::GENERIC);
}
