#include "catch.hpp"
#include "symbol_helper.hpp"
#include "tessera/logging/log_storage.hpp"

using namespace tessera;

static bool MessageContains(const std::exception &ex, const string &needle) {
	return string(ex.what()).find(needle) != string::npos;
}

TEST_CASE("Test resolving builtin overloads", "[function]") {
	FunctionRegistry registry;
	BuiltinFunctions::RegisterAll(registry);
	REQUIRE(registry.OverloadCount() > 0);

	// exact match
	auto signature = registry.Resolve(FunctionName("abs"), {LogicalType::INTEGER});
	REQUIRE(signature.ArgumentTypes() == vector<LogicalType> {LogicalType::INTEGER});
	REQUIRE(signature.ReturnType() == LogicalType::INTEGER);

	// the narrowest widening wins
	signature = registry.Resolve(FunctionName("add"), {LogicalType::INTEGER, LogicalType::BIGINT});
	REQUIRE(signature.ToString() == "add(bigint, bigint):bigint");
	signature = registry.Resolve(FunctionName("add"), {LogicalType::SMALLINT, LogicalType::REAL});
	REQUIRE(signature.ToString() == "add(real, real):real");

	// wildcards
	signature = registry.Resolve(FunctionName("op_="), {LogicalType::TEXT, LogicalType::TEXT});
	REQUIRE(signature.HasFeature(FunctionFeature::COMPARISON_REPLACEMENT));
	signature = registry.Resolve(FunctionName("any_="),
	                             {LogicalType::INTEGER, LogicalType::ARRAY(LogicalType::INTEGER)});
	REQUIRE(signature.GetName().Name() == "any_=");

	// variadic overloads
	signature = registry.Resolve(FunctionName("concat"), {LogicalType::TEXT, LogicalType::TEXT, LogicalType::TEXT});
	REQUIRE(signature.IsVariadic());

	// untyped arguments match any parameter
	signature = registry.Resolve(FunctionName("op_not"), {LogicalType::UNDEFINED});
	REQUIRE(signature.ReturnType() == LogicalType::BOOLEAN);
}

TEST_CASE("Test resolution failures", "[function]") {
	FunctionRegistry registry;
	BuiltinFunctions::RegisterAll(registry);

	try {
		registry.Resolve(FunctionName("abss"), {LogicalType::INTEGER});
		FAIL("expected an exception");
	} catch (ResolutionException &ex) {
		REQUIRE(MessageContains(ex, "Unknown function: abss"));
		REQUIRE(MessageContains(ex, "\"abs\""));
	}

	try {
		registry.Resolve(FunctionName("op_like"), {LogicalType::INTEGER, LogicalType::BOOLEAN});
		FAIL("expected an exception");
	} catch (ResolutionException &ex) {
		REQUIRE(MessageContains(ex, "No function matches the given name and argument types"));
		REQUIRE(MessageContains(ex, "op_like(text, text):boolean"));
	}

	// too many arguments for a fixed arity overload
	REQUIRE_THROWS_AS(registry.Resolve(FunctionName("abs"), {LogicalType::INTEGER, LogicalType::INTEGER}),
	                  ResolutionException);
	// text does not widen to a number
	REQUIRE_THROWS_AS(registry.Resolve(FunctionName("abs"), {LogicalType::TEXT}), ResolutionException);
}

TEST_CASE("Test ambiguous overloads are rejected", "[function]") {
	FunctionRegistry registry;
	registry.Register(
	    Signature::Scalar(FunctionName("greatest"), {LogicalType::INTEGER, LogicalType::BIGINT}, LogicalType::BIGINT));
	registry.Register(
	    Signature::Scalar(FunctionName("greatest"), {LogicalType::BIGINT, LogicalType::INTEGER}, LogicalType::BIGINT));

	try {
		registry.Resolve(FunctionName("greatest"), {LogicalType::INTEGER, LogicalType::INTEGER});
		FAIL("expected an exception");
	} catch (ResolutionException &ex) {
		REQUIRE(MessageContains(ex, "Could not choose a best candidate function"));
		REQUIRE(MessageContains(ex, "greatest(integer, bigint):bigint"));
		REQUIRE(MessageContains(ex, "greatest(bigint, integer):bigint"));
	}
	// an exact match is not ambiguous
	auto signature = registry.Resolve(FunctionName("greatest"), {LogicalType::INTEGER, LogicalType::BIGINT});
	REQUIRE(signature.ArgumentTypes()[0] == LogicalType::INTEGER);

	// the same overload can not be registered twice
	REQUIRE_THROWS_AS(registry.Register(Signature::Scalar(FunctionName("greatest"),
	                                                      {LogicalType::INTEGER, LogicalType::BIGINT},
	                                                      LogicalType::BIGINT)),
	                  InternalException);
	REQUIRE(registry.OverloadCount() == 2);
}

TEST_CASE("Test schema qualified resolution", "[function]") {
	FunctionRegistry registry;
	BuiltinFunctions::RegisterAll(registry);

	auto signature = registry.Resolve(FunctionName(DEFAULT_FUNCTION_SCHEMA, "current_schema"), {});
	REQUIRE(signature.GetName().Schema() == DEFAULT_FUNCTION_SCHEMA);
	// unqualified names match overloads of every schema
	signature = registry.Resolve(FunctionName("current_schema"), {});
	REQUIRE(signature.GetName().Schema() == DEFAULT_FUNCTION_SCHEMA);

	REQUIRE_THROWS_AS(registry.Resolve(FunctionName("doc", "current_schema"), {}), ResolutionException);
}

TEST_CASE("Test return type binding", "[function]") {
	FunctionRegistry registry;
	BuiltinFunctions::RegisterAll(registry);

	auto sum = registry.Bind(FunctionName("sum"), {ColumnRef("x", LogicalType::INTEGER)});
	REQUIRE(sum->ValueType() == LogicalType::BIGINT);
	REQUIRE(sum->Kind() == FunctionKind::AGGREGATE);
	sum = registry.Bind(FunctionName("sum"), {ColumnRef("x", LogicalType::REAL)});
	REQUIRE(sum->ValueType() == LogicalType::DOUBLE);
	REQUIRE_THROWS_AS(registry.Bind(FunctionName("sum"), {ColumnRef("x", LogicalType::TEXT)}), ResolutionException);

	auto array = registry.Bind(FunctionName("_array"), {IntegerLiteral(1), IntegerLiteral(2)});
	REQUIRE(array->ValueType() == LogicalType::ARRAY(LogicalType::INTEGER));
	REQUIRE(array->ToString(RenderStyle::UNQUALIFIED) == "_array(1, 2)");

	auto subscript = registry.Bind(FunctionName("subscript"),
	                               {ColumnRef("tags", LogicalType::ARRAY(LogicalType::TEXT)), IntegerLiteral(1)});
	REQUIRE(subscript->ValueType() == LogicalType::TEXT);
	REQUIRE(subscript->ToString(RenderStyle::UNQUALIFIED) == "tags[1]");

	// overloads with a generic return type need a binding
	registry.Register(Signature::Scalar(FunctionName("identity"), {LogicalType::ANY}, LogicalType::ANY));
	REQUIRE_THROWS_AS(registry.Bind(FunctionName("identity"), {IntegerLiteral(1)}), InternalException);
}

TEST_CASE("Test binding inserts implicit casts", "[function]") {
	FunctionRegistry registry;
	BuiltinFunctions::RegisterAll(registry);

	auto call = registry.Bind(FunctionName("add"),
	                          {ColumnRef("x", LogicalType::INTEGER), Literal::Create(Value::BIGINT(1))});
	REQUIRE(call->ValueType() == LogicalType::BIGINT);
	REQUIRE(call->GetSignature());
	REQUIRE(call->GetSignature()->ToString() == "add(bigint, bigint):bigint");

	auto &cast = call->Arguments()[0]->Cast<Function>();
	REQUIRE(cast.Name() == "_cast");
	REQUIRE(cast.ValueType() == LogicalType::BIGINT);
	REQUIRE(call->ToString(RenderStyle::UNQUALIFIED) == "(_cast(x, 'bigint') + 1)");

	// the legacy descriptor records the argument types after casting
	REQUIRE(call->Info().Ident().ArgumentTypes() ==
	        vector<LogicalType> {LogicalType::BIGINT, LogicalType::BIGINT});

	// literals are folded instead of wrapped
	call = registry.Bind(FunctionName("add"), {IntegerLiteral(1), Literal::Create(Value::BIGINT(2))});
	REQUIRE(call->Arguments()[0]->type == SymbolType::LITERAL);
	REQUIRE(call->Arguments()[0]->ValueType() == LogicalType::BIGINT);

	// wildcard parameters keep the argument as-is
	call = registry.Bind(FunctionName("op_="), {ColumnRef("x", LogicalType::INTEGER), TextLiteral("1")});
	REQUIRE(call->Arguments()[0]->type == SymbolType::REFERENCE);
	REQUIRE(call->Arguments()[1]->ValueType() == LogicalType::TEXT);
}

TEST_CASE("Test binding a FILTER clause", "[function]") {
	FunctionRegistry registry;
	BuiltinFunctions::RegisterAll(registry);

	auto predicate = registry.Bind(FunctionName("op_>"), {ColumnRef("x", LogicalType::INTEGER), IntegerLiteral(0)});
	auto count = registry.Bind(FunctionName("count"), {}, predicate);
	REQUIRE(count->Filter());
	REQUIRE(count->ToString(RenderStyle::UNQUALIFIED) == "count(*) FILTER (WHERE (x > 0))");
	REQUIRE(count->HasFeature(FunctionFeature::NON_NULLABLE));

	REQUIRE_THROWS_AS(registry.Bind(FunctionName("abs"), {ColumnRef("x", LogicalType::INTEGER)}, predicate),
	                  InvalidInputException);
}

TEST_CASE("Test resolution failures are logged", "[function][logging]") {
	NodeConfig config;
	config.SetOptionByName("enable_logging", Value::BOOLEAN(true));
	config.SetOptionByName("logging_level", Value("debug"));

	FunctionRegistry registry(&config.GetLogger());
	BuiltinFunctions::RegisterAll(registry);
	REQUIRE_THROWS(registry.Resolve(FunctionName("abs"), {LogicalType::TEXT}));

	auto storage = config.GetLogManager().GetLogStorage();
	auto entries = dynamic_cast<InMemoryLogStorage &>(*storage).GetEntries("resolution");
	// registrations are only logged at TRACE level
	REQUIRE(entries.size() == 1);
	REQUIRE(entries[0].level == LogLevel::LOG_DEBUG);
	REQUIRE(entries[0].message == "No overload matches abs(text)");
}
