#include "catch.hpp"
#include "symbol_helper.hpp"
#include "tessera/symbol/symbol_iterator.hpp"
#include "tessera/symbol/symbol_visitor.hpp"

using namespace tessera;

namespace {

class ReferenceCollector : public SymbolVisitor {
public:
	vector<string> columns;

	void VisitReference(const Reference &reference) override {
		columns.push_back(reference.Column().Name());
	}
};

} // namespace

static shared_ptr<Function> FilteredSum() {
	auto predicate = CreateCall("op_>", {ColumnRef("y", LogicalType::INTEGER), IntegerLiteral(0)},
	                            LogicalType::BOOLEAN);
	auto product = CreateCall("multiply", {ColumnRef("x", LogicalType::INTEGER), IntegerLiteral(2)},
	                          LogicalType::INTEGER);
	return CreateCall("sum", {product}, LogicalType::BIGINT, predicate, FunctionKind::AGGREGATE);
}

TEST_CASE("Test visiting symbol trees", "[symbol]") {
	auto sum = FilteredSum();

	ReferenceCollector collector;
	collector.VisitSymbol(*sum);
	// arguments are visited before the filter
	REQUIRE(collector.columns == vector<string> {"x", "y"});

	REQUIRE(SymbolUtil::CollectFunctionNames(*sum) == vector<string> {"sum", "multiply", "op_>"});
}

TEST_CASE("Test iterating symbol trees", "[symbol]") {
	auto sum = FilteredSum();

	vector<SymbolType> children;
	SymbolIterator::EnumerateChildren(*sum, [&](const Symbol &child) { children.push_back(child.type); });
	REQUIRE(children == vector<SymbolType> {SymbolType::FUNCTION, SymbolType::FUNCTION});

	idx_t leaf_count = 0;
	SymbolIterator::EnumerateChildren(*IntegerLiteral(1), [&](const Symbol &child) { leaf_count++; });
	REQUIRE(leaf_count == 0);

	vector<string> nodes;
	SymbolIterator::VisitTree(*sum, [&](const Symbol &node) { nodes.push_back(node.ToString(RenderStyle::UNQUALIFIED)); });
	REQUIRE(nodes == vector<string> {"sum((x * 2)) FILTER (WHERE (y > 0))", "(x * 2)", "x", "2", "(y > 0)", "y", "0"});
}

TEST_CASE("Test determinism of symbol trees", "[symbol]") {
	auto sum = FilteredSum();
	REQUIRE(SymbolUtil::IsDeterministic(*sum));
	REQUIRE(SymbolUtil::IsDeterministic(*IntegerLiteral(1)));

	Function random(Signature::Scalar(FunctionName("random"), {}, LogicalType::DOUBLE, FunctionFeatures()), {},
	                LogicalType::DOUBLE);
	REQUIRE(!random.IsDeterministic());
	REQUIRE(!SymbolUtil::IsDeterministic(random));

	auto random_ptr = make_shared_ptr<Function>(
	    Signature::Scalar(FunctionName("random"), {}, LogicalType::DOUBLE, FunctionFeatures()),
	    vector<shared_ptr<Symbol>>(), LogicalType::DOUBLE);
	auto nested = CreateCall("add", {random_ptr, IntegerLiteral(1)}, LogicalType::DOUBLE);
	REQUIRE(!SymbolUtil::IsDeterministic(*nested));
}

TEST_CASE("Test parameters in symbol trees", "[symbol]") {
	REQUIRE(!SymbolUtil::ContainsParameter(*FilteredSum()));

	auto parameter = make_shared_ptr<ParameterSymbol>(1, LogicalType::UNDEFINED);
	REQUIRE(parameter->ToString(RenderStyle::UNQUALIFIED) == "$2");
	auto predicate = CreateCall("op_=", {ColumnRef("x", LogicalType::INTEGER), parameter}, LogicalType::BOOLEAN);
	auto count = CreateCall("count", {}, LogicalType::BIGINT, predicate, FunctionKind::AGGREGATE);
	REQUIRE(SymbolUtil::ContainsParameter(*count));

	// casting a parameter types it
	auto typed = parameter->CastTo(LogicalType::BIGINT);
	REQUIRE(typed->type == SymbolType::PARAMETER);
	REQUIRE(typed->ValueType() == LogicalType::BIGINT);
	REQUIRE(typed->Cast<ParameterSymbol>().Index() == 1);
	REQUIRE(!typed->Equals(*parameter));
}

TEST_CASE("Test leaf symbols", "[symbol]") {
	REQUIRE(IntegerLiteral(1)->Equals(*IntegerLiteral(1)));
	REQUIRE(!IntegerLiteral(1)->Equals(*IntegerLiteral(2)));
	REQUIRE(!IntegerLiteral(1)->Equals(*Literal::Create(Value::BIGINT(1))));
	REQUIRE(IntegerLiteral(1)->Hash() == IntegerLiteral(1)->Hash());
	REQUIRE(TextLiteral("it's")->ToString(RenderStyle::UNQUALIFIED) == "'it''s'");
	REQUIRE(Literal::Null(LogicalType::INTEGER)->ToString(RenderStyle::UNQUALIFIED) == "NULL");

	REQUIRE(ColumnRef("x", LogicalType::INTEGER)->Equals(*ColumnRef("x", LogicalType::INTEGER)));
	REQUIRE(!ColumnRef("x", LogicalType::INTEGER)->Equals(*ColumnRef("x", LogicalType::BIGINT)));
	auto nested = ColumnRef("o", LogicalType::TEXT, {"a", "b"});
	REQUIRE(nested->ToString(RenderStyle::UNQUALIFIED) == "o['a']['b']");
	REQUIRE(nested->ToString(RenderStyle::QUALIFIED) == "doc.t1.o['a']['b']");
	REQUIRE(ColumnRef("Select", LogicalType::TEXT)->ToString(RenderStyle::UNQUALIFIED) == "\"Select\"");

	// a literal is converted instead of wrapped into a cast
	auto cast = TextLiteral("42")->CastTo(LogicalType::INTEGER);
	REQUIRE(cast->Equals(*IntegerLiteral(42)));
	REQUIRE_THROWS_AS(TextLiteral("abc")->CastTo(LogicalType::INTEGER), ConversionException);
	REQUIRE(TextLiteral("abc")->CastTo(LogicalType::INTEGER, {CastMode::TRY})->Equals(*Literal::Null(LogicalType::INTEGER)));

	// a column is wrapped into a cast
	auto column_cast = ColumnRef("x", LogicalType::INTEGER)->CastTo(LogicalType::TEXT, {CastMode::EXPLICIT});
	REQUIRE(column_cast->ToString(RenderStyle::UNQUALIFIED) == "cast(x AS text)");
}
