#include "tessera/symbol/symbol_util.hpp"

#include "tessera/main/config.hpp"
#include "tessera/symbol/function.hpp"
#include "tessera/symbol/symbol_iterator.hpp"
#include "tessera/symbol/symbol_visitor.hpp"

namespace tessera {

namespace {

class DeterminismVisitor : public SymbolVisitor {
public:
	bool deterministic = true;

	void VisitFunction(const Function &function) override {
		if (!function.IsDeterministic()) {
			deterministic = false;
			return;
		}
		SymbolVisitor::VisitFunction(function);
	}
};

class FunctionNameCollector : public SymbolVisitor {
public:
	vector<string> names;

	void VisitFunction(const Function &function) override {
		names.push_back(function.Name());
		SymbolVisitor::VisitFunction(function);
	}
};

} // namespace

bool SymbolUtil::IsDeterministic(const Symbol &symbol) {
	DeterminismVisitor visitor;
	visitor.VisitSymbol(symbol);
	return visitor.deterministic;
}

bool SymbolUtil::ContainsParameter(const Symbol &symbol) {
	bool contains_parameter = false;
	SymbolIterator::VisitTree(symbol, [&](const Symbol &node) {
		if (node.type == SymbolType::PARAMETER) {
			contains_parameter = true;
		}
	});
	return contains_parameter;
}

vector<string> SymbolUtil::CollectFunctionNames(const Symbol &symbol) {
	FunctionNameCollector collector;
	collector.VisitSymbol(symbol);
	return std::move(collector.names);
}

string SymbolUtil::ToExplainString(const Symbol &symbol, const NodeConfig &config) {
	return symbol.ToString(config.options.render_style);
}

} // namespace tessera
