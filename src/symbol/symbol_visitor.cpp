#include "tessera/symbol/symbol_visitor.hpp"

#include "tessera/symbol/function.hpp"
#include "tessera/symbol/literal.hpp"
#include "tessera/symbol/parameter_symbol.hpp"
#include "tessera/symbol/reference.hpp"

namespace tessera {

void SymbolVisitor::VisitSymbol(const Symbol &symbol) {
	symbol.Accept(*this);
}

void SymbolVisitor::VisitLiteral(const Literal &literal) {
}

void SymbolVisitor::VisitReference(const Reference &reference) {
}

void SymbolVisitor::VisitParameter(const ParameterSymbol &parameter) {
}

void SymbolVisitor::VisitFunction(const Function &function) {
	for (auto &argument : function.Arguments()) {
		VisitSymbol(*argument);
	}
	auto filter = function.Filter();
	if (filter) {
		VisitSymbol(*filter);
	}
}

} // namespace tessera
