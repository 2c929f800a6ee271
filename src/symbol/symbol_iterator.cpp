#include "tessera/symbol/symbol_iterator.hpp"

#include "tessera/symbol/function.hpp"

namespace tessera {

void SymbolIterator::EnumerateChildren(const Symbol &symbol,
                                       const std::function<void(const Symbol &child)> &callback) {
	switch (symbol.type) {
	case SymbolType::FUNCTION: {
		auto &function = symbol.Cast<Function>();
		for (auto &argument : function.Arguments()) {
			callback(*argument);
		}
		auto filter = function.Filter();
		if (filter) {
			callback(*filter);
		}
		break;
	}
	case SymbolType::LITERAL:
	case SymbolType::REFERENCE:
	case SymbolType::PARAMETER:
		// these symbols have no children
		break;
	default:
		throw InternalException("Unimplemented symbol type %s in SymbolIterator::EnumerateChildren",
		                        SymbolTypeToString(symbol.type));
	}
}

void SymbolIterator::VisitTree(const Symbol &symbol, const std::function<void(const Symbol &node)> &callback) {
	callback(symbol);
	EnumerateChildren(symbol, [&](const Symbol &child) { VisitTree(child, callback); });
}

} // namespace tessera
