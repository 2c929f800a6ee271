//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/symbol_iterator.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/symbol/symbol.hpp"

#include <functional>

namespace tessera {

class SymbolIterator {
public:
	//! Calls the callback for the direct children of the symbol (the arguments of a call, followed by its filter)
	static void EnumerateChildren(const Symbol &symbol, const std::function<void(const Symbol &child)> &callback);
	//! Calls the callback for the symbol and all its descendants in pre-order
	static void VisitTree(const Symbol &symbol, const std::function<void(const Symbol &node)> &callback);
};

} // namespace tessera
