//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/symbol_util.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/symbol/symbol.hpp"

namespace tessera {

class NodeConfig;

//! Helpers the planner uses to inspect symbol trees
class SymbolUtil {
public:
	//! True if every call in the tree is deterministic
	static bool IsDeterministic(const Symbol &symbol);
	//! True if the tree contains a parameter placeholder
	static bool ContainsParameter(const Symbol &symbol);
	//! The names of all callees in the tree, in pre-order
	static vector<string> CollectFunctionNames(const Symbol &symbol);
	//! Renders the symbol in the explain style configured for the node
	static string ToExplainString(const Symbol &symbol, const NodeConfig &config);
};

} // namespace tessera
