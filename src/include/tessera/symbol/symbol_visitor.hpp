//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/symbol_visitor.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

class Symbol;
class Literal;
class Reference;
class ParameterSymbol;
class Function;

//! The SymbolVisitor is the double dispatch target of Symbol::Accept. Visitors keep their state in members; the
//! default implementation of VisitFunction visits the arguments and the filter of the call.
class SymbolVisitor {
public:
	virtual ~SymbolVisitor() {
	}

	void VisitSymbol(const Symbol &symbol);

	virtual void VisitLiteral(const Literal &literal);
	virtual void VisitReference(const Reference &reference);
	virtual void VisitParameter(const ParameterSymbol &parameter);
	virtual void VisitFunction(const Function &function);
};

} // namespace tessera
