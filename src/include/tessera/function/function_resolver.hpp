//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/function/function_resolver.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/function/signature.hpp"

namespace tessera {

//! Resolves a function name and the argument types of a call to a concrete overload
class FunctionResolver {
public:
	virtual ~FunctionResolver() {
	}

	//! Returns the signature of the overload that matches best, throws a ResolutionException if none matches
	virtual Signature Resolve(const FunctionName &name, const vector<LogicalType> &argument_types) = 0;
};

} // namespace tessera
