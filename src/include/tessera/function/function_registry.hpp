//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/function/function_registry.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/optional_ptr.hpp"
#include "tessera/function/function_resolver.hpp"

#include <mutex>

namespace tessera {

class Function;
class Logger;
class Symbol;

//! Computes the return type of a call from its actual argument types, for overloads whose return type depends on
//! the arguments (e.g. the element type of an array)
typedef LogicalType (*bind_return_type_t)(const Signature &signature, const vector<LogicalType> &argument_types);

struct FunctionOverload {
	FunctionOverload(Signature signature, bind_return_type_t bind_return_type = nullptr)
	    : signature(std::move(signature)), bind_return_type(bind_return_type) {
	}

	Signature signature;
	bind_return_type_t bind_return_type;
};

//! The FunctionRegistry holds all overloads known to a node
class FunctionRegistry : public FunctionResolver {
public:
	explicit FunctionRegistry(optional_ptr<Logger> logger = nullptr);

	//! Registers an overload; a second overload with the same signature is rejected
	void Register(Signature signature, bind_return_type_t bind_return_type = nullptr);

	Signature Resolve(const FunctionName &name, const vector<LogicalType> &argument_types) override;

	//! The return type of a call to the resolved overload with the given argument types
	LogicalType BindReturnType(const Signature &signature, const vector<LogicalType> &argument_types);

	//! Resolves the callee, implicitly casts the arguments to the declared argument types and builds the call
	shared_ptr<Function> Bind(const FunctionName &name, vector<shared_ptr<Symbol>> arguments,
	                          shared_ptr<Symbol> filter = nullptr);

	//! The number of registered overloads
	idx_t OverloadCount();

private:
	const FunctionOverload &ResolveOverload(const FunctionName &name, const vector<LogicalType> &argument_types);
	const FunctionOverload &FindOverload(const Signature &signature);

private:
	std::mutex lock;
	optional_ptr<Logger> logger;
	//! name -> overloads, overloads of one name are kept in registration order
	unordered_map<string, vector<FunctionOverload>> functions;
};

} // namespace tessera
