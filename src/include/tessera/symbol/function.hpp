//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/function.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/enums/function_syntax.hpp"
#include "tessera/common/optional_ptr.hpp"
#include "tessera/function/function_info.hpp"
#include "tessera/function/signature.hpp"
#include "tessera/symbol/symbol.hpp"

namespace tessera {

//! Function represents the application of a function or operator to a list of arguments.
//!
//! A call carries two descriptions of its callee: the Signature of the resolved overload, and the FunctionInfo
//! understood by nodes that predate signatures. The FunctionInfo is always present; the Signature is only present
//! if the call was built locally or received from a node that transmits signatures. All identity and capability
//! accessors prefer the Signature and fall back to the FunctionInfo.
class Function : public Symbol {
public:
	static constexpr const SymbolType TYPE = SymbolType::FUNCTION;

public:
	//! Builds a fresh call, the FunctionInfo is derived from the signature and the argument types
	Function(Signature signature, vector<shared_ptr<Symbol>> arguments, LogicalType return_type,
	         shared_ptr<Symbol> filter = nullptr);
	//! Builds a call from a FunctionInfo (e.g. received from an older node); the signature is optional
	Function(FunctionInfo info, unique_ptr<Signature> signature, vector<shared_ptr<Symbol>> arguments,
	         LogicalType return_type, shared_ptr<Symbol> filter);

public:
	//! The name of the callee
	const string &Name() const;
	bool HasFeature(FunctionFeature feature) const;
	bool IsDeterministic() const;
	//! The schema qualified name of the callee
	const FunctionName &FullyQualifiedName() const;
	FunctionKind Kind() const;

	const vector<shared_ptr<Symbol>> &Arguments() const {
		return arguments;
	}
	//! The FILTER (WHERE ...) clause of an aggregate call, if any
	optional_ptr<Symbol> Filter() const {
		return filter.get();
	}
	const shared_ptr<Symbol> &FilterPtr() const {
		return filter;
	}
	//! The resolved signature, absent if the call was received from a node that does not transmit signatures
	optional_ptr<const Signature> GetSignature() const {
		return signature.get();
	}
	const FunctionInfo &Info() const {
		return info;
	}
	//! The rendering shape, classified from the callee name
	FunctionSyntax Syntax() const {
		return syntax;
	}

public:
	const LogicalType &ValueType() const override {
		return return_type;
	}
	void Accept(SymbolVisitor &visitor) const override;
	//! Casts of the array constructor to an array type are pushed down into the elements
	shared_ptr<Symbol> CastTo(const LogicalType &target_type, CastModes modes = CastModes()) const override;
	string ToString(RenderStyle style) const override;

	//! Equality covers the arguments, the FunctionInfo and the filter; the signature does not take part
	bool Equals(const Symbol &other) const override;
	hash_t Hash() const override;

	static shared_ptr<Symbol> Deserialize(Deserializer &source);

	//! Classifies a callee name into its rendering shape
	static FunctionSyntax ClassifySyntax(const string &name);

protected:
	void SerializeProperties(Serializer &serializer) const override;

private:
	shared_ptr<Symbol> CastArrayElements(const LogicalType &target_type, CastModes modes) const;

private:
	FunctionInfo info;
	unique_ptr<Signature> signature;
	vector<shared_ptr<Symbol>> arguments;
	LogicalType return_type;
	shared_ptr<Symbol> filter;
	FunctionSyntax syntax;
};

} // namespace tessera
