//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/function/function_info.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/enums/function_feature.hpp"
#include "tessera/common/enums/function_kind.hpp"
#include "tessera/common/types.hpp"
#include "tessera/function/function_name.hpp"

namespace tessera {

class Signature;

//! Identifies a function overload by its name and the types of the arguments it was called with
class FunctionIdent {
public:
	FunctionIdent(FunctionName fqn_name, vector<LogicalType> argument_types);

	const string &Name() const {
		return fqn_name.Name();
	}
	const FunctionName &FqnName() const {
		return fqn_name;
	}
	const vector<LogicalType> &ArgumentTypes() const {
		return argument_types;
	}

	bool operator==(const FunctionIdent &rhs) const;
	bool operator!=(const FunctionIdent &rhs) const {
		return !(*this == rhs);
	}
	hash_t Hash() const;
	string ToString() const;

	void Serialize(Serializer &serializer) const;
	static FunctionIdent Deserialize(Deserializer &source);

private:
	FunctionName fqn_name;
	vector<LogicalType> argument_types;
};

//! The descriptor of a function call that is understood by every protocol version. Nodes that do not know about
//! signatures identify a function solely by this descriptor, so it is always transmitted.
class FunctionInfo {
public:
	FunctionInfo(FunctionIdent ident, LogicalType return_type, FunctionKind kind, FunctionFeatures features);

	//! Derives the descriptor of a call to the given signature with the actual argument and return types
	static FunctionInfo Of(const Signature &signature, const vector<LogicalType> &argument_types,
	                       const LogicalType &return_type);

	const FunctionIdent &Ident() const {
		return ident;
	}
	const LogicalType &ReturnType() const {
		return return_type;
	}
	FunctionKind Kind() const {
		return kind;
	}
	const FunctionFeatures &Features() const {
		return features;
	}
	bool HasFeature(FunctionFeature feature) const {
		return features.Contains(feature);
	}
	bool IsDeterministic() const {
		return features.Contains(FunctionFeature::DETERMINISTIC);
	}

	bool operator==(const FunctionInfo &rhs) const;
	bool operator!=(const FunctionInfo &rhs) const {
		return !(*this == rhs);
	}
	hash_t Hash() const;

	void Serialize(Serializer &serializer) const;
	static FunctionInfo Deserialize(Deserializer &source);

private:
	FunctionIdent ident;
	LogicalType return_type;
	FunctionKind kind;
	FunctionFeatures features;
};

} // namespace tessera
