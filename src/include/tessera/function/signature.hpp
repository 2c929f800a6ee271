//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/function/signature.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/enums/function_feature.hpp"
#include "tessera/common/enums/function_kind.hpp"
#include "tessera/common/types.hpp"
#include "tessera/function/function_name.hpp"

namespace tessera {

//! A Signature describes one resolved overload of a function: its name, kind, declared argument types, declared
//! return type and features. ANY acts as a wildcard in the argument and return types.
class Signature {
public:
	Signature(FunctionName name, FunctionKind kind, vector<LogicalType> argument_types, LogicalType return_type,
	          FunctionFeatures features = FunctionFeatures(), bool variadic = false);

	static Signature Scalar(FunctionName name, vector<LogicalType> argument_types, LogicalType return_type,
	                        FunctionFeatures features = {FunctionFeature::DETERMINISTIC});
	static Signature Aggregate(FunctionName name, vector<LogicalType> argument_types, LogicalType return_type,
	                           FunctionFeatures features = {FunctionFeature::DETERMINISTIC});

public:
	const FunctionName &GetName() const {
		return name;
	}
	FunctionKind GetKind() const {
		return kind;
	}
	const vector<LogicalType> &ArgumentTypes() const {
		return argument_types;
	}
	const LogicalType &ReturnType() const {
		return return_type;
	}
	const FunctionFeatures &Features() const {
		return features;
	}
	//! The last declared argument type may be repeated any number of times (including zero)
	bool IsVariadic() const {
		return variadic;
	}

	bool HasFeature(FunctionFeature feature) const {
		return features.Contains(feature);
	}
	bool IsDeterministic() const {
		return features.Contains(FunctionFeature::DETERMINISTIC);
	}

	//! The declared type of the argument at the given position (the variadic type repeats)
	const LogicalType &ArgumentType(idx_t index) const;
	//! Whether a call with the given number of arguments can bind to this signature
	bool AcceptsArgumentCount(idx_t count) const;

	//! e.g. "add(integer, integer):integer"
	string ToString() const;

	bool operator==(const Signature &rhs) const;
	bool operator!=(const Signature &rhs) const {
		return !(*this == rhs);
	}
	hash_t Hash() const;

	void Serialize(Serializer &serializer) const;
	static unique_ptr<Signature> Deserialize(Deserializer &source);

private:
	FunctionName name;
	FunctionKind kind;
	vector<LogicalType> argument_types;
	LogicalType return_type;
	FunctionFeatures features;
	bool variadic;
};

} // namespace tessera
