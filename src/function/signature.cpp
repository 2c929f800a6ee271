#include "tessera/function/signature.hpp"

#include "tessera/common/serializer.hpp"
#include "tessera/common/string_util.hpp"
#include "tessera/common/types/hash.hpp"

namespace tessera {

Signature::Signature(FunctionName name_p, FunctionKind kind, vector<LogicalType> argument_types_p,
                     LogicalType return_type_p, FunctionFeatures features, bool variadic)
    : name(std::move(name_p)), kind(kind), argument_types(std::move(argument_types_p)),
      return_type(std::move(return_type_p)), features(features), variadic(variadic) {
	if (variadic && argument_types.empty()) {
		throw InternalException("Variadic signature of \"%s\" requires at least one argument type", name.Name());
	}
}

Signature Signature::Scalar(FunctionName name, vector<LogicalType> argument_types, LogicalType return_type,
                            FunctionFeatures features) {
	return Signature(std::move(name), FunctionKind::SCALAR, std::move(argument_types), std::move(return_type),
	                 features);
}

Signature Signature::Aggregate(FunctionName name, vector<LogicalType> argument_types, LogicalType return_type,
                               FunctionFeatures features) {
	return Signature(std::move(name), FunctionKind::AGGREGATE, std::move(argument_types), std::move(return_type),
	                 features);
}

const LogicalType &Signature::ArgumentType(idx_t index) const {
	if (index < argument_types.size()) {
		return argument_types[index];
	}
	if (!variadic) {
		throw InternalException("Argument index %d out of range for signature %s", index, ToString());
	}
	return argument_types.back();
}

bool Signature::AcceptsArgumentCount(idx_t count) const {
	if (variadic) {
		return count + 1 >= argument_types.size();
	}
	return count == argument_types.size();
}

string Signature::ToString() const {
	auto arguments = StringUtil::ToString(argument_types, ", ");
	if (variadic) {
		arguments += "...";
	}
	return name.ToString(RenderStyle::QUALIFIED) + "(" + arguments + "):" + return_type.ToString();
}

bool Signature::operator==(const Signature &rhs) const {
	return name == rhs.name && kind == rhs.kind && argument_types == rhs.argument_types &&
	       return_type == rhs.return_type && features == rhs.features && variadic == rhs.variadic;
}

hash_t Signature::Hash() const {
	hash_t result = name.Hash();
	result = CombineHash(result, tessera::Hash<uint8_t>(static_cast<uint8_t>(kind)));
	for (auto &type : argument_types) {
		result = CombineHash(result, type.Hash());
	}
	result = CombineHash(result, return_type.Hash());
	result = CombineHash(result, tessera::Hash<uint8_t>(features.GetMask()));
	return CombineHash(result, tessera::Hash<bool>(variadic));
}

void Signature::Serialize(Serializer &serializer) const {
	name.Serialize(serializer);
	serializer.Write<uint8_t>(static_cast<uint8_t>(kind));
	LogicalType::SerializeList(serializer, argument_types);
	return_type.Serialize(serializer);
	serializer.Write<uint8_t>(features.GetMask());
	serializer.Write<bool>(variadic);
}

unique_ptr<Signature> Signature::Deserialize(Deserializer &source) {
	auto name = FunctionName::Deserialize(source);
	auto kind_position = source.GetPosition();
	auto kind = FunctionKindFromTag(source.Read<uint8_t>(), kind_position);
	auto argument_types = LogicalType::DeserializeList(source);
	auto return_type = LogicalType::Deserialize(source);
	auto features_position = source.GetPosition();
	auto features = FunctionFeatures::FromMask(source.Read<uint8_t>(), features_position);
	auto variadic = source.ReadBool();
	if (variadic && argument_types.empty()) {
		throw SerializationException("Failed to deserialize: variadic signature \"%s\" without argument types",
		                             name.Name());
	}
	return make_uniq<Signature>(std::move(name), kind, std::move(argument_types), std::move(return_type), features,
	                            variadic);
}

} // namespace tessera
