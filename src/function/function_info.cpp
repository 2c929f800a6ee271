#include "tessera/function/function_info.hpp"

#include "tessera/common/serializer.hpp"
#include "tessera/common/string_util.hpp"
#include "tessera/common/types/hash.hpp"
#include "tessera/function/signature.hpp"

namespace tessera {

FunctionIdent::FunctionIdent(FunctionName fqn_name_p, vector<LogicalType> argument_types_p)
    : fqn_name(std::move(fqn_name_p)), argument_types(std::move(argument_types_p)) {
}

bool FunctionIdent::operator==(const FunctionIdent &rhs) const {
	return fqn_name == rhs.fqn_name && argument_types == rhs.argument_types;
}

hash_t FunctionIdent::Hash() const {
	hash_t result = fqn_name.Hash();
	for (auto &type : argument_types) {
		result = CombineHash(result, type.Hash());
	}
	return result;
}

string FunctionIdent::ToString() const {
	return fqn_name.ToString(RenderStyle::QUALIFIED) + "(" + StringUtil::ToString(argument_types, ", ") + ")";
}

void FunctionIdent::Serialize(Serializer &serializer) const {
	fqn_name.Serialize(serializer);
	LogicalType::SerializeList(serializer, argument_types);
}

FunctionIdent FunctionIdent::Deserialize(Deserializer &source) {
	auto fqn_name = FunctionName::Deserialize(source);
	auto argument_types = LogicalType::DeserializeList(source);
	return FunctionIdent(std::move(fqn_name), std::move(argument_types));
}

FunctionInfo::FunctionInfo(FunctionIdent ident_p, LogicalType return_type_p, FunctionKind kind,
                           FunctionFeatures features)
    : ident(std::move(ident_p)), return_type(std::move(return_type_p)), kind(kind), features(features) {
}

FunctionInfo FunctionInfo::Of(const Signature &signature, const vector<LogicalType> &argument_types,
                              const LogicalType &return_type) {
	return FunctionInfo(FunctionIdent(signature.GetName(), argument_types), return_type, signature.GetKind(),
	                    signature.Features());
}

bool FunctionInfo::operator==(const FunctionInfo &rhs) const {
	return ident == rhs.ident && return_type == rhs.return_type && kind == rhs.kind && features == rhs.features;
}

hash_t FunctionInfo::Hash() const {
	hash_t result = ident.Hash();
	result = CombineHash(result, return_type.Hash());
	result = CombineHash(result, tessera::Hash<uint8_t>(static_cast<uint8_t>(kind)));
	return CombineHash(result, tessera::Hash<uint8_t>(features.GetMask()));
}

void FunctionInfo::Serialize(Serializer &serializer) const {
	ident.Serialize(serializer);
	return_type.Serialize(serializer);
	serializer.Write<uint8_t>(static_cast<uint8_t>(kind));
	serializer.Write<uint8_t>(features.GetMask());
}

FunctionInfo FunctionInfo::Deserialize(Deserializer &source) {
	auto ident = FunctionIdent::Deserialize(source);
	auto return_type = LogicalType::Deserialize(source);
	auto kind_position = source.GetPosition();
	auto kind = FunctionKindFromTag(source.Read<uint8_t>(), kind_position);
	auto features_position = source.GetPosition();
	auto features = FunctionFeatures::FromMask(source.Read<uint8_t>(), features_position);
	return FunctionInfo(std::move(ident), std::move(return_type), kind, features);
}

} // namespace tessera
