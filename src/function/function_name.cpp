#include "tessera/function/function_name.hpp"

#include "tessera/common/serializer.hpp"
#include "tessera/common/types/hash.hpp"

namespace tessera {

FunctionName::FunctionName(string name) : name(std::move(name)) {
}

FunctionName::FunctionName(string schema, string name) : schema(std::move(schema)), name(std::move(name)) {
}

string FunctionName::ToString(RenderStyle style) const {
	if (style == RenderStyle::QUALIFIED && HasSchema()) {
		return schema + "." + name;
	}
	return name;
}

hash_t FunctionName::Hash() const {
	return CombineHash(tessera::Hash(schema), tessera::Hash(name));
}

void FunctionName::Serialize(Serializer &serializer) const {
	serializer.Write<bool>(HasSchema());
	if (HasSchema()) {
		serializer.WriteString(schema);
	}
	serializer.WriteString(name);
}

FunctionName FunctionName::Deserialize(Deserializer &source) {
	string schema;
	if (source.ReadBool()) {
		schema = source.Read<string>();
	}
	auto name = source.Read<string>();
	return FunctionName(std::move(schema), std::move(name));
}

} // namespace tessera
