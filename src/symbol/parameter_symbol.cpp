#include "tessera/symbol/parameter_symbol.hpp"

#include "tessera/common/serializer.hpp"
#include "tessera/common/types/hash.hpp"
#include "tessera/symbol/symbol_visitor.hpp"

namespace tessera {

constexpr const SymbolType ParameterSymbol::TYPE;

ParameterSymbol::ParameterSymbol(uint32_t index, LogicalType type)
    : Symbol(SymbolType::PARAMETER), index(index), type_(std::move(type)) {
}

void ParameterSymbol::Accept(SymbolVisitor &visitor) const {
	visitor.VisitParameter(*this);
}

shared_ptr<Symbol> ParameterSymbol::CastTo(const LogicalType &target_type, CastModes modes) const {
	if (ValueType() == target_type) {
		return Self();
	}
	return make_shared_ptr<ParameterSymbol>(index, target_type);
}

string ParameterSymbol::ToString(RenderStyle style) const {
	return "$" + std::to_string(index + 1);
}

bool ParameterSymbol::Equals(const Symbol &other) const {
	return Symbol::Equals(other) && index == other.Cast<ParameterSymbol>().index;
}

hash_t ParameterSymbol::Hash() const {
	return CombineHash(Symbol::Hash(), tessera::Hash<uint32_t>(index));
}

void ParameterSymbol::SerializeProperties(Serializer &serializer) const {
	serializer.Write<int32_t>(static_cast<int32_t>(index));
	type_.Serialize(serializer);
}

shared_ptr<Symbol> ParameterSymbol::Deserialize(Deserializer &source) {
	auto position = source.GetPosition();
	auto index = source.Read<int32_t>();
	if (index < 0) {
		throw SerializationException("Failed to deserialize: negative parameter index %d at position %d", index,
		                             position);
	}
	auto type = LogicalType::Deserialize(source);
	return make_shared_ptr<ParameterSymbol>(static_cast<uint32_t>(index), std::move(type));
}

} // namespace tessera
