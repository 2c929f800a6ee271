#include "tessera/symbol/literal.hpp"

#include "tessera/common/serializer.hpp"
#include "tessera/common/types/hash.hpp"
#include "tessera/symbol/symbol_visitor.hpp"

namespace tessera {

constexpr const SymbolType Literal::TYPE;

Literal::Literal(Value value) : Symbol(SymbolType::LITERAL), value(std::move(value)) {
}

shared_ptr<Literal> Literal::Create(Value value) {
	return make_shared_ptr<Literal>(std::move(value));
}

shared_ptr<Literal> Literal::Null(const LogicalType &type) {
	return make_shared_ptr<Literal>(Value(type));
}

void Literal::Accept(SymbolVisitor &visitor) const {
	visitor.VisitLiteral(*this);
}

shared_ptr<Symbol> Literal::CastTo(const LogicalType &target_type, CastModes modes) const {
	if (ValueType() == target_type) {
		return Self();
	}
	Value new_value;
	if (!value.TryCastAs(target_type, new_value)) {
		if (modes.Contains(CastMode::TRY)) {
			return Null(target_type);
		}
		throw ConversionException(ValueType(), target_type);
	}
	return Create(std::move(new_value));
}

string Literal::ToString(RenderStyle style) const {
	return value.ToSQLString();
}

bool Literal::Equals(const Symbol &other) const {
	if (!Symbol::Equals(other)) {
		return false;
	}
	return Value::NotDistinctFrom(value, other.Cast<Literal>().value);
}

hash_t Literal::Hash() const {
	return CombineHash(Symbol::Hash(), value.Hash());
}

void Literal::SerializeProperties(Serializer &serializer) const {
	value.Serialize(serializer);
}

shared_ptr<Symbol> Literal::Deserialize(Deserializer &source) {
	return Create(Value::Deserialize(source));
}

} // namespace tessera
