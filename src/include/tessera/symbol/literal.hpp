//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/literal.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/types/value.hpp"
#include "tessera/symbol/symbol.hpp"

namespace tessera {

//! A constant value
class Literal : public Symbol {
public:
	static constexpr const SymbolType TYPE = SymbolType::LITERAL;

public:
	explicit Literal(Value value);

	static shared_ptr<Literal> Create(Value value);
	//! A NULL literal of the given type
	static shared_ptr<Literal> Null(const LogicalType &type);

	const Value &GetValue() const {
		return value;
	}

public:
	const LogicalType &ValueType() const override {
		return value.type();
	}
	void Accept(SymbolVisitor &visitor) const override;
	//! Literals are converted eagerly; in TRY mode a failed conversion yields a NULL literal
	shared_ptr<Symbol> CastTo(const LogicalType &target_type, CastModes modes = CastModes()) const override;
	string ToString(RenderStyle style) const override;

	bool Equals(const Symbol &other) const override;
	hash_t Hash() const override;

	static shared_ptr<Symbol> Deserialize(Deserializer &source);

protected:
	void SerializeProperties(Serializer &serializer) const override;

private:
	Value value;
};

} // namespace tessera
