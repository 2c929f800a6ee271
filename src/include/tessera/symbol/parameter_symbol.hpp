//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/parameter_symbol.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/symbol/symbol.hpp"

namespace tessera {

//! A positional parameter ($1, $2, ...) of a prepared statement; the index is zero based
class ParameterSymbol : public Symbol {
public:
	static constexpr const SymbolType TYPE = SymbolType::PARAMETER;

public:
	ParameterSymbol(uint32_t index, LogicalType type);

	uint32_t Index() const {
		return index;
	}

public:
	const LogicalType &ValueType() const override {
		return type_;
	}
	void Accept(SymbolVisitor &visitor) const override;
	//! Parameters take on the target type, no cast function is inserted
	shared_ptr<Symbol> CastTo(const LogicalType &target_type, CastModes modes = CastModes()) const override;
	string ToString(RenderStyle style) const override;

	bool Equals(const Symbol &other) const override;
	hash_t Hash() const override;

	static shared_ptr<Symbol> Deserialize(Deserializer &source);

protected:
	void SerializeProperties(Serializer &serializer) const override;

private:
	uint32_t index;
	LogicalType type_;
};

} // namespace tessera
