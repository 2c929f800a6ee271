//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/symbol.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/enums/cast_mode.hpp"
#include "tessera/common/enums/render_style.hpp"
#include "tessera/common/enums/symbol_type.hpp"
#include "tessera/common/exception.hpp"
#include "tessera/common/types.hpp"

namespace tessera {

class Serializer;
class Deserializer;
class SymbolVisitor;

//!  The Symbol class is the base class of all nodes of an analyzed expression tree. Symbols are immutable once
//!  constructed and are shared between trees through shared_ptr; every transformation builds new symbols.
class Symbol : public std::enable_shared_from_this<Symbol> {
public:
	explicit Symbol(SymbolType type) : type(type) {
	}
	virtual ~Symbol() {
	}

	//! Type of the symbol
	const SymbolType type;

public:
	//! The type the symbol evaluates to
	virtual const LogicalType &ValueType() const = 0;
	//! Double dispatch into the matching Visit method of the visitor
	virtual void Accept(SymbolVisitor &visitor) const = 0;

	//! Returns a symbol that evaluates to the target type. Symbols of the target type are returned as-is, other
	//! symbols are wrapped into a cast function matching the cast modes. Throws a ConversionException if the type of
	//! the symbol can not be converted.
	virtual shared_ptr<Symbol> CastTo(const LogicalType &target_type, CastModes modes = CastModes()) const;

	//! Renders the symbol as SQL text
	virtual string ToString(RenderStyle style) const = 0;

	//! Structural equality
	virtual bool Equals(const Symbol &other) const;
	virtual hash_t Hash() const;

	//! Writes the symbol type tag, followed by the properties of the symbol
	void Serialize(Serializer &serializer) const;
	static shared_ptr<Symbol> Deserialize(Deserializer &source);

	static bool Equals(const shared_ptr<Symbol> &left, const shared_ptr<Symbol> &right);
	static bool ListEquals(const vector<shared_ptr<Symbol>> &left, const vector<shared_ptr<Symbol>> &right);
	//! The value types of the given symbols
	static vector<LogicalType> TypeView(const vector<shared_ptr<Symbol>> &symbols);

protected:
	virtual void SerializeProperties(Serializer &serializer) const = 0;
	shared_ptr<Symbol> Self() const;

public:
	template <class TARGET>
	TARGET &Cast() {
		if (type != TARGET::TYPE) {
			throw InternalException("Failed to cast symbol to type - symbol type mismatch");
		}
		return static_cast<TARGET &>(*this);
	}

	template <class TARGET>
	const TARGET &Cast() const {
		if (type != TARGET::TYPE) {
			throw InternalException("Failed to cast symbol to type - symbol type mismatch");
		}
		return static_cast<const TARGET &>(*this);
	}
};

} // namespace tessera
