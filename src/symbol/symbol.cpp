#include "tessera/symbol/symbol.hpp"

#include "tessera/common/serializer.hpp"
#include "tessera/common/types/hash.hpp"
#include "tessera/function/builtin_functions.hpp"
#include "tessera/symbol/function.hpp"
#include "tessera/symbol/literal.hpp"
#include "tessera/symbol/parameter_symbol.hpp"
#include "tessera/symbol/reference.hpp"

namespace tessera {

shared_ptr<Symbol> Symbol::Self() const {
	return std::const_pointer_cast<Symbol>(shared_from_this());
}

shared_ptr<Symbol> Symbol::CastTo(const LogicalType &target_type, CastModes modes) const {
	if (ValueType() == target_type) {
		return Self();
	}
	if (!CastRules::CanCast(ValueType(), target_type)) {
		throw ConversionException(ValueType(), target_type);
	}
	if (modes.Contains(CastMode::IMPLICIT) && modes.Count() > 1) {
		throw InternalException("Implicit casts can not be combined with other cast modes: %s", modes.ToString());
	}
	vector<shared_ptr<Symbol>> arguments;
	arguments.push_back(Self());
	string cast_name;
	if (modes.Contains(CastMode::TRY)) {
		cast_name = BuiltinFunctions::TRY_CAST;
		arguments.push_back(Literal::Null(target_type));
	} else if (modes.Contains(CastMode::EXPLICIT)) {
		cast_name = BuiltinFunctions::EXPLICIT_CAST;
		arguments.push_back(Literal::Null(target_type));
	} else {
		// the implicit cast carries the target type as a text value
		cast_name = BuiltinFunctions::IMPLICIT_CAST;
		arguments.push_back(Literal::Create(Value(target_type.ToString())));
	}
	return make_shared_ptr<Function>(BuiltinFunctions::CastSignature(cast_name), std::move(arguments), target_type);
}

bool Symbol::Equals(const Symbol &other) const {
	return type == other.type && ValueType() == other.ValueType();
}

hash_t Symbol::Hash() const {
	return CombineHash(tessera::Hash<uint8_t>(static_cast<uint8_t>(type)), ValueType().Hash());
}

bool Symbol::Equals(const shared_ptr<Symbol> &left, const shared_ptr<Symbol> &right) {
	if (left.get() == right.get()) {
		return true;
	}
	if (!left || !right) {
		return false;
	}
	return left->Equals(*right);
}

bool Symbol::ListEquals(const vector<shared_ptr<Symbol>> &left, const vector<shared_ptr<Symbol>> &right) {
	if (left.size() != right.size()) {
		return false;
	}
	for (idx_t i = 0; i < left.size(); i++) {
		if (!Equals(left[i], right[i])) {
			return false;
		}
	}
	return true;
}

vector<LogicalType> Symbol::TypeView(const vector<shared_ptr<Symbol>> &symbols) {
	vector<LogicalType> result;
	result.reserve(symbols.size());
	for (auto &symbol : symbols) {
		result.push_back(symbol->ValueType());
	}
	return result;
}

void Symbol::Serialize(Serializer &serializer) const {
	serializer.Write<uint8_t>(static_cast<uint8_t>(type));
	SerializeProperties(serializer);
}

shared_ptr<Symbol> Symbol::Deserialize(Deserializer &source) {
	auto position = source.GetPosition();
	auto tag = source.Read<uint8_t>();
	switch (static_cast<SymbolType>(tag)) {
	case SymbolType::LITERAL:
		return Literal::Deserialize(source);
	case SymbolType::REFERENCE:
		return Reference::Deserialize(source);
	case SymbolType::PARAMETER:
		return ParameterSymbol::Deserialize(source);
	case SymbolType::FUNCTION:
		return Function::Deserialize(source);
	default:
		throw SerializationException("Failed to deserialize: unknown symbol type tag %d at position %d", tag,
		                             position);
	}
}

} // namespace tessera
