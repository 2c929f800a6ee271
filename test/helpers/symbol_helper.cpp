#include "symbol_helper.hpp"

namespace tessera {

shared_ptr<Symbol> IntegerLiteral(int32_t value) {
	return Literal::Create(Value::INTEGER(value));
}

shared_ptr<Symbol> TextLiteral(const string &value) {
	return Literal::Create(Value(value));
}

shared_ptr<Symbol> ColumnRef(const string &name, const LogicalType &type, vector<string> path) {
	return make_shared_ptr<Reference>(RelationName("doc", "t1"), ColumnIdent(name, std::move(path)), type);
}

shared_ptr<Function> CreateCall(const string &name, vector<shared_ptr<Symbol>> arguments,
                                const LogicalType &return_type, shared_ptr<Symbol> filter, FunctionKind kind) {
	Signature signature(FunctionName(name), kind, Symbol::TypeView(arguments), return_type,
	                    {FunctionFeature::DETERMINISTIC});
	return make_shared_ptr<Function>(std::move(signature), std::move(arguments), return_type, std::move(filter));
}

BinaryData EncodeSymbol(const Symbol &symbol, ProtocolVersion version) {
	BufferedSerializer serializer;
	serializer.SetVersion(version);
	symbol.Serialize(serializer);
	return serializer.GetData();
}

shared_ptr<Symbol> DecodeSymbol(BinaryData &data, ProtocolVersion version, optional_ptr<Logger> logger) {
	BufferedDeserializer source(data.data.get(), data.size);
	source.SetVersion(version);
	source.SetLogger(logger);
	auto result = Symbol::Deserialize(source);
	if (!source.Finished()) {
		throw SerializationException("Trailing bytes after symbol at position %d", source.GetPosition());
	}
	return result;
}

shared_ptr<Symbol> RoundTrip(const Symbol &symbol, ProtocolVersion version, optional_ptr<Logger> logger) {
	auto data = EncodeSymbol(symbol, version);
	return DecodeSymbol(data, version, logger);
}

} // namespace tessera
