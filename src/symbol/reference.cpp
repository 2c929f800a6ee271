#include "tessera/symbol/reference.hpp"

#include "tessera/common/serializer.hpp"
#include "tessera/common/types/hash.hpp"
#include "tessera/parser/keyword_helper.hpp"
#include "tessera/symbol/symbol_visitor.hpp"

namespace tessera {

constexpr const SymbolType Reference::TYPE;

string RelationName::ToString() const {
	string result;
	if (!schema.empty()) {
		result = KeywordHelper::WriteOptionallyQuoted(schema, '"', false) + ".";
	}
	return result + KeywordHelper::WriteOptionallyQuoted(name, '"', false);
}

ColumnIdent::ColumnIdent(string name, vector<string> path) : name(std::move(name)), path(std::move(path)) {
}

string ColumnIdent::QuotedOutputName() const {
	auto result = KeywordHelper::WriteOptionallyQuoted(name, '"', false);
	for (auto &element : path) {
		result += "[" + KeywordHelper::WriteQuoted(element, '\'') + "]";
	}
	return result;
}

Reference::Reference(RelationName relation, ColumnIdent column, LogicalType type)
    : Symbol(SymbolType::REFERENCE), relation(std::move(relation)), column(std::move(column)),
      type_(std::move(type)) {
}

void Reference::Accept(SymbolVisitor &visitor) const {
	visitor.VisitReference(*this);
}

string Reference::ToString(RenderStyle style) const {
	if (style == RenderStyle::QUALIFIED && !relation.name.empty()) {
		return relation.ToString() + "." + column.QuotedOutputName();
	}
	return column.QuotedOutputName();
}

bool Reference::Equals(const Symbol &other) const {
	if (!Symbol::Equals(other)) {
		return false;
	}
	auto &other_ref = other.Cast<Reference>();
	return relation == other_ref.relation && column == other_ref.column;
}

hash_t Reference::Hash() const {
	auto result = CombineHash(Symbol::Hash(), tessera::Hash(relation.schema));
	result = CombineHash(result, tessera::Hash(relation.name));
	result = CombineHash(result, tessera::Hash(column.Name()));
	for (auto &element : column.Path()) {
		result = CombineHash(result, tessera::Hash(element));
	}
	return result;
}

void Reference::SerializeProperties(Serializer &serializer) const {
	serializer.WriteString(relation.schema);
	serializer.WriteString(relation.name);
	serializer.WriteString(column.Name());
	serializer.WriteStringVector(column.Path());
	type_.Serialize(serializer);
}

shared_ptr<Symbol> Reference::Deserialize(Deserializer &source) {
	RelationName relation;
	relation.schema = source.Read<string>();
	relation.name = source.Read<string>();
	auto name = source.Read<string>();
	vector<string> path;
	source.ReadStringVector(path);
	auto type = LogicalType::Deserialize(source);
	return make_shared_ptr<Reference>(std::move(relation), ColumnIdent(std::move(name), std::move(path)),
	                                  std::move(type));
}

} // namespace tessera
