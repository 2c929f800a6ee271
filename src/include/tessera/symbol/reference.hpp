//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/reference.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/symbol/symbol.hpp"

namespace tessera {

//! The (schema qualified) name of a table
struct RelationName {
	RelationName() {
	}
	RelationName(string schema, string name) : schema(std::move(schema)), name(std::move(name)) {
	}

	string schema;
	string name;

	//! e.g. doc.t1, identifiers are quoted where required
	string ToString() const;

	bool operator==(const RelationName &rhs) const {
		return schema == rhs.schema && name == rhs.name;
	}
};

//! A column name, optionally followed by a path into a nested object column (e.g. o['a']['b'])
class ColumnIdent {
public:
	explicit ColumnIdent(string name, vector<string> path = vector<string>());

	const string &Name() const {
		return name;
	}
	const vector<string> &Path() const {
		return path;
	}
	bool IsRoot() const {
		return path.empty();
	}

	//! The column as it is written in SQL, e.g. "Col"['a']['b']
	string QuotedOutputName() const;

	bool operator==(const ColumnIdent &rhs) const {
		return name == rhs.name && path == rhs.path;
	}

private:
	string name;
	vector<string> path;
};

//! A reference to a column of a table
class Reference : public Symbol {
public:
	static constexpr const SymbolType TYPE = SymbolType::REFERENCE;

public:
	Reference(RelationName relation, ColumnIdent column, LogicalType type);

	const RelationName &Relation() const {
		return relation;
	}
	const ColumnIdent &Column() const {
		return column;
	}

public:
	const LogicalType &ValueType() const override {
		return type_;
	}
	void Accept(SymbolVisitor &visitor) const override;
	string ToString(RenderStyle style) const override;

	bool Equals(const Symbol &other) const override;
	hash_t Hash() const override;

	static shared_ptr<Symbol> Deserialize(Deserializer &source);

protected:
	void SerializeProperties(Serializer &serializer) const override;

private:
	RelationName relation;
	ColumnIdent column;
	LogicalType type_;
};

} // namespace tessera
