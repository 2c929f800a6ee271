//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/function/function_name.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"
#include "tessera/common/enums/render_style.hpp"

namespace tessera {

class Serializer;
class Deserializer;

//! The (optionally schema qualified) name of a function
class FunctionName {
public:
	explicit FunctionName(string name);
	FunctionName(string schema, string name);

	const string &Schema() const {
		return schema;
	}
	bool HasSchema() const {
		return !schema.empty();
	}
	const string &Name() const {
		return name;
	}

	//! The name is only qualified with its schema in QUALIFIED style
	string ToString(RenderStyle style) const;

	bool operator==(const FunctionName &rhs) const {
		return schema == rhs.schema && name == rhs.name;
	}
	bool operator!=(const FunctionName &rhs) const {
		return !(*this == rhs);
	}
	hash_t Hash() const;

	void Serialize(Serializer &serializer) const;
	static FunctionName Deserialize(Deserializer &source);

private:
	string schema;
	string name;
};

} // namespace tessera
