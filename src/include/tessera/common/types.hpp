//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/types.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

class Serializer;
class Deserializer;

//===--------------------------------------------------------------------===//
// SQL Types
//===--------------------------------------------------------------------===//
//! The numeric ids double as the wire tags of the types, do not renumber them
enum class LogicalTypeId : uint8_t {
	UNDEFINED = 0,
	BOOLEAN = 3,
	TEXT = 4,
	DOUBLE = 6,
	REAL = 7,
	SMALLINT = 8,
	INTEGER = 9,
	BIGINT = 10,
	TIMESTAMP_TZ = 11,
	OBJECT = 12,
	TIMESTAMP = 15,
	ARRAY = 100,
	//! Wildcard that is only valid inside function signatures
	ANY = 255
};

class LogicalType {
public:
	LogicalType();
	LogicalType(LogicalTypeId id); // NOLINT: Allow implicit conversion from `LogicalTypeId`

	LogicalTypeId id() const { // NOLINT: mimic std casing
		return id_;
	}

	bool operator==(const LogicalType &rhs) const;
	bool operator!=(const LogicalType &rhs) const {
		return !(*this == rhs);
	}

	//! The element type of an ARRAY type
	const LogicalType &ChildType() const;
	//! Strips all array dimensions, e.g. array(array(integer)) -> integer
	const LogicalType &InnermostType() const;

	bool IsNumeric() const;
	bool IsIntegral() const;
	bool IsTimestamp() const;
	bool IsArray() const {
		return id_ == LogicalTypeId::ARRAY;
	}

	//! The type signature of this type, e.g. "array(integer)"
	string ToString() const;
	hash_t Hash() const;

	//! Writes the variable-length type descriptor (type id, followed by the element type for arrays)
	void Serialize(Serializer &serializer) const;
	static LogicalType Deserialize(Deserializer &source);
	//! Writes an int32 count followed by every type of the list
	static void SerializeList(Serializer &serializer, const vector<LogicalType> &types);
	static vector<LogicalType> DeserializeList(Deserializer &source);

public:
	static constexpr const LogicalTypeId UNDEFINED = LogicalTypeId::UNDEFINED;
	static constexpr const LogicalTypeId BOOLEAN = LogicalTypeId::BOOLEAN;
	static constexpr const LogicalTypeId TEXT = LogicalTypeId::TEXT;
	static constexpr const LogicalTypeId DOUBLE = LogicalTypeId::DOUBLE;
	static constexpr const LogicalTypeId REAL = LogicalTypeId::REAL;
	static constexpr const LogicalTypeId SMALLINT = LogicalTypeId::SMALLINT;
	static constexpr const LogicalTypeId INTEGER = LogicalTypeId::INTEGER;
	static constexpr const LogicalTypeId BIGINT = LogicalTypeId::BIGINT;
	static constexpr const LogicalTypeId TIMESTAMP_TZ = LogicalTypeId::TIMESTAMP_TZ;
	static constexpr const LogicalTypeId OBJECT = LogicalTypeId::OBJECT;
	static constexpr const LogicalTypeId TIMESTAMP = LogicalTypeId::TIMESTAMP;
	static constexpr const LogicalTypeId ANY = LogicalTypeId::ANY;

	static LogicalType ARRAY(const LogicalType &child); // NOLINT

private:
	LogicalTypeId id_;
	shared_ptr<LogicalType> child_type;
};

string LogicalTypeIdToString(LogicalTypeId type);

//! Returns true if a value of the source type can be converted into the target type
struct CastRules {
	static bool CanCast(const LogicalType &source, const LogicalType &target);
};

} // namespace tessera
