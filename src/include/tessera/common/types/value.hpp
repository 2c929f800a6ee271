//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/types/value.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/types.hpp"

namespace tessera {

class Serializer;
class Deserializer;

//! The Value object holds a single arbitrary value of any type that can be
//! stored in the database.
class Value {
public:
	//! Create an empty NULL value of the undefined type
	Value();
	//! Create an empty NULL value of the specified type
	explicit Value(LogicalType type);
	//! Create a TEXT value
	Value(const char *val); // NOLINT: Allow implicit conversion from `const char *`
	//! Create a TEXT value
	Value(string val); // NOLINT: Allow implicit conversion from `string`

public:
	//! Create a boolean Value from a specified value
	static Value BOOLEAN(bool value);
	//! Create a smallint Value from a specified value
	static Value SMALLINT(int16_t value);
	//! Create an integer Value from a specified value
	static Value INTEGER(int32_t value);
	//! Create a bigint Value from a specified value
	static Value BIGINT(int64_t value);
	//! Create a real Value from a specified value
	static Value REAL(float value);
	//! Create a double precision Value from a specified value
	static Value DOUBLE(double value);
	//! Create a timestamp Value from milliseconds since epoch
	static Value TIMESTAMP(int64_t millis);
	//! Create a timestamp with time zone Value from milliseconds since epoch (UTC)
	static Value TIMESTAMP_TZ(int64_t millis);
	//! Create an array value with the given element type
	static Value ARRAY(const LogicalType &child_type, vector<Value> values); // NOLINT
	//! Create an object value from (key, value) pairs; keys keep their insertion order
	static Value OBJECT(vector<string> keys, vector<Value> values); // NOLINT

	const LogicalType &type() const { // NOLINT: mimic std casing
		return type_;
	}
	bool IsNull() const {
		return is_null;
	}

	bool GetBoolean() const;
	//! The integral payload of SMALLINT, INTEGER, BIGINT and timestamp values
	int64_t GetBigInt() const;
	//! The payload of REAL and DOUBLE values
	double GetDouble() const;
	const string &GetString() const;
	//! The elements of an ARRAY value or the values of an OBJECT value
	const vector<Value> &GetChildren() const;
	const vector<string> &GetObjectKeys() const;

	//! Convert this value to a string
	string ToString() const;
	//! Convert this value to a SQL-parseable string
	string ToSQLString() const;

	//! Tries to cast this value to the target type; returns false (and fills in the error message) on failure
	bool TryCastAs(const LogicalType &target_type, Value &new_value, string *error_message = nullptr) const;
	//! Casts this value to the target type, throws a ConversionException on failure
	Value DefaultCastAs(const LogicalType &target_type) const;

	hash_t Hash() const;
	//! Returns true if both values are NULL or equal; the types have to match as well
	static bool NotDistinctFrom(const Value &lvalue, const Value &rvalue);

	bool operator==(const Value &rhs) const {
		return NotDistinctFrom(*this, rhs);
	}
	bool operator!=(const Value &rhs) const {
		return !NotDistinctFrom(*this, rhs);
	}

	void Serialize(Serializer &serializer) const;
	static Value Deserialize(Deserializer &source);

private:
	//! The logical of the value
	LogicalType type_;
	//! Whether or not the value is NULL
	bool is_null;

	//! The value of the object, if it is of a constant size Type
	union Val {
		bool boolean;
		int64_t bigint;
		double double_;
	} value_;

	string str_value;
	vector<string> object_keys;
	vector<Value> children;
};

} // namespace tessera
