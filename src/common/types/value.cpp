#include "tessera/common/types/value.hpp"

#include "tessera/common/exception.hpp"
#include "tessera/common/serializer.hpp"
#include "tessera/common/string_util.hpp"
#include "tessera/common/types/hash.hpp"
#include "tessera/common/types/timestamp.hpp"
#include "tessera/parser/keyword_helper.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cmath>
#include <limits>

namespace tessera {

Value::Value() : Value(LogicalType(LogicalTypeId::UNDEFINED)) {
}

Value::Value(LogicalType type) : type_(std::move(type)), is_null(true) {
	value_.bigint = 0;
}

Value::Value(const char *val) : Value(val ? string(val) : string()) {
	if (!val) {
		is_null = true;
	}
}

Value::Value(string val) : type_(LogicalType::TEXT), is_null(false), str_value(std::move(val)) {
	value_.bigint = 0;
}

Value Value::BOOLEAN(bool value) {
	Value result(LogicalType::BOOLEAN);
	result.value_.boolean = value;
	result.is_null = false;
	return result;
}

Value Value::SMALLINT(int16_t value) {
	Value result(LogicalType::SMALLINT);
	result.value_.bigint = value;
	result.is_null = false;
	return result;
}

Value Value::INTEGER(int32_t value) {
	Value result(LogicalType::INTEGER);
	result.value_.bigint = value;
	result.is_null = false;
	return result;
}

Value Value::BIGINT(int64_t value) {
	Value result(LogicalType::BIGINT);
	result.value_.bigint = value;
	result.is_null = false;
	return result;
}

Value Value::REAL(float value) {
	Value result(LogicalType::REAL);
	result.value_.double_ = value;
	result.is_null = false;
	return result;
}

Value Value::DOUBLE(double value) {
	Value result(LogicalType::DOUBLE);
	result.value_.double_ = value;
	result.is_null = false;
	return result;
}

Value Value::TIMESTAMP(int64_t millis) {
	Value result(LogicalType::TIMESTAMP);
	result.value_.bigint = millis;
	result.is_null = false;
	return result;
}

Value Value::TIMESTAMP_TZ(int64_t millis) {
	Value result(LogicalType::TIMESTAMP_TZ);
	result.value_.bigint = millis;
	result.is_null = false;
	return result;
}

Value Value::ARRAY(const LogicalType &child_type, vector<Value> values) {
	Value result(LogicalType::ARRAY(child_type));
	for (auto &value : values) {
		if (value.type() != child_type) {
			throw InternalException("Array element of type %s does not match the array element type %s",
			                        value.type().ToString(), child_type.ToString());
		}
	}
	result.children = std::move(values);
	result.is_null = false;
	return result;
}

Value Value::OBJECT(vector<string> keys, vector<Value> values) {
	if (keys.size() != values.size()) {
		throw InternalException("Object value requires one value per key");
	}
	Value result(LogicalType::OBJECT);
	result.object_keys = std::move(keys);
	result.children = std::move(values);
	result.is_null = false;
	return result;
}

//===--------------------------------------------------------------------===//
// Type-specific getters
//===--------------------------------------------------------------------===//
bool Value::GetBoolean() const {
	if (is_null || type_.id() != LogicalTypeId::BOOLEAN) {
		throw InternalException("GetBoolean called on value of type %s", type_.ToString());
	}
	return value_.boolean;
}

int64_t Value::GetBigInt() const {
	if (is_null || !(type_.IsIntegral() || type_.IsTimestamp())) {
		throw InternalException("GetBigInt called on value of type %s", type_.ToString());
	}
	return value_.bigint;
}

double Value::GetDouble() const {
	if (is_null || (type_.id() != LogicalTypeId::DOUBLE && type_.id() != LogicalTypeId::REAL)) {
		throw InternalException("GetDouble called on value of type %s", type_.ToString());
	}
	return value_.double_;
}

const string &Value::GetString() const {
	if (is_null || type_.id() != LogicalTypeId::TEXT) {
		throw InternalException("GetString called on value of type %s", type_.ToString());
	}
	return str_value;
}

const vector<Value> &Value::GetChildren() const {
	if (is_null || (type_.id() != LogicalTypeId::ARRAY && type_.id() != LogicalTypeId::OBJECT)) {
		throw InternalException("GetChildren called on value of type %s", type_.ToString());
	}
	return children;
}

const vector<string> &Value::GetObjectKeys() const {
	if (is_null || type_.id() != LogicalTypeId::OBJECT) {
		throw InternalException("GetObjectKeys called on value of type %s", type_.ToString());
	}
	return object_keys;
}

//===--------------------------------------------------------------------===//
// ToString
//===--------------------------------------------------------------------===//
static string FloatingPointToString(double value, bool is_real) {
	if (std::isnan(value)) {
		return "NaN";
	}
	if (std::isinf(value)) {
		return value < 0 ? "-Infinity" : "Infinity";
	}
	auto result = is_real ? fmt::format("{}", float(value)) : fmt::format("{}", value);
	if (result.find_first_of(".e") == string::npos) {
		result += ".0";
	}
	return result;
}

string Value::ToString() const {
	if (is_null) {
		return "NULL";
	}
	switch (type_.id()) {
	case LogicalTypeId::BOOLEAN:
		return value_.boolean ? "true" : "false";
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
		return std::to_string(value_.bigint);
	case LogicalTypeId::REAL:
		return FloatingPointToString(value_.double_, true);
	case LogicalTypeId::DOUBLE:
		return FloatingPointToString(value_.double_, false);
	case LogicalTypeId::TEXT:
		return str_value;
	case LogicalTypeId::TIMESTAMP:
		return Timestamp::ToString(value_.bigint, false);
	case LogicalTypeId::TIMESTAMP_TZ:
		return Timestamp::ToString(value_.bigint, true);
	case LogicalTypeId::ARRAY:
		return "[" +
		       StringUtil::Join(children, children.size(), ", ",
		                        [](const Value &child) { return child.ToString(); }) +
		       "]";
	case LogicalTypeId::OBJECT: {
		string ret = "{";
		for (idx_t i = 0; i < children.size(); i++) {
			if (i > 0) {
				ret += ", ";
			}
			ret += object_keys[i] + "=" + children[i].ToString();
		}
		ret += "}";
		return ret;
	}
	default:
		throw InternalException("Unimplemented type for Value::ToString: %s", type_.ToString());
	}
}

string Value::ToSQLString() const {
	if (is_null) {
		return ToString();
	}
	switch (type_.id()) {
	case LogicalTypeId::TEXT:
		return KeywordHelper::WriteQuoted(str_value, '\'');
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::TIMESTAMP_TZ:
		return "'" + ToString() + "'::" + type_.ToString();
	case LogicalTypeId::REAL:
	case LogicalTypeId::DOUBLE:
		if (!std::isfinite(value_.double_)) {
			return "'" + ToString() + "'::" + type_.ToString();
		}
		return ToString();
	case LogicalTypeId::ARRAY: {
		string ret = "[";
		for (idx_t i = 0; i < children.size(); i++) {
			ret += children[i].ToSQLString();
			if (i < children.size() - 1) {
				ret += ", ";
			}
		}
		ret += "]";
		return ret;
	}
	case LogicalTypeId::OBJECT: {
		string ret = "{";
		for (idx_t i = 0; i < children.size(); i++) {
			ret += KeywordHelper::WriteQuoted(object_keys[i], '"') + "=" + children[i].ToSQLString();
			if (i < children.size() - 1) {
				ret += ", ";
			}
		}
		ret += "}";
		return ret;
	}
	default:
		return ToString();
	}
}

//===--------------------------------------------------------------------===//
// Cast
//===--------------------------------------------------------------------===//
static bool IntegralInRange(LogicalTypeId target, int64_t value) {
	switch (target) {
	case LogicalTypeId::SMALLINT:
		return value >= std::numeric_limits<int16_t>::min() && value <= std::numeric_limits<int16_t>::max();
	case LogicalTypeId::INTEGER:
		return value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max();
	default:
		return true;
	}
}

static bool TryParseBigInt(const string &input, int64_t &result) {
	auto str = input;
	StringUtil::Trim(str);
	if (str.empty()) {
		return false;
	}
	char *end = nullptr;
	errno = 0;
	auto parsed = std::strtoll(str.c_str(), &end, 10);
	if (errno != 0 || end != str.c_str() + str.size()) {
		return false;
	}
	result = parsed;
	return true;
}

static bool TryParseDouble(const string &input, double &result) {
	auto str = input;
	StringUtil::Trim(str);
	if (str.empty()) {
		return false;
	}
	char *end = nullptr;
	errno = 0;
	auto parsed = std::strtod(str.c_str(), &end);
	if (errno == ERANGE || end != str.c_str() + str.size()) {
		return false;
	}
	result = parsed;
	return true;
}

static bool TryParseBoolean(const string &input, bool &result) {
	auto str = StringUtil::Lower(input);
	StringUtil::Trim(str);
	if (str == "t" || str == "true" || str == "yes" || str == "on" || str == "1") {
		result = true;
		return true;
	}
	if (str == "f" || str == "false" || str == "no" || str == "off" || str == "0") {
		result = false;
		return true;
	}
	return false;
}

static bool TryRoundToBigInt(double input, int64_t &result) {
	if (!std::isfinite(input)) {
		return false;
	}
	auto rounded = std::round(input);
	if (rounded < -9223372036854775808.0 || rounded >= 9223372036854775808.0) {
		return false;
	}
	result = int64_t(rounded);
	return true;
}

static Value IntegralValue(LogicalTypeId target, int64_t value) {
	switch (target) {
	case LogicalTypeId::SMALLINT:
		return Value::SMALLINT(int16_t(value));
	case LogicalTypeId::INTEGER:
		return Value::INTEGER(int32_t(value));
	case LogicalTypeId::TIMESTAMP:
		return Value::TIMESTAMP(value);
	case LogicalTypeId::TIMESTAMP_TZ:
		return Value::TIMESTAMP_TZ(value);
	default:
		return Value::BIGINT(value);
	}
}

static Value FloatingValue(LogicalTypeId target, double value) {
	if (target == LogicalTypeId::REAL) {
		return Value::REAL(float(value));
	}
	return Value::DOUBLE(value);
}

static bool CastFailed(const Value &source, const LogicalType &target_type, string *error_message) {
	if (error_message) {
		*error_message = StringUtil::Format("Cannot cast value %s to type %s", source.ToSQLString(),
		                                    target_type.ToString());
	}
	return false;
}

bool Value::TryCastAs(const LogicalType &target_type, Value &new_value, string *error_message) const {
	if (type_ == target_type) {
		new_value = *this;
		return true;
	}
	if (!CastRules::CanCast(type_, target_type)) {
		return CastFailed(*this, target_type, error_message);
	}
	if (is_null) {
		new_value = Value(target_type);
		return true;
	}
	auto target = target_type.id();
	switch (type_.id()) {
	case LogicalTypeId::BOOLEAN:
		if (target == LogicalTypeId::TEXT) {
			new_value = Value(ToString());
			return true;
		}
		new_value = IntegralValue(target, value_.boolean ? 1 : 0);
		return true;
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
		if (target == LogicalTypeId::TEXT) {
			new_value = Value(ToString());
			return true;
		}
		if (target == LogicalTypeId::BOOLEAN) {
			new_value = Value::BOOLEAN(value_.bigint != 0);
			return true;
		}
		if (target == LogicalTypeId::REAL || target == LogicalTypeId::DOUBLE) {
			new_value = FloatingValue(target, double(value_.bigint));
			return true;
		}
		if (!IntegralInRange(target, value_.bigint)) {
			return CastFailed(*this, target_type, error_message);
		}
		new_value = IntegralValue(target, value_.bigint);
		return true;
	case LogicalTypeId::REAL:
	case LogicalTypeId::DOUBLE: {
		if (target == LogicalTypeId::TEXT) {
			new_value = Value(ToString());
			return true;
		}
		if (target == LogicalTypeId::BOOLEAN) {
			new_value = Value::BOOLEAN(value_.double_ != 0);
			return true;
		}
		if (target == LogicalTypeId::REAL || target == LogicalTypeId::DOUBLE) {
			new_value = FloatingValue(target, value_.double_);
			return true;
		}
		int64_t rounded;
		if (target_type.IsTimestamp()) {
			// timestamps truncate fractional milliseconds
			if (!TryRoundToBigInt(std::trunc(value_.double_), rounded)) {
				return CastFailed(*this, target_type, error_message);
			}
			new_value = IntegralValue(target, rounded);
			return true;
		}
		if (!TryRoundToBigInt(value_.double_, rounded) || !IntegralInRange(target, rounded)) {
			return CastFailed(*this, target_type, error_message);
		}
		new_value = IntegralValue(target, rounded);
		return true;
	}
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::TIMESTAMP_TZ:
		if (target == LogicalTypeId::TEXT) {
			new_value = Value(ToString());
			return true;
		}
		new_value = IntegralValue(target, value_.bigint);
		return true;
	case LogicalTypeId::TEXT:
		switch (target) {
		case LogicalTypeId::BOOLEAN: {
			bool result;
			if (!TryParseBoolean(str_value, result)) {
				return CastFailed(*this, target_type, error_message);
			}
			new_value = Value::BOOLEAN(result);
			return true;
		}
		case LogicalTypeId::SMALLINT:
		case LogicalTypeId::INTEGER:
		case LogicalTypeId::BIGINT: {
			int64_t result;
			if (!TryParseBigInt(str_value, result) || !IntegralInRange(target, result)) {
				return CastFailed(*this, target_type, error_message);
			}
			new_value = IntegralValue(target, result);
			return true;
		}
		case LogicalTypeId::REAL:
		case LogicalTypeId::DOUBLE: {
			double result;
			if (!TryParseDouble(str_value, result)) {
				return CastFailed(*this, target_type, error_message);
			}
			new_value = FloatingValue(target, result);
			return true;
		}
		case LogicalTypeId::TIMESTAMP:
		case LogicalTypeId::TIMESTAMP_TZ: {
			int64_t result;
			if (!Timestamp::TryConvertTimestamp(str_value.c_str(), str_value.size(), result)) {
				return CastFailed(*this, target_type, error_message);
			}
			new_value = IntegralValue(target, result);
			return true;
		}
		default:
			// array literals are not parsed from text
			return CastFailed(*this, target_type, error_message);
		}
	case LogicalTypeId::ARRAY: {
		auto &child_type = target_type.ChildType();
		vector<Value> new_children;
		for (auto &child : children) {
			Value new_child;
			if (!child.TryCastAs(child_type, new_child, error_message)) {
				return false;
			}
			new_children.push_back(std::move(new_child));
		}
		new_value = Value::ARRAY(child_type, std::move(new_children));
		return true;
	}
	default:
		return CastFailed(*this, target_type, error_message);
	}
}

Value Value::DefaultCastAs(const LogicalType &target_type) const {
	Value new_value;
	string error_message;
	if (!TryCastAs(target_type, new_value, &error_message)) {
		throw ConversionException(error_message);
	}
	return new_value;
}

//===--------------------------------------------------------------------===//
// Hash / Comparison
//===--------------------------------------------------------------------===//
hash_t Value::Hash() const {
	hash_t result = type_.Hash();
	if (is_null) {
		return result;
	}
	switch (type_.id()) {
	case LogicalTypeId::BOOLEAN:
		return CombineHash(result, tessera::Hash<bool>(value_.boolean));
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::TIMESTAMP_TZ:
		return CombineHash(result, tessera::Hash<int64_t>(value_.bigint));
	case LogicalTypeId::REAL:
	case LogicalTypeId::DOUBLE:
		return CombineHash(result, tessera::Hash<double>(value_.double_));
	case LogicalTypeId::TEXT:
		return CombineHash(result, tessera::Hash(str_value));
	case LogicalTypeId::OBJECT:
		for (auto &key : object_keys) {
			result = CombineHash(result, tessera::Hash(key));
		}
		for (auto &child : children) {
			result = CombineHash(result, child.Hash());
		}
		return result;
	case LogicalTypeId::ARRAY:
		for (auto &child : children) {
			result = CombineHash(result, child.Hash());
		}
		return result;
	default:
		return result;
	}
}

bool Value::NotDistinctFrom(const Value &lvalue, const Value &rvalue) {
	if (lvalue.type_ != rvalue.type_ || lvalue.is_null != rvalue.is_null) {
		return false;
	}
	if (lvalue.is_null) {
		return true;
	}
	switch (lvalue.type_.id()) {
	case LogicalTypeId::BOOLEAN:
		return lvalue.value_.boolean == rvalue.value_.boolean;
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::TIMESTAMP_TZ:
		return lvalue.value_.bigint == rvalue.value_.bigint;
	case LogicalTypeId::REAL:
	case LogicalTypeId::DOUBLE:
		// NaN is not distinct from NaN
		if (std::isnan(lvalue.value_.double_) && std::isnan(rvalue.value_.double_)) {
			return true;
		}
		return lvalue.value_.double_ == rvalue.value_.double_;
	case LogicalTypeId::TEXT:
		return lvalue.str_value == rvalue.str_value;
	case LogicalTypeId::OBJECT:
	case LogicalTypeId::ARRAY:
		if (lvalue.object_keys != rvalue.object_keys || lvalue.children.size() != rvalue.children.size()) {
			return false;
		}
		for (idx_t i = 0; i < lvalue.children.size(); i++) {
			if (!NotDistinctFrom(lvalue.children[i], rvalue.children[i])) {
				return false;
			}
		}
		return true;
	default:
		return true;
	}
}

//===--------------------------------------------------------------------===//
// Serialization
//===--------------------------------------------------------------------===//
void Value::Serialize(Serializer &serializer) const {
	type_.Serialize(serializer);
	serializer.Write<bool>(is_null);
	if (is_null) {
		return;
	}
	switch (type_.id()) {
	case LogicalTypeId::BOOLEAN:
		serializer.Write<bool>(value_.boolean);
		break;
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::TIMESTAMP_TZ:
		serializer.Write<int64_t>(value_.bigint);
		break;
	case LogicalTypeId::REAL:
	case LogicalTypeId::DOUBLE:
		serializer.Write<double>(value_.double_);
		break;
	case LogicalTypeId::TEXT:
		serializer.WriteString(str_value);
		break;
	case LogicalTypeId::ARRAY:
		serializer.Write<int32_t>((int32_t)children.size());
		for (auto &child : children) {
			child.Serialize(serializer);
		}
		break;
	case LogicalTypeId::OBJECT:
		serializer.Write<int32_t>((int32_t)children.size());
		for (idx_t i = 0; i < children.size(); i++) {
			serializer.WriteString(object_keys[i]);
			children[i].Serialize(serializer);
		}
		break;
	default:
		throw InternalException("Unimplemented type for Value::Serialize: %s", type_.ToString());
	}
}

static int32_t ReadEntryCount(Deserializer &source) {
	auto position = source.GetPosition();
	auto count = source.Read<int32_t>();
	if (count < 0) {
		throw InternalException("Failed to deserialize: negative value entry count %d at position %d", count,
		                        position);
	}
	return count;
}

Value Value::Deserialize(Deserializer &source) {
	auto position = source.GetPosition();
	auto type = LogicalType::Deserialize(source);
	auto is_null = source.ReadBool();
	if (is_null) {
		return Value(type);
	}
	switch (type.id()) {
	case LogicalTypeId::BOOLEAN:
		return Value::BOOLEAN(source.ReadBool());
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::TIMESTAMP_TZ: {
		auto value = source.Read<int64_t>();
		if (!IntegralInRange(type.id(), value)) {
			throw SerializationException("Failed to deserialize: %s value out of range at position %d",
			                             type.ToString(), position);
		}
		return IntegralValue(type.id(), value);
	}
	case LogicalTypeId::REAL:
	case LogicalTypeId::DOUBLE:
		return FloatingValue(type.id(), source.Read<double>());
	case LogicalTypeId::TEXT:
		return Value(source.Read<string>());
	case LogicalTypeId::ARRAY: {
		auto count = ReadEntryCount(source);
		vector<Value> values;
		for (int32_t i = 0; i < count; i++) {
			auto child_position = source.GetPosition();
			auto child = Value::Deserialize(source);
			if (child.type() != type.ChildType()) {
				throw SerializationException("Failed to deserialize: array element of type %s at position %d "
				                             "does not match element type %s",
				                             child.type().ToString(), child_position, type.ChildType().ToString());
			}
			values.push_back(std::move(child));
		}
		return Value::ARRAY(type.ChildType(), std::move(values));
	}
	case LogicalTypeId::OBJECT: {
		auto count = ReadEntryCount(source);
		vector<string> keys;
		vector<Value> values;
		for (int32_t i = 0; i < count; i++) {
			keys.push_back(source.Read<string>());
			values.push_back(Value::Deserialize(source));
		}
		return Value::OBJECT(std::move(keys), std::move(values));
	}
	default:
		throw SerializationException("Failed to deserialize: non-null value of type %s at position %d",
		                             type.ToString(), position);
	}
}

} // namespace tessera
