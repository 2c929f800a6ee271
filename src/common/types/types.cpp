#include "tessera/common/types.hpp"

#include "tessera/common/exception.hpp"
#include "tessera/common/serializer.hpp"
#include "tessera/common/types/hash.hpp"

namespace tessera {

constexpr const LogicalTypeId LogicalType::UNDEFINED;
constexpr const LogicalTypeId LogicalType::BOOLEAN;
constexpr const LogicalTypeId LogicalType::TEXT;
constexpr const LogicalTypeId LogicalType::DOUBLE;
constexpr const LogicalTypeId LogicalType::REAL;
constexpr const LogicalTypeId LogicalType::SMALLINT;
constexpr const LogicalTypeId LogicalType::INTEGER;
constexpr const LogicalTypeId LogicalType::BIGINT;
constexpr const LogicalTypeId LogicalType::TIMESTAMP_TZ;
constexpr const LogicalTypeId LogicalType::OBJECT;
constexpr const LogicalTypeId LogicalType::TIMESTAMP;
constexpr const LogicalTypeId LogicalType::ANY;

LogicalType::LogicalType() : LogicalType(LogicalTypeId::UNDEFINED) {
}

LogicalType::LogicalType(LogicalTypeId id) : id_(id) {
}

LogicalType LogicalType::ARRAY(const LogicalType &child) { // NOLINT
	LogicalType result(LogicalTypeId::ARRAY);
	result.child_type = std::make_shared<LogicalType>(child);
	return result;
}

bool LogicalType::operator==(const LogicalType &rhs) const {
	if (id_ != rhs.id_) {
		return false;
	}
	if (id_ == LogicalTypeId::ARRAY) {
		return ChildType() == rhs.ChildType();
	}
	return true;
}

const LogicalType &LogicalType::ChildType() const {
	if (id_ != LogicalTypeId::ARRAY || !child_type) {
		throw InternalException("ChildType called on non-array type %s", ToString());
	}
	return *child_type;
}

const LogicalType &LogicalType::InnermostType() const {
	const LogicalType *type = this;
	while (type->id() == LogicalTypeId::ARRAY) {
		type = &type->ChildType();
	}
	return *type;
}

bool LogicalType::IsNumeric() const {
	switch (id_) {
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::REAL:
	case LogicalTypeId::DOUBLE:
		return true;
	default:
		return false;
	}
}

bool LogicalType::IsIntegral() const {
	switch (id_) {
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
		return true;
	default:
		return false;
	}
}

bool LogicalType::IsTimestamp() const {
	return id_ == LogicalTypeId::TIMESTAMP || id_ == LogicalTypeId::TIMESTAMP_TZ;
}

string LogicalTypeIdToString(LogicalTypeId id) {
	switch (id) {
	case LogicalTypeId::UNDEFINED:
		return "undefined";
	case LogicalTypeId::BOOLEAN:
		return "boolean";
	case LogicalTypeId::TEXT:
		return "text";
	case LogicalTypeId::DOUBLE:
		return "double precision";
	case LogicalTypeId::REAL:
		return "real";
	case LogicalTypeId::SMALLINT:
		return "smallint";
	case LogicalTypeId::INTEGER:
		return "integer";
	case LogicalTypeId::BIGINT:
		return "bigint";
	case LogicalTypeId::TIMESTAMP_TZ:
		return "timestamp with time zone";
	case LogicalTypeId::OBJECT:
		return "object";
	case LogicalTypeId::TIMESTAMP:
		return "timestamp without time zone";
	case LogicalTypeId::ARRAY:
		return "array";
	case LogicalTypeId::ANY:
		return "any";
	}
	return "unknown";
}

string LogicalType::ToString() const {
	if (id_ == LogicalTypeId::ARRAY) {
		return "array(" + ChildType().ToString() + ")";
	}
	return LogicalTypeIdToString(id_);
}

hash_t LogicalType::Hash() const {
	hash_t result = tessera::Hash<uint8_t>(static_cast<uint8_t>(id_));
	if (id_ == LogicalTypeId::ARRAY) {
		result = CombineHash(result, ChildType().Hash());
	}
	return result;
}

static bool IsKnownTypeId(uint8_t id) {
	switch (static_cast<LogicalTypeId>(id)) {
	case LogicalTypeId::UNDEFINED:
	case LogicalTypeId::BOOLEAN:
	case LogicalTypeId::TEXT:
	case LogicalTypeId::DOUBLE:
	case LogicalTypeId::REAL:
	case LogicalTypeId::SMALLINT:
	case LogicalTypeId::INTEGER:
	case LogicalTypeId::BIGINT:
	case LogicalTypeId::TIMESTAMP_TZ:
	case LogicalTypeId::OBJECT:
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::ARRAY:
	case LogicalTypeId::ANY:
		return true;
	default:
		return false;
	}
}

void LogicalType::Serialize(Serializer &serializer) const {
	serializer.Write<uint8_t>(static_cast<uint8_t>(id_));
	if (id_ == LogicalTypeId::ARRAY) {
		ChildType().Serialize(serializer);
	}
}

LogicalType LogicalType::Deserialize(Deserializer &source) {
	auto position = source.GetPosition();
	auto id = source.Read<uint8_t>();
	if (!IsKnownTypeId(id)) {
		throw SerializationException("Failed to deserialize: unknown type id %d at position %d", id, position);
	}
	auto type_id = static_cast<LogicalTypeId>(id);
	if (type_id == LogicalTypeId::ARRAY) {
		return LogicalType::ARRAY(LogicalType::Deserialize(source));
	}
	return LogicalType(type_id);
}

void LogicalType::SerializeList(Serializer &serializer, const vector<LogicalType> &types) {
	serializer.Write<int32_t>((int32_t)types.size());
	for (auto &type : types) {
		type.Serialize(serializer);
	}
}

vector<LogicalType> LogicalType::DeserializeList(Deserializer &source) {
	auto position = source.GetPosition();
	auto count = source.Read<int32_t>();
	if (count < 0) {
		throw InternalException("Failed to deserialize: negative type list length %d at position %d", count,
		                        position);
	}
	vector<LogicalType> result;
	for (int32_t i = 0; i < count; i++) {
		result.push_back(LogicalType::Deserialize(source));
	}
	return result;
}

//===--------------------------------------------------------------------===//
// Cast Rules
//===--------------------------------------------------------------------===//
static bool CanCastNumeric(const LogicalType &source, const LogicalType &target) {
	if (target.IsNumeric()) {
		return true;
	}
	switch (target.id()) {
	case LogicalTypeId::TEXT:
	case LogicalTypeId::BOOLEAN:
		return true;
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::TIMESTAMP_TZ:
		return source.IsIntegral() || source.id() == LogicalTypeId::DOUBLE;
	default:
		return false;
	}
}

bool CastRules::CanCast(const LogicalType &source, const LogicalType &target) {
	if (source == target || source.id() == LogicalTypeId::UNDEFINED) {
		return true;
	}
	if (source.IsArray() || target.IsArray()) {
		if (!source.IsArray() || !target.IsArray()) {
			return false;
		}
		return CanCast(source.ChildType(), target.ChildType());
	}
	if (source.IsNumeric()) {
		return CanCastNumeric(source, target);
	}
	switch (source.id()) {
	case LogicalTypeId::BOOLEAN:
		return target.id() == LogicalTypeId::TEXT || target.IsIntegral();
	case LogicalTypeId::TEXT:
		return target.id() != LogicalTypeId::OBJECT && target.id() != LogicalTypeId::ANY;
	case LogicalTypeId::TIMESTAMP:
	case LogicalTypeId::TIMESTAMP_TZ:
		return target.IsTimestamp() || target.id() == LogicalTypeId::BIGINT || target.id() == LogicalTypeId::TEXT;
	default:
		return target.id() == LogicalTypeId::ANY;
	}
}

} // namespace tessera
