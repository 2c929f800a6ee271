#include "tessera/common/serializer.hpp"

namespace tessera {

template <>
string Deserializer::Read() {
	auto position = GetPosition();
	uint32_t size = Read<uint32_t>();
	if (size == 0) {
		return string();
	}
	if (size > RemainingSize()) {
		throw SerializationException("Failed to deserialize: string length %d at position %d exceeds the %d "
		                             "remaining bytes",
		                             size, position, RemainingSize());
	}
	auto buffer = unique_ptr<data_t[]>(new data_t[size]);
	ReadData(buffer.get(), size);
	return string(const_char_ptr_cast(buffer.get()), size);
}

bool Deserializer::ReadBool() {
	auto position = GetPosition();
	auto value = Read<uint8_t>();
	if (value > 1) {
		throw SerializationException("Failed to deserialize: invalid boolean byte %d at position %d", value,
		                             position);
	}
	return value == 1;
}

void Deserializer::ReadStringVector(vector<string> &list) {
	uint32_t sz = Read<uint32_t>();
	list.clear();
	for (idx_t i = 0; i < sz; i++) {
		list.push_back(Read<string>());
	}
}

} // namespace tessera
