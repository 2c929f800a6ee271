#include "tessera/common/serializer/buffered_deserializer.hpp"

#include <cstring>

namespace tessera {

BufferedDeserializer::BufferedDeserializer(data_ptr_t ptr, idx_t data_size)
    : ptr(ptr), endptr(ptr + data_size), startptr(ptr) {
}

BufferedDeserializer::BufferedDeserializer(BufferedSerializer &serializer)
    : BufferedDeserializer(serializer.data, serializer.blob.size) {
	version = serializer.GetVersion();
}

void BufferedDeserializer::ReadData(data_ptr_t buffer, idx_t read_size) {
	if (ptr + read_size > endptr) { // LCOV_EXCL_START
		throw SerializationException("Failed to deserialize: not enough data in buffer to fulfill read request of "
		                             "%d bytes at position %d",
		                             read_size, GetPosition());
	} // LCOV_EXCL_STOP
	memcpy(buffer, ptr, read_size);
	ptr += read_size;
}

idx_t BufferedDeserializer::GetPosition() const {
	return idx_t(ptr - startptr);
}

idx_t BufferedDeserializer::RemainingSize() const {
	return idx_t(endptr - ptr);
}

} // namespace tessera
