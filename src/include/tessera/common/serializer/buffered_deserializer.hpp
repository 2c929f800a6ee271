//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/serializer/buffered_deserializer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/serializer.hpp"
#include "tessera/common/serializer/buffered_serializer.hpp"

namespace tessera {

class BufferedDeserializer : public Deserializer {
public:
	BufferedDeserializer(data_ptr_t ptr, idx_t data_size);
	explicit BufferedDeserializer(BufferedSerializer &serializer);

	data_ptr_t ptr;
	data_ptr_t endptr;

public:
	void ReadData(data_ptr_t buffer, idx_t read_size) override;
	idx_t GetPosition() const override;
	idx_t RemainingSize() const override;
	//! Whether or not every byte of the buffer has been consumed
	bool Finished() const {
		return ptr == endptr;
	}

private:
	data_ptr_t startptr;
};

} // namespace tessera
