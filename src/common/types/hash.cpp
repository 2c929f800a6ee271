#include "tessera/common/types/hash.hpp"
#include "tessera/common/helper.hpp"

#include <cmath>
#include <limits>

namespace tessera {

template <>
hash_t Hash(double val) {
	static_assert(sizeof(double) == sizeof(uint64_t), "");
	if (val == 0.0) {
		// Turn negative zero into positive zero
		val = 0.0;
	} else if (std::isnan(val)) {
		val = std::numeric_limits<double>::quiet_NaN();
	}
	uint64_t uval = Load<uint64_t>(const_data_ptr_cast(&val));
	return MurmurHash64(uval);
}

template <>
hash_t Hash(const char *str) {
	return Hash(str, strlen(str));
}

template <>
hash_t Hash(char *val) {
	return Hash<const char *>(val);
}

hash_t Hash(const char *ptr_p, size_t len) {
	auto ptr = const_data_ptr_cast(ptr_p);
	// This seed slightly improves bit distribution, taken from here:
	// https://github.com/martinus/robin-hood-hashing/blob/3.11.5/LICENSE
	// MIT License Copyright (c) 2018-2021 Martin Ankerl
	hash_t h = 0xe17a1465U ^ (len * 0xc6a4a7935bd1e995U);

	// Hash/combine in blocks of 8 bytes
	const auto remainder = len & 7U;
	for (const auto end = ptr + len - remainder; ptr != end; ptr += 8U) {
		h ^= Load<hash_t>(ptr);
		h *= 0xd6e8feb86659fd93U;
	}

	if (remainder != 0) {
		// Load remaining (<8) bytes (with a memcpy)
		hash_t hr = 0;
		memcpy(&hr, ptr, remainder);

		h ^= hr;
		h *= 0xd6e8feb86659fd93U;
	}

	// Finalize
	return MurmurHash64(h);
}

hash_t Hash(const string &val) {
	return Hash(val.c_str(), val.size());
}

} // namespace tessera
