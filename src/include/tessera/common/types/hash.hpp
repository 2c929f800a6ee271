//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/types/hash.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

// efficient hash function that maximizes the avalanche effect and minimizes
// bias
// see: https://nullprogram.com/blog/2018/07/31/

inline hash_t MurmurHash64(uint64_t x) {
	x ^= x >> 32;
	x *= 0xd6e8feb86659fd93U;
	x ^= x >> 32;
	x *= 0xd6e8feb86659fd93U;
	x ^= x >> 32;
	return x;
}

//! Combine two hashes; the combination is order dependent
inline hash_t CombineHash(hash_t left, hash_t right) {
	return (left * 0xbf58476d1ce4e5b9U) ^ right;
}

template <class T>
hash_t Hash(T value) {
	return MurmurHash64(static_cast<uint64_t>(value));
}

template <>
hash_t Hash(double val);
template <>
hash_t Hash(const char *val);
template <>
hash_t Hash(char *val);

hash_t Hash(const char *val, size_t size);
hash_t Hash(const string &val);

} // namespace tessera
