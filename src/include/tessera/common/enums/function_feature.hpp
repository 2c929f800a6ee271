//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/enums/function_feature.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

#include <initializer_list>

namespace tessera {

//! Properties of a function that the planner relies on. The ordinal is the bit position on the wire.
enum class FunctionFeature : uint8_t {
	//! Same arguments always produce the same result
	DETERMINISTIC = 0,
	//! The function may return NULL even for non-NULL arguments
	NULLABLE = 1,
	//! The function never returns NULL
	NON_NULLABLE = 2,
	//! A comparison that can be replaced by an index lookup
	COMPARISON_REPLACEMENT = 3
};

string FunctionFeatureToString(FunctionFeature feature);

//! A set of function features
class FunctionFeatures {
public:
	FunctionFeatures() : mask(0) {
	}
	FunctionFeatures(std::initializer_list<FunctionFeature> features); // NOLINT: allow brace initialization

	bool Contains(FunctionFeature feature) const {
		return (mask & Bit(feature)) != 0;
	}
	void Add(FunctionFeature feature) {
		mask |= Bit(feature);
	}
	bool IsEmpty() const {
		return mask == 0;
	}
	string ToString() const;

	uint8_t GetMask() const {
		return mask;
	}
	//! Rebuilds a set from its wire form, throws a SerializationException if unknown bits are set
	static FunctionFeatures FromMask(uint8_t mask, idx_t position);

	bool operator==(const FunctionFeatures &rhs) const {
		return mask == rhs.mask;
	}
	bool operator!=(const FunctionFeatures &rhs) const {
		return mask != rhs.mask;
	}

	static const uint8_t VALID_MASK = 0x0F;

private:
	static uint8_t Bit(FunctionFeature feature) {
		return uint8_t(1 << static_cast<uint8_t>(feature));
	}

	uint8_t mask;
};

} // namespace tessera
