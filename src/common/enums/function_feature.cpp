#include "tessera/common/enums/function_feature.hpp"

#include "tessera/common/exception.hpp"
#include "tessera/common/string_util.hpp"

namespace tessera {

string FunctionFeatureToString(FunctionFeature feature) {
	switch (feature) {
	case FunctionFeature::DETERMINISTIC:
		return "DETERMINISTIC";
	case FunctionFeature::NULLABLE:
		return "NULLABLE";
	case FunctionFeature::NON_NULLABLE:
		return "NON_NULLABLE";
	case FunctionFeature::COMPARISON_REPLACEMENT:
		return "COMPARISON_REPLACEMENT";
	default:
		throw InternalException("Unrecognized function feature %d", static_cast<uint8_t>(feature));
	}
}

FunctionFeatures::FunctionFeatures(std::initializer_list<FunctionFeature> features) : mask(0) {
	for (auto feature : features) {
		mask |= Bit(feature);
	}
}

string FunctionFeatures::ToString() const {
	vector<string> names;
	for (auto feature : {FunctionFeature::DETERMINISTIC, FunctionFeature::NULLABLE, FunctionFeature::NON_NULLABLE,
	                     FunctionFeature::COMPARISON_REPLACEMENT}) {
		if (Contains(feature)) {
			names.push_back(FunctionFeatureToString(feature));
		}
	}
	return "[" + StringUtil::Join(names, ", ") + "]";
}

FunctionFeatures FunctionFeatures::FromMask(uint8_t mask, idx_t position) {
	if ((mask & ~VALID_MASK) != 0) {
		throw SerializationException("Failed to deserialize: unknown function feature bits %d at position %d", mask,
		                             position);
	}
	FunctionFeatures result;
	result.mask = mask;
	return result;
}

} // namespace tessera
