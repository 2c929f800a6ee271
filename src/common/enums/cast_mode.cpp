#include "tessera/common/enums/cast_mode.hpp"

#include "tessera/common/exception.hpp"
#include "tessera/common/string_util.hpp"

namespace tessera {

string CastModeToString(CastMode mode) {
	switch (mode) {
	case CastMode::IMPLICIT:
		return "IMPLICIT";
	case CastMode::EXPLICIT:
		return "EXPLICIT";
	case CastMode::TRY:
		return "TRY";
	default:
		throw InternalException("Unrecognized cast mode %d", static_cast<uint8_t>(mode));
	}
}

CastModes::CastModes(std::initializer_list<CastMode> modes) : mask(0) {
	for (auto mode : modes) {
		mask |= Bit(mode);
	}
}

idx_t CastModes::Count() const {
	idx_t count = 0;
	for (uint8_t bits = mask; bits; bits &= uint8_t(bits - 1)) {
		count++;
	}
	return count;
}

string CastModes::ToString() const {
	vector<string> names;
	for (auto mode : {CastMode::IMPLICIT, CastMode::EXPLICIT, CastMode::TRY}) {
		if (Contains(mode)) {
			names.push_back(CastModeToString(mode));
		}
	}
	return "[" + StringUtil::Join(names, ", ") + "]";
}

} // namespace tessera
