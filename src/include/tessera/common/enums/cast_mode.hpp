//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/enums/cast_mode.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

#include <initializer_list>

namespace tessera {

enum class CastMode : uint8_t {
	//! Inserted by the analyzer to make argument types match a signature
	IMPLICIT = 0,
	//! Requested by the user with CAST(x AS type) or x::type
	EXPLICIT = 1,
	//! Requested by the user with TRY_CAST(x AS type); a failing conversion yields NULL
	TRY = 2
};

string CastModeToString(CastMode mode);

//! A set of cast modes
class CastModes {
public:
	CastModes() : mask(0) {
	}
	CastModes(std::initializer_list<CastMode> modes); // NOLINT: allow {CastMode::TRY} initialization

	bool Contains(CastMode mode) const {
		return (mask & Bit(mode)) != 0;
	}
	bool IsEmpty() const {
		return mask == 0;
	}
	idx_t Count() const;
	string ToString() const;

	bool operator==(const CastModes &rhs) const {
		return mask == rhs.mask;
	}
	bool operator!=(const CastModes &rhs) const {
		return mask != rhs.mask;
	}

private:
	static uint8_t Bit(CastMode mode) {
		return uint8_t(1 << static_cast<uint8_t>(mode));
	}

	uint8_t mask;
};

} // namespace tessera
