//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/protocol_version.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

//! The wire protocol version negotiated with a peer node. Fields that were added to the wire format later are
//! gated on the version they were introduced in, so nodes of different versions can exchange plans during a
//! rolling upgrade.
struct ProtocolVersion {
public:
	ProtocolVersion() : id(0) {
	}
	explicit ProtocolVersion(uint32_t id) : id(id) {
	}
	ProtocolVersion(uint32_t major, uint32_t minor, uint32_t revision)
	    : id(major * 1000000 + minor * 10000 + revision * 100 + 99) {
	}

	uint32_t id;

public:
	uint32_t Major() const {
		return id / 1000000;
	}
	uint32_t Minor() const {
		return (id / 10000) % 100;
	}
	uint32_t Revision() const {
		return (id / 100) % 100;
	}

	bool OnOrAfter(const ProtocolVersion &other) const {
		return id >= other.id;
	}
	bool Before(const ProtocolVersion &other) const {
		return id < other.id;
	}
	bool operator==(const ProtocolVersion &other) const {
		return id == other.id;
	}
	bool operator!=(const ProtocolVersion &other) const {
		return id != other.id;
	}

	//! e.g. "4.2.0"
	string ToString() const;

	//! Parses "major.minor.revision" (optionally prefixed with "v") or "latest"
	static ProtocolVersion FromString(const string &input);
	static ProtocolVersion Latest();

	//! Known protocol versions
	static const ProtocolVersion V_4_0_0;
	static const ProtocolVersion V_4_1_0;
	static const ProtocolVersion V_4_2_0;

	//! First version that transmits the FILTER clause of aggregate calls
	static const ProtocolVersion FUNCTION_FILTER_SUPPORT;
	//! First version that transmits resolved function signatures
	static const ProtocolVersion FUNCTION_SIGNATURE_SUPPORT;
};

} // namespace tessera
