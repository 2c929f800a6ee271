#include "tessera/common/protocol_version.hpp"

#include "tessera/common/string_util.hpp"

namespace tessera {

const ProtocolVersion ProtocolVersion::V_4_0_0 = ProtocolVersion(4, 0, 0);
const ProtocolVersion ProtocolVersion::V_4_1_0 = ProtocolVersion(4, 1, 0);
const ProtocolVersion ProtocolVersion::V_4_2_0 = ProtocolVersion(4, 2, 0);

const ProtocolVersion ProtocolVersion::FUNCTION_FILTER_SUPPORT = ProtocolVersion(4, 1, 0);
const ProtocolVersion ProtocolVersion::FUNCTION_SIGNATURE_SUPPORT = ProtocolVersion(4, 2, 0);

ProtocolVersion ProtocolVersion::Latest() {
	return ProtocolVersion(4, 2, 0);
}

string ProtocolVersion::ToString() const {
	return StringUtil::Format("%d.%d.%d", Major(), Minor(), Revision());
}

static bool TryParseComponent(const string &input, uint32_t &result) {
	if (input.empty() || input.size() > 2) {
		return false;
	}
	result = 0;
	for (auto c : input) {
		if (!StringUtil::CharacterIsDigit(c)) {
			return false;
		}
		result = result * 10 + uint32_t(c - '0');
	}
	return true;
}

ProtocolVersion ProtocolVersion::FromString(const string &input_p) {
	auto input = StringUtil::Lower(input_p);
	StringUtil::Trim(input);
	if (input.empty()) {
		throw InvalidInputException("Protocol version string can not be empty");
	}
	if (input == "latest") {
		return Latest();
	}
	if (input[0] == 'v') {
		input = input.substr(1);
	}
	auto components = StringUtil::Split(input, '.');
	uint32_t parts[3];
	if (components.size() != 3 || !TryParseComponent(components[0], parts[0]) ||
	    !TryParseComponent(components[1], parts[1]) || !TryParseComponent(components[2], parts[2])) {
		throw InvalidInputException("The version string '%s' is not a valid protocol version, expected "
		                            "\"major.minor.revision\" or \"latest\"",
		                            input_p);
	}
	return ProtocolVersion(parts[0], parts[1], parts[2]);
}

} // namespace tessera
