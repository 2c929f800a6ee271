#include "tessera/common/enums/render_style.hpp"

#include "tessera/common/exception.hpp"
#include "tessera/common/string_util.hpp"

namespace tessera {

string RenderStyleToString(RenderStyle style) {
	switch (style) {
	case RenderStyle::UNQUALIFIED:
		return "unqualified";
	case RenderStyle::QUALIFIED:
		return "qualified";
	default:
		throw InternalException("Unrecognized render style %d", static_cast<uint8_t>(style));
	}
}

RenderStyle RenderStyleFromString(const string &style) {
	auto lower = StringUtil::Lower(style);
	if (lower == "unqualified") {
		return RenderStyle::UNQUALIFIED;
	} else if (lower == "qualified") {
		return RenderStyle::QUALIFIED;
	}
	throw InvalidInputException("Unrecognized render style '%s', expected 'unqualified' or 'qualified'", style);
}

} // namespace tessera
