#include "tessera/common/enums/function_kind.hpp"

#include "tessera/common/exception.hpp"

namespace tessera {

string FunctionKindToString(FunctionKind kind) {
	switch (kind) {
	case FunctionKind::SCALAR:
		return "SCALAR";
	case FunctionKind::AGGREGATE:
		return "AGGREGATE";
	case FunctionKind::TABLE:
		return "TABLE";
	case FunctionKind::WINDOW:
		return "WINDOW";
	default:
		throw InternalException("Unrecognized function kind %d", static_cast<uint8_t>(kind));
	}
}

FunctionKind FunctionKindFromTag(uint8_t tag, idx_t position) {
	if (tag > static_cast<uint8_t>(FunctionKind::WINDOW)) {
		throw SerializationException("Failed to deserialize: unknown function kind %d at position %d", tag, position);
	}
	return static_cast<FunctionKind>(tag);
}

} // namespace tessera
