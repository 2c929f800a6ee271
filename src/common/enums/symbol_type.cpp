#include "tessera/common/enums/symbol_type.hpp"

namespace tessera {

string SymbolTypeToString(SymbolType type) {
	switch (type) {
	case SymbolType::LITERAL:
		return "LITERAL";
	case SymbolType::REFERENCE:
		return "REFERENCE";
	case SymbolType::PARAMETER:
		return "PARAMETER";
	case SymbolType::FUNCTION:
		return "FUNCTION";
	default:
		return "INVALID";
	}
}

} // namespace tessera
