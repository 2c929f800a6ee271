#include "tessera/common/constants.hpp"

#include <limits>

namespace tessera {

const idx_t INVALID_INDEX = std::numeric_limits<idx_t>::max();
const char *DEFAULT_FUNCTION_SCHEMA = "pg_catalog";

} // namespace tessera
