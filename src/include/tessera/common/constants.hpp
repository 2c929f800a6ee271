//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/constants.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>

namespace tessera {

using std::move;
using std::shared_ptr;
using std::string;
using std::unique_ptr;
using std::unordered_map;
using std::unordered_set;
using std::vector;

//! a saner size_t for loop indices etc
typedef uint64_t idx_t;

//! The type used for hashes
typedef uint64_t hash_t;

//! data pointers
typedef uint8_t data_t;
typedef data_t *data_ptr_t;
typedef const data_t *const_data_ptr_t;

//! The value used to signify an invalid index entry
extern const idx_t INVALID_INDEX;

//! Schema name of built-in functions and system information pseudo-functions
extern const char *DEFAULT_FUNCTION_SCHEMA;

} // namespace tessera
