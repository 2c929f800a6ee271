//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/protocol_version.hpp"
#include "tessera/common/serializer/buffered_deserializer.hpp"
#include "tessera/common/serializer/buffered_serializer.hpp"
#include "tessera/common/types/value.hpp"
#include "tessera/function/builtin_functions.hpp"
#include "tessera/function/function_registry.hpp"
#include "tessera/logging/log_manager.hpp"
#include "tessera/main/config.hpp"
#include "tessera/symbol/function.hpp"
#include "tessera/symbol/literal.hpp"
#include "tessera/symbol/parameter_symbol.hpp"
#include "tessera/symbol/reference.hpp"
#include "tessera/symbol/symbol_util.hpp"
