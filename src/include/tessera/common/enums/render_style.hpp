//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/enums/render_style.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

//! How symbols are rendered into text
enum class RenderStyle : uint8_t {
	//! Names are written without their schema/relation qualification
	UNQUALIFIED = 0,
	//! Functions and columns are qualified with their schema/relation where known
	QUALIFIED = 1
};

string RenderStyleToString(RenderStyle style);
RenderStyle RenderStyleFromString(const string &style);

} // namespace tessera
