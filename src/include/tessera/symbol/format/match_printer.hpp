//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/format/match_printer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/enums/render_style.hpp"

namespace tessera {

class Function;

//! Renders a full-text match predicate, e.g.
//! MATCH((title 2.0, body), 'term') USING best_fields WITH (fuzziness = 'AUTO')
//!
//! The arguments of the predicate are literals: an object of column name to boost (a NULL boost is omitted), the
//! search term, the match type and an object with the options of the match.
class MatchPrinter {
public:
	static string Print(const Function &function, RenderStyle style);
};

} // namespace tessera
