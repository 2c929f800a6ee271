//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/symbol/format/function_printer.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/enums/render_style.hpp"

namespace tessera {

class Function;

//! Renders function calls as SQL text. The shape of the output is chosen by the syntax classification of the call;
//! all arguments are rendered recursively with the same style.
//! A FILTER clause is only expected on aggregate calls, the printer does not check it.
class FunctionPrinter {
public:
	static string Print(const Function &function, RenderStyle style);

private:
	static void PrintSubscript(const Function &function, RenderStyle style, string &result);
	static void PrintSubscriptRecord(const Function &function, RenderStyle style, string &result);
	static void PrintAnyOperator(const Function &function, RenderStyle style, string &result);
	static void PrintCast(const Function &function, RenderStyle style, string &result);
	static void PrintOperator(const Function &function, RenderStyle style, const string &op, string &result);
	static void PrintExtract(const Function &function, RenderStyle style, string &result);
	static void PrintFunctionWithParenthesis(const Function &function, RenderStyle style, string &result);
	static void PrintFilter(const Function &function, RenderStyle style, string &result);
};

} // namespace tessera
