#include "tessera/symbol/format/function_printer.hpp"

#include "tessera/common/string_util.hpp"
#include "tessera/function/builtin_functions.hpp"
#include "tessera/symbol/format/match_printer.hpp"
#include "tessera/symbol/function.hpp"
#include "tessera/symbol/reference.hpp"

#include <cstring>

namespace tessera {

static string ArithmeticOperator(const string &name) {
	if (name == BuiltinFunctions::ADD) {
		return "+";
	}
	if (name == BuiltinFunctions::SUBTRACT) {
		return "-";
	}
	if (name == BuiltinFunctions::MULTIPLY) {
		return "*";
	}
	if (name == BuiltinFunctions::DIVIDE) {
		return "/";
	}
	if (name == BuiltinFunctions::MOD || name == BuiltinFunctions::MODULUS) {
		return "%";
	}
	throw InternalException("%s is not an arithmetic function", name);
}

string FunctionPrinter::Print(const Function &function, RenderStyle style) {
	auto &arguments = function.Arguments();
	auto &name = function.Info().Ident().Name();
	string result;
	switch (function.Syntax()) {
	case FunctionSyntax::MATCH_PREDICATE:
		return MatchPrinter::Print(function, style);
	case FunctionSyntax::SUBSCRIPT:
		PrintSubscript(function, style, result);
		break;
	case FunctionSyntax::SUBSCRIPT_RECORD:
		PrintSubscriptRecord(function, style, result);
		break;
	case FunctionSyntax::CURRENT_USER:
		result = "CURRENT_USER";
		break;
	case FunctionSyntax::SESSION_USER:
		result = "SESSION_USER";
		break;
	case FunctionSyntax::CURRENT_SCHEMAS:
		result = BuiltinFunctions::CURRENT_SCHEMAS;
		break;
	case FunctionSyntax::CURRENT_SCHEMA:
		result = BuiltinFunctions::CURRENT_SCHEMA;
		break;
	case FunctionSyntax::IS_NULL:
		result = "(" + arguments[0]->ToString(style) + " IS NULL)";
		break;
	case FunctionSyntax::NOT:
		result = "(NOT " + arguments[0]->ToString(style) + ")";
		break;
	case FunctionSyntax::COUNT:
		if (arguments.empty()) {
			result = "count(*)";
			PrintFilter(function, style, result);
		} else {
			PrintFunctionWithParenthesis(function, style, result);
		}
		break;
	case FunctionSyntax::CURRENT_TIMESTAMP:
		if (arguments.empty()) {
			result = "CURRENT_TIMESTAMP";
		} else {
			PrintFunctionWithParenthesis(function, style, result);
		}
		break;
	case FunctionSyntax::ANY_OPERATOR:
		PrintAnyOperator(function, style, result);
		break;
	case FunctionSyntax::CAST:
		PrintCast(function, style, result);
		break;
	case FunctionSyntax::OPERATOR: {
		auto op = name.substr(strlen(BuiltinFunctions::OPERATOR_PREFIX));
		PrintOperator(function, style, StringUtil::Upper(op), result);
		break;
	}
	case FunctionSyntax::EXTRACT:
		PrintExtract(function, style, result);
		break;
	case FunctionSyntax::ARITHMETIC:
		PrintOperator(function, style, ArithmeticOperator(name), result);
		break;
	case FunctionSyntax::GENERIC:
		PrintFunctionWithParenthesis(function, style, result);
		break;
	}
	return result;
}

void FunctionPrinter::PrintSubscript(const Function &function, RenderStyle style, string &result) {
	auto &arguments = function.Arguments();
	auto &base = *arguments[0];
	auto index = arguments[1]->ToString(style);
	if (base.type == SymbolType::REFERENCE && base.ValueType().IsArray()) {
		auto &column = base.Cast<Reference>().Column();
		if (!column.IsRoot()) {
			// subscript on an array nested in an object column: o['arr'][1] is written as o[1]['arr']
			result += column.Name() + "[" + index + "]['" + column.Path()[0] + "']";
			return;
		}
	}
	result += base.ToString(style) + "[" + index + "]";
}

void FunctionPrinter::PrintSubscriptRecord(const Function &function, RenderStyle style, string &result) {
	auto &arguments = function.Arguments();
	result += "(" + arguments[0]->ToString(style) + ")." + arguments[1]->ToString(style);
}

void FunctionPrinter::PrintAnyOperator(const Function &function, RenderStyle style, string &result) {
	auto &arguments = function.Arguments();
	auto &name = function.Info().Ident().Name();
	if (arguments.size() != 2) {
		throw InternalException("Operator %s expects 2 arguments, got %d", name, arguments.size());
	}
	auto op = name.substr(strlen(BuiltinFunctions::ANY_OPERATOR_PREFIX));
	op = StringUtil::Upper(StringUtil::Replace(op, "_", " "));
	result += "(" + arguments[0]->ToString(style) + " " + op + " ANY(" + arguments[1]->ToString(style) + "))";
}

void FunctionPrinter::PrintCast(const Function &function, RenderStyle style, string &result) {
	auto &arguments = function.Arguments();
	auto &name = function.Info().Ident().Name();
	result += name + "(" + arguments[0]->ToString(style);
	if (StringUtil::CIEquals(name, BuiltinFunctions::IMPLICIT_CAST)) {
		// the target type of an implicit cast is passed as a value
		result += ", " + arguments[1]->ToString(style);
	} else {
		result += " AS " + function.Info().ReturnType().ToString();
	}
	result += ")";
}

void FunctionPrinter::PrintOperator(const Function &function, RenderStyle style, const string &op,
                                    string &result) {
	auto &arguments = function.Arguments();
	if (arguments.size() != 2) {
		throw InternalException("Operator %s expects 2 arguments, got %d", function.Info().Ident().Name(),
		                        arguments.size());
	}
	result += "(" + arguments[0]->ToString(style) + " " + op + " " + arguments[1]->ToString(style) + ")";
}

void FunctionPrinter::PrintExtract(const Function &function, RenderStyle style, string &result) {
	auto &name = function.Info().Ident().Name();
	auto field = name.substr(strlen(BuiltinFunctions::EXTRACT_PREFIX));
	result += "extract(" + field + " FROM " + function.Arguments()[0]->ToString(style) + ")";
}

void FunctionPrinter::PrintFunctionWithParenthesis(const Function &function, RenderStyle style, string &result) {
	result += function.Info().Ident().FqnName().ToString(style);
	result += "(";
	result += StringUtil::Join(function.Arguments(), function.Arguments().size(), ", ",
	                           [&](const shared_ptr<Symbol> &argument) { return argument->ToString(style); });
	result += ")";
	PrintFilter(function, style, result);
}

void FunctionPrinter::PrintFilter(const Function &function, RenderStyle style, string &result) {
	auto filter = function.Filter();
	if (filter) {
		result += " FILTER (WHERE " + filter->ToString(style) + ")";
	}
}

} // namespace tessera
