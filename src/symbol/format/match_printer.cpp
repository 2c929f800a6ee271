#include "tessera/symbol/format/match_printer.hpp"

#include "tessera/symbol/function.hpp"
#include "tessera/symbol/literal.hpp"

namespace tessera {

static void PrintColumns(const Value &columns, string &result) {
	auto &names = columns.GetObjectKeys();
	auto &boosts = columns.GetChildren();
	result += "(";
	for (idx_t i = 0; i < names.size(); i++) {
		if (i > 0) {
			result += ", ";
		}
		result += names[i];
		if (!boosts[i].IsNull()) {
			result += " " + boosts[i].ToString();
		}
	}
	result += ")";
}

static void PrintOptions(const Value &options, string &result) {
	auto &keys = options.GetObjectKeys();
	if (keys.empty()) {
		return;
	}
	auto &values = options.GetChildren();
	result += " WITH (";
	for (idx_t i = 0; i < keys.size(); i++) {
		if (i > 0) {
			result += ", ";
		}
		result += keys[i] + " = ";
		if (!values[i].IsNull()) {
			result += values[i].ToSQLString();
		}
	}
	result += ")";
}

string MatchPrinter::Print(const Function &function, RenderStyle style) {
	auto &arguments = function.Arguments();
	D_ASSERT(arguments.size() == 4);
	string result = "MATCH(";
	PrintColumns(arguments[0]->Cast<Literal>().GetValue(), result);
	result += ", ";
	result += arguments[1]->ToString(style);
	result += ") USING ";
	result += arguments[2]->Cast<Literal>().GetValue().GetString();
	PrintOptions(arguments[3]->Cast<Literal>().GetValue(), result);
	return result;
}

} // namespace tessera
