#include "tessera/parser/keyword_helper.hpp"
#include "tessera/common/string_util.hpp"

namespace tessera {

static const char *RESERVED_KEYWORDS[] = {
    "all",     "alter",   "and",       "any",      "array",  "as",        "asc",    "between", "by",
    "case",    "cast",    "create",    "current_date", "current_schema", "current_time", "current_timestamp",
    "current_user", "default", "delete", "desc",  "distinct", "drop",    "else",   "end",    "escape",
    "except",  "exists",  "extract",   "false",    "filter", "for",       "from",   "full",    "group",
    "having",  "if",      "in",        "insert",   "intersect", "into",   "is",     "join",    "left",
    "like",    "limit",   "match",     "not",      "null",   "nulls",     "object", "offset",  "on",
    "or",      "order",   "right",     "select",   "session_user", "set", "table",  "then",    "true",
    "try_cast", "union",  "update",    "user",     "using",  "values",    "when",   "where",   "with"};

bool KeywordHelper::IsKeyword(const string &text) {
	auto lower = StringUtil::Lower(text);
	for (auto &keyword : RESERVED_KEYWORDS) {
		if (lower == keyword) {
			return true;
		}
	}
	return false;
}

bool KeywordHelper::RequiresQuotes(const string &text, bool allow_caps) {
	if (text.empty()) {
		return true;
	}
	for (size_t i = 0; i < text.size(); i++) {
		if (i > 0 && (text[i] >= '0' && text[i] <= '9')) {
			continue;
		}
		if (text[i] >= 'a' && text[i] <= 'z') {
			continue;
		}
		if (allow_caps) {
			if (text[i] >= 'A' && text[i] <= 'Z') {
				continue;
			}
		}
		if (text[i] == '_') {
			continue;
		}
		return true;
	}
	return IsKeyword(text);
}

string KeywordHelper::WriteQuoted(const string &text, char quote) {
	// 1. Escapes all occurences of 'quote' by doubling them (escape in SQL)
	// 2. Adds quotes around the string
	return string(1, quote) + StringUtil::Replace(text, string(1, quote), string(2, quote)) + string(1, quote);
}

string KeywordHelper::WriteOptionallyQuoted(const string &text, char quote, bool allow_caps) {
	if (!RequiresQuotes(text, allow_caps)) {
		return text;
	}
	return WriteQuoted(text, quote);
}

} // namespace tessera
