#include "catch.hpp"
#include "tessera/common/string_util.hpp"
#include "tessera/parser/keyword_helper.hpp"

using namespace tessera;

TEST_CASE("Test join vector items", "[string_util]") {
	SECTION("Three string items") {
		vector<string> str_items = {"abc", "def", "ghi"};
		REQUIRE(StringUtil::Join(str_items, ",") == "abc,def,ghi");
	}

	SECTION("No string items") {
		vector<string> str_items;
		REQUIRE(StringUtil::Join(str_items, ",") == "");
	}

	SECTION("Three int items") {
		vector<int> int_items = {1, 2, 3};
		string result =
		    StringUtil::Join(int_items, int_items.size(), ", ", [](const int &item) { return std::to_string(item); });
		REQUIRE(result == "1, 2, 3");
	}
}

TEST_CASE("Test string case and search helpers", "[string_util]") {
	REQUIRE(StringUtil::Upper("not_like") == "NOT_LIKE");
	REQUIRE(StringUtil::Lower("CURRENT_USER") == "current_user");
	REQUIRE(StringUtil::CIEquals("TRY_CAST", "try_cast"));
	REQUIRE_FALSE(StringUtil::CIEquals("cast", "_cast"));
	REQUIRE(StringUtil::StartsWith("op_and", "op_"));
	REQUIRE_FALSE(StringUtil::StartsWith("op", "op_"));
	REQUIRE(StringUtil::Replace("not_like", "_", " ") == "not like");

	string padded = "  4.2.0 \t";
	StringUtil::Trim(padded);
	REQUIRE(padded == "4.2.0");

	auto parts = StringUtil::Split("4.1.0", '.');
	REQUIRE(parts.size() == 3);
	REQUIRE(parts[1] == "1");
}

TEST_CASE("Test printf-style formatting", "[string_util]") {
	REQUIRE(StringUtil::Format("%s(%d)", string("abs"), 42) == "abs(42)");
	REQUIRE(StringUtil::Format("100%%") == "100%");
}

TEST_CASE("Test candidate messages", "[string_util]") {
	vector<string> names = {"count", "concat", "current_user", "abs"};
	auto message = StringUtil::CandidatesErrorMessage(names, "coutn", "Did you mean");
	REQUIRE(StringUtil::StartsWith(message, "\nDid you mean: \"count\""));
	REQUIRE(StringUtil::CandidatesMessage(vector<string>()) == "");
}

TEST_CASE("Test identifier quoting", "[string_util]") {
	REQUIRE(KeywordHelper::WriteOptionallyQuoted("name", '"', false) == "name");
	REQUIRE(KeywordHelper::WriteOptionallyQuoted("Name", '"', false) == "\"Name\"");
	REQUIRE(KeywordHelper::WriteOptionallyQuoted("select", '"', false) == "\"select\"");
	REQUIRE(KeywordHelper::WriteQuoted("it's", '\'') == "'it''s'");
	REQUIRE(KeywordHelper::IsKeyword("FROM"));
	REQUIRE_FALSE(KeywordHelper::IsKeyword("tessera"));
}
