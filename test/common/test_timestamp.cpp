#include "catch.hpp"
#include "tessera/common/exception.hpp"
#include "tessera/common/types/timestamp.hpp"

using namespace tessera;

static void VerifyTimestamp(int32_t year, int32_t month, int32_t day, int32_t hour, int32_t minute, int32_t second,
                            int64_t epoch_seconds) {
	auto stamp = Timestamp::FromDatetime(year, month, day, hour, minute, second, 0);
	REQUIRE(stamp == epoch_seconds * 1000);

	int32_t r_year, r_month, r_day, r_hour, r_minute, r_second, r_msec;
	Timestamp::Convert(stamp, r_year, r_month, r_day, r_hour, r_minute, r_second, r_msec);
	REQUIRE(r_year == year);
	REQUIRE(r_month == month);
	REQUIRE(r_day == day);
	REQUIRE(r_hour == hour);
	REQUIRE(r_minute == minute);
	REQUIRE(r_second == second);
	REQUIRE(r_msec == 0);

	// parse the rendered string back
	REQUIRE(Timestamp::FromString(Timestamp::ToString(stamp, true)) == stamp);
}

TEST_CASE("Verify that timestamp functions work", "[timestamp]") {
	VerifyTimestamp(2019, 8, 26, 8, 52, 6, 1566809526);
	VerifyTimestamp(1970, 1, 1, 0, 0, 0, 0);
	VerifyTimestamp(2000, 10, 10, 10, 10, 10, 971172610);
	VerifyTimestamp(1969, 12, 31, 23, 59, 59, -1);
}

TEST_CASE("Test timestamp parsing", "[timestamp]") {
	REQUIRE(Timestamp::FromString("1970-01-02") == 86400000);
	REQUIRE(Timestamp::FromString("1970-01-01 00:00:01.250") == 1250);
	REQUIRE(Timestamp::FromString(" 1970-01-01T00:01:00Z ") == 60000);
	REQUIRE(Timestamp::ToString(1250, false) == "1970-01-01T00:00:01.250");

	int64_t result;
	string invalid = "2019-02-29";
	REQUIRE_FALSE(Timestamp::TryConvertTimestamp(invalid.c_str(), invalid.size(), result));
	REQUIRE_THROWS_AS(Timestamp::FromString("not a timestamp"), ConversionException);
	REQUIRE_THROWS_AS(Timestamp::FromString("2020-01-01 25:00:00"), ConversionException);
}

TEST_CASE("Test leap years", "[timestamp]") {
	REQUIRE(Timestamp::IsLeapYear(2000));
	REQUIRE(Timestamp::IsLeapYear(2024));
	REQUIRE_FALSE(Timestamp::IsLeapYear(1900));
	REQUIRE(Timestamp::MonthDays(2024, 2) == 29);
	REQUIRE(Timestamp::MonthDays(2023, 2) == 28);
}
