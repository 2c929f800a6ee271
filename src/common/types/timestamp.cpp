#include "tessera/common/types/timestamp.hpp"

#include "tessera/common/exception.hpp"
#include "tessera/common/string_util.hpp"

#include <fmt/format.h>

#include <chrono>

namespace tessera {

// string format is YYYY-MM-DDThh:mm:ss[.fff]Z
// T may be a space
// Z is optional
// ISO 8601

static const int64_t MSECS_PER_SEC = 1000;
static const int64_t MSECS_PER_DAY = 86400000;

bool Timestamp::IsLeapYear(int32_t year) {
	return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

int32_t Timestamp::MonthDays(int32_t year, int32_t month) {
	static const int32_t NORMAL_DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2 && IsLeapYear(year)) {
		return 29;
	}
	return NORMAL_DAYS[month - 1];
}

// days since 1970-01-01 of a proleptic gregorian date
static int64_t DaysFromCivil(int64_t y, int64_t m, int64_t d) {
	y -= m <= 2;
	const int64_t era = (y >= 0 ? y : y - 399) / 400;
	const int64_t yoe = y - era * 400;
	const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

static void CivilFromDays(int64_t z, int32_t &year, int32_t &month, int32_t &day) {
	z += 719468;
	const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const int64_t doe = z - era * 146097;
	const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const int64_t mp = (5 * doy + 2) / 153;
	day = int32_t(doy - (153 * mp + 2) / 5 + 1);
	month = int32_t(mp < 10 ? mp + 3 : mp - 9);
	year = int32_t(yoe + era * 400 + (month <= 2));
}

int64_t Timestamp::FromDatetime(int32_t year, int32_t month, int32_t day, int32_t hour, int32_t minute,
                                int32_t second, int32_t millis) {
	auto days = DaysFromCivil(year, month, day);
	return days * MSECS_PER_DAY + ((int64_t(hour) * 60 + minute) * 60 + second) * MSECS_PER_SEC + millis;
}

void Timestamp::Convert(int64_t millis, int32_t &year, int32_t &month, int32_t &day, int32_t &hour, int32_t &minute,
                        int32_t &second, int32_t &msec) {
	auto days = millis / MSECS_PER_DAY;
	auto rest = millis % MSECS_PER_DAY;
	if (rest < 0) {
		days--;
		rest += MSECS_PER_DAY;
	}
	CivilFromDays(days, year, month, day);
	msec = int32_t(rest % MSECS_PER_SEC);
	rest /= MSECS_PER_SEC;
	second = int32_t(rest % 60);
	rest /= 60;
	minute = int32_t(rest % 60);
	hour = int32_t(rest / 60);
}

static bool ParseDigits(const char *str, idx_t len, idx_t &pos, idx_t count, int32_t &result) {
	result = 0;
	for (idx_t i = 0; i < count; i++) {
		if (pos >= len || !StringUtil::CharacterIsDigit(str[pos])) {
			return false;
		}
		result = result * 10 + (str[pos] - '0');
		pos++;
	}
	return true;
}

bool Timestamp::TryConvertTimestamp(const char *str, idx_t len, int64_t &result) {
	idx_t pos = 0;
	// skip leading spaces
	while (pos < len && StringUtil::CharacterIsSpace(str[pos])) {
		pos++;
	}
	int32_t year, month, day;
	int32_t hour = 0, minute = 0, second = 0, millis = 0;
	if (!ParseDigits(str, len, pos, 4, year)) {
		return false;
	}
	if (pos >= len || str[pos++] != '-' || !ParseDigits(str, len, pos, 2, month)) {
		return false;
	}
	if (pos >= len || str[pos++] != '-' || !ParseDigits(str, len, pos, 2, day)) {
		return false;
	}
	if (month < 1 || month > 12 || day < 1 || day > MonthDays(year, month)) {
		return false;
	}
	if (pos < len && (str[pos] == ' ' || str[pos] == 'T')) {
		pos++;
		if (!ParseDigits(str, len, pos, 2, hour)) {
			return false;
		}
		if (pos >= len || str[pos++] != ':' || !ParseDigits(str, len, pos, 2, minute)) {
			return false;
		}
		if (pos >= len || str[pos++] != ':' || !ParseDigits(str, len, pos, 2, second)) {
			return false;
		}
		if (hour > 23 || minute > 59 || second > 59) {
			return false;
		}
		if (pos < len && str[pos] == '.') {
			pos++;
			// fractional seconds are truncated to milliseconds
			int32_t digits = 0;
			while (pos < len && StringUtil::CharacterIsDigit(str[pos])) {
				if (digits < 3) {
					millis = millis * 10 + (str[pos] - '0');
				}
				digits++;
				pos++;
			}
			if (digits == 0) {
				return false;
			}
			for (; digits < 3; digits++) {
				millis *= 10;
			}
		}
	}
	if (pos < len && str[pos] == 'Z') {
		pos++;
	}
	// skip trailing spaces
	while (pos < len && StringUtil::CharacterIsSpace(str[pos])) {
		pos++;
	}
	if (pos != len) {
		return false;
	}
	result = FromDatetime(year, month, day, hour, minute, second, millis);
	return true;
}

int64_t Timestamp::FromString(const string &str) {
	int64_t result;
	if (!TryConvertTimestamp(str.c_str(), str.size(), result)) {
		throw ConversionException("timestamp field value out of range: \"%s\", expected format is "
		                          "(YYYY-MM-DD HH:MM:SS[.MS])",
		                          str);
	}
	return result;
}

string Timestamp::ToString(int64_t millis, bool with_zone) {
	int32_t year, month, day, hour, minute, second, msec;
	Convert(millis, year, month, day, hour, minute, second, msec);
	return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}{}", year, month, day, hour, minute, second,
	                   msec, with_zone ? "Z" : "");
}

int64_t Timestamp::GetCurrentTimestamp() {
	auto now = std::chrono::system_clock::now();
	return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

} // namespace tessera
