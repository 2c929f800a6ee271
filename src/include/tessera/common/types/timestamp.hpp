//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/common/types/timestamp.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"

namespace tessera {

//! Timestamps are stored as milliseconds since the unix epoch (UTC)
class Timestamp {
public:
	//! Converts a string of the format YYYY-MM-DD[( |T)hh:mm:ss[.fff]][Z] into a timestamp; returns false on failure
	static bool TryConvertTimestamp(const char *str, idx_t len, int64_t &result);
	//! Converts a string into a timestamp, throws a ConversionException on failure
	static int64_t FromString(const string &str);
	//! Renders the timestamp as ISO-8601, with a trailing "Z" if [with_zone] is set
	static string ToString(int64_t millis, bool with_zone);
	//! The current wall clock time in milliseconds since epoch
	static int64_t GetCurrentTimestamp();

	static int64_t FromDatetime(int32_t year, int32_t month, int32_t day, int32_t hour, int32_t minute,
	                            int32_t second, int32_t millis);
	static void Convert(int64_t millis, int32_t &year, int32_t &month, int32_t &day, int32_t &hour, int32_t &minute,
	                    int32_t &second, int32_t &msec);

	static bool IsLeapYear(int32_t year);
	static int32_t MonthDays(int32_t year, int32_t month);
};

} // namespace tessera
