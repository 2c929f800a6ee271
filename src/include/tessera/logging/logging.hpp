//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/logging/logging.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/constants.hpp"
#include "tessera/common/optional_ptr.hpp"

namespace tessera {

//! Logging levels, can be used to filter logs
enum class LogLevel : uint8_t {
	LOG_TRACE = 10,
	LOG_DEBUG = 20,
	LOG_INFO = 30,
	LOG_WARN = 40,
	LOG_ERROR = 50,
	LOG_FATAL = 60
};

//! Logging mode, determines how the log types are used to filter
enum class LogMode : uint8_t {
	//! Only the log level is used to filter logs
	LEVEL_ONLY = 0,
	//! All log types except the disabled ones are logged
	DISABLE_SELECTED = 1,
	//! Only the enabled log types are logged
	ENABLE_SELECTED = 2,
};

string LogLevelToString(LogLevel level);
//! Parses "trace", "debug", ... (case insensitive)
LogLevel StringToLogLevel(const string &level);
string LogModeToString(LogMode mode);
LogMode StringToLogMode(const string &mode);

struct LogConfig {
	constexpr static const char *IN_MEMORY_STORAGE_NAME = "memory";
	constexpr static const char *STDOUT_STORAGE_NAME = "stdout";

	constexpr static LogLevel DEFAULT_LOG_LEVEL = LogLevel::LOG_INFO;
	constexpr static const char *DEFAULT_LOG_STORAGE = IN_MEMORY_STORAGE_NAME;

	LogConfig();

	static LogConfig Create(bool enabled, LogLevel level);
	static LogConfig CreateFromEnabled(bool enabled, LogLevel level, unordered_set<string> &enabled_log_types);
	static LogConfig CreateFromDisabled(bool enabled, LogLevel level, unordered_set<string> &disabled_log_types);

	bool IsConsistent() const;

	bool enabled;
	LogMode mode;
	LogLevel level;
	string storage;

	unordered_set<string> enabled_log_types;
	unordered_set<string> disabled_log_types;

protected:
	LogConfig(bool enabled, LogLevel level, LogMode mode, optional_ptr<unordered_set<string>> enabled_log_types,
	          optional_ptr<unordered_set<string>> disabled_log_types);
};

//! A single entry written to a log storage
struct LogEntry {
	//! Milliseconds since epoch
	int64_t timestamp;
	LogLevel level;
	string log_type;
	string message;
};

} // namespace tessera
