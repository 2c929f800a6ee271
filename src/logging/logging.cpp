#include "tessera/logging/logging.hpp"

#include "tessera/common/exception.hpp"
#include "tessera/common/string_util.hpp"

namespace tessera {

constexpr const char *LogConfig::IN_MEMORY_STORAGE_NAME;
constexpr const char *LogConfig::STDOUT_STORAGE_NAME;
constexpr LogLevel LogConfig::DEFAULT_LOG_LEVEL;
constexpr const char *LogConfig::DEFAULT_LOG_STORAGE;

LogConfig::LogConfig()
    : enabled(false), mode(LogMode::LEVEL_ONLY), level(DEFAULT_LOG_LEVEL), storage(DEFAULT_LOG_STORAGE) {
}

bool LogConfig::IsConsistent() const {
	if (mode == LogMode::LEVEL_ONLY) {
		return enabled_log_types.empty() && disabled_log_types.empty();
	}
	if (mode == LogMode::DISABLE_SELECTED) {
		return enabled_log_types.empty() && !disabled_log_types.empty();
	}
	if (mode == LogMode::ENABLE_SELECTED) {
		return !enabled_log_types.empty() && disabled_log_types.empty();
	}
	return false;
}

LogConfig LogConfig::Create(bool enabled, LogLevel level) {
	return LogConfig(enabled, level, LogMode::LEVEL_ONLY, nullptr, nullptr);
}

LogConfig LogConfig::CreateFromEnabled(bool enabled, LogLevel level, unordered_set<string> &enabled_log_types) {
	return LogConfig(enabled, level, LogMode::ENABLE_SELECTED, enabled_log_types, nullptr);
}

LogConfig LogConfig::CreateFromDisabled(bool enabled, LogLevel level, unordered_set<string> &disabled_log_types) {
	return LogConfig(enabled, level, LogMode::DISABLE_SELECTED, nullptr, disabled_log_types);
}

LogConfig::LogConfig(bool enabled, LogLevel level_p, LogMode mode_p,
                     optional_ptr<unordered_set<string>> enabled_log_types_p,
                     optional_ptr<unordered_set<string>> disabled_log_types_p)
    : enabled(enabled), mode(mode_p), level(level_p), storage(DEFAULT_LOG_STORAGE) {
	if (enabled_log_types_p) {
		enabled_log_types = *enabled_log_types_p;
	}
	if (disabled_log_types_p) {
		disabled_log_types = *disabled_log_types_p;
	}
}

string LogLevelToString(LogLevel level) {
	switch (level) {
	case LogLevel::LOG_TRACE:
		return "TRACE";
	case LogLevel::LOG_DEBUG:
		return "DEBUG";
	case LogLevel::LOG_INFO:
		return "INFO";
	case LogLevel::LOG_WARN:
		return "WARN";
	case LogLevel::LOG_ERROR:
		return "ERROR";
	case LogLevel::LOG_FATAL:
		return "FATAL";
	default:
		throw InternalException("Unrecognized log level %d", static_cast<uint8_t>(level));
	}
}

LogLevel StringToLogLevel(const string &level) {
	auto upper = StringUtil::Upper(level);
	if (upper == "TRACE") {
		return LogLevel::LOG_TRACE;
	} else if (upper == "DEBUG") {
		return LogLevel::LOG_DEBUG;
	} else if (upper == "INFO") {
		return LogLevel::LOG_INFO;
	} else if (upper == "WARN" || upper == "WARNING") {
		return LogLevel::LOG_WARN;
	} else if (upper == "ERROR") {
		return LogLevel::LOG_ERROR;
	} else if (upper == "FATAL") {
		return LogLevel::LOG_FATAL;
	}
	throw InvalidInputException("Unrecognized log level '%s', expected one of TRACE, DEBUG, INFO, WARN, ERROR or FATAL",
	                            level);
}

string LogModeToString(LogMode mode) {
	switch (mode) {
	case LogMode::LEVEL_ONLY:
		return "level_only";
	case LogMode::DISABLE_SELECTED:
		return "disable_selected";
	case LogMode::ENABLE_SELECTED:
		return "enable_selected";
	default:
		throw InternalException("Unrecognized log mode %d", static_cast<uint8_t>(mode));
	}
}

LogMode StringToLogMode(const string &mode) {
	auto lower = StringUtil::Lower(mode);
	if (lower == "level_only") {
		return LogMode::LEVEL_ONLY;
	} else if (lower == "disable_selected") {
		return LogMode::DISABLE_SELECTED;
	} else if (lower == "enable_selected") {
		return LogMode::ENABLE_SELECTED;
	}
	throw InvalidInputException("Unrecognized log mode '%s'", mode);
}

} // namespace tessera
