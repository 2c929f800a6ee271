//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/logging/logger.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/exception.hpp"
#include "tessera/common/string_util.hpp"
#include "tessera/logging/logging.hpp"

#include <atomic>
#include <mutex>

namespace tessera {

class LogManager;

// Main logging macro, checks the level and type before formatting the message
#define TESSERA_LOG_INTERNAL(LOGGER, LOG_TYPE, LOG_LEVEL, ...)                                                       \
	{                                                                                                                  \
		auto &logger_ref = (LOGGER);                                                                                   \
		if (logger_ref.ShouldLog(LOG_TYPE, LOG_LEVEL)) {                                                               \
			logger_ref.WriteLog(LOG_TYPE, LOG_LEVEL, ::tessera::StringUtil::Format(__VA_ARGS__));                      \
		}                                                                                                              \
	}

#define TESSERA_LOG_TRACE(LOGGER, LOG_TYPE, ...) TESSERA_LOG_INTERNAL(LOGGER, LOG_TYPE, LogLevel::LOG_TRACE, __VA_ARGS__)
#define TESSERA_LOG_DEBUG(LOGGER, LOG_TYPE, ...) TESSERA_LOG_INTERNAL(LOGGER, LOG_TYPE, LogLevel::LOG_DEBUG, __VA_ARGS__)
#define TESSERA_LOG_INFO(LOGGER, LOG_TYPE, ...)  TESSERA_LOG_INTERNAL(LOGGER, LOG_TYPE, LogLevel::LOG_INFO, __VA_ARGS__)
#define TESSERA_LOG_WARN(LOGGER, LOG_TYPE, ...)  TESSERA_LOG_INTERNAL(LOGGER, LOG_TYPE, LogLevel::LOG_WARN, __VA_ARGS__)
#define TESSERA_LOG_ERROR(LOGGER, LOG_TYPE, ...) TESSERA_LOG_INTERNAL(LOGGER, LOG_TYPE, LogLevel::LOG_ERROR, __VA_ARGS__)

//! Main logging interface
class Logger {
public:
	explicit Logger(LogManager &manager) : manager(manager) {
	}
	virtual ~Logger() {
	}

	virtual bool ShouldLog(const char *log_type, LogLevel log_level) = 0;
	virtual void WriteLog(const char *log_type, LogLevel log_level, const char *message) = 0;
	void WriteLog(const char *log_type, LogLevel log_level, const string &message);

	virtual void Flush() = 0;

	virtual bool IsMutable() {
		return false;
	}
	virtual void UpdateConfig(LogConfig &new_config) {
		throw InternalException("Cannot update the config of an immutable logger");
	}

protected:
	LogManager &manager;
};

//! Logger that is used when logging is disabled, does nothing
class NopLogger : public Logger {
public:
	explicit NopLogger(LogManager &manager) : Logger(manager) {
	}
	using Logger::WriteLog;
	bool ShouldLog(const char *log_type, LogLevel log_level) override {
		return false;
	}
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override {
	}
	void Flush() override {
	}
};

//! Thread-safe logger whose config is a snapshot taken at creation time
class ThreadSafeLogger : public Logger {
public:
	ThreadSafeLogger(LogConfig &config_p, LogManager &manager);
	using Logger::WriteLog;

	bool ShouldLog(const char *log_type, LogLevel log_level) override;
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override;
	void Flush() override;

protected:
	const LogConfig config;
};

//! Thread-safe logger whose config can be changed at run time
class MutableLogger : public Logger {
public:
	MutableLogger(LogConfig &config_p, LogManager &manager);
	using Logger::WriteLog;

	bool ShouldLog(const char *log_type, LogLevel log_level) override;
	void WriteLog(const char *log_type, LogLevel log_level, const char *message) override;
	void Flush() override;

	bool IsMutable() override {
		return true;
	}
	void UpdateConfig(LogConfig &new_config) override;

protected:
	// Atomics for lock-free log setting checks
	std::atomic<bool> enabled;
	std::atomic<LogMode> mode;
	std::atomic<LogLevel> level;

	std::mutex lock;
	LogConfig config;
};

} // namespace tessera
