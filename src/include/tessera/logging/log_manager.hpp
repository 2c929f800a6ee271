//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/logging/log_manager.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/logging/logger.hpp"

namespace tessera {

class LogStorage;

//! The LogManager holds the log configuration and the log storage of a node, and hands out loggers
class LogManager {
	friend class ThreadSafeLogger;
	friend class MutableLogger;

public:
	explicit LogManager(LogConfig config = LogConfig());
	~LogManager();

	//! Creates a logger; a mutable logger follows later config changes
	unique_ptr<Logger> CreateLogger(bool mutable_settings = false);

	//! The node-wide logger, follows config changes
	Logger &GlobalLogger();

	bool RegisterLogStorage(const string &name, shared_ptr<LogStorage> &storage);

	//! The storage the entries are written to
	shared_ptr<LogStorage> GetLogStorage();
	void Flush();

	void SetEnableLogging(bool enable);
	void SetLogMode(LogMode mode);
	void SetLogLevel(LogLevel level);
	void SetEnabledLogTypes(unordered_set<string> &enabled_log_types);
	void SetDisabledLogTypes(unordered_set<string> &disabled_log_types);
	void SetLogStorage(const string &storage_name);
	void TruncateLogStorage();

	LogConfig GetConfig();

protected:
	void WriteLogEntry(int64_t timestamp, const char *log_type, LogLevel log_level, const char *log_message);

	std::mutex lock;
	LogConfig config;

	unique_ptr<Logger> global_logger;

	shared_ptr<LogStorage> log_storage;
	unordered_map<string, shared_ptr<LogStorage>> registered_log_storages;
};

} // namespace tessera
