#include "tessera/logging/log_manager.hpp"

#include "tessera/common/helper.hpp"
#include "tessera/logging/log_storage.hpp"

namespace tessera {

unique_ptr<Logger> LogManager::CreateLogger(bool mutable_settings) {
	std::unique_lock<std::mutex> lck(lock);
	if (mutable_settings) {
		return make_uniq<MutableLogger>(config, *this);
	}
	if (!config.enabled) {
		return make_uniq<NopLogger>(*this);
	}
	return make_uniq<ThreadSafeLogger>(config, *this);
}

bool LogManager::RegisterLogStorage(const string &name, shared_ptr<LogStorage> &storage) {
	std::unique_lock<std::mutex> lck(lock);
	auto lname = StringUtil::Lower(name);
	if (registered_log_storages.find(lname) != registered_log_storages.end()) {
		return false;
	}
	registered_log_storages.insert(std::make_pair(lname, storage));
	return true;
}

Logger &LogManager::GlobalLogger() {
	return *global_logger;
}

void LogManager::Flush() {
	std::unique_lock<std::mutex> lck(lock);
	log_storage->Flush();
}

shared_ptr<LogStorage> LogManager::GetLogStorage() {
	std::unique_lock<std::mutex> lck(lock);
	return log_storage;
}

LogManager::LogManager(LogConfig config_p) : config(std::move(config_p)) {
	if (config.storage == LogConfig::STDOUT_STORAGE_NAME) {
		log_storage = make_shared_ptr<StdOutLogStorage>();
	} else {
		log_storage = make_shared_ptr<InMemoryLogStorage>();
		config.storage = LogConfig::IN_MEMORY_STORAGE_NAME;
	}
	global_logger = make_uniq<MutableLogger>(config, *this);
}

LogManager::~LogManager() {
}

void LogManager::WriteLogEntry(int64_t timestamp, const char *log_type, LogLevel log_level, const char *log_message) {
	std::unique_lock<std::mutex> lck(lock);
	log_storage->WriteLogEntry(timestamp, log_level, log_type, log_message);
}

void LogManager::SetEnableLogging(bool enable) {
	std::unique_lock<std::mutex> lck(lock);
	config.enabled = enable;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogMode(LogMode mode) {
	std::unique_lock<std::mutex> lck(lock);
	config.mode = mode;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogLevel(LogLevel level) {
	std::unique_lock<std::mutex> lck(lock);
	config.level = level;
	global_logger->UpdateConfig(config);
}

void LogManager::SetEnabledLogTypes(unordered_set<string> &enabled_log_types) {
	std::unique_lock<std::mutex> lck(lock);
	config.enabled_log_types = enabled_log_types;
	global_logger->UpdateConfig(config);
}

void LogManager::SetDisabledLogTypes(unordered_set<string> &disabled_log_types) {
	std::unique_lock<std::mutex> lck(lock);
	config.disabled_log_types = disabled_log_types;
	global_logger->UpdateConfig(config);
}

void LogManager::SetLogStorage(const string &storage_name) {
	std::unique_lock<std::mutex> lck(lock);
	auto storage_name_to_lower = StringUtil::Lower(storage_name);

	if (config.storage == storage_name_to_lower) {
		return;
	}

	// Flush the old storage, we are going to replace it.
	log_storage->Flush();

	if (storage_name_to_lower == LogConfig::IN_MEMORY_STORAGE_NAME) {
		log_storage = make_shared_ptr<InMemoryLogStorage>();
	} else if (storage_name_to_lower == LogConfig::STDOUT_STORAGE_NAME) {
		log_storage = make_shared_ptr<StdOutLogStorage>();
	} else if (registered_log_storages.find(storage_name_to_lower) != registered_log_storages.end()) {
		log_storage = registered_log_storages[storage_name_to_lower];
	} else {
		throw InvalidInputException("Log storage '%s' is not yet registered", storage_name);
	}
	config.storage = storage_name_to_lower;
}

void LogManager::TruncateLogStorage() {
	std::unique_lock<std::mutex> lck(lock);
	log_storage->Truncate();
}

LogConfig LogManager::GetConfig() {
	std::unique_lock<std::mutex> lck(lock);
	return config;
}

} // namespace tessera
