#include "tessera/logging/log_storage.hpp"

#include "tessera/common/exception.hpp"
#include "tessera/common/printer.hpp"
#include "tessera/common/types/timestamp.hpp"

namespace tessera {

void LogStorage::Truncate() {
	throw NotImplementedException("Not implemented for this LogStorage: TruncateLogStorage");
}

StdOutLogStorage::StdOutLogStorage() {
}

StdOutLogStorage::~StdOutLogStorage() {
}

void StdOutLogStorage::WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type,
                                     const string &log_message) {
	Printer::RawPrint(OutputStream::STREAM_STDOUT, Timestamp::ToString(timestamp, true) + "\t" + log_type + "\t" +
	                                                   LogLevelToString(level) + "\t" + log_message + "\n");
}

void StdOutLogStorage::Flush() {
	Printer::Flush(OutputStream::STREAM_STDOUT);
}

InMemoryLogStorage::InMemoryLogStorage() {
}

InMemoryLogStorage::~InMemoryLogStorage() {
}

void InMemoryLogStorage::WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type,
                                       const string &log_message) {
	std::lock_guard<std::mutex> lck(lock);
	LogEntry entry;
	entry.timestamp = timestamp;
	entry.level = level;
	entry.log_type = log_type;
	entry.message = log_message;
	entries.push_back(std::move(entry));
}

void InMemoryLogStorage::Flush() {
	// NOP
}

void InMemoryLogStorage::Truncate() {
	std::lock_guard<std::mutex> lck(lock);
	entries.clear();
}

vector<LogEntry> InMemoryLogStorage::GetEntries() {
	std::lock_guard<std::mutex> lck(lock);
	return entries;
}

vector<LogEntry> InMemoryLogStorage::GetEntries(const string &log_type) {
	std::lock_guard<std::mutex> lck(lock);
	vector<LogEntry> result;
	for (auto &entry : entries) {
		if (entry.log_type == log_type) {
			result.push_back(entry);
		}
	}
	return result;
}

} // namespace tessera
