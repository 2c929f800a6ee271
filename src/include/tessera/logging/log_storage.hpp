//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/logging/log_storage.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/logging/logging.hpp"

#include <mutex>

namespace tessera {

//! Interface for writing log entries
class LogStorage {
public:
	LogStorage() {
	}
	virtual ~LogStorage() {
	}

	//! WRITING
	virtual void WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type, const string &log_message) = 0;
	virtual void Flush() = 0;

	//! Erases all stored log entries
	virtual void Truncate();
};

//! Writes one tab-separated line per entry to stdout
class StdOutLogStorage : public LogStorage {
public:
	StdOutLogStorage();
	~StdOutLogStorage() override;

	void WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type, const string &log_message) override;
	void Flush() override;
};

//! Keeps all entries in memory so they can be inspected
class InMemoryLogStorage : public LogStorage {
public:
	InMemoryLogStorage();
	~InMemoryLogStorage() override;

	void WriteLogEntry(int64_t timestamp, LogLevel level, const string &log_type, const string &log_message) override;
	void Flush() override;
	void Truncate() override;

	//! A snapshot of the entries written so far
	vector<LogEntry> GetEntries();
	//! The entries of the given log type
	vector<LogEntry> GetEntries(const string &log_type);

protected:
	std::mutex lock;
	vector<LogEntry> entries;
};

} // namespace tessera
