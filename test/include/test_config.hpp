//===----------------------------------------------------------------------===//
//
//                         Tessera
//
// test_config.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/protocol_version.hpp"
#include "tessera/main/config.hpp"

namespace tessera {

//! Settings of the unittest binary, parsed from the command line
class TestConfiguration {
public:
	static TestConfiguration &Get();

	//! Consumes a runner argument; returns false if the argument is not ours (it is then passed on to Catch)
	bool ParseArgument(const string &arg, idx_t argc, char **argv, idx_t &i);

	//! The protocol version streams are written with by default (--protocol-version)
	ProtocolVersion GetProtocolVersion() const {
		return protocol_version;
	}
	//! Whether log entries are echoed to stdout (--log)
	bool GetLogToStdout() const {
		return log_to_stdout;
	}

	//! Options for a node that follows the settings of the test run
	NodeConfigOptions GetNodeOptions() const;

private:
	ProtocolVersion protocol_version = ProtocolVersion::Latest();
	bool log_to_stdout = false;
};

} // namespace tessera
