#include "test_config.hpp"

#include "tessera/common/exception.hpp"

namespace tessera {

TestConfiguration &TestConfiguration::Get() {
	static TestConfiguration instance;
	return instance;
}

bool TestConfiguration::ParseArgument(const string &arg, idx_t argc, char **argv, idx_t &i) {
	if (arg == "--protocol-version") {
		if (i + 1 >= argc) {
			throw InvalidInputException("--protocol-version expected a version, e.g. 4.1.0");
		}
		protocol_version = ProtocolVersion::FromString(argv[++i]);
		return true;
	}
	if (arg == "--log") {
		log_to_stdout = true;
		return true;
	}
	return false;
}

NodeConfigOptions TestConfiguration::GetNodeOptions() const {
	NodeConfigOptions options;
	options.protocol_version = protocol_version;
	if (log_to_stdout) {
		options.log_config = LogConfig::Create(true, LogLevel::LOG_TRACE);
		options.log_config.storage = LogConfig::STDOUT_STORAGE_NAME;
	}
	return options;
}

} // namespace tessera
