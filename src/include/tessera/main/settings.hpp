//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/main/settings.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/main/config.hpp"

namespace tessera {

struct ProtocolVersionSetting {
	static constexpr const char *Name = "protocol_version";
	static constexpr const char *Description = "The protocol version used to exchange plans with other nodes";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::TEXT;
	static void SetGlobal(NodeConfig &config, const Value &parameter);
	static Value GetSetting(const NodeConfig &config);
};

struct EnableLoggingSetting {
	static constexpr const char *Name = "enable_logging";
	static constexpr const char *Description = "Enables the logger";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::BOOLEAN;
	static void SetGlobal(NodeConfig &config, const Value &parameter);
	static Value GetSetting(const NodeConfig &config);
};

struct LoggingLevelSetting {
	static constexpr const char *Name = "logging_level";
	static constexpr const char *Description = "The log level which will be recorded in the log";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::TEXT;
	static void SetGlobal(NodeConfig &config, const Value &parameter);
	static Value GetSetting(const NodeConfig &config);
};

struct EnabledLogTypesSetting {
	static constexpr const char *Name = "enabled_log_types";
	static constexpr const char *Description =
	    "Sets the list of enabled loggers, a comma separated list (e.g. 'wire,resolution')";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::TEXT;
	static void SetGlobal(NodeConfig &config, const Value &parameter);
	static Value GetSetting(const NodeConfig &config);
};

struct DisabledLogTypesSetting {
	static constexpr const char *Name = "disabled_log_types";
	static constexpr const char *Description = "Sets the list of disabled loggers, a comma separated list";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::TEXT;
	static void SetGlobal(NodeConfig &config, const Value &parameter);
	static Value GetSetting(const NodeConfig &config);
};

struct ExplainStyleSetting {
	static constexpr const char *Name = "explain_style";
	static constexpr const char *Description =
	    "Whether EXPLAIN qualifies function names with their schema (qualified or unqualified)";
	static constexpr const LogicalTypeId InputType = LogicalTypeId::TEXT;
	static void SetGlobal(NodeConfig &config, const Value &parameter);
	static Value GetSetting(const NodeConfig &config);
};

} // namespace tessera
