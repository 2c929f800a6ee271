//===----------------------------------------------------------------------===//
//                         Tessera
//
// tessera/main/config.hpp
//
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tessera/common/enums/render_style.hpp"
#include "tessera/common/optional_ptr.hpp"
#include "tessera/common/protocol_version.hpp"
#include "tessera/common/types/value.hpp"
#include "tessera/logging/logging.hpp"

#include <mutex>

namespace tessera {

class Deserializer;
class LogManager;
class Logger;
class NodeConfig;
class Serializer;

typedef void (*set_global_function_t)(NodeConfig &config, const Value &parameter);
typedef Value (*get_setting_function_t)(const NodeConfig &config);

struct ConfigurationOption {
	const char *name;
	const char *description;
	LogicalTypeId parameter_type;
	set_global_function_t set_global;
	get_setting_function_t get_setting;
};

struct NodeConfigOptions {
	//! The protocol version streams created by this node are written and read with
	ProtocolVersion protocol_version = ProtocolVersion::Latest();
	//! The configuration of the node's logger
	LogConfig log_config;
	//! How symbols are rendered in EXPLAIN output
	RenderStyle render_style = RenderStyle::UNQUALIFIED;
};

//! The NodeConfig holds the settings of a cluster node that the expression core depends on
class NodeConfig {
public:
	NodeConfig();
	explicit NodeConfig(NodeConfigOptions options);
	~NodeConfig();

	NodeConfigOptions options;

public:
	static vector<ConfigurationOption> GetOptions();
	static idx_t GetOptionCount();
	static vector<string> GetOptionNames();
	//! Fetch an option by name, returns nullptr if the option can not be found
	static optional_ptr<const ConfigurationOption> GetOptionByName(const string &name);

	void SetOption(const ConfigurationOption &option, const Value &value);
	//! Sets an option, throws an InvalidInputException if no option with that name exists
	void SetOptionByName(const string &name, const Value &value);
	Value GetSettingByName(const string &name) const;

	LogManager &GetLogManager() const {
		return *log_manager;
	}
	Logger &GetLogger() const;

	//! Binds a stream to the protocol version and the logger of this node
	void ConfigureStream(Serializer &serializer) const;
	void ConfigureStream(Deserializer &source) const;

private:
	static const ConfigurationOption &GetOptionOrThrow(const string &name);

	std::mutex config_lock;
	unique_ptr<LogManager> log_manager;
};

} // namespace tessera
