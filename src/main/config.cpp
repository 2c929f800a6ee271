#include "tessera/main/config.hpp"

#include "tessera/common/serializer.hpp"
#include "tessera/common/string_util.hpp"
#include "tessera/logging/log_manager.hpp"
#include "tessera/main/settings.hpp"

namespace tessera {

#define TESSERA_GLOBAL(_PARAM)                                                                                        \
	{ _PARAM::Name, _PARAM::Description, _PARAM::InputType, _PARAM::SetGlobal, _PARAM::GetSetting }

#define FINAL_SETTING                                                                                                  \
	{ nullptr, nullptr, LogicalTypeId::UNDEFINED, nullptr, nullptr }

static const ConfigurationOption internal_options[] = {TESSERA_GLOBAL(DisabledLogTypesSetting),
                                                       TESSERA_GLOBAL(EnableLoggingSetting),
                                                       TESSERA_GLOBAL(EnabledLogTypesSetting),
                                                       TESSERA_GLOBAL(ExplainStyleSetting),
                                                       TESSERA_GLOBAL(LoggingLevelSetting),
                                                       TESSERA_GLOBAL(ProtocolVersionSetting),
                                                       FINAL_SETTING};

NodeConfig::NodeConfig() : NodeConfig(NodeConfigOptions()) {
}

NodeConfig::NodeConfig(NodeConfigOptions options_p) : options(std::move(options_p)) {
	log_manager = make_uniq<LogManager>(options.log_config);
	// the log manager normalizes the storage name
	options.log_config = log_manager->GetConfig();
}

NodeConfig::~NodeConfig() {
}

vector<ConfigurationOption> NodeConfig::GetOptions() {
	vector<ConfigurationOption> result;
	for (idx_t index = 0; internal_options[index].name; index++) {
		result.push_back(internal_options[index]);
	}
	return result;
}

idx_t NodeConfig::GetOptionCount() {
	idx_t count = 0;
	for (idx_t index = 0; internal_options[index].name; index++) {
		count++;
	}
	return count;
}

vector<string> NodeConfig::GetOptionNames() {
	vector<string> names;
	for (idx_t index = 0; internal_options[index].name; index++) {
		names.emplace_back(internal_options[index].name);
	}
	return names;
}

optional_ptr<const ConfigurationOption> NodeConfig::GetOptionByName(const string &name) {
	auto lname = StringUtil::Lower(name);
	for (idx_t index = 0; internal_options[index].name; index++) {
		D_ASSERT(StringUtil::Lower(internal_options[index].name) == string(internal_options[index].name));
		if (internal_options[index].name == lname) {
			return internal_options + index;
		}
	}
	return nullptr;
}

const ConfigurationOption &NodeConfig::GetOptionOrThrow(const string &name) {
	auto option = GetOptionByName(name);
	if (!option) {
		throw InvalidInputException("Unrecognized configuration parameter \"%s\"%s", name,
		                            StringUtil::CandidatesErrorMessage(GetOptionNames(), name, "Did you mean"));
	}
	return *option;
}

void NodeConfig::SetOption(const ConfigurationOption &option, const Value &value) {
	std::lock_guard<std::mutex> l(config_lock);
	Value input;
	string error;
	if (!value.TryCastAs(LogicalType(option.parameter_type), input, &error)) {
		throw InvalidInputException("Invalid value for setting \"%s\": %s", option.name, error);
	}
	if (input.IsNull()) {
		throw InvalidInputException("Setting \"%s\" can not be set to NULL", option.name);
	}
	option.set_global(*this, input);
}

void NodeConfig::SetOptionByName(const string &name, const Value &value) {
	SetOption(GetOptionOrThrow(name), value);
}

Value NodeConfig::GetSettingByName(const string &name) const {
	return GetOptionOrThrow(name).get_setting(*this);
}

Logger &NodeConfig::GetLogger() const {
	return log_manager->GlobalLogger();
}

void NodeConfig::ConfigureStream(Serializer &serializer) const {
	serializer.SetVersion(options.protocol_version);
}

void NodeConfig::ConfigureStream(Deserializer &source) const {
	source.SetVersion(options.protocol_version);
	source.SetLogger(&log_manager->GlobalLogger());
}

} // namespace tessera
