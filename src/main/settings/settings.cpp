#include "tessera/main/settings.hpp"

#include "tessera/common/string_util.hpp"
#include "tessera/logging/log_manager.hpp"

#include <algorithm>

namespace tessera {

constexpr const char *ProtocolVersionSetting::Name;
constexpr const char *ProtocolVersionSetting::Description;
constexpr const LogicalTypeId ProtocolVersionSetting::InputType;
constexpr const char *EnableLoggingSetting::Name;
constexpr const char *EnableLoggingSetting::Description;
constexpr const LogicalTypeId EnableLoggingSetting::InputType;
constexpr const char *LoggingLevelSetting::Name;
constexpr const char *LoggingLevelSetting::Description;
constexpr const LogicalTypeId LoggingLevelSetting::InputType;
constexpr const char *EnabledLogTypesSetting::Name;
constexpr const char *EnabledLogTypesSetting::Description;
constexpr const LogicalTypeId EnabledLogTypesSetting::InputType;
constexpr const char *DisabledLogTypesSetting::Name;
constexpr const char *DisabledLogTypesSetting::Description;
constexpr const LogicalTypeId DisabledLogTypesSetting::InputType;
constexpr const char *ExplainStyleSetting::Name;
constexpr const char *ExplainStyleSetting::Description;
constexpr const LogicalTypeId ExplainStyleSetting::InputType;

static unordered_set<string> ParseLogTypes(const string &input) {
	unordered_set<string> result;
	for (auto &entry : StringUtil::Split(input, ',')) {
		auto log_type = entry;
		StringUtil::Trim(log_type);
		if (!log_type.empty()) {
			result.insert(log_type);
		}
	}
	return result;
}

static string LogTypesToString(const unordered_set<string> &log_types) {
	vector<string> sorted(log_types.begin(), log_types.end());
	std::sort(sorted.begin(), sorted.end());
	return StringUtil::Join(sorted, ",");
}

//===----------------------------------------------------------------------===//
// Protocol Version
//===----------------------------------------------------------------------===//
void ProtocolVersionSetting::SetGlobal(NodeConfig &config, const Value &input) {
	config.options.protocol_version = ProtocolVersion::FromString(input.GetString());
}

Value ProtocolVersionSetting::GetSetting(const NodeConfig &config) {
	return Value(config.options.protocol_version.ToString());
}

//===----------------------------------------------------------------------===//
// Enable Logging
//===----------------------------------------------------------------------===//
void EnableLoggingSetting::SetGlobal(NodeConfig &config, const Value &input) {
	config.GetLogManager().SetEnableLogging(input.GetBoolean());
	config.options.log_config = config.GetLogManager().GetConfig();
}

Value EnableLoggingSetting::GetSetting(const NodeConfig &config) {
	return Value::BOOLEAN(config.options.log_config.enabled);
}

//===----------------------------------------------------------------------===//
// Logging Level
//===----------------------------------------------------------------------===//
void LoggingLevelSetting::SetGlobal(NodeConfig &config, const Value &input) {
	config.GetLogManager().SetLogLevel(StringToLogLevel(input.GetString()));
	config.options.log_config = config.GetLogManager().GetConfig();
}

Value LoggingLevelSetting::GetSetting(const NodeConfig &config) {
	return Value(LogLevelToString(config.options.log_config.level));
}

//===----------------------------------------------------------------------===//
// Enabled Log Types
//===----------------------------------------------------------------------===//
void EnabledLogTypesSetting::SetGlobal(NodeConfig &config, const Value &input) {
	auto &log_manager = config.GetLogManager();
	auto log_types = ParseLogTypes(input.GetString());
	log_manager.SetEnabledLogTypes(log_types);
	log_manager.SetLogMode(log_types.empty() ? LogMode::LEVEL_ONLY : LogMode::ENABLE_SELECTED);
	config.options.log_config = log_manager.GetConfig();
}

Value EnabledLogTypesSetting::GetSetting(const NodeConfig &config) {
	return Value(LogTypesToString(config.options.log_config.enabled_log_types));
}

//===----------------------------------------------------------------------===//
// Disabled Log Types
//===----------------------------------------------------------------------===//
void DisabledLogTypesSetting::SetGlobal(NodeConfig &config, const Value &input) {
	auto &log_manager = config.GetLogManager();
	auto log_types = ParseLogTypes(input.GetString());
	log_manager.SetDisabledLogTypes(log_types);
	log_manager.SetLogMode(log_types.empty() ? LogMode::LEVEL_ONLY : LogMode::DISABLE_SELECTED);
	config.options.log_config = log_manager.GetConfig();
}

Value DisabledLogTypesSetting::GetSetting(const NodeConfig &config) {
	return Value(LogTypesToString(config.options.log_config.disabled_log_types));
}

//===----------------------------------------------------------------------===//
// Explain Style
//===----------------------------------------------------------------------===//
void ExplainStyleSetting::SetGlobal(NodeConfig &config, const Value &input) {
	config.options.render_style = RenderStyleFromString(input.GetString());
}

Value ExplainStyleSetting::GetSetting(const NodeConfig &config) {
	return Value(RenderStyleToString(config.options.render_style));
}

} // namespace tessera
