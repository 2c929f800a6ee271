#include "catch.hpp"
#include "symbol_helper.hpp"
#include "tessera/main/settings.hpp"

#include <map>

using namespace tessera;

TEST_CASE("Test node config configuration", "[api]") {
	NodeConfig config;

	auto options = NodeConfig::GetOptions();
	REQUIRE(options.size() == NodeConfig::GetOptionCount());

	std::map<string, vector<string>> test_options;
	test_options["protocol_version"] = {"4.0.0", "4.1.0", "latest"};
	test_options["enable_logging"] = {"true", "false"};
	test_options["logging_level"] = {"trace", "error"};
	test_options["explain_style"] = {"qualified", "unqualified"};

	REQUIRE(NodeConfig::GetOptionByName("unknownoption") == nullptr);

	for (auto &option : options) {
		auto op = NodeConfig::GetOptionByName(option.name);
		REQUIRE(op);

		auto entry = test_options.find(option.name);
		if (entry != test_options.end()) {
			for (auto &str_val : entry->second) {
				Value val(str_val);
				REQUIRE_NOTHROW(config.SetOption(option, val));
			}
			Value invalid_val("___this_is_probably_invalid");
			REQUIRE_THROWS(config.SetOption(option, invalid_val));
		}
	}
}

TEST_CASE("Test settings are applied to the node", "[api]") {
	NodeConfig config;
	REQUIRE(config.options.protocol_version == ProtocolVersion::Latest());
	REQUIRE(config.options.render_style == RenderStyle::UNQUALIFIED);

	config.SetOptionByName("protocol_version", Value("4.1.0"));
	REQUIRE(config.options.protocol_version == ProtocolVersion::V_4_1_0);
	REQUIRE(config.GetSettingByName("protocol_version").GetString() == "4.1.0");

	config.SetOptionByName("EXPLAIN_STYLE", Value("qualified"));
	REQUIRE(config.options.render_style == RenderStyle::QUALIFIED);
	REQUIRE(config.GetSettingByName("explain_style").GetString() == "qualified");

	config.SetOptionByName("enabled_log_types", Value(" wire , resolution"));
	REQUIRE(config.options.log_config.mode == LogMode::ENABLE_SELECTED);
	REQUIRE(config.GetSettingByName("enabled_log_types").GetString() == "resolution,wire");

	config.SetOptionByName("logging_level", Value("warn"));
	REQUIRE(config.GetSettingByName("logging_level").GetString() == "WARN");

	REQUIRE_THROWS_AS(config.SetOptionByName("enable_logging", Value(LogicalType::BOOLEAN)), InvalidInputException);
}

TEST_CASE("Test unknown settings suggest candidates", "[api]") {
	NodeConfig config;
	try {
		config.SetOptionByName("protocol_versoin", Value("4.2.0"));
		FAIL("expected an exception");
	} catch (InvalidInputException &ex) {
		REQUIRE(string(ex.what()).find("Did you mean: \"protocol_version\"") != string::npos);
	}
	REQUIRE_THROWS_AS(config.GetSettingByName("threads"), InvalidInputException);
}

TEST_CASE("Test streams follow the node config", "[api]") {
	NodeConfigOptions options;
	options.protocol_version = ProtocolVersion::V_4_0_0;
	NodeConfig config(options);

	BufferedSerializer serializer;
	config.ConfigureStream(serializer);
	REQUIRE(serializer.GetVersion() == ProtocolVersion::V_4_0_0);

	BufferedDeserializer source(nullptr, 0);
	config.ConfigureStream(source);
	REQUIRE(source.GetVersion() == ProtocolVersion::V_4_0_0);
	REQUIRE(source.GetLogger());
}

TEST_CASE("Test explain rendering follows the node config", "[api]") {
	NodeConfig config;
	auto call = make_shared_ptr<Function>(
	    Signature::Scalar(FunctionName(DEFAULT_FUNCTION_SCHEMA, "abs"), {LogicalType::INTEGER}, LogicalType::INTEGER),
	    vector<shared_ptr<Symbol>> {ColumnRef("x", LogicalType::INTEGER)}, LogicalType::INTEGER);

	REQUIRE(SymbolUtil::ToExplainString(*call, config) == "abs(x)");
	config.SetOptionByName("explain_style", Value("qualified"));
	REQUIRE(SymbolUtil::ToExplainString(*call, config) == "pg_catalog.abs(doc.t1.x)");
}
