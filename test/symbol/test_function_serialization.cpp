#include "catch.hpp"
#include "symbol_helper.hpp"
#include "test_config.hpp"
#include "tessera/logging/log_storage.hpp"

#include <cstring>

using namespace tessera;

static shared_ptr<Function> FilteredCount() {
	auto predicate = CreateCall("op_>", {ColumnRef("x", LogicalType::INTEGER), IntegerLiteral(0)},
	                            LogicalType::BOOLEAN);
	return CreateCall("count", {ColumnRef("x", LogicalType::INTEGER)}, LogicalType::BIGINT, predicate,
	                  FunctionKind::AGGREGATE);
}

TEST_CASE("Test call serialization at the latest version", "[serialization]") {
	auto call = FilteredCount();
	auto result = RoundTrip(*call, ProtocolVersion::Latest());

	REQUIRE(result->type == SymbolType::FUNCTION);
	auto &decoded = result->Cast<Function>();
	REQUIRE(decoded.Equals(*call));
	REQUIRE(decoded.Hash() == call->Hash());
	REQUIRE(decoded.GetSignature());
	REQUIRE(*decoded.GetSignature() == *call->GetSignature());
	REQUIRE(decoded.Filter());
	REQUIRE(decoded.ValueType() == LogicalType::BIGINT);
	REQUIRE(decoded.ToString(RenderStyle::QUALIFIED) == call->ToString(RenderStyle::QUALIFIED));
}

TEST_CASE("Test call serialization across protocol versions", "[serialization]") {
	auto call = FilteredCount();
	vector<ProtocolVersion> versions {ProtocolVersion::V_4_0_0, ProtocolVersion::V_4_1_0, ProtocolVersion::V_4_2_0};
	for (auto &version : versions) {
		auto result = RoundTrip(*call, version);
		auto &decoded = result->Cast<Function>();

		REQUIRE(decoded.Name() == call->Name());
		REQUIRE(Symbol::ListEquals(decoded.Arguments(), call->Arguments()));
		REQUIRE(decoded.ValueType() == call->ValueType());
		REQUIRE(decoded.Info() == call->Info());

		bool has_filter = version.OnOrAfter(ProtocolVersion::FUNCTION_FILTER_SUPPORT);
		bool has_signature = version.OnOrAfter(ProtocolVersion::FUNCTION_SIGNATURE_SUPPORT);
		REQUIRE(bool(decoded.Filter()) == has_filter);
		REQUIRE(bool(decoded.GetSignature()) == has_signature);
		if (has_filter) {
			REQUIRE(decoded.Filter()->Equals(*call->Filter()));
		}
		// the nested call of the filter follows the same rules
		if (has_filter && !has_signature) {
			REQUIRE(!decoded.Filter()->Cast<Function>().GetSignature());
		}
	}
}

TEST_CASE("Test gated fields only appear in newer encodings", "[serialization]") {
	auto call = CreateCall("abs", {ColumnRef("x", LogicalType::INTEGER)}, LogicalType::INTEGER);
	auto v400 = EncodeSymbol(*call, ProtocolVersion::V_4_0_0);
	auto v410 = EncodeSymbol(*call, ProtocolVersion::V_4_1_0);
	auto v420 = EncodeSymbol(*call, ProtocolVersion::V_4_2_0);

	// the absent filter costs one presence byte
	REQUIRE(v410.size == v400.size + 1);
	// the signature adds a presence byte, the signature and the result type
	REQUIRE(v420.size > v410.size + 1);
	// older encodings are a prefix of newer ones when no filter is present
	REQUIRE(memcmp(v410.data.get(), v420.data.get(), v410.size) == 0);

	// a call without signature only adds the presence byte
	Function legacy(call->Info(), nullptr, call->Arguments(), call->ValueType(), nullptr);
	auto legacy_v420 = EncodeSymbol(legacy, ProtocolVersion::V_4_2_0);
	REQUIRE(legacy_v420.size == v410.size + 1);
}

TEST_CASE("Test calls decoded from older nodes derive their result type", "[serialization]") {
	// the result type of the call differs from the declared return type of its legacy descriptor
	auto info = FunctionInfo(FunctionIdent(FunctionName("_array"), {LogicalType::UNDEFINED}),
	                         LogicalType::ARRAY(LogicalType::UNDEFINED), FunctionKind::SCALAR,
	                         {FunctionFeature::DETERMINISTIC});
	auto signature = make_uniq<Signature>(FunctionName("_array"), FunctionKind::SCALAR,
	                                      vector<LogicalType> {LogicalType::ANY},
	                                      LogicalType::ARRAY(LogicalType::ANY),
	                                      FunctionFeatures {FunctionFeature::DETERMINISTIC}, true);
	auto call = make_shared_ptr<Function>(info, std::move(signature),
	                                      vector<shared_ptr<Symbol>> {Literal::Null(LogicalType::UNDEFINED)},
	                                      LogicalType::ARRAY(LogicalType::TEXT), nullptr);

	for (auto &version : {ProtocolVersion::V_4_0_0, ProtocolVersion::V_4_1_0}) {
		auto result = RoundTrip(*call, version);
		auto &decoded = result->Cast<Function>();
		REQUIRE(!decoded.GetSignature());
		REQUIRE(decoded.ValueType() == LogicalType::ARRAY(LogicalType::UNDEFINED));
		REQUIRE(decoded.ValueType() == decoded.Info().ReturnType());
	}
	auto result = RoundTrip(*call, ProtocolVersion::V_4_2_0);
	REQUIRE(result->ValueType() == LogicalType::ARRAY(LogicalType::TEXT));
}

TEST_CASE("Test decoding calls without signature is logged", "[serialization][logging]") {
	NodeConfig config;
	config.SetOptionByName("enable_logging", Value::BOOLEAN(true));
	config.SetOptionByName("logging_level", Value("debug"));

	auto call = CreateCall("abs", {ColumnRef("x", LogicalType::INTEGER)}, LogicalType::INTEGER);
	RoundTrip(*call, ProtocolVersion::V_4_2_0, &config.GetLogger());
	RoundTrip(*call, ProtocolVersion::V_4_1_0, &config.GetLogger());

	auto storage = config.GetLogManager().GetLogStorage();
	auto entries = dynamic_cast<InMemoryLogStorage &>(*storage).GetEntries("wire");
	REQUIRE(entries.size() == 1);
	REQUIRE(entries[0].level == LogLevel::LOG_DEBUG);
	REQUIRE(entries[0].message == "Decoded call to abs(integer) without signature (protocol version 4.1.0)");
}

TEST_CASE("Test leaf symbol serialization", "[serialization]") {
	vector<shared_ptr<Symbol>> symbols {
	    IntegerLiteral(42),
	    TextLiteral("it's"),
	    Literal::Null(LogicalType::TIMESTAMP_TZ),
	    Literal::Create(Value::ARRAY(LogicalType::INTEGER, {Value::INTEGER(1), Value(LogicalType::INTEGER)})),
	    ColumnRef("o", LogicalType::ARRAY(LogicalType::TEXT), {"a", "b"}),
	    make_shared_ptr<ParameterSymbol>(3, LogicalType::BIGINT)};
	for (auto &symbol : symbols) {
		auto result = RoundTrip(*symbol, ProtocolVersion::V_4_0_0);
		REQUIRE(result->Equals(*symbol));
		REQUIRE(result->ToString(RenderStyle::QUALIFIED) == symbol->ToString(RenderStyle::QUALIFIED));
	}
}

static BinaryData CallPrefix(int32_t argument_count) {
	auto call = CreateCall("abs", {ColumnRef("x", LogicalType::INTEGER)}, LogicalType::INTEGER);
	BufferedSerializer serializer;
	serializer.Write<uint8_t>(static_cast<uint8_t>(SymbolType::FUNCTION));
	call->Info().Serialize(serializer);
	// no filter
	serializer.Write<bool>(false);
	serializer.Write<int32_t>(argument_count);
	return serializer.GetData();
}

static BinaryData Append(BinaryData data, uint8_t byte) {
	BufferedSerializer serializer;
	serializer.WriteData(data.data.get(), data.size);
	serializer.Write<uint8_t>(byte);
	return serializer.GetData();
}

TEST_CASE("Test decoding malformed streams", "[serialization]") {
	SECTION("unknown symbol type tag") {
		BufferedSerializer serializer;
		serializer.Write<uint8_t>(42);
		auto data = serializer.GetData();
		REQUIRE_THROWS_AS(DecodeSymbol(data, ProtocolVersion::Latest()), SerializationException);
	}
	SECTION("unknown tag of an argument") {
		auto data = Append(CallPrefix(1), 42);
		try {
			DecodeSymbol(data, ProtocolVersion::V_4_1_0);
			FAIL("expected an exception");
		} catch (SerializationException &ex) {
			REQUIRE(string(ex.what()).find("unknown symbol type tag 42") != string::npos);
		}
	}
	SECTION("missing arguments") {
		auto data = CallPrefix(2);
		REQUIRE_THROWS_AS(DecodeSymbol(data, ProtocolVersion::V_4_1_0), SerializationException);
	}
	SECTION("negative argument count") {
		auto data = CallPrefix(-1);
		REQUIRE_THROWS_AS(DecodeSymbol(data, ProtocolVersion::V_4_1_0), InternalException);
	}
	SECTION("truncated stream") {
		auto call = FilteredCount();
		auto data = EncodeSymbol(*call, ProtocolVersion::Latest());
		for (idx_t size = 0; size < data.size; size++) {
			BufferedDeserializer source(data.data.get(), size);
			REQUIRE_THROWS_AS(Symbol::Deserialize(source), SerializationException);
		}
	}
	SECTION("unknown result type") {
		auto call = CreateCall("abs", {ColumnRef("x", LogicalType::INTEGER)}, LogicalType::INTEGER);
		auto data = EncodeSymbol(*call, ProtocolVersion::Latest());
		// the last byte is the type id of the result
		data.data[data.size - 1] = 0x63;
		REQUIRE_THROWS_AS(DecodeSymbol(data, ProtocolVersion::Latest()), SerializationException);
	}
	SECTION("wildcard result type") {
		auto call = CreateCall("abs", {ColumnRef("x", LogicalType::INTEGER)}, LogicalType::INTEGER);
		auto data = EncodeSymbol(*call, ProtocolVersion::Latest());
		data.data[data.size - 1] = static_cast<uint8_t>(LogicalTypeId::ANY);
		try {
			DecodeSymbol(data, ProtocolVersion::Latest());
			FAIL("expected an exception");
		} catch (SerializationException &ex) {
			REQUIRE(string(ex.what()).find("result type any") != string::npos);
		}
	}
	SECTION("string length beyond the end of the stream") {
		BufferedSerializer serializer;
		serializer.Write<uint8_t>(static_cast<uint8_t>(SymbolType::FUNCTION));
		// no schema
		serializer.Write<bool>(false);
		serializer.Write<uint32_t>(0xFFFFFFF0);
		serializer.Write<uint8_t>('a');
		auto data = serializer.GetData();
		try {
			DecodeSymbol(data, ProtocolVersion::Latest());
			FAIL("expected an exception");
		} catch (SerializationException &ex) {
			REQUIRE(string(ex.what()).find("string length 4294967280 at position 2 exceeds the 1 remaining bytes") !=
			        string::npos);
		}
	}
}

TEST_CASE("Test streams inherit the version of the node", "[serialization]") {
	NodeConfig config;
	config.SetOptionByName("protocol_version", Value("4.0.0"));

	auto call = FilteredCount();
	BufferedSerializer serializer;
	config.ConfigureStream(serializer);
	call->Serialize(serializer);

	BufferedDeserializer source(serializer);
	config.ConfigureStream(source);
	auto result = Symbol::Deserialize(source);
	REQUIRE(source.Finished());
	REQUIRE(!result->Cast<Function>().Filter());
	REQUIRE(!result->Cast<Function>().GetSignature());
}

TEST_CASE("Test call serialization at the protocol version of the test run", "[serialization]") {
	NodeConfig config(TestConfiguration::Get().GetNodeOptions());
	auto version = config.options.protocol_version;

	auto call = FilteredCount();
	auto result = RoundTrip(*call, version, &config.GetLogger());
	auto &decoded = result->Cast<Function>();
	REQUIRE(decoded.Info() == call->Info());
	REQUIRE(bool(decoded.Filter()) == version.OnOrAfter(ProtocolVersion::FUNCTION_FILTER_SUPPORT));
	REQUIRE(bool(decoded.GetSignature()) == version.OnOrAfter(ProtocolVersion::FUNCTION_SIGNATURE_SUPPORT));
	REQUIRE(decoded.ToString(RenderStyle::UNQUALIFIED).find("count(x)") == 0);
}
