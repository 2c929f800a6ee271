#include "catch.hpp"
#include "tessera/common/serializer/buffered_deserializer.hpp"
#include "tessera/common/serializer/buffered_serializer.hpp"
#include "tessera/common/types.hpp"

using namespace tessera;

TEST_CASE("Basic serializer test", "[serializer]") {
	BufferedSerializer serializer(4);
	serializer.Write<int32_t>(33);
	serializer.Write<uint64_t>(42);
	serializer.WriteString("hello");
	serializer.WriteString("");
	auto data = serializer.GetData();

	BufferedDeserializer source(data.data.get(), data.size);
	REQUIRE(source.Read<int32_t>() == 33);
	REQUIRE(source.Read<uint64_t>() == 42);
	REQUIRE(source.Read<string>() == "hello");
	REQUIRE(source.Read<string>() == "");
	REQUIRE(source.Finished());
}

TEST_CASE("Reading past the end of a buffer fails", "[serializer]") {
	BufferedSerializer serializer;
	serializer.Write<uint16_t>(7);
	auto data = serializer.GetData();

	BufferedDeserializer source(data.data.get(), data.size);
	REQUIRE_THROWS_AS(source.Read<int32_t>(), SerializationException);
}

TEST_CASE("String lengths are checked against the remaining bytes", "[serializer]") {
	BufferedSerializer serializer;
	serializer.Write<uint32_t>(0xFFFFFFF0);
	serializer.Write<uint32_t>(0);
	auto data = serializer.GetData();

	BufferedDeserializer source(data.data.get(), data.size);
	REQUIRE(source.RemainingSize() == 8);
	REQUIRE_THROWS_AS(source.Read<string>(), SerializationException);
	REQUIRE(source.RemainingSize() == 4);
}

TEST_CASE("Booleans only accept 0 and 1", "[serializer]") {
	BufferedSerializer serializer;
	serializer.Write<bool>(true);
	serializer.Write<uint8_t>(2);
	auto data = serializer.GetData();

	BufferedDeserializer source(data.data.get(), data.size);
	REQUIRE(source.ReadBool());
	REQUIRE_THROWS_AS(source.ReadBool(), SerializationException);
}

TEST_CASE("Type serialization", "[serializer]") {
	vector<LogicalType> types = {LogicalType::INTEGER, LogicalType::ARRAY(LogicalType::ARRAY(LogicalType::TEXT)),
	                             LogicalType::TIMESTAMP_TZ, LogicalType::UNDEFINED};
	BufferedSerializer serializer;
	LogicalType::SerializeList(serializer, types);
	auto data = serializer.GetData();

	BufferedDeserializer source(data.data.get(), data.size);
	auto result = LogicalType::DeserializeList(source);
	REQUIRE(result == types);
	REQUIRE(source.Finished());
}

TEST_CASE("Unknown type ids are rejected", "[serializer]") {
	BufferedSerializer serializer;
	serializer.Write<uint8_t>(42);
	auto data = serializer.GetData();

	BufferedDeserializer source(data.data.get(), data.size);
	REQUIRE_THROWS_AS(LogicalType::Deserialize(source), SerializationException);
}

TEST_CASE("Negative list lengths are internal errors", "[serializer]") {
	BufferedSerializer serializer;
	serializer.Write<int32_t>(-1);
	auto data = serializer.GetData();

	BufferedDeserializer source(data.data.get(), data.size);
	REQUIRE_THROWS_AS(LogicalType::DeserializeList(source), InternalException);
}

TEST_CASE("Streams carry the protocol version", "[serializer]") {
	BufferedSerializer serializer;
	REQUIRE(serializer.GetVersion() == ProtocolVersion::Latest());
	serializer.SetVersion(ProtocolVersion::V_4_0_0);
	serializer.Write<int32_t>(1);

	BufferedDeserializer source(serializer);
	REQUIRE(source.GetVersion() == ProtocolVersion::V_4_0_0);
	REQUIRE(source.Read<int32_t>() == 1);
}
