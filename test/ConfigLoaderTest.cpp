#include <gtest/gtest.h>

#include "CanVss/Core/CANHelpers.hpp"
#include "CanVss/Mapping/ConfigLoader.hpp"

using namespace CanVss;

namespace {

    constexpr const char* mapping_file = "test/data/vehicle_mapping.json";

    constexpr const char* two_messages = R"({
        "message_definitions": [
            {"id": "0x200", "name": "First", "dlc": 8,
             "signals": [{"name": "A", "start_bit": 0, "bit_length": 8, "kind": "uint8"}]},
            {"id": "0x201", "name": "Second", "dlc": 8,
             "signals": [{"name": "B", "start_bit": 0, "bit_length": 8, "kind": "not_a_kind"}]}
        ],
        "mappings": [
            {"id": "0x200", "signals": [{"name": "A", "destination": "Vehicle.A"}]}
        ]
    })";

}

TEST(ParseIdentifier, Forms) {
    EXPECT_EQ(parse_identifier("0x100"), 0x100u);
    EXPECT_EQ(parse_identifier("0X1a0"), 0x1A0u);
    EXPECT_EQ(parse_identifier("1A0"), 0x1A0u);
    EXPECT_EQ(parse_identifier("416"), 0x416u);
    EXPECT_EQ(parse_identifier("100"), 0x100u);
    EXPECT_EQ(parse_identifier("  0x7FF "), 0x7FFu);
    EXPECT_EQ(parse_identifier("0x1FFFFFFF"), 0x1FFFFFFFu);

    EXPECT_FALSE(parse_identifier("").has_value());
    EXPECT_FALSE(parse_identifier("0x").has_value());
    EXPECT_FALSE(parse_identifier("12G").has_value());
    EXPECT_FALSE(parse_identifier("0x20000000").has_value());
}

TEST(ConfigLoader, LoadsFile) {
    MappingTable table;
    auto summary = ConfigLoader(table).load_file(mapping_file);

    EXPECT_EQ(summary.messages, 3u);
    EXPECT_EQ(summary.mappings, 4u);
    EXPECT_EQ(table.message_ids(), (std::vector<canid_t>{ 0x100, 0x101, 0x1B0 }));

    auto headlamp = table.message(0x100);
    ASSERT_TRUE(headlamp.has_value());
    EXPECT_EQ(headlamp->cycle_time, 100u);
    EXPECT_EQ(headlamp->description, "Headlamp control message");

    auto climate = table.message(0x1B0);
    ASSERT_TRUE(climate.has_value());
    EXPECT_EQ(climate->dlc, 4u);
    ASSERT_EQ(climate->signals.size(), 2u);
    EXPECT_EQ(climate->signals[0].kind, SignalKind::i16);
    EXPECT_DOUBLE_EQ(climate->signals[0].scale, 0.1);
    EXPECT_DOUBLE_EQ(*climate->signals[0].min, -40.0);
    EXPECT_EQ(climate->signals[1].kind, SignalKind::boolean);

    EXPECT_EQ(table.destination(0x100, "HeadlampStatus"), "Vehicle.Body.Lights.IsHighBeamOn");
    EXPECT_EQ(table.destination(0x1B0, "AcActive"), "Vehicle.Cabin.HVAC.IsAirConditioningActive");
}

TEST(ConfigLoader, MissingFileThrows) {
    MappingTable table;
    EXPECT_THROW(ConfigLoader(table).load_file("test/data/does_not_exist.json"), ConfigError);
}

TEST(ConfigLoader, MalformedJsonThrows) {
    MappingTable table;
    EXPECT_THROW(ConfigLoader(table).load_string("{ \"message_definitions\": [ "), ConfigError);
    EXPECT_EQ(table.message_count(), 0u);
}

TEST(ConfigLoader, MissingFieldThrows) {
    MappingTable table;
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"message_definitions": [{"id": "0x10", "dlc": 8, "signals": []}]})"),
                 ConfigError);
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"mappings": [{"id": "0x10", "signals": [{"name": "A"}]}]})"),
                 ConfigError);
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"mappings": [{"id": "zz", "signals": []}]})"), ConfigError);
}

TEST(ConfigLoader, IdTextIsHexAndIntegersAreTakenAsIs) {
    MappingTable table;
    ConfigLoader(table).load_string(R"({"message_definitions": [
        {"id": "100", "name": "Text", "dlc": 8,
         "signals": [{"name": "A", "start_bit": 0, "bit_length": 8, "kind": "uint8"}]},
        {"id": "256", "name": "HexText", "dlc": 8,
         "signals": [{"name": "B", "start_bit": 0, "bit_length": 8, "kind": "uint8"}]},
        {"id": 100, "name": "Number", "dlc": 8,
         "signals": [{"name": "C", "start_bit": 0, "bit_length": 8, "kind": "uint8"}]}]})");

    EXPECT_EQ(table.message_ids(), (std::vector<canid_t>{ 100, 0x100, 0x256 }));
    EXPECT_EQ(table.message(0x100)->name, "Text");
    EXPECT_EQ(table.message(0x256)->name, "HexText");
    EXPECT_EQ(table.message(100)->name, "Number");

    MappingTable numeric;
    ConfigLoader(numeric).load_string(R"({"mappings": [{"id": 256, "signals": [{"name": "S", "destination": "Vehicle.S"}]}]})");
    EXPECT_EQ(numeric.destination(256, "S"), "Vehicle.S");

    EXPECT_THROW(ConfigLoader(table).load_string(R"({"mappings": [{"id": -1, "signals": []}]})"), ConfigError);
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"mappings": [{"id": 536870912, "signals": []}]})"), ConfigError);
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"mappings": [{"id": 1.5, "signals": []}]})"), ConfigError);
}

TEST(ConfigLoader, CanIdIsAnAliasOfId) {
    MappingTable table;
    ConfigLoader(table).load_string(R"({
        "message_definitions": [{"can_id": "0x100", "name": "M", "dlc": 8,
            "signals": [{"name": "S", "start_bit": 0, "bit_length": 8, "kind": "uint8"}]}],
        "mappings": [{"can_id": "0x100", "signals": [{"name": "S", "vss_path": "Vehicle.X"}]}]
    })");

    EXPECT_TRUE(table.message(0x100).has_value());
    EXPECT_EQ(table.destination(0x100, "S"), "Vehicle.X");
}

TEST(ConfigLoader, InvalidGeometryThrows) {
    MappingTable table;
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"message_definitions": [
        {"id": "0x10", "name": "M", "dlc": 1,
         "signals": [{"name": "A", "start_bit": 4, "bit_length": 8, "kind": "uint8"}]}]})"), ConfigError);

    // negative numbers must not wrap into huge unsigned offsets
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"message_definitions": [
        {"id": "0x10", "name": "M", "dlc": 8,
         "signals": [{"name": "A", "start_bit": -8, "bit_length": 16, "kind": "uint16"}]}]})"), ConfigError);
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"message_definitions": [
        {"id": "0x10", "name": "M", "dlc": 8,
         "signals": [{"name": "A", "start_bit": 0, "bit_length": -8, "kind": "uint8"}]}]})"), ConfigError);
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"message_definitions": [
        {"id": "0x10", "name": "M", "dlc": -1, "signals": []}]})"), ConfigError);
    EXPECT_THROW(ConfigLoader(table).load_string(R"({"message_definitions": [
        {"id": "0x10", "name": "M", "dlc": 8, "cycle_time": -100, "signals": []}]})"), ConfigError);
    EXPECT_EQ(table.message_count(), 0u);
}

TEST(ConfigLoader, MergeKeepsItemsBeforeError) {
    MappingTable table;
    table.add_mapping(0x300, "Existing", "Vehicle.Existing");

    EXPECT_THROW(ConfigLoader(table).load_string(two_messages), ConfigError);

    EXPECT_TRUE(table.message(0x200).has_value());
    EXPECT_FALSE(table.message(0x201).has_value());
    // mappings come after the failing definition
    EXPECT_FALSE(table.destination(0x200, "A").has_value());
    EXPECT_EQ(table.destination(0x300, "Existing"), "Vehicle.Existing");
}

TEST(ConfigLoader, ReplaceIsAllOrNothing) {
    MappingTable table;
    install_default_mappings(table);

    EXPECT_THROW(ConfigLoader(table).load_string(two_messages, LoadMode::replace), ConfigError);
    EXPECT_EQ(table.message_ids(), (std::vector<canid_t>{ 0x100, 0x101, 0x102 }));

    ConfigLoader(table).load_file(mapping_file, LoadMode::replace);
    EXPECT_EQ(table.message_ids(), (std::vector<canid_t>{ 0x100, 0x101, 0x1B0 }));
    EXPECT_FALSE(table.destination(0x102, "AmbientLight").has_value());
}

TEST(ConfigLoader, MergeOverwritesPerItem) {
    MappingTable table;
    ConfigLoader loader(table);
    loader.load_file(mapping_file);

    loader.load_string(R"({
        "message_definitions": [{"id": "0x101", "name": "LampPowerV2", "dlc": 8,
            "signals": [{"name": "LampPower", "start_bit": 0, "bit_length": 16, "kind": "uint16", "scale": 0.5}]}],
        "mappings": [{"id": "0x101", "signals": [{"name": "LampPower", "destination": "Vehicle.Power"}]}]
    })");

    EXPECT_EQ(table.message(0x101)->name, "LampPowerV2");
    EXPECT_EQ(table.destination(0x101, "LampPower"), "Vehicle.Power");
    EXPECT_EQ(table.message_count(), 3u);
}

TEST(ConfigLoader, UnknownKindNamesTheSignal) {
    MappingTable table;
    try {
        ConfigLoader(table).load_string(two_messages);
        FAIL() << "expected ConfigError";
    }
    catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("not_a_kind"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("'B'"), std::string::npos);
    }
}

TEST(ConfigLoader, Settings) {
    auto content = read_file(mapping_file);
    ASSERT_TRUE(content.has_value());

    auto settings = load_settings(*content);
    EXPECT_EQ(settings.rx_buffer_size, 500u);
    EXPECT_EQ(settings.log_level, LogLevel::debug);
    EXPECT_FALSE(settings.default_mappings);

    auto defaults = load_settings("{}");
    EXPECT_EQ(defaults.rx_buffer_size, 1000u);
    EXPECT_EQ(defaults.log_level, LogLevel::info);

    EXPECT_THROW(load_settings(R"({"settings": {"rx_buffer_size": 0}})"), ConfigError);
    EXPECT_THROW(load_settings(R"({"settings": {"log_level": "loud"}})"), ConfigError);
}
