#include <stdexcept>

#include <gtest/gtest.h>

#include "CanVss/DBC/DBCImporter.hpp"

using namespace CanVss;

namespace {

    const SignalDefinition& signal_of(const MessageDefinition& def, std::string_view name) {
        auto sig = def.get_signal(name);
        if (!sig)
            throw std::runtime_error("no signal " + std::string(name));
        return **sig;
    }

}

TEST(DBCImporter, KindForWidthAndSign) {
    EXPECT_EQ(kind_for(1, false), SignalKind::boolean);
    EXPECT_EQ(kind_for(1, true), SignalKind::i8);
    EXPECT_EQ(kind_for(7, false), SignalKind::u8);
    EXPECT_EQ(kind_for(12, true), SignalKind::i16);
    EXPECT_EQ(kind_for(16, false), SignalKind::u16);
    EXPECT_EQ(kind_for(24, true), SignalKind::i32);
    EXPECT_EQ(kind_for(32, false), SignalKind::u32);
    EXPECT_FALSE(kind_for(33, false).has_value());
    EXPECT_FALSE(kind_for(0, false).has_value());
}

TEST(DBCImporter, ImportsBodyFile) {
    MappingTable table;
    DBCImporter importer(table);

    ASSERT_TRUE(importer.import_file("test/data/body.dbc"));
    EXPECT_EQ(importer.imported_messages(), 4u);
    // big-endian current, 40-bit odometer, multiplexed ambient light
    EXPECT_EQ(importer.skipped_signals(), 3u);

    EXPECT_EQ(table.message_ids(), (std::vector<canid_t>{ 0x100, 0x101, 0x102, 0x300 }));

    auto headlamp = table.message(0x100);
    ASSERT_TRUE(headlamp.has_value());
    EXPECT_EQ(headlamp->name, "HeadlampControl");
    EXPECT_EQ(headlamp->dlc, 8u);
    EXPECT_EQ(signal_of(*headlamp, "HeadlampStatus").kind, SignalKind::u8);
    EXPECT_EQ(signal_of(*headlamp, "LowBeamOn").kind, SignalKind::boolean);
    EXPECT_EQ(signal_of(*headlamp, "LowBeamOn").start_bit, 8u);

    auto power = table.message(0x101);
    ASSERT_TRUE(power.has_value());
    EXPECT_EQ(power->signal_count(), 2u);
    const auto& lamp = signal_of(*power, "LampPower");
    EXPECT_EQ(lamp.kind, SignalKind::u16);
    EXPECT_EQ(lamp.unit, "W");
    EXPECT_FALSE(lamp.min.has_value());
    const auto& voltage = signal_of(*power, "SupplyVoltage");
    EXPECT_DOUBLE_EQ(voltage.scale, 0.01);
    EXPECT_DOUBLE_EQ(*voltage.max, 40.95);
    EXPECT_FALSE(power->get_signal("LampCurrentMotorola").has_value());

    // extended id flag is stripped
    auto climate = table.message(0x300);
    ASSERT_TRUE(climate.has_value());
    EXPECT_EQ(signal_of(*climate, "CabinTemp").kind, SignalKind::i16);
    EXPECT_DOUBLE_EQ(*signal_of(*climate, "CabinTemp").min, -40.0);
    EXPECT_EQ(signal_of(*climate, "Humidity").kind, SignalKind::u8);
    EXPECT_FALSE(climate->get_signal("Odometer").has_value());

    auto ambient = table.message(0x102);
    ASSERT_TRUE(ambient.has_value());
    EXPECT_TRUE(ambient->get_signal("Page").has_value());
    EXPECT_FALSE(ambient->get_signal("AmbientLight").has_value());
    EXPECT_EQ(signal_of(*ambient, "SensorFault").kind, SignalKind::boolean);
}

TEST(DBCImporter, DefinitionsWithoutRoutesDoNotConvert) {
    MappingTable table;
    DBCImporter importer(table);
    ASSERT_TRUE(importer.import("BO_ 512 Door: 2 Vector__XXX\n SG_ Open : 0|1@1+ (1,0) [0|1] \"\" Vector__XXX\n"));

    EXPECT_TRUE(table.message(0x200).has_value());
    EXPECT_FALSE(table.lookup(0x200).has_value());

    table.add_mapping(0x200, "Open", "Vehicle.Cabin.Door.Row1.DriverSide.IsOpen");
    EXPECT_TRUE(table.lookup(0x200).has_value());
}

TEST(DBCImporter, MalformedSignalLineFails) {
    MappingTable table;
    DBCImporter importer(table);

    const char* src =
        "BO_ 100 Good: 8 Node\n"
        " SG_ Fine : 0|8@1+ (1,0) [0|0] \"\" Node\n"
        " SG_ Broken : 8|@1+ (1,0) [0|0] \"\" Node\n";

    EXPECT_FALSE(importer.import(src));
    // the well-formed part is still registered
    auto def = table.message(100);
    ASSERT_TRUE(def.has_value());
    EXPECT_TRUE(def->get_signal("Fine").has_value());
    EXPECT_FALSE(def->get_signal("Broken").has_value());
}

TEST(DBCImporter, SignalOutsideMessageFails) {
    MappingTable table;
    DBCImporter importer(table);

    EXPECT_FALSE(importer.import(" SG_ Loose : 0|8@1+ (1,0) [0|0] \"\" Node\n"));
    EXPECT_EQ(table.message_count(), 0u);
}

TEST(DBCImporter, SignalPastDlcIsRejected) {
    MappingTable table;
    DBCImporter importer(table);

    const char* src =
        "BO_ 300 Tiny: 1 Node\n"
        " SG_ TooLong : 0|16@1+ (1,0) [0|0] \"\" Node\n"
        "\n"
        "BO_ 301 Fine: 2 Node\n"
        " SG_ Ok : 0|16@1+ (1,0) [0|0] \"\" Node\n";

    EXPECT_FALSE(importer.import(src));
    EXPECT_FALSE(table.message(300).has_value());
    EXPECT_TRUE(table.message(301).has_value());
    EXPECT_EQ(importer.imported_messages(), 1u);
}

TEST(DBCImporter, MissingFile) {
    MappingTable table;
    DBCImporter importer(table);
    EXPECT_FALSE(importer.import_file("test/data/missing.dbc"));
}
