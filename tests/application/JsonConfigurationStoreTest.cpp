#include "application/config/JsonConfigurationStore.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>

using core::config::JsonConfigurationStore;
using namespace core::types;
namespace fs = std::filesystem;

TEST(JsonConfigurationStoreTest, ParsesEntriesWithDefaults) {
    auto printers = JsonConfigurationStore::parse(R"({"printers": [
        {"id": "bar", "name": "Bar", "type": "bluetooth", "address": "/dev/rfcomm0", "model": "EPSON_TM_M30III"},
        {"id": "kitchen", "type": "network", "address": "192.168.1.40", "port": 9101, "active": false}
    ]})", 9100, 9600);

    ASSERT_EQ(printers.size(), 2u);
    EXPECT_EQ(printers[0].id, "bar");
    EXPECT_EQ(printers[0].kind, TransportKind::Bluetooth);
    EXPECT_EQ(printers[0].model, PrinterModel::EpsonTmM30III);
    EXPECT_TRUE(printers[0].active);
    EXPECT_EQ(printers[0].baudRate, 9600u);

    EXPECT_EQ(printers[1].name, "kitchen");
    EXPECT_EQ(printers[1].port, 9101);
    EXPECT_FALSE(printers[1].active);
}

TEST(JsonConfigurationStoreTest, SkipsInvalidAndDuplicateEntries) {
    auto printers = JsonConfigurationStore::parse(R"({"printers": [
        "not an object",
        {"id": "noaddress", "type": "usb"},
        {"id": "badtype", "type": "telepathy", "address": "x"},
        {"id": "wrongtype", "type": "usb", "address": "/dev/ttyUSB0", "port": "ninety"},
        {"id": "ok", "type": "usb", "address": "/dev/ttyUSB0"},
        {"id": "ok", "type": "usb", "address": "/dev/ttyUSB1"}
    ]})", 9100, 9600);

    ASSERT_EQ(printers.size(), 1u);
    EXPECT_EQ(printers[0].address, "/dev/ttyUSB0");
}

TEST(JsonConfigurationStoreTest, MissingPrintersArrayIsEmpty) {
    EXPECT_TRUE(JsonConfigurationStore::parse(R"({"other": 1})", 9100, 9600).empty());
}

TEST(JsonConfigurationStoreTest, LoadKeepsPreviousListOnParseError) {
    std::random_device rd;
    auto path = fs::temp_directory_path() / ("printers_" + std::to_string(rd()) + ".json");

    JsonConfigurationStore store(path.string());
    EXPECT_TRUE(store.load());
    EXPECT_TRUE(store.list().empty());

    std::ofstream(path) << R"({"printers": [{"id": "p", "type": "network", "address": "10.0.0.1"}]})";
    ASSERT_TRUE(store.load());
    ASSERT_EQ(store.list().size(), 1u);
    EXPECT_TRUE(store.find("p").has_value());

    std::ofstream(path) << "{ broken";
    EXPECT_FALSE(store.load());
    EXPECT_EQ(store.list().size(), 1u);

    std::error_code ec;
    fs::remove(path, ec);
}
