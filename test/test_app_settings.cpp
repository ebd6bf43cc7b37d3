/**
 * @file test_app_settings.cpp
 * @brief Settings file parsing
 */

#include <gtest/gtest.h>

#include "AppSettings.h"

#include <cstdio>
#include <fstream>
#include <string>

using namespace Tapir;

namespace {

std::string writeFile(const std::string& name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream file(path, std::ios::trunc);
    file << contents;
    return path;
}

} // namespace

TEST(AppSettings, Defaults) {
    AppSettings settings;
    EXPECT_EQ(RNS::LOG_NOTICE, settings.log_level);
    EXPECT_EQ("simulated", settings.platform);
    EXPECT_EQ("TAPIR", settings.name_filter);
    EXPECT_TRUE(settings.auto_connect);
    EXPECT_EQ("pcm16", settings.codec);

    BLE::LinkConfig config = settings.linkConfig();
    EXPECT_EQ(BLE::MTU::REQUESTED, config.requested_mtu);
    EXPECT_EQ(BLE::Timing::SCAN_TIMEOUT_MS, config.scan_timeout_ms);
}

TEST(AppSettings, LoadsKeysAndSkipsNoise) {
    std::string path = writeFile("tapir_settings.ini",
        "# comment\n"
        "; another\n"
        "[link]\n"
        "Name_Filter = desk\n"
        "scan_timeout_ms=2500\n"
        "auto_connect = no\n"
        "last_device = AA:BB:CC:DD:EE:FF\n"
        "this line has no equals\n"
        "mystery = 3\n"
        "\n"
        "[voice]\n"
        "sample_rate = 8000\n"
        "log_level = debug\n");

    AppSettings settings;
    ASSERT_TRUE(settings.load(path));
    EXPECT_EQ("desk", settings.name_filter);
    EXPECT_EQ(2500u, settings.scan_timeout_ms);
    EXPECT_FALSE(settings.auto_connect);
    EXPECT_EQ("AA:BB:CC:DD:EE:FF", settings.last_device);
    EXPECT_EQ(8000u, settings.sample_rate);
    EXPECT_EQ(RNS::LOG_DEBUG, settings.log_level);
    EXPECT_EQ("desk", settings.linkConfig().name_filter);
    std::remove(path.c_str());
}

TEST(AppSettings, BadValuesKeepDefaults) {
    AppSettings settings;
    EXPECT_FALSE(settings.set("requested_mtu", "12"));
    EXPECT_FALSE(settings.set("requested_mtu", "9000"));
    EXPECT_FALSE(settings.set("scan_timeout_ms", "-5"));
    EXPECT_FALSE(settings.set("auto_connect", "maybe"));
    EXPECT_FALSE(settings.set("log_level", "loud"));
    EXPECT_FALSE(settings.set("unknown_key", "1"));

    EXPECT_EQ(BLE::MTU::REQUESTED, settings.requested_mtu);
    EXPECT_EQ(BLE::Timing::SCAN_TIMEOUT_MS, settings.scan_timeout_ms);
    EXPECT_TRUE(settings.auto_connect);
    EXPECT_EQ(RNS::LOG_NOTICE, settings.log_level);
}

TEST(AppSettings, MissingFileKeepsDefaults) {
    AppSettings settings;
    EXPECT_FALSE(settings.load("/nonexistent-dir/tapir.ini"));
    EXPECT_EQ("simulated", settings.platform);
}

TEST(AppSettings, SaveThenLoad) {
    std::string path = ::testing::TempDir() + "tapir_saved.ini";

    AppSettings original;
    original.last_device = "SIM-TAPIR-0001";
    original.requested_mtu = 247;
    original.auto_connect = false;
    original.log_level = RNS::LOG_WARNING;
    ASSERT_TRUE(original.save(path));

    AppSettings loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ("SIM-TAPIR-0001", loaded.last_device);
    EXPECT_EQ(247, loaded.requested_mtu);
    EXPECT_FALSE(loaded.auto_connect);
    EXPECT_EQ(RNS::LOG_WARNING, loaded.log_level);
    std::remove(path.c_str());
}

TEST(AppSettings, ParseLogLevel) {
    RNS::LogLevel level;
    ASSERT_TRUE(parseLogLevel("ERROR", level));
    EXPECT_EQ(RNS::LOG_ERROR, level);
    ASSERT_TRUE(parseLogLevel("2", level));
    EXPECT_EQ(static_cast<RNS::LogLevel>(2), level);
    EXPECT_FALSE(parseLogLevel("", level));
}
