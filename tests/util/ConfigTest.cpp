#include "sta/util/Config.hpp"
#include "sta/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

using sta::util::Config;

namespace {

// Warnings from deliberately bad input stay out of the test output.
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { sta::util::logger().setLevel(sta::util::LogLevel::Error); }
    void TearDown() override { sta::util::logger().setLevel(sta::util::LogLevel::Info); }
};

} // namespace

TEST_F(ConfigTest, Defaults) {
    Config c;
    EXPECT_EQ(c.defaultPeriod, 9u);
    EXPECT_EQ(c.extremumPeriod, 14u);
    EXPECT_EQ(c.cciPeriod, 20u);
    EXPECT_EQ(c.macdFast, 12u);
    EXPECT_EQ(c.macdSlow, 26u);
    EXPECT_EQ(c.macdSignal, 9u);
    EXPECT_EQ(c.keltnerPeriod, 10u);
    EXPECT_DOUBLE_EQ(c.chandelierK, 3.0);
    EXPECT_EQ(c.logLevel, "info");
    EXPECT_FALSE(c.logJson);
}

TEST_F(ConfigTest, ParsesKeyValues) {
    std::istringstream in(
            "# indicator defaults\n"
            "default_period = 20\n"
            "; another comment\n"
            "\n"
            "bbands_k=2.5\r\n"
            "stoch_smooth= 5\n"
            "log_level = debug\n"
            "log_json = true\n");
    Config c;
    EXPECT_TRUE(c.loadFromStream(in));
    EXPECT_EQ(c.defaultPeriod, 20u);
    EXPECT_DOUBLE_EQ(c.bbandsK, 2.5);
    EXPECT_EQ(c.stochSmooth, 5u);
    EXPECT_EQ(c.logLevel, "debug");
    EXPECT_TRUE(c.logJson);
}

TEST_F(ConfigTest, BadValuesKeepDefaults) {
    std::istringstream in(
            "rsi_period=0\n"
            "atr_period=-4\n"
            "mfi_period=abc\n"
            "keltner_k=-1\n"
            "chandelier_k=inf\n"
            "not_a_key=1\n"
            "no equals sign here\n");
    Config c;
    EXPECT_TRUE(c.loadFromStream(in));
    EXPECT_EQ(c.rsiPeriod, 14u);
    EXPECT_EQ(c.atrPeriod, 14u);
    EXPECT_EQ(c.mfiPeriod, 14u);
    EXPECT_DOUBLE_EQ(c.keltnerK, 2.0);
    EXPECT_DOUBLE_EQ(c.chandelierK, 3.0);
}

TEST_F(ConfigTest, MacdOrderFallsBack) {
    std::istringstream in("macd_fast=30\nmacd_slow=10\nmacd_signal=4\n");
    Config c;
    c.loadFromStream(in);
    EXPECT_EQ(c.macdFast, 12u);
    EXPECT_EQ(c.macdSlow, 26u);
    EXPECT_EQ(c.macdSignal, 4u);
}

TEST_F(ConfigTest, LoadFromFile) {
    Config c;
    EXPECT_FALSE(c.loadFromFile(::testing::TempDir() + "sta_missing_config.ini"));

    const std::string path = ::testing::TempDir() + "sta_config_test.ini";
    {
        std::ofstream out(path);
        out << "extremum_period=30\nmacd_fast=5\nmacd_slow=35\n";
    }
    EXPECT_TRUE(c.loadFromFile(path));
    EXPECT_EQ(c.extremumPeriod, 30u);
    EXPECT_EQ(c.macdFast, 5u);
    EXPECT_EQ(c.macdSlow, 35u);
    std::remove(path.c_str());
}

TEST_F(ConfigTest, ApplyLoggingConfiguresLogger) {
    std::istringstream in("log_level=error\nlog_json=false\n");
    Config c;
    c.loadFromStream(in);
    sta::util::logger().setLevel(sta::util::LogLevel::Trace);
    c.applyLogging();
    EXPECT_EQ(sta::util::logger().level(), sta::util::LogLevel::Error);
    EXPECT_FALSE(sta::util::logger().enabled(sta::util::LogLevel::Warn));
}
