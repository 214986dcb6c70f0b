#include "sta/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace sta::util;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "sta_logger_test.log";
        std::remove(path_.c_str());
        logger().setFile(path_);
        logger().setLevel(LogLevel::Trace);
        logger().setFormatJson(false);
    }

    void TearDown() override {
        logger().setFile("");
        logger().setLevel(LogLevel::Info);
        logger().setFormatJson(false);
        std::remove(path_.c_str());
    }

    std::string contents() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
};

TEST_F(LoggerTest, TextFormat) {
    logger().log(LogLevel::Info, "Indicator built", { {"type", "sma"}, {"name", "SMA(9)"} });
    const auto out = contents();
    EXPECT_EQ(out.front(), '[');
    EXPECT_NE(out.find("] INFO  Indicator built type=sma name=SMA(9)\n"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltering) {
    logger().setLevel(LogLevel::Warn);
    EXPECT_FALSE(logger().enabled(LogLevel::Info));
    EXPECT_TRUE(logger().enabled(LogLevel::Error));
    logger().log(LogLevel::Debug, "hidden");
    logger().log(LogLevel::Error, "shown");
    const auto out = contents();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("ERROR shown"), std::string::npos);
}

TEST_F(LoggerTest, JsonFormatEscapes) {
    logger().setFormatJson(true);
    logger().log(LogLevel::Warn, "say \"hi\"", { {"path", "$[1]"} });
    const auto out = contents();
    EXPECT_NE(out.find("\"lvl\":\"WARN\""), std::string::npos);
    EXPECT_NE(out.find("\"msg\":\"say \\\"hi\\\"\""), std::string::npos);
    EXPECT_NE(out.find("\"path\":\"$[1]\"}"), std::string::npos);
}

TEST_F(LoggerTest, ScopedContextNestsAndRestores) {
    {
        Logger::Scoped outer(std::vector<Field>{ {"feed", "A"} });
        {
            Logger::Scoped inner(std::vector<Field>{ {"feed", "B"} });
            logger().log(LogLevel::Info, "inner");
        }
        logger().log(LogLevel::Info, "outer");
    }
    logger().log(LogLevel::Info, "bare");
    const auto out = contents();
    EXPECT_NE(out.find("inner feed=B"), std::string::npos);
    EXPECT_NE(out.find("outer feed=A"), std::string::npos);
    EXPECT_NE(out.find("bare\n"), std::string::npos);
}

TEST(LogLevelTest, ParseAndName) {
    EXPECT_EQ(parseLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(levelName(LogLevel::Trace), "TRACE");
}
