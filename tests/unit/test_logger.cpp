/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <uuidcore/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace uuidcore::utils;
using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setSink(&sink_);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setLevel(LogLevel::TRACE);
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().setColorEnabled(true);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::vector<std::string> lines() const {
        std::vector<std::string> result;
        std::istringstream in(sink_.str());
        std::string line;
        while (std::getline(in, line)) {
            result.push_back(line);
        }
        return result;
    }

    std::ostringstream sink_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "filtered");
    LOG_DEBUG("Test", "filtered");
    LOG_INFO("Test", "filtered");
    LOG_WARN("Test", "kept warn");
    LOG_ERROR("Test", "kept error");

    auto out = lines();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_THAT(out[0], HasSubstr("[WARN ]"));
    EXPECT_THAT(out[0], EndsWith("[Test] kept warn"));
    EXPECT_THAT(out[1], HasSubstr("[ERROR]"));
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);

    LOG_ERROR("Test", "dropped");
    LOG_FATAL("Test", "dropped");

    EXPECT_THAT(sink_.str(), IsEmpty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::FATAL));
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::OFF));
}

TEST_F(LoggerTest, FatalDoesNotTerminate) {
    LOG_FATAL("Test", "still running");
    EXPECT_THAT(sink_.str(), HasSubstr("[FATAL] [Test] still running"));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelName(LogLevel::FATAL), "FATAL");
    EXPECT_EQ(Logger::levelName(LogLevel::OFF), "OFF");
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Info"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::OFF);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST_F(LoggerTest, PlaceholderFormatting) {
    LOG_INFO("Fmt", "{} of {} ids", 3, "five");
    LOG_INFO("Fmt", "no args {}");
    LOG_INFO("Fmt", "missing {} and {}", 1);

    auto out = lines();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_THAT(out[0], EndsWith("[Fmt] 3 of five ids"));
    EXPECT_THAT(out[1], EndsWith("[Fmt] no args {}"));
    EXPECT_THAT(out[2], EndsWith("[Fmt] missing 1 and {}"));
}

TEST_F(LoggerTest, LineStartsWithTimestamp) {
    LOG_INFO("Clock", "tick");

    auto out = lines();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_THAT(out[0], StartsWith("["));
    // [YYYY-MM-DD HH:MM:SS.mmm] is 25 characters
    ASSERT_GT(out[0].size(), 25u);
    EXPECT_EQ(out[0][24], ']');
    EXPECT_EQ(out[0][5], '-');
    EXPECT_EQ(out[0][20], '.');
}

TEST_F(LoggerTest, ColorWrapsLevelTag) {
    Logger::instance().setColorEnabled(true);
    LOG_ERROR("Color", "red");
    EXPECT_THAT(sink_.str(), HasSubstr("\033[31m[ERROR]\033[0m"));
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread" + std::to_string(i), "Message {}", j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    auto out = lines();
    EXPECT_EQ(out.size(), static_cast<size_t>(num_threads * logs_per_thread));
    for (const auto& line : out) {
        EXPECT_THAT(line, HasSubstr("] [Thread"));
    }
}
