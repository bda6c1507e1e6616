#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"

using namespace chunkvault::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = std::filesystem::temp_directory_path() / "chunkvault_logger_test";
        // Clean up any existing logs
        std::filesystem::remove_all(log_dir);
        std::filesystem::create_directories(log_dir);
        log_file = log_dir / "chunkvault.log";

        LogConfig config;
        config.level = "debug";
        config.log_file = log_file.string();
        config.console = false;
        init_logging(config);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove_all(log_dir);
    }

    std::string read_log() {
        boost::log::core::get()->flush();
        std::ifstream file(log_file, std::ios::in | std::ios::binary);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }

    bool log_contains(const std::string& text) {
        return read_log().find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, ParsesSeverityNames) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("debug"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("info"), boost::log::trivial::info);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("error"), boost::log::trivial::error);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
    EXPECT_THROW(parse_severity(""), std::invalid_argument);
}

TEST_F(LoggerTest, WritesFormattedMessagesToFile) {
    BOOST_LOG_TRIVIAL(info) << "File storage: Uploading test message";

    const auto content = read_log();
    EXPECT_NE(content.find("File storage: Uploading test message"), std::string::npos);
    EXPECT_NE(content.find("[info]"), std::string::npos);
    EXPECT_NE(content.find("[Thread "), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowConfiguredLevel) {
    BOOST_LOG_TRIVIAL(trace) << "Hidden trace message";
    BOOST_LOG_TRIVIAL(debug) << "Visible debug message";

    EXPECT_FALSE(log_contains("Hidden trace message"));
    EXPECT_TRUE(log_contains("Visible debug message"));

    set_log_level(boost::log::trivial::error);
    BOOST_LOG_TRIVIAL(warning) << "Suppressed warning";
    BOOST_LOG_TRIVIAL(error) << "Reported error";

    EXPECT_FALSE(log_contains("Suppressed warning"));
    EXPECT_TRUE(log_contains("Reported error"));
}

TEST_F(LoggerTest, ConcurrentLogging) {
    const int NUM_THREADS = 4;
    const int MESSAGES_PER_THREAD = 25;
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                BOOST_LOG_TRIVIAL(info) << "Thread " << t << " message " << i;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const auto content = read_log();
    for (int t = 0; t < NUM_THREADS; ++t) {
        EXPECT_NE(content.find("Thread " + std::to_string(t) + " message " + std::to_string(MESSAGES_PER_THREAD - 1)),
                  std::string::npos);
    }
}

TEST_F(LoggerTest, UnknownLevelRejectedBeforeSinksChange) {
    LogConfig bad;
    bad.level = "chatty";
    EXPECT_THROW(init_logging(bad), std::invalid_argument);

    // Existing file sink keeps working
    BOOST_LOG_TRIVIAL(info) << "Still logging";
    EXPECT_TRUE(log_contains("Still logging"));
}
