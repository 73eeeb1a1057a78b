#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace vault::logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_dir = make_test_dir("logger_test");
        log_file = log_dir / "vault.log";

        LogOptions options;
        options.console = false;
        options.log_file = log_file;
        options.min_level = boost::log::trivial::trace;
        init_logging(options);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove_all(log_dir);
        ::init_logging();
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        std::ifstream file(log_file, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        return content.str().find(text) != std::string::npos;
    }

    std::filesystem::path log_dir;
    std::filesystem::path log_file;
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    set_min_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, ParsesSeverityNames) {
    EXPECT_EQ(parse_severity("debug"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_FALSE(parse_severity("loud").has_value());
}
