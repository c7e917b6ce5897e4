#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace dfp::logging;

class LoggerTest : public ::testing::Test {
protected:
    dfp::test::TempDir dir{"logger_test"};
    std::filesystem::path log_file;

    void SetUp() override {
        log_file = dir.path() / "logs" / "dfp.log";
        LogSettings settings;
        settings.log_file = log_file.string();
        settings.min_level = boost::log::trivial::trace;
        settings.console = false;
        init_logging(settings);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
    }

    bool log_contains(const std::string& text, int max_retries = 3) {
        for (int retry = 0; retry < max_retries; ++retry) {
            boost::log::core::get()->flush();
            std::ifstream file(log_file);
            std::stringstream buffer;
            buffer << file.rdbuf();
            if (buffer.str().find(text) != std::string::npos) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50 << retry));
        }
        return false;
    }
};

TEST_F(LoggerTest, ParsesSeverityNames) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("DEBUG"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("Info"), boost::log::trivial::info);
    EXPECT_EQ(parse_severity("warn"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("error"), boost::log::trivial::error);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("verbose"), std::invalid_argument);
    EXPECT_THROW(parse_severity(""), std::invalid_argument);
}

TEST_F(LoggerTest, WritesFormattedRecordsToFile) {
    BOOST_LOG_TRIVIAL(info) << "Session store: Created session abc";
    EXPECT_TRUE(std::filesystem::exists(log_file.parent_path()));
    EXPECT_TRUE(log_contains("[info]"));
    EXPECT_TRUE(log_contains("[Thread "));
    EXPECT_TRUE(log_contains("Session store: Created session abc"));
}

TEST_F(LoggerTest, LevelFiltersRecords) {
    set_log_level(boost::log::trivial::warning);
    BOOST_LOG_TRIVIAL(info) << "filtered-out-record";
    BOOST_LOG_TRIVIAL(warning) << "kept-record";

    EXPECT_TRUE(log_contains("kept-record"));
    EXPECT_FALSE(log_contains("filtered-out-record", 1));
}

TEST_F(LoggerTest, ReinitializingAppendsToExistingFile) {
    BOOST_LOG_TRIVIAL(info) << "before-reinit";
    boost::log::core::get()->flush();

    LogSettings settings;
    settings.log_file = log_file.string();
    settings.console = false;
    init_logging(settings);
    BOOST_LOG_TRIVIAL(info) << "after-reinit";

    EXPECT_TRUE(log_contains("before-reinit"));
    EXPECT_TRUE(log_contains("after-reinit"));
}
