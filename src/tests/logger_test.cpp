#include <gtest/gtest.h>
#include <boost/log/core.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include "logger/logger.hpp"
#include "store/store_error.hpp"

using namespace docpipe::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_path;

    void SetUp() override {
        log_path = std::filesystem::temp_directory_path() /
            ("docpipe_logger_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + ".log");
        init_logging(log_path.string(), boost::log::trivial::trace);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove(log_path);
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        std::ifstream file(log_path);
        std::stringstream content;
        content << file.rdbuf();
        return content.str().find(text) != std::string::npos;
    }
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
    set_log_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, EnableDisableLogging) {
    disable_logging();
    BOOST_LOG_TRIVIAL(info) << "Hidden while disabled";

    enable_logging();
    BOOST_LOG_TRIVIAL(info) << "Visible once enabled";

    EXPECT_FALSE(log_contains("Hidden while disabled"));
    EXPECT_TRUE(log_contains("Visible once enabled"));
}

TEST_F(LoggerTest, ReinitialisingDoesNotDuplicate) {
    init_logging(log_path.string(), boost::log::trivial::trace);
    BOOST_LOG_TRIVIAL(info) << "Written once";
    boost::log::core::get()->flush();

    std::ifstream file(log_path);
    std::stringstream content;
    content << file.rdbuf();
    const std::string text = content.str();
    const auto first = text.find("Written once");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(text.find("Written once", first + 1), std::string::npos);
}

TEST(ParseSeverityTest, KnownAndUnknownNames) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("loud"), docpipe::store::InvalidArgumentError);
    EXPECT_THROW(parse_severity(""), docpipe::store::InvalidArgumentError);
}
