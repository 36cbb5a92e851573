#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include "cli/app_config.hpp"
#include "store/store_error.hpp"

using namespace docpipe::cli;

class AppConfigTest : public ::testing::Test {
protected:
  std::ostringstream err;

  ProgramOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "docpipe");
    return parse_command_line(static_cast<int>(args.size()), args.data(), err);
  }
};

TEST_F(AppConfigTest, Defaults) {
  const AppConfig config;
  EXPECT_EQ(config.chunk_size, 50000u);
  EXPECT_EQ(config.derived_chunk_size, 50000u);
  EXPECT_EQ(config.direct_load_threshold, 50000u);
  EXPECT_EQ(config.fetch_all_limit, 100u * 1024 * 1024);
  EXPECT_DOUBLE_EQ(config.load_more_threshold, 0.8);
  EXPECT_DOUBLE_EQ(config.line_height, 20.0);
  EXPECT_DOUBLE_EQ(config.viewport_height, 400.0);
  EXPECT_EQ(config.buffer_lines, 10u);
  EXPECT_EQ(config.log_file, "docpipe.log");
  EXPECT_EQ(config.log_level, boost::log::trivial::info);
  EXPECT_FALSE(config.log_to_console);
  EXPECT_NO_THROW(config.validate());
}

TEST_F(AppConfigTest, ValidateRejectsBadValues) {
  AppConfig config;
  config.chunk_size = 0;
  EXPECT_THROW(config.validate(), docpipe::store::InvalidArgumentError);

  config = AppConfig();
  config.load_more_threshold = 0.0;
  EXPECT_THROW(config.validate(), docpipe::store::InvalidArgumentError);
  config.load_more_threshold = 1.5;
  EXPECT_THROW(config.validate(), docpipe::store::InvalidArgumentError);
  config.load_more_threshold = 1.0;
  EXPECT_NO_THROW(config.validate());

  config.viewport_height = 0.0;
  EXPECT_THROW(config.validate(), docpipe::store::InvalidArgumentError);
}

TEST_F(AppConfigTest, NoArgumentsGivesDefaults) {
  const ProgramOptions options = parse({});
  EXPECT_TRUE(options.valid);
  EXPECT_FALSE(options.show_help);
  EXPECT_EQ(options.config.chunk_size, 50000u);
  EXPECT_TRUE(options.initial_file.empty());
}

TEST_F(AppConfigTest, ParsesEveryFlag) {
  const ProgramOptions options = parse({"-c", "1000", "--derived-chunk-size", "2000", "-t", "0.5",
                                        "-H", "600", "-l", "out.log", "-v", "debug", "--console-log",
                                        "-f", "data.json"});
  ASSERT_TRUE(options.valid) << err.str();
  EXPECT_EQ(options.config.chunk_size, 1000u);
  EXPECT_EQ(options.config.derived_chunk_size, 2000u);
  EXPECT_DOUBLE_EQ(options.config.load_more_threshold, 0.5);
  EXPECT_DOUBLE_EQ(options.config.viewport_height, 600.0);
  EXPECT_EQ(options.config.log_file, "out.log");
  EXPECT_EQ(options.config.log_level, boost::log::trivial::debug);
  EXPECT_TRUE(options.config.log_to_console);
  EXPECT_EQ(options.initial_file, "data.json");
}

TEST_F(AppConfigTest, HelpFlag) {
  const ProgramOptions options = parse({"--help"});
  EXPECT_TRUE(options.valid);
  EXPECT_TRUE(options.show_help);
}

TEST_F(AppConfigTest, UnknownFlagIsReported) {
  const ProgramOptions options = parse({"--port", "3000"});
  EXPECT_FALSE(options.valid);
  EXPECT_NE(err.str().find("Unknown argument: --port"), std::string::npos);
  EXPECT_NE(err.str().find("Usage:"), std::string::npos);
}

TEST_F(AppConfigTest, BadValuesAreReported) {
  EXPECT_FALSE(parse({"-c", "abc"}).valid);
  EXPECT_FALSE(parse({"-c", "-5"}).valid);
  EXPECT_FALSE(parse({"-c", "0"}).valid);
  EXPECT_FALSE(parse({"-t", "2"}).valid);
  EXPECT_FALSE(parse({"-v", "loud"}).valid);
  EXPECT_FALSE(parse({"-c"}).valid);
  EXPECT_NE(err.str().find("Missing value for -c"), std::string::npos);
}
