#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "cli/cli.hpp"
#include "service/fetch_client.hpp"
#include "transform/builtin_transforms.hpp"
#include "test_utils.hpp"

using namespace docpipe;
using namespace docpipe::cli;

class CLITest : public ::testing::Test {
protected:
  store::ContentStore store;
  transform::TransformCatalog catalog;
  std::unique_ptr<transform::TransformPipeline> pipeline;
  std::unique_ptr<service::ChunkFetchService> service;
  std::unique_ptr<service::LocalFetchClient> fetch_client;
  std::istringstream in;
  std::ostringstream out;
  std::unique_ptr<CLI> shell;

  void SetUp() override {
    init_test_logging(boost::log::trivial::fatal);
    transform::register_builtin_transforms(catalog);
    pipeline = std::make_unique<transform::TransformPipeline>(store, catalog);
    service = std::make_unique<service::ChunkFetchService>(store, *pipeline);
    fetch_client = std::make_unique<service::LocalFetchClient>(*service);
  }

  void TearDown() override {
    shell.reset();
  }

  void start(const std::string& input, AppConfig config = small_config()) {
    in.str(input);
    shell = std::make_unique<CLI>(*service, *pipeline, *fetch_client, config, in, out);
  }

  static AppConfig small_config() {
    AppConfig config;
    config.chunk_size = 4;
    config.derived_chunk_size = 4;
    config.direct_load_threshold = 10;
    return config;
  }

  // Output produced by a single command
  std::string run(const std::string& command) {
    out.str("");
    shell->execute(command);
    return out.str();
  }

  static std::string numbered_lines(int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
      text += "row " + std::to_string(i) + "\n";
    }
    return text;
  }
};

TEST_F(CLITest, PasteFormatAndViewOutput) {
  start("{\"a\":1}\n.\n");

  EXPECT_NE(run("paste").find("Loaded 7 characters into input (2 chunks)"), std::string::npos);
  EXPECT_NE(run("format").find("Formatted input with json into output (12 characters, 3 chunks)"),
            std::string::npos);

  // 12 characters is above the direct threshold, so this goes through the loader
  const std::string shown = run("view output");
  EXPECT_NE(shown.find("{\n  \"a\": 1\n}\n"), std::string::npos) << shown;
  EXPECT_EQ(shell->viewed_slot(), "output");
  EXPECT_TRUE(shell->loader().is_complete());
  EXPECT_NE(shown.find("3/3 chunks loaded"), std::string::npos) << shown;
}

TEST_F(CLITest, SmallEntriesAreShownWhole) {
  start("short\n.\n");
  run("paste");

  const std::string shown = run("view input");
  EXPECT_NE(shown.find("short\n"), std::string::npos);
  EXPECT_EQ(shown.find("chunks loaded"), std::string::npos);
  EXPECT_EQ(shell->loader().state(), client::LoaderState::State::EMPTY);
}

TEST_F(CLITest, TransformErrorsAreShownVerbatim) {
  start("{bad\n.\n");
  run("paste");

  const std::string result = run("format");
  EXPECT_NE(result.find("Parse error on line 1"), std::string::npos) << result;
  EXPECT_FALSE(store.has(OUTPUT_SLOT));
}

TEST_F(CLITest, StoreErrorsAreShownGenerically) {
  start("");
  EXPECT_NE(run("view input").find("Operation failed"), std::string::npos);
  EXPECT_NE(run("format").find("Operation failed"), std::string::npos);
}

TEST_F(CLITest, NewInputClearsOutput) {
  start("[1]\n.\n[2]\n.\n");
  run("paste");
  run("format");
  ASSERT_TRUE(store.has(OUTPUT_SLOT));

  run("paste");
  EXPECT_FALSE(store.has(OUTPUT_SLOT));
  EXPECT_EQ(store.get_content(INPUT_SLOT)->text(), "[2]");
}

TEST_F(CLITest, ToolSelection) {
  start("");
  EXPECT_EQ(shell->active_tool(), "json");

  EXPECT_NE(run("tool xml").find("Active tool: xml"), std::string::npos);
  EXPECT_EQ(shell->active_tool(), "xml");

  EXPECT_NE(run("tool yaml").find("Unknown tool: yaml"), std::string::npos);
  EXPECT_EQ(shell->active_tool(), "xml");

  const std::string tools = run("tools");
  EXPECT_NE(tools.find("* xml"), std::string::npos);
  EXPECT_NE(tools.find("  jwt"), std::string::npos);
}

TEST_F(CLITest, Base64Editing) {
  start("");

  const std::string encoded = run("b64 plain hi there");
  EXPECT_NE(encoded.find("encoded: aGkgdGhlcmU="), std::string::npos) << encoded;

  const std::string decoded = run("b64 encoded aGkgdGhlcmU=");
  EXPECT_NE(decoded.find("plain:   hi there"), std::string::npos) << decoded;

  EXPECT_NE(run("b64 encoded @@@").find("error:   Invalid Base64 string"), std::string::npos);
  EXPECT_NE(run("b64 sideways x").find("Usage: b64"), std::string::npos);
}

TEST_F(CLITest, ScrollingLoadsMoreChunks) {
  const std::string text = numbered_lines(200);
  AppConfig config = small_config();
  config.chunk_size = 50;
  config.viewport_height = 100.0;
  start("", config);
  store.put(store::ContentKind::RAW, text, 50, std::string(INPUT_SLOT));

  run("view input");
  const std::size_t after_view = shell->loader().retrieved_count();
  EXPECT_GE(after_view, 1u);
  EXPECT_LT(after_view, shell->loader().chunk_count());

  run("end");
  run("end");
  EXPECT_GT(shell->loader().retrieved_count(), after_view);

  const std::string scrolled = run("down 3");
  EXPECT_NE(scrolled.find("-- input: lines"), std::string::npos);

  // copy always returns the whole entry
  EXPECT_EQ(run("copy"), text + "\n");
}

TEST_F(CLITest, ReplacedEntryIsReselectedNotMixed) {
  AppConfig config = small_config();
  config.chunk_size = 50;
  config.viewport_height = 100.0;
  start("", config);
  store.put(store::ContentKind::RAW, numbered_lines(200), 50, std::string(INPUT_SLOT));
  run("view input");
  ASSERT_FALSE(shell->loader().is_complete());

  // Replaced behind the shell's back while only part of it is loaded
  std::string replacement;
  for (int i = 0; i < 200; ++i) {
    replacement += "new " + std::to_string(i) + "\n";
  }
  store.put(store::ContentKind::RAW, replacement, 50, std::string(INPUT_SLOT));

  const std::string shown = run("end");
  EXPECT_EQ(shown.find("loading failed"), std::string::npos) << shown;
  EXPECT_FALSE(shell->loader().is_superseded());
  EXPECT_EQ(shell->loader().content().rfind("new 0\n", 0), 0u);
  EXPECT_EQ(shell->loader().content().find("row "), std::string::npos);
  EXPECT_EQ(run("copy"), replacement + "\n");
}

TEST_F(CLITest, SaveWritesWholeEntry) {
  const auto path = std::filesystem::temp_directory_path() / "docpipe_cli_save_test.txt";
  start("alpha beta gamma\n.\n");
  run("paste");
  run("view input");

  EXPECT_NE(run("save " + path.string()).find("Saved 16 characters"), std::string::npos);

  std::ifstream file(path);
  std::stringstream content;
  content << file.rdbuf();
  EXPECT_EQ(content.str(), "alpha beta gamma");
  std::filesystem::remove(path);
}

TEST_F(CLITest, InfoReportsEntries) {
  start("abc\n.\n");
  run("paste");

  const std::string info = run("info");
  EXPECT_NE(info.find("input: raw, 3 characters"), std::string::npos) << info;
  EXPECT_NE(info.find("output: empty"), std::string::npos) << info;
  EXPECT_NE(info.find("viewing: nothing"), std::string::npos) << info;
}

TEST_F(CLITest, ClearRemovesEverything) {
  start("[1]\n.\n");
  run("paste");
  run("format");
  run("view output");

  EXPECT_NE(run("clear").find("Cleared"), std::string::npos);
  EXPECT_EQ(store.size(), 0u);
  EXPECT_EQ(shell->viewed_slot(), "");
  EXPECT_NE(run("show").find("Nothing to show"), std::string::npos);
}

TEST_F(CLITest, UnknownCommand) {
  start("");
  EXPECT_NE(run("fly away").find("Unknown command"), std::string::npos);
}

TEST_F(CLITest, RunStopsAtQuit) {
  start("help\nquit\ninfo\n");
  shell->run();

  EXPECT_FALSE(shell->is_running());
  EXPECT_NE(out.str().find("docpipe> "), std::string::npos);
  EXPECT_NE(out.str().find("Available commands:"), std::string::npos);
  EXPECT_EQ(out.str().find("input: "), std::string::npos);
}
