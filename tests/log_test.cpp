#include "stepflow/util/log.hpp"

#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace stepflow;

namespace {

class LogFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = std::filesystem::temp_directory_path() /
            ("stepflow_log_test_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path_);
    saved_level_ = log::logger().level();
  }

  void TearDown() override {
    log::stop();
    ASSERT_TRUE(log::set_output_file(""));
    log::set_level(saved_level_);
    log::start();
    std::filesystem::remove(path_);
  }

  auto read_back() -> std::string {
    std::ifstream in(path_);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  std::filesystem::path path_;
  log::Level saved_level_{log::Level::Info};
};

} // namespace

TEST(LogLevelTest, ParseKnownAndUnknownNames) {
  EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
  EXPECT_EQ(log::parse_level("error"), log::Level::Error);
  EXPECT_FALSE(log::parse_level("verbose").has_value());
  EXPECT_EQ(log::level_name(log::Level::Warn), "warn");
}

TEST_F(LogFileTest, WriterThreadFlushesQueuedLinesOnStop) {
  log::set_level(log::Level::Info);
  log::start();
  ASSERT_TRUE(log::set_output_file(path_.string()));

  for (int i = 0; i < 200; ++i) {
    log::info("workflow line {}", i);
  }
  log::debug("filtered out");
  log::stop();

  const auto text = read_back();
  EXPECT_NE(text.find("INFO"), std::string::npos);
  EXPECT_NE(text.find("workflow line 0\n"), std::string::npos);
  EXPECT_NE(text.find("workflow line 199\n"), std::string::npos);
  EXPECT_EQ(text.find("filtered out"), std::string::npos);
  // File output carries no terminal colors.
  EXPECT_EQ(text.find('\x1b'), std::string::npos);
}

TEST_F(LogFileTest, WritesInlineWithoutWriter) {
  log::stop();
  log::set_level(log::Level::Warn);
  ASSERT_TRUE(log::set_output_file(path_.string()));
  log::warn("step '{}' failed", "extract");
  log::info("not shown");

  const auto text = read_back();
  EXPECT_NE(text.find("WARN"), std::string::npos);
  EXPECT_NE(text.find("step 'extract' failed"), std::string::npos);
  EXPECT_EQ(text.find("not shown"), std::string::npos);
}

TEST(LogFileOpenTest, UnwritablePathIsReported) {
  EXPECT_FALSE(log::set_output_file("/nonexistent-dir/stepflow.log"));
}
