#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "test_helpers.hpp"
#include "tuid/util/logging.hpp"

using namespace tuid;
using namespace tuid::util;
using namespace tuid::test;

TEST(LoggingTest, ParseKnownLevels) {
  EXPECT_EQ(parseLogLevel("trace").value(), spdlog::level::trace);
  EXPECT_EQ(parseLogLevel("debug").value(), spdlog::level::debug);
  EXPECT_EQ(parseLogLevel("info").value(), spdlog::level::info);
  EXPECT_EQ(parseLogLevel("warn").value(), spdlog::level::warn);
  EXPECT_EQ(parseLogLevel("warning").value(), spdlog::level::warn);
  EXPECT_EQ(parseLogLevel("error").value(), spdlog::level::err);
  EXPECT_EQ(parseLogLevel("critical").value(), spdlog::level::critical);
  EXPECT_EQ(parseLogLevel("off").value(), spdlog::level::off);
}

TEST(LoggingTest, ParseUnknownLevel) {
  EXPECT_ERROR(parseLogLevel("loud"), ErrorCode::kConfigError);
  EXPECT_ERROR(parseLogLevel(""), ErrorCode::kConfigError);
  EXPECT_ERROR(parseLogLevel("WARN"), ErrorCode::kConfigError);
}

TEST(LoggingTest, SetupInstallsDefaultLogger) {
  setupLogging(spdlog::level::err);

  auto logger = spdlog::default_logger();
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "tuid");
  EXPECT_EQ(logger->level(), spdlog::level::err);
  EXPECT_EQ(logger->sinks().size(), 1u);
}

class LogFileTest : public TempDirTest {};

TEST_F(LogFileTest, FileSinkReceivesMessages) {
  auto log_file = temp_dir_ / "logs" / "tuid.log";
  setupLogging(spdlog::level::info, log_file);
  EXPECT_EQ(spdlog::default_logger()->sinks().size(), 2u);

  spdlog::info("written to file");
  spdlog::debug("below threshold");
  spdlog::default_logger()->flush();

  std::ifstream file(log_file);
  std::stringstream content;
  content << file.rdbuf();
  EXPECT_NE(content.str().find("[info] [tuid] written to file"), std::string::npos);
  EXPECT_EQ(content.str().find("below threshold"), std::string::npos);

  // Release the file before the fixture removes the directory
  setupLogging(spdlog::level::warn);
}
