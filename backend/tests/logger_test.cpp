#include <gtest/gtest.h>
#include "common/logger.hpp"
#include <vector>

namespace {

using common::LogLevel;
using common::Logger;

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    previous_ = Logger::level();
    Logger::setSink([this](LogLevel level, const std::string& line) { lines_.emplace_back(level, line); });
  }
  void TearDown() override {
    Logger::setSink(nullptr);
    Logger::setLevel(previous_);
  }

  LogLevel previous_{LogLevel::kInfo};
  std::vector<std::pair<LogLevel, std::string>> lines_;
};

TEST_F(LoggerTest, LevelFiltersLowerSeverities) {
  Logger::setLevel(LogLevel::kWarn);
  Logger::info("hidden");
  Logger::warn("shown");
  Logger::error("also shown");
  ASSERT_EQ(lines_.size(), 2u);
  EXPECT_EQ(lines_[0].first, LogLevel::kWarn);
  EXPECT_NE(lines_[0].second.find("[WARN] shown"), std::string::npos);
  EXPECT_NE(lines_[1].second.find("[ERROR] also shown"), std::string::npos);
}

TEST_F(LoggerTest, ParsesLevelNames) {
  EXPECT_TRUE(Logger::setLevel(std::string("debug")));
  EXPECT_EQ(Logger::level(), LogLevel::kDebug);
  EXPECT_FALSE(Logger::setLevel(std::string("verbose")));
  EXPECT_EQ(Logger::level(), LogLevel::kDebug);
  Logger::debug("trace line");
  ASSERT_EQ(lines_.size(), 1u);
}

} // namespace
