#include "common/Logger.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

using sessiondb::common::ConfigurationError;
using sessiondb::common::Logger;

TEST(LoggerTest, GetReturnsNamedDefaultLogger) {
  auto spLog = Logger::get();
  ASSERT_NE(spLog, nullptr);
  EXPECT_EQ(spLog->name(), "sessiondb");
  EXPECT_EQ(spLog, spdlog::default_logger());
}

TEST(LoggerTest, InitAdjustsLevelOnExistingLogger) {
  Logger::init("debug");
  EXPECT_EQ(Logger::get()->level(), spdlog::level::debug);

  Logger::init("warn");
  EXPECT_EQ(Logger::get()->level(), spdlog::level::warn);

  Logger::init("info");
}

TEST(LoggerTest, ParsesKnownLevels) {
  EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
  EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
  EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
}

TEST(LoggerTest, UnknownLevelIsRejected) {
  EXPECT_THROW(Logger::parseLevel("verbose"), ConfigurationError);

  Logger::init("info");
  EXPECT_THROW(Logger::init("loud"), ConfigurationError);
  EXPECT_EQ(Logger::get()->level(), spdlog::level::info);
}
