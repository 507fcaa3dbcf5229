#include <gtest/gtest.h>

#include "lumina/ansi.hpp"
#include "lumina/log_level.hpp"

using lumina::LogLevel;
using lumina::default_color;
using lumina::to_string;

TEST(LogLevel, ToStringReturnsCorrectValues)
{
  static_assert(to_string(LogLevel::Debug) == "DEBUG");
  static_assert(to_string(LogLevel::Info) == "INFO");
  static_assert(to_string(LogLevel::Warn) == "WARN");
  static_assert(to_string(LogLevel::Error) == "ERROR");
  static_assert(to_string(LogLevel::Fatal) == "FATAL");

  EXPECT_EQ(to_string(LogLevel::Info), "INFO");
}

TEST(LogLevel, DefaultColorsMatchAnsiTable)
{
  EXPECT_EQ(default_color(LogLevel::Debug), lumina::ansi::kGreen);
  EXPECT_EQ(default_color(LogLevel::Info), lumina::ansi::kCyan);
  EXPECT_EQ(default_color(LogLevel::Warn), lumina::ansi::kYellow);
  EXPECT_EQ(default_color(LogLevel::Error), lumina::ansi::kRed);
  EXPECT_EQ(default_color(LogLevel::Fatal), lumina::ansi::kBoldRed);
}

TEST(LogLevel, EnumValuesIndexDefaults)
{
  static_assert(static_cast<size_t>(LogLevel::Debug) == 0);
  static_assert(static_cast<size_t>(LogLevel::Fatal) == lumina::kLogLevelCount - 1);

  EXPECT_TRUE(true);
}
