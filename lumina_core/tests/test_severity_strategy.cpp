#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "_common/memory_filesystem.hpp"
#include "_common/test_util.hpp"
#include "lumina/ansi.hpp"
#include "lumina/severity_strategy.hpp"
#include "lumina/sink_cache.hpp"

using namespace lumina;

namespace
{

Message make_message(SeverityStrategy& strategy, std::vector<std::string> lines,
                     TimePoint at = test_util::fixed_time())
{
  Message message;
  message.strategy = &strategy;
  message.lines = std::move(lines);
  message.created_at = at;
  message.echo_to_console = false;
  return message;
}

}  // namespace

class SeverityStrategyTest : public ::testing::Test
{
 protected:
  std::shared_ptr<MemoryFileSystem> fs_ = std::make_shared<MemoryFileSystem>();
  EngineConfig config_ = test_util::memory_config(fs_);
  SinkCache cache_;
};

TEST_F(SeverityStrategyTest, FileStemIsLowerCase)
{
  SeverityStrategy strategy("WARN", std::string(ansi::kYellow), StrategyKind::Default, config_,
                            cache_);
  EXPECT_EQ(strategy.Name(), "WARN");
  EXPECT_EQ(strategy.FileStem(), "warn");
  EXPECT_EQ(strategy.Kind(), StrategyKind::Default);
}

TEST_F(SeverityStrategyTest, DefaultFormat)
{
  SeverityStrategy strategy("INFO", std::string(ansi::kCyan), StrategyKind::Default, config_,
                            cache_);
  EXPECT_EQ(strategy.FormatFile(test_util::fixed_time(), {"hello"}),
            "[12:30:00.123] - INFO - Test - hello");
  EXPECT_EQ(strategy.FormatConsole(test_util::fixed_time(), {"hello"}),
            std::string("[12:30:00.123] - ") + std::string(ansi::kCyan) + "INFO" +
                std::string(ansi::kReset) + " - Test - hello");
}

TEST_F(SeverityStrategyTest, EveryLineGetsPrefix)
{
  SeverityStrategy strategy("INFO", "", StrategyKind::Default, config_, cache_);
  EXPECT_EQ(strategy.FormatFile(test_util::fixed_time(), {"a", "b\nc"}),
            "[12:30:00.123] - INFO - Test - a\n"
            "[12:30:00.123] - INFO - Test - b\n"
            "[12:30:00.123] - INFO - Test - c");
}

TEST_F(SeverityStrategyTest, ColorMarkersTranslatedOnConsoleOnly)
{
  SeverityStrategy strategy("INFO", std::string(ansi::kCyan), StrategyKind::Default, config_,
                            cache_);
  std::string console = strategy.FormatConsole(test_util::fixed_time(), {"&4red&r"});
  std::string file = strategy.FormatFile(test_util::fixed_time(), {"&4red&r"});

  EXPECT_NE(console.find(std::string(ansi::kRed) + "red"), std::string::npos);
  // markers reach the file as written; the severity color does not
  EXPECT_EQ(file, "[12:30:00.123] - INFO - Test - &4red&r");
  EXPECT_EQ(file.find('\033'), std::string::npos);
}

TEST_F(SeverityStrategyTest, EscapedMarkerKeptInFile)
{
  SeverityStrategy strategy("INFO", "", StrategyKind::Default, config_, cache_);
  EXPECT_EQ(strategy.FormatFile(test_util::fixed_time(), {"Tom \\& Jerry"}),
            "[12:30:00.123] - INFO - Test - Tom \\& Jerry");
  EXPECT_NE(strategy.FormatConsole(test_util::fixed_time(), {"Tom \\& Jerry"}).find("Tom & Jerry"),
            std::string::npos);
}

TEST_F(SeverityStrategyTest, RawEscapesStrippedFromFile)
{
  SeverityStrategy strategy("INFO", "", StrategyKind::Default, config_, cache_);
  std::string colored = std::string(ansi::kGreen) + "ok" + std::string(ansi::kReset);
  EXPECT_EQ(strategy.FormatFile(test_util::fixed_time(), {colored}),
            "[12:30:00.123] - INFO - Test - ok");
}

TEST_F(SeverityStrategyTest, WriteCreatesDatedFile)
{
  SeverityStrategy strategy("INFO", "", StrategyKind::Default, config_, cache_);
  strategy.Write(make_message(strategy, {"first"}));
  strategy.Write(make_message(strategy, {"second"}));

  const std::string path = "/mem/logs/16.02.2026/info.log";
  EXPECT_EQ(strategy.CurrentPath(), path);
  EXPECT_EQ(strategy.CurrentPeriodKey(), "16.02.2026");
  auto lines = fs_->Lines(path);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "[12:30:00.123] - INFO - Test - first");
  EXPECT_EQ(lines[1], "[12:30:00.123] - INFO - Test - second");
}

TEST_F(SeverityStrategyTest, NewPeriodRotatesFile)
{
  SeverityStrategy strategy("ERROR", "", StrategyKind::Default, config_, cache_);
  auto today = test_util::fixed_time();
  auto tomorrow = today + std::chrono::hours(24);

  strategy.Write(make_message(strategy, {"day one"}, today));
  strategy.Write(make_message(strategy, {"day two"}, tomorrow));

  EXPECT_EQ(fs_->Lines("/mem/logs/16.02.2026/error.log").size(), 1u);
  EXPECT_EQ(fs_->Lines("/mem/logs/17.02.2026/error.log").size(), 1u);
  EXPECT_EQ(strategy.CurrentPeriodKey(), "17.02.2026");
  // old handle released
  EXPECT_EQ(fs_->close_count.load(), 1);
  {
    std::lock_guard<std::mutex> lock(cache_.Mutex());
    EXPECT_FALSE(cache_.Contains("/mem/logs/16.02.2026/error.log"));
  }
}

TEST_F(SeverityStrategyTest, StrategiesSharingPathShareHandle)
{
  config_.file = [](const std::string& dir, const std::string&)
  { return lumina::join_path(dir, "all.log"); };
  SeverityStrategy info("INFO", "", StrategyKind::Default, config_, cache_);
  SeverityStrategy warn("WARN", "", StrategyKind::Default, config_, cache_);

  info.Write(make_message(info, {"i"}));
  warn.Write(make_message(warn, {"w"}));

  EXPECT_EQ(fs_->open_count.load(), 1);
  {
    std::lock_guard<std::mutex> lock(cache_.Mutex());
    EXPECT_EQ(cache_.RefCount("/mem/logs/16.02.2026/all.log"), 2u);
  }

  info.Close();
  // warn still holds the handle
  warn.Write(make_message(warn, {"w2"}));
  EXPECT_EQ(fs_->Lines("/mem/logs/16.02.2026/all.log").size(), 3u);
}

TEST_F(SeverityStrategyTest, OpenFailureRetriesOnNextMessage)
{
  SeverityStrategy strategy("INFO", "", StrategyKind::Default, config_, cache_);
  fs_->fail_opens = true;
  strategy.Write(make_message(strategy, {"lost"}));
  EXPECT_EQ(strategy.CurrentPath(), "");
  EXPECT_EQ(strategy.CurrentPeriodKey(), "");

  fs_->fail_opens = false;
  strategy.Write(make_message(strategy, {"kept"}));
  auto lines = fs_->Lines("/mem/logs/16.02.2026/info.log");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("kept"), std::string::npos);
}

TEST_F(SeverityStrategyTest, CloseThenWriteReopens)
{
  SeverityStrategy strategy("INFO", "", StrategyKind::Default, config_, cache_);
  strategy.Write(make_message(strategy, {"a"}));
  strategy.Close();
  EXPECT_EQ(strategy.CurrentPath(), "");
  strategy.Write(make_message(strategy, {"b"}));
  EXPECT_EQ(fs_->open_count.load(), 2);
  EXPECT_EQ(fs_->Lines("/mem/logs/16.02.2026/info.log").size(), 2u);
}

TEST_F(SeverityStrategyTest, SealedStrategyKeepsNoHandle)
{
  SeverityStrategy strategy("INFO", "", StrategyKind::Default, config_, cache_);
  strategy.Write(make_message(strategy, {"before"}));
  {
    std::lock_guard<std::mutex> lock(cache_.Mutex());
    strategy.SealLocked();
    EXPECT_EQ(cache_.Size(), 0u);
  }
  EXPECT_EQ(fs_->close_count.load(), 1);

  strategy.Write(make_message(strategy, {"after"}));
  strategy.Write(make_message(strategy, {"again"}));

  EXPECT_EQ(strategy.CurrentPath(), "");
  EXPECT_EQ(strategy.CurrentPeriodKey(), "");
  EXPECT_EQ(fs_->open_count.load(), 3);
  EXPECT_EQ(fs_->close_count.load(), 3);
  {
    std::lock_guard<std::mutex> lock(cache_.Mutex());
    EXPECT_EQ(cache_.Size(), 0u);
  }
  auto lines = fs_->Lines("/mem/logs/16.02.2026/info.log");
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[2], "[12:30:00.123] - INFO - Test - again");
}

TEST_F(SeverityStrategyTest, SealedStrategyLeavesSharedHandleOpen)
{
  config_.file = [](const std::string& dir, const std::string&)
  { return lumina::join_path(dir, "all.log"); };
  SeverityStrategy info("INFO", "", StrategyKind::Default, config_, cache_);
  SeverityStrategy warn("WARN", "", StrategyKind::Default, config_, cache_);
  warn.Write(make_message(warn, {"w"}));
  {
    std::lock_guard<std::mutex> lock(cache_.Mutex());
    info.SealLocked();
  }

  info.Write(make_message(info, {"i"}));
  // info borrowed warn's handle and gave its reference back
  EXPECT_EQ(fs_->open_count.load(), 1);
  EXPECT_EQ(fs_->close_count.load(), 0);
  {
    std::lock_guard<std::mutex> lock(cache_.Mutex());
    EXPECT_EQ(cache_.RefCount("/mem/logs/16.02.2026/all.log"), 1u);
  }
  EXPECT_EQ(fs_->Lines("/mem/logs/16.02.2026/all.log").size(), 2u);
}

TEST_F(SeverityStrategyTest, StackTraceLayout)
{
  SeverityStrategy strategy("STACKTRACE", std::string(ansi::kBoldRed), StrategyKind::StackTrace,
                            config_, cache_);
  std::string text = strategy.FormatFile(test_util::fixed_time(), {"Exception: X", "Message: y"});
  EXPECT_EQ(text,
            "[12:30:00.123] ----------- STACKTRACE BEGIN -----------\n"
            "[12:30:00.123] From (Logger Name): Test\n"
            "[12:30:00.123] Exception: X\n"
            "[12:30:00.123] Message: y\n"
            "[12:30:00.123] -----------  STACKTRACE END  -----------");

  std::string console =
      strategy.FormatConsole(test_util::fixed_time(), {"Exception: X", "Message: y"});
  EXPECT_NE(console.find(std::string(ansi::kBoldRed) + "STACKTRACE BEGIN"), std::string::npos);
}

TEST(DescribeException, PlainException)
{
  std::runtime_error e("boom");
  auto lines = describe_exception(e);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "Exception: std::runtime_error");
  EXPECT_EQ(lines[1], "Message: boom");
}

TEST(DescribeException, NestedCauses)
{
  try
  {
    try
    {
      throw std::invalid_argument("inner");
    }
    catch (const std::exception&)
    {
      std::throw_with_nested(std::runtime_error("outer"));
    }
  }
  catch (const std::exception& e)
  {
    auto lines = describe_exception(e);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1], "Message: outer");
    EXPECT_EQ(lines[2], "Caused by: std::invalid_argument");
    EXPECT_EQ(lines[3], "Message: inner");
  }
}
