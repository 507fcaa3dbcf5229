#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "filesystem.hpp"
#include "message_queue.hpp"
#include "platform.hpp"
#include "timestamp.hpp"

namespace lumina
{

class SinkCache;

class ConfigError : public std::invalid_argument
{
 public:
  using std::invalid_argument::invalid_argument;
};

struct RotationPolicy
{
  bool enabled = true;
  std::chrono::seconds retention =
      std::chrono::hours(24 * LUMINA_DEFAULT_RETENTION_DAYS);
  std::chrono::seconds sweep_interval =
      std::chrono::hours(LUMINA_DEFAULT_SWEEP_INTERVAL_HOURS);
};

// period key -> directory
using DirectoryNamer = std::function<std::string(const std::string& period_key)>;

// (directory, lower-case severity name) -> file path
using FileNamer =
    std::function<std::string(const std::string& directory, const std::string& severity)>;

// (formatted time, colored severity label, logger name, lines) -> text
using MessageFormatter = std::function<std::string(
    const std::string& time, const std::string& colored_severity,
    const std::string& logger_name, const std::vector<std::string>& lines)>;

using Clock = std::function<TimePoint()>;

std::string default_file_namer(const std::string& directory, const std::string& severity);

// "[<time>] - <severity> - <name> - <line>" for every line; embedded newlines
// repeat the prefix.
std::string default_message_formatter(const std::string& time,
                                      const std::string& colored_severity,
                                      const std::string& logger_name,
                                      const std::vector<std::string>& lines);

struct EngineConfig
{
  std::string name = "Lumina";

  // Used by the default directory namer: <log_root>/<period key>.
  std::string log_root = LUMINA_DEFAULT_LOG_ROOT;
  DirectoryNamer directory;
  FileNamer file = default_file_namer;
  MessageFormatter message = default_message_formatter;

  std::string time_format = "%H:%M:%S.%L";
  std::string date_format = "%d.%m.%Y";
  bool use_utc = true;

  RotationPolicy rotation;

  size_t queue_capacity = kUnboundedQueue;
  OverflowPolicy overflow = OverflowPolicy::Block;

  std::shared_ptr<IFileSystem> filesystem = std::make_shared<PosixFileSystem>();
  Clock clock = wall_clock_now;

  // Engines that should write through the same handles (and the same lock)
  // pass the same cache. nullptr gives the engine a private one.
  std::shared_ptr<SinkCache> sink_cache;

  std::FILE* console = stdout;
  std::FILE* diagnostics = stderr;

  // Throws ConfigError.
  void Validate() const;

  std::string PeriodKey(TimePoint t) const;
  std::string TimeString(TimePoint t) const;
  std::string DirectoryFor(const std::string& period_key) const;
  std::string FileFor(const std::string& period_key, const std::string& severity) const;

  // Parent of today's directory: where the rotation clock looks for
  // expired period directories.
  std::string RotationRoot(TimePoint now) const;
};

}  // namespace lumina
