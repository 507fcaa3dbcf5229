#pragma once
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#include "config.hpp"
#include "filesystem.hpp"
#include "message.hpp"
#include "sink_cache.hpp"
#include "timestamp.hpp"

namespace lumina
{

enum class StrategyKind : uint8_t
{
  Default,
  StackTrace
};

// Formats messages of one severity and owns that severity's current file.
// The file is chosen per period key (the date bucket of the message
// timestamp); a new key rotates the strategy onto a new path.
class SeverityStrategy
{
 public:
  SeverityStrategy(std::string name, std::string color, StrategyKind kind,
                   const EngineConfig& config, SinkCache& cache);
  ~SeverityStrategy();

  SeverityStrategy(const SeverityStrategy&) = delete;
  SeverityStrategy& operator=(const SeverityStrategy&) = delete;

  // Takes the sink cache lock. I/O failures go to the diagnostic stream.
  void Write(const Message& message);

  // Releases the current sink. The next Write reopens one.
  void Close();

  // Releases the current sink and switches to one-shot writes: every later
  // Write opens its file, appends, then releases it again. Used once the
  // engine shuts down. The caller holds cache_.Mutex().
  void SealLocked();

  std::string FormatConsole(TimePoint timestamp, const std::vector<std::string>& lines) const;
  std::string FormatFile(TimePoint timestamp, const std::vector<std::string>& lines) const;

  const std::string& Name() const { return name_; }
  const std::string& Color() const { return color_; }
  StrategyKind Kind() const { return kind_; }

  // Lower-case name used by the file namer.
  const std::string& FileStem() const { return file_stem_; }

  std::string CurrentPeriodKey();
  std::string CurrentPath();

 private:
  std::string name_;
  std::string color_;
  std::string file_stem_;
  StrategyKind kind_;
  const EngineConfig& config_;
  SinkCache& cache_;

  // 以下成员由 cache_.Mutex() 保护
  std::string current_period_key_;
  std::string current_path_;
  IAppendFile* sink_ = nullptr;
  bool sealed_ = false;

  std::string Render(TimePoint timestamp, const std::vector<std::string>& lines,
                     bool for_console) const;
  std::string RenderStackTrace(TimePoint timestamp, const std::vector<std::string>& lines,
                               bool for_console) const;
  void RotateIfNeeded(const std::string& period_key);
  void ReleaseSink();
  void Report(const std::string& what) const;
};

// "Exception: <type>" / "Message: <what>" lines for e, followed by
// "Caused by:" entries for every std::nested_exception level.
std::vector<std::string> describe_exception(const std::exception& e);

}  // namespace lumina
