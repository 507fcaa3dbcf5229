#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

#include "config.hpp"
#include "sink_cache.hpp"
#include "timestamp.hpp"

namespace lumina
{

enum class RotationState : uint8_t
{
  Stopped,
  Running,
  Stopping
};

// Periodically deletes period directories older than the retention window.
class RotationClock
{
 public:
  RotationClock(const EngineConfig& config, SinkCache& cache);
  ~RotationClock();

  RotationClock(const RotationClock&) = delete;
  RotationClock& operator=(const RotationClock&) = delete;

  // No-op when rotation is disabled or the clock already runs.
  void Start();

  // Wakes the loop and waits for the sweep in progress to finish.
  void Stop();

  // One sweep against `now`; returns the number of directories removed.
  size_t SweepOnce(TimePoint now);

  RotationState State() const;

 private:
  const EngineConfig& config_;
  SinkCache& cache_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  RotationState state_ = RotationState::Stopped;
  std::thread worker_;

  void Loop();
};

}  // namespace lumina
