#include "lumina/engine.hpp"

#include <cstdio>
#include <cstdlib>

namespace lumina
{

EngineConfig Engine::Validated(EngineConfig config)
{
  config.Validate();
  return config;
}

Engine::Engine(EngineConfig config)
    : config_(Validated(std::move(config))),
      cache_(config_.sink_cache ? config_.sink_cache : std::make_shared<SinkCache>()),
      owns_cache_(!config_.sink_cache),
      dispatcher_(config_, [](const Message& message) { message.strategy->Write(message); }),
      rotation_(config_, *cache_)
{
  for (size_t i = 0; i < kLogLevelCount; ++i)
  {
    auto level = static_cast<LogLevel>(i);
    defaults_[i] = &AddStrategy(std::string(to_string(level)),
                                std::string(default_color(level)), StrategyKind::Default);
  }
  stack_trace_ = &AddStrategy("STACKTRACE", std::string(ansi::kBoldRed), StrategyKind::StackTrace);

  std::string today = config_.DirectoryFor(config_.PeriodKey(config_.clock()));
  if (!config_.filesystem->Exists(today) && !config_.filesystem->CreateDirectories(today))
  {
    fmt::print(config_.diagnostics, "[{}] engine: failed to create '{}'\n", config_.name, today);
  }

  dispatcher_.Start();
  rotation_.Start();
}

Engine::~Engine() { Shutdown(); }

SeverityStrategy& Engine::AddStrategy(std::string name, std::string color, StrategyKind kind)
{
  std::lock_guard<std::mutex> lock(strategies_mutex_);
  strategies_.push_back(std::make_unique<SeverityStrategy>(std::move(name), std::move(color),
                                                           kind, config_, *cache_));
  if (shutting_down_.load())
  {
    std::lock_guard<std::mutex> cache_lock(cache_->Mutex());
    strategies_.back()->SealLocked();
  }
  return *strategies_.back();
}

SeverityStrategy& Engine::RegisterStrategy(std::string name, std::string color, StrategyKind kind)
{
  return AddStrategy(std::move(name), std::move(color), kind);
}

SeverityStrategy* Engine::FindStrategy(const std::string& name)
{
  std::lock_guard<std::mutex> lock(strategies_mutex_);
  for (auto& strategy : strategies_)
  {
    if (strategy->Name() == name)
    {
      return strategy.get();
    }
  }
  return nullptr;
}

void Engine::WriteNow(const Message& message) { dispatcher_.Invoke(message); }

SubmitResult Engine::Submit(Message message)
{
  if (message.strategy == nullptr)
  {
    fmt::print(config_.diagnostics, "[{}] engine: message without strategy rejected\n",
               config_.name);
    return SubmitResult::Rejected;
  }
  if (shutting_down_.load())
  {
    WriteNow(message);
    return SubmitResult::Written;
  }

  switch (dispatcher_.Enqueue(std::move(message)))
  {
    case PushResult::Ok:
      return SubmitResult::Queued;
    case PushResult::Dropped:
    case PushResult::Full:
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return SubmitResult::Dropped;
    case PushResult::Closed:
      break;
  }
  // 队列已关闭：同步写出
  WriteNow(message);
  return SubmitResult::Written;
}

SubmitResult Engine::TrySubmit(Message message)
{
  if (message.strategy == nullptr)
  {
    fmt::print(config_.diagnostics, "[{}] engine: message without strategy rejected\n",
               config_.name);
    return SubmitResult::Rejected;
  }
  if (shutting_down_.load())
  {
    WriteNow(message);
    return SubmitResult::Written;
  }

  switch (dispatcher_.TryEnqueue(std::move(message)))
  {
    case PushResult::Ok:
      return SubmitResult::Queued;
    case PushResult::Full:
    case PushResult::Dropped:
      return SubmitResult::Full;
    case PushResult::Closed:
      break;
  }
  WriteNow(message);
  return SubmitResult::Written;
}

SubmitResult Engine::LogException(const std::exception& e, bool echo_to_console)
{
  Message message;
  message.strategy = stack_trace_;
  message.echo_to_console = echo_to_console;
  message.created_at = config_.clock();
  message.lines = describe_exception(e);
  return Submit(std::move(message));
}

void Engine::Flush()
{
  if (!shutting_down_.load())
  {
    dispatcher_.WaitIdle();
  }
  std::lock_guard<std::mutex> lock(cache_->Mutex());
  if (!cache_->FlushAll())
  {
    fmt::print(config_.diagnostics, "[{}] engine: flush failed\n", config_.name);
  }
}

size_t Engine::SweepNow() { return rotation_.SweepOnce(config_.clock()); }

ShutdownResult Engine::Shutdown(std::chrono::milliseconds timeout)
{
  // 1. 之后的 Submit 直接同步写
  if (shutting_down_.exchange(true))
  {
    return ShutdownResult::AlreadyShutDown;
  }

  // 2-3. 关闭队列，等待消费线程在超时内排空
  dispatcher_.Close();
  bool drained = dispatcher_.WaitForDrain(timeout);

  // 4. 超时：在当前线程排空剩余消息
  if (!drained)
  {
    dispatcher_.DrainRemaining();
    fmt::print(config_.console, "{}WARNING: Logger shutdown timed out, some logs may be lost.{}\n",
               ansi::kBoldYellow, ansi::kReset);
  }

  // 5. 停止日志清理线程
  rotation_.Stop();
  dispatcher_.Join();

  // 6. 关闭文件句柄。释放与 CloseAll 在同一临界区内完成，
  //    此后的同步写每次自行打开并释放句柄。
  {
    std::lock_guard<std::mutex> lock(strategies_mutex_);
    std::lock_guard<std::mutex> cache_lock(cache_->Mutex());
    for (auto& strategy : strategies_)
    {
      strategy->SealLocked();
    }
    bool ok = owns_cache_ ? cache_->CloseAll() : cache_->FlushAll();
    if (!ok)
    {
      fmt::print(config_.diagnostics, "[{}] engine: failed to close sinks\n", config_.name);
    }
  }
  std::fflush(config_.console);

  return drained ? ShutdownResult::Drained : ShutdownResult::TimedOut;
}

void exit_process(Engine& engine, int status, std::chrono::milliseconds timeout)
{
  try
  {
    engine.Shutdown(timeout);
  }
  catch (const std::exception& e)
  {
    std::fprintf(stderr, "[%s] shutdown failed: %s\n", engine.Config().name.c_str(), e.what());
  }
  std::exit(status);
}

}  // namespace lumina
