#include <lumina/ansi.hpp>
#include <lumina/engine.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>

int main()
{
  // --- Configuration ---

  lumina::EngineConfig config;
  config.name = "basic_example";
  config.log_root = "/tmp/lumina_example/logs";
  config.use_utc = false;
  config.rotation.retention = std::chrono::hours(24 * 7);
  config.rotation.sweep_interval = std::chrono::hours(1);

  lumina::Engine engine(config);

  // --- Basic logging ---

  engine.Debug(fmt::format("debug value: {}", 42));
  engine.Info("hello world, version 1.0");
  engine.Warn("disk usage at 85%");
  engine.Error("connection failed: timeout");

  // Every argument becomes its own line, each with the full prefix
  engine.Info("multi-line report", "line two", "line three\nline four");

  // --- Color markers ---

  // &<code> is translated on the console and kept as written in the file
  engine.Info("&aservice up&r, &4errors: 0&r");
  engine.Info("literal ampersand: Tom \\& Jerry");

  // File only, no console echo
  engine.Log(engine.Strategy(lumina::LogLevel::Info), false, "written to info.log only");

  // --- Custom severity ---

  auto& audit = engine.RegisterStrategy("AUDIT", std::string(lumina::ansi::kPurple));
  engine.Log(audit, true, "user admin logged in");

  // --- Exceptions ---

  try
  {
    try
    {
      throw std::runtime_error("socket closed");
    }
    catch (const std::exception&)
    {
      std::throw_with_nested(std::runtime_error("request failed"));
    }
  }
  catch (const std::exception& e)
  {
    engine.LogException(e);
  }

  // --- Multi-thread demo ---

  auto worker = [&engine](int id)
  {
    for (int i = 0; i < 5; ++i)
    {
      engine.Info(fmt::format("worker-{} processing step {}", id, i));
    }
  };

  std::thread t1(worker, 1);
  std::thread t2(worker, 2);
  t1.join();
  t2.join();

  // --- Shutdown ---

  engine.Info("shutting down");
  if (engine.Shutdown(std::chrono::seconds(2)) == lumina::ShutdownResult::TimedOut)
  {
    std::fprintf(stderr, "log queue was drained synchronously\n");
  }

  std::printf("Example finished. Check %s for per-severity files.\n",
              config.log_root.c_str());
  return 0;
}
