#pragma once
#include "ansi.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "log_level.hpp"
#include "message.hpp"
#include "rotation_clock.hpp"
#include "severity_strategy.hpp"
#include "sink_cache.hpp"
#include "timestamp.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace lumina {

enum class SubmitResult : uint8_t {
    Queued,
    Written,   // written synchronously (shutdown in progress)
    Full,      // TrySubmit on a full bounded queue
    Dropped,   // bounded queue with OverflowPolicy::Drop
    Rejected   // no strategy
};

enum class ShutdownResult : uint8_t {
    Drained,
    TimedOut,
    AlreadyShutDown
};

constexpr std::chrono::milliseconds kDefaultShutdownTimeout{LUMINA_DEFAULT_SHUTDOWN_TIMEOUT_MS};

class Engine {
public:
    // Throws ConfigError before any thread is started.
    explicit Engine(EngineConfig config);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    SeverityStrategy& Strategy(LogLevel level) { return *defaults_[static_cast<size_t>(level)]; }
    SeverityStrategy& StackTrace() { return *stack_trace_; }

    // Adds a severity with its own file (<lower-case name>.log).
    SeverityStrategy& RegisterStrategy(std::string name, std::string color,
                                       StrategyKind kind = StrategyKind::Default);
    SeverityStrategy* FindStrategy(const std::string& name);

    SubmitResult Submit(Message message);

    // Never blocks: Full instead of waiting on a bounded queue.
    SubmitResult TrySubmit(Message message);

    template <typename... Args>
    SubmitResult Log(SeverityStrategy& strategy, bool echo_to_console, Args&&... content);

    template <typename... Args>
    SubmitResult Debug(Args&&... content) {
        return Log(Strategy(LogLevel::Debug), true, std::forward<Args>(content)...);
    }
    template <typename... Args>
    SubmitResult Info(Args&&... content) {
        return Log(Strategy(LogLevel::Info), true, std::forward<Args>(content)...);
    }
    template <typename... Args>
    SubmitResult Warn(Args&&... content) {
        return Log(Strategy(LogLevel::Warn), true, std::forward<Args>(content)...);
    }
    template <typename... Args>
    SubmitResult Error(Args&&... content) {
        return Log(Strategy(LogLevel::Error), true, std::forward<Args>(content)...);
    }
    template <typename... Args>
    SubmitResult Fatal(Args&&... content) {
        return Log(Strategy(LogLevel::Fatal), true, std::forward<Args>(content)...);
    }

    SubmitResult LogException(const std::exception& e, bool echo_to_console = true);

    // Waits for everything queued so far, then flushes all sinks.
    void Flush();

    // Idempotent. Drains the queue (bounded by timeout, then synchronously),
    // stops the rotation clock and closes this engine's sinks. Later submits
    // are written synchronously and keep no file open.
    ShutdownResult Shutdown(std::chrono::milliseconds timeout = kDefaultShutdownTimeout);

    // Runs one retention sweep now.
    size_t SweepNow();

    bool IsShuttingDown() const { return shutting_down_.load(); }
    uint64_t DroppedCount() const { return dropped_.load(std::memory_order_relaxed); }
    const EngineConfig& Config() const { return config_; }
    RotationState RotationStatus() const { return rotation_.State(); }

private:
    EngineConfig config_;
    std::shared_ptr<SinkCache> cache_;
    bool owns_cache_;

    std::mutex strategies_mutex_;
    std::vector<std::unique_ptr<SeverityStrategy>> strategies_;
    std::array<SeverityStrategy*, kLogLevelCount> defaults_{};
    SeverityStrategy* stack_trace_ = nullptr;

    Dispatcher dispatcher_;
    RotationClock rotation_;

    std::atomic<bool> shutting_down_{false};
    std::atomic<uint64_t> dropped_{0};

    static EngineConfig Validated(EngineConfig config);
    SeverityStrategy& AddStrategy(std::string name, std::string color, StrategyKind kind);
    void WriteNow(const Message& message);
};

// Shuts the engine down, then exits the process with status.
[[noreturn]] void exit_process(Engine& engine, int status = 0,
                               std::chrono::milliseconds timeout = kDefaultShutdownTimeout);

// ===== Log template implementation =====

template <typename... Args>
SubmitResult Engine::Log(SeverityStrategy& strategy, bool echo_to_console, Args&&... content) {
    Message message;
    message.strategy = &strategy;
    message.echo_to_console = echo_to_console;
    message.created_at = config_.clock();
    message.lines.reserve(sizeof...(Args));
    (message.lines.push_back(fmt::format("{}", std::forward<Args>(content))), ...);
    return Submit(std::move(message));
}

} // namespace lumina
