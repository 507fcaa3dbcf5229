#include "lumina/dispatcher.hpp"

#include <fmt/format.h>

#include <exception>

namespace lumina {

Dispatcher::Dispatcher(const EngineConfig& config, Handler handler)
    : config_(config)
    , handler_(std::move(handler))
    , queue_(config.queue_capacity, config.overflow)
    , exited_future_(exited_.get_future())
{
}

Dispatcher::~Dispatcher() {
    Close();
    Join();
}

void Dispatcher::Start() {
    if (started_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&Dispatcher::WorkerLoop, this);
}

PushResult Dispatcher::Enqueue(Message&& message) {
    PushResult result = queue_.Push(std::move(message));
    if (result == PushResult::Ok) {
        NoteEnqueued();
    }
    return result;
}

PushResult Dispatcher::TryEnqueue(Message&& message) {
    PushResult result = queue_.TryPush(std::move(message));
    if (result == PushResult::Ok) {
        NoteEnqueued();
    }
    return result;
}

void Dispatcher::NoteEnqueued() {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    ++enqueued_;
}

void Dispatcher::Close() {
    queue_.Close();
}

bool Dispatcher::WaitForDrain(std::chrono::milliseconds timeout) {
    if (!started_.load()) {
        return queue_.Empty();
    }
    return exited_future_.wait_for(timeout) == std::future_status::ready;
}

size_t Dispatcher::DrainRemaining() {
    size_t count = 0;
    Message message;
    while (queue_.TryPop(message)) {
        Dispatch(message);
        ++count;
    }
    return count;
}

void Dispatcher::Join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void Dispatcher::WaitIdle() {
    std::unique_lock<std::mutex> lock(progress_mutex_);
    const uint64_t target = enqueued_;
    progress_cv_.wait(lock, [this, target] { return completed_ >= target; });
}

void Dispatcher::Invoke(const Message& message) {
    try {
        handler_(message);
    } catch (const std::exception& e) {
        fmt::print(config_.diagnostics, "[{}] Log consumer error: {}\n", config_.name, e.what());
    } catch (...) {
        fmt::print(config_.diagnostics, "[{}] Log consumer error: unknown exception\n",
                   config_.name);
    }
}

void Dispatcher::Dispatch(const Message& message) {
    Invoke(message);
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        ++completed_;
    }
    progress_cv_.notify_all();
}

void Dispatcher::WorkerLoop() {
    Message message;
    while (queue_.Pop(message)) {
        Dispatch(message);
    }
    exited_.set_value();
}

} // namespace lumina
