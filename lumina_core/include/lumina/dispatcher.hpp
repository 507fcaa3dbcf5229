#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

#include "config.hpp"
#include "message.hpp"
#include "message_queue.hpp"

namespace lumina
{

// 单消费者分发管线：业务线程入队，后端线程按 FIFO 顺序写出
class Dispatcher
{
 public:
  using Handler = std::function<void(const Message&)>;

  Dispatcher(const EngineConfig& config, Handler handler);
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  // 启动后端线程
  void Start();

  // 生产者调用（业务线程）。Blocks only on a full bounded queue with
  // OverflowPolicy::Block.
  PushResult Enqueue(Message&& message);
  PushResult TryEnqueue(Message&& message);

  // No new entries; queued ones stay consumable.
  void Close();

  // Waits up to timeout for the consumer to empty the closed queue and exit.
  bool WaitForDrain(std::chrono::milliseconds timeout);

  // Pops and dispatches whatever is still queued on the calling thread.
  size_t DrainRemaining();

  void Join();

  // Returns once every message enqueued before the call has been handled.
  void WaitIdle();

  // Runs the handler with the consumer's error reporting. Used directly for
  // messages that bypass the queue.
  void Invoke(const Message& message);

  bool IsClosed() const { return queue_.IsClosed(); }
  size_t Pending() const { return queue_.Size(); }

 private:
  const EngineConfig& config_;
  Handler handler_;
  MessageQueue<Message> queue_;

  std::thread worker_;
  std::atomic<bool> started_{false};
  std::promise<void> exited_;
  std::future<void> exited_future_;

  std::mutex progress_mutex_;
  std::condition_variable progress_cv_;
  uint64_t enqueued_ = 0;
  uint64_t completed_ = 0;

  void WorkerLoop();
  void Dispatch(const Message& message);
  void NoteEnqueued();
};

}  // namespace lumina
