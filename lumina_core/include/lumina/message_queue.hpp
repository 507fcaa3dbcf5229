#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <mutex>

namespace lumina
{

constexpr size_t kUnboundedQueue = std::numeric_limits<size_t>::max();

// What a producer does when a bounded queue is full.
enum class OverflowPolicy : uint8_t
{
  Block,
  Drop
};

enum class PushResult : uint8_t
{
  Ok,
  Full,     // TryPush only
  Dropped,  // OverflowPolicy::Drop
  Closed
};

// Multi-producer / single-consumer FIFO. Close() stops new pushes but keeps
// already queued items poppable, so the consumer can drain before exiting.
template <typename T>
class MessageQueue
{
 public:
  explicit MessageQueue(size_t capacity = kUnboundedQueue,
                        OverflowPolicy policy = OverflowPolicy::Block)
      : capacity_(capacity), policy_(policy)
  {
  }

  MessageQueue(const MessageQueue&) = delete;
  MessageQueue& operator=(const MessageQueue&) = delete;

  // `item` is only moved from when Ok is returned.
  PushResult Push(T&& item)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_)
    {
      return PushResult::Closed;
    }
    if (items_.size() >= capacity_)
    {
      if (policy_ == OverflowPolicy::Drop)
      {
        return PushResult::Dropped;
      }
      not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
      if (closed_)
      {
        return PushResult::Closed;
      }
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return PushResult::Ok;
  }

  PushResult TryPush(T&& item)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_)
    {
      return PushResult::Closed;
    }
    if (items_.size() >= capacity_)
    {
      return PushResult::Full;
    }
    items_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return PushResult::Ok;
  }

  // Blocks until an item is available or the queue is closed and empty.
  bool Pop(T& item)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty())
    {
      return false;
    }
    item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  bool TryPop(T& item)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (items_.empty())
    {
      return false;
    }
    item = std::move(items_.front());
    items_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  void Close()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool IsClosed() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  bool Empty() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
  }

  size_t Size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

 private:
  const size_t capacity_;
  const OverflowPolicy policy_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> items_;
  bool closed_ = false;
};

}  // namespace lumina
