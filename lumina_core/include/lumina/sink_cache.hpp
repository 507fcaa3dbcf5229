#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "filesystem.hpp"

namespace lumina
{

// 路径 -> 打开的追加写句柄。多个 strategy 写同一个文件时共用一个句柄。
//
// The cache owns the lock that serializes every write, rotation and sweep of
// the engines sharing it. All member functions except Mutex() expect the
// caller to hold that lock.
class SinkCache
{
 public:
  SinkCache() = default;
  ~SinkCache();

  SinkCache(const SinkCache&) = delete;
  SinkCache& operator=(const SinkCache&) = delete;

  std::mutex& Mutex() { return mutex_; }

  // Returns the open handle for path, opening it (and creating its parent
  // directories) on first use. Each successful call must be paired with a
  // Release. Returns nullptr when the file cannot be opened.
  IAppendFile* Acquire(const std::string& path, IFileSystem& fs);

  // Drops one reference; the last one flushes, closes and evicts the handle.
  // Returns false if that close failed.
  bool Release(const std::string& path);

  bool FlushAll();

  // Closes every handle regardless of reference counts.
  bool CloseAll();

  size_t Size() const { return sinks_.size(); }
  bool Contains(const std::string& path) const;
  size_t RefCount(const std::string& path) const;

 private:
  struct Entry
  {
    std::unique_ptr<IAppendFile> file;
    size_t refs;
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Entry> sinks_;
};

}  // namespace lumina
