#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lumina
{

// 追加写入的文件句柄（带缓冲）
class IAppendFile
{
 public:
  virtual ~IAppendFile() = default;

  // Buffers data; may write through when the buffer fills up.
  virtual bool Write(std::string_view data) = 0;

  // Pushes buffered bytes to the underlying file.
  virtual bool Flush() = 0;

  // Flushes and releases the handle. Further writes fail.
  virtual bool Close() = 0;
};

// Everything the engine needs from the filesystem. Paths are plain strings
// with '/' separators.
class IFileSystem
{
 public:
  virtual ~IFileSystem() = default;

  virtual bool Exists(const std::string& path) const = 0;
  virtual bool IsDirectory(const std::string& path) const = 0;

  // mkdir -p; true when the directory exists afterwards.
  virtual bool CreateDirectories(const std::string& path) = 0;

  // Names (not full paths) of the entries in a directory, without "." and "..".
  virtual std::vector<std::string> List(const std::string& path) const = 0;

  virtual bool DeleteRecursively(const std::string& path) = 0;

  // Returns nullptr when the file cannot be opened.
  virtual std::unique_ptr<IAppendFile> OpenAppend(const std::string& path) = 0;
};

class PosixFileSystem : public IFileSystem
{
 public:
  bool Exists(const std::string& path) const override;
  bool IsDirectory(const std::string& path) const override;
  bool CreateDirectories(const std::string& path) override;
  std::vector<std::string> List(const std::string& path) const override;
  bool DeleteRecursively(const std::string& path) override;
  std::unique_ptr<IAppendFile> OpenAppend(const std::string& path) override;
};

// Path helpers shared by the strategies and the rotation clock.
std::string join_path(std::string_view dir, std::string_view name);
std::string parent_path(std::string_view path);
std::string file_name(std::string_view path);

}  // namespace lumina
