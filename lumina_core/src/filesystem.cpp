#include "lumina/filesystem.hpp"

#include "lumina/platform.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>

namespace lumina {

namespace {

class PosixAppendFile : public IAppendFile {
public:
    explicit PosixAppendFile(int fd) : fd_(fd) {
        buffer_.reserve(LUMINA_IO_BUFFER_SIZE);
    }

    ~PosixAppendFile() override {
        if (fd_ >= 0) {
            Close();
        }
    }

    bool Write(std::string_view data) override {
        if (fd_ < 0) return false;
        if (buffer_.size() + data.size() > LUMINA_IO_BUFFER_SIZE) {
            if (!Flush()) return false;
            if (data.size() > LUMINA_IO_BUFFER_SIZE) {
                return WriteAll(data.data(), data.size());
            }
        }
        buffer_.append(data.data(), data.size());
        return true;
    }

    bool Flush() override {
        if (fd_ < 0) return false;
        if (buffer_.empty()) return true;
        bool ok = WriteAll(buffer_.data(), buffer_.size());
        buffer_.clear();
        return ok;
    }

    bool Close() override {
        if (fd_ < 0) return false;
        bool ok = Flush();
        if (::fsync(fd_) != 0 && errno != EINVAL) {
            ok = false;
        }
        if (::close(fd_) != 0) {
            ok = false;
        }
        fd_ = -1;
        return ok;
    }

private:
    int fd_;
    std::string buffer_;

    bool WriteAll(const char* data, size_t len) {
        while (len > 0) {
            ssize_t n = ::write(fd_, data, len);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }
};

} // namespace

bool PosixFileSystem::Exists(const std::string& path) const {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

bool PosixFileSystem::IsDirectory(const std::string& path) const {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool PosixFileSystem::CreateDirectories(const std::string& path) {
    if (path.empty()) return false;
    std::string tmp;
    tmp.reserve(path.size());
    for (size_t i = 0; i < path.size(); ++i) {
        tmp += path[i];
        if ((path[i] == '/' || i == path.size() - 1) && tmp != "/") {
            if (::mkdir(tmp.c_str(), 0755) != 0 && errno != EEXIST) {
                return false;
            }
        }
    }
    return IsDirectory(path);
}

std::vector<std::string> PosixFileSystem::List(const std::string& path) const {
    std::vector<std::string> names;
    DIR* dir = ::opendir(path.c_str());
    if (!dir) return names;

    struct dirent* ent;
    while ((ent = ::readdir(dir)) != nullptr) {
        std::string name(ent->d_name);
        if (name == "." || name == "..") continue;
        names.push_back(std::move(name));
    }
    ::closedir(dir);
    return names;
}

bool PosixFileSystem::DeleteRecursively(const std::string& path) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }
    if (!S_ISDIR(st.st_mode)) {
        return ::unlink(path.c_str()) == 0;
    }

    bool ok = true;
    for (const auto& name : List(path)) {
        if (!DeleteRecursively(join_path(path, name))) {
            ok = false;
        }
    }
    if (::rmdir(path.c_str()) != 0) {
        ok = false;
    }
    return ok;
}

std::unique_ptr<IAppendFile> PosixFileSystem::OpenAppend(const std::string& path) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return nullptr;
    }
    return std::make_unique<PosixAppendFile>(fd);
}

std::string join_path(std::string_view dir, std::string_view name) {
    std::string result(dir);
    if (!result.empty() && result.back() != '/') {
        result += '/';
    }
    result.append(name.data(), name.size());
    return result;
}

std::string parent_path(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    size_t slash = path.rfind('/');
    if (slash == std::string_view::npos) {
        return {};
    }
    if (slash == 0) {
        return "/";
    }
    return std::string(path.substr(0, slash));
}

std::string file_name(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    size_t slash = path.rfind('/');
    if (slash == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(slash + 1));
}

} // namespace lumina
