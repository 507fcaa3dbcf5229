#include "lumina/sink_cache.hpp"

namespace lumina {

SinkCache::~SinkCache() {
    for (auto& kv : sinks_) {
        if (kv.second.file) {
            kv.second.file->Close();
        }
    }
}

IAppendFile* SinkCache::Acquire(const std::string& path, IFileSystem& fs) {
    auto it = sinks_.find(path);
    if (it != sinks_.end()) {
        ++it->second.refs;
        return it->second.file.get();
    }

    std::string dir = parent_path(path);
    if (!dir.empty() && !fs.Exists(dir) && !fs.CreateDirectories(dir)) {
        return nullptr;
    }

    std::unique_ptr<IAppendFile> file = fs.OpenAppend(path);
    if (!file) {
        return nullptr;
    }
    IAppendFile* raw = file.get();
    sinks_.emplace(path, Entry{std::move(file), 1});
    return raw;
}

bool SinkCache::Release(const std::string& path) {
    auto it = sinks_.find(path);
    if (it == sinks_.end()) {
        return true;
    }
    if (--it->second.refs > 0) {
        return true;
    }
    bool ok = it->second.file->Close();
    sinks_.erase(it);
    return ok;
}

bool SinkCache::FlushAll() {
    bool ok = true;
    for (auto& kv : sinks_) {
        if (!kv.second.file->Flush()) {
            ok = false;
        }
    }
    return ok;
}

bool SinkCache::CloseAll() {
    bool ok = true;
    for (auto& kv : sinks_) {
        if (!kv.second.file->Close()) {
            ok = false;
        }
    }
    sinks_.clear();
    return ok;
}

bool SinkCache::Contains(const std::string& path) const {
    return sinks_.find(path) != sinks_.end();
}

size_t SinkCache::RefCount(const std::string& path) const {
    auto it = sinks_.find(path);
    return it == sinks_.end() ? 0 : it->second.refs;
}

} // namespace lumina
