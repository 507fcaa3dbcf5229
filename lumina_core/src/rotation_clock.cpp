#include "lumina/rotation_clock.hpp"

#include <fmt/format.h>

#include <exception>
#include <string>
#include <vector>

namespace lumina {

RotationClock::RotationClock(const EngineConfig& config, SinkCache& cache)
    : config_(config), cache_(cache) {}

RotationClock::~RotationClock() {
    Stop();
}

void RotationClock::Start() {
    if (!config_.rotation.enabled) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != RotationState::Stopped) {
        return;
    }
    state_ = RotationState::Running;
    worker_ = std::thread(&RotationClock::Loop, this);
}

void RotationClock::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != RotationState::Running) {
            return;
        }
        state_ = RotationState::Stopping;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = RotationState::Stopped;
}

RotationState RotationClock::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t RotationClock::SweepOnce(TimePoint now) {
    const TimePoint threshold = now - config_.rotation.retention;
    const std::string root = config_.RotationRoot(now);
    IFileSystem& fs = *config_.filesystem;

    std::lock_guard<std::mutex> lock(cache_.Mutex());

    size_t removed = 0;
    std::vector<std::string> names = fs.List(root);
    for (const auto& name : names) {
        std::string path = join_path(root, name);
        if (!fs.IsDirectory(path)) {
            continue;
        }
        auto dir_date = parse_date(name, config_.date_format, config_.use_utc);
        if (!dir_date) {
            continue;
        }
        if (*dir_date < threshold) {
            if (fs.DeleteRecursively(path)) {
                ++removed;
            } else {
                fmt::print(config_.diagnostics, "[{}] rotation: failed to delete '{}'\n",
                           config_.name, path);
            }
        }
    }
    return removed;
}

void RotationClock::Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (state_ == RotationState::Running) {
        lock.unlock();
        try {
            SweepOnce(config_.clock());
        } catch (const std::exception& e) {
            fmt::print(config_.diagnostics, "[{}] rotation: sweep failed: {}\n",
                       config_.name, e.what());
        }
        lock.lock();
        cv_.wait_for(lock, config_.rotation.sweep_interval,
                     [this] { return state_ != RotationState::Running; });
    }
}

} // namespace lumina
