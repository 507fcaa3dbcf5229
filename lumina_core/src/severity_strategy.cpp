#include "lumina/severity_strategy.hpp"

#include <cxxabi.h>
#include <fmt/format.h>

#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <typeinfo>

#include "lumina/ansi.hpp"

namespace lumina {

namespace {

constexpr const char* kStackTraceBegin = "STACKTRACE BEGIN";
constexpr const char* kStackTraceEnd = "STACKTRACE END";

std::string lower(const std::string& s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> res(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    return (status == 0 && res) ? std::string(res.get()) : std::string(mangled);
}

void append_exception(const std::exception& e, std::vector<std::string>& out, bool cause) {
    out.push_back(fmt::format("{}: {}", cause ? "Caused by" : "Exception",
                              demangle(typeid(e).name())));
    out.push_back(fmt::format("Message: {}", e.what()));
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        append_exception(nested, out, true);
    } catch (...) {
        out.push_back("Caused by: <non-standard exception>");
    }
}

} // namespace

std::vector<std::string> describe_exception(const std::exception& e) {
    std::vector<std::string> lines;
    append_exception(e, lines, false);
    return lines;
}

SeverityStrategy::SeverityStrategy(std::string name, std::string color, StrategyKind kind,
                                   const EngineConfig& config, SinkCache& cache)
    : name_(std::move(name))
    , color_(std::move(color))
    , file_stem_(lower(name_))
    , kind_(kind)
    , config_(config)
    , cache_(cache)
{
}

SeverityStrategy::~SeverityStrategy() {
    Close();
}

void SeverityStrategy::Report(const std::string& what) const {
    fmt::print(config_.diagnostics, "[{}] {}: {}\n", config_.name, name_, what);
}

void SeverityStrategy::ReleaseSink() {
    if (sink_ == nullptr) {
        return;
    }
    if (!cache_.Release(current_path_)) {
        Report(fmt::format("failed to close '{}'", current_path_));
    }
    sink_ = nullptr;
}

void SeverityStrategy::RotateIfNeeded(const std::string& period_key) {
    if (sink_ != nullptr && period_key == current_period_key_) {
        return;
    }

    ReleaseSink();

    current_period_key_ = period_key;
    current_path_ = config_.FileFor(period_key, file_stem_);
    sink_ = cache_.Acquire(current_path_, *config_.filesystem);
    if (sink_ == nullptr) {
        Report(fmt::format("failed to open '{}'", current_path_));
        // retry on the next message
        current_period_key_.clear();
    }
}

void SeverityStrategy::Write(const Message& message) {
    std::lock_guard<std::mutex> lock(cache_.Mutex());

    RotateIfNeeded(config_.PeriodKey(message.created_at));

    if (message.echo_to_console) {
        std::string text = Render(message.created_at, message.lines, true);
        fmt::print(config_.console, "{}\n", text);
    }

    if (sink_ != nullptr) {
        std::string text = Render(message.created_at, message.lines, false);
        text += '\n';
        if (!sink_->Write(text) || !sink_->Flush()) {
            Report(fmt::format("failed to write '{}'", current_path_));
        }
    }

    // 关闭后不保留句柄
    if (sealed_) {
        ReleaseSink();
        current_period_key_.clear();
    }
}

void SeverityStrategy::Close() {
    std::lock_guard<std::mutex> lock(cache_.Mutex());
    ReleaseSink();
    current_period_key_.clear();
}

void SeverityStrategy::SealLocked() {
    ReleaseSink();
    current_period_key_.clear();
    sealed_ = true;
}

std::string SeverityStrategy::CurrentPeriodKey() {
    std::lock_guard<std::mutex> lock(cache_.Mutex());
    return current_period_key_;
}

std::string SeverityStrategy::CurrentPath() {
    std::lock_guard<std::mutex> lock(cache_.Mutex());
    return sink_ ? current_path_ : std::string();
}

std::string SeverityStrategy::FormatConsole(TimePoint timestamp,
                                            const std::vector<std::string>& lines) const {
    return Render(timestamp, lines, true);
}

std::string SeverityStrategy::FormatFile(TimePoint timestamp,
                                         const std::vector<std::string>& lines) const {
    return Render(timestamp, lines, false);
}

std::string SeverityStrategy::Render(TimePoint timestamp, const std::vector<std::string>& lines,
                                     bool for_console) const {
    std::string text;
    if (kind_ == StrategyKind::StackTrace) {
        text = RenderStackTrace(timestamp, lines, for_console);
    } else {
        std::string label = fmt::format("{}{}{}", color_, name_, ansi::kReset);
        text = config_.message(config_.TimeString(timestamp), label, config_.name, lines);
    }
    // 文件中保留 & 标记原文，只去掉转义序列
    return for_console ? to_display(text) : to_plain(text);
}

std::string SeverityStrategy::RenderStackTrace(TimePoint timestamp,
                                               const std::vector<std::string>& lines,
                                               bool for_console) const {
    const std::string prefix = fmt::format("[{}] ", config_.TimeString(timestamp));
    std::string begin = kStackTraceBegin;
    std::string end = kStackTraceEnd;
    if (for_console) {
        begin = fmt::format("{}{}{}", ansi::kBoldRed, kStackTraceBegin, ansi::kReset);
        end = fmt::format("{}{}{}", ansi::kBoldRed, kStackTraceEnd, ansi::kReset);
    }

    std::string out = fmt::format("{}----------- {} -----------\n", prefix, begin);
    out += fmt::format("{}From (Logger Name): {}\n", prefix, config_.name);
    for (const auto& line : lines) {
        out += prefix;
        for (char c : line) {
            out += c;
            if (c == '\n') out += prefix;
        }
        out += '\n';
    }
    out += fmt::format("{}-----------  {}  -----------", prefix, end);
    return out;
}

} // namespace lumina
