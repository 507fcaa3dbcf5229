#include "lumina/config.hpp"

#include <fmt/format.h>

#include <cctype>

namespace lumina {

namespace {

bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool has_braces(const std::string& s) {
    return s.find('{') != std::string::npos || s.find('}') != std::string::npos;
}

} // namespace

std::string default_file_namer(const std::string& directory, const std::string& severity) {
    return join_path(directory, severity + ".log");
}

std::string default_message_formatter(const std::string& time,
                                      const std::string& colored_severity,
                                      const std::string& logger_name,
                                      const std::vector<std::string>& lines) {
    const std::string prefix = fmt::format("[{}] - {} - {} - ", time, colored_severity, logger_name);

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += prefix;
        for (char c : lines[i]) {
            out += c;
            if (c == '\n') out += prefix;
        }
    }
    return out;
}

void EngineConfig::Validate() const {
    if (is_blank(name)) {
        throw ConfigError("logger name must not be blank");
    }
    if (queue_capacity == 0) {
        throw ConfigError("queue capacity must be greater than zero");
    }
    if (rotation.retention.count() <= 0) {
        throw ConfigError("rotation retention must be positive");
    }
    if (rotation.enabled && rotation.sweep_interval.count() <= 0) {
        throw ConfigError("rotation sweep interval must be positive");
    }
    if (time_format.empty() || date_format.empty()) {
        throw ConfigError("time and date formats must not be empty");
    }
    if (has_braces(time_format) || has_braces(date_format)) {
        throw ConfigError("time and date formats must not contain '{' or '}'");
    }
    if (!directory && log_root.empty()) {
        throw ConfigError("either a directory namer or a log root is required");
    }
    if (!file || !message || !clock) {
        throw ConfigError("file namer, message formatter and clock must be set");
    }
    if (!filesystem) {
        throw ConfigError("filesystem must be set");
    }
    if (console == nullptr || diagnostics == nullptr) {
        throw ConfigError("console and diagnostic streams must be set");
    }
}

std::string EngineConfig::PeriodKey(TimePoint t) const {
    return format_instant(t, date_format, use_utc);
}

std::string EngineConfig::TimeString(TimePoint t) const {
    return format_instant(t, time_format, use_utc);
}

std::string EngineConfig::DirectoryFor(const std::string& period_key) const {
    if (directory) {
        return directory(period_key);
    }
    return join_path(log_root, period_key);
}

std::string EngineConfig::FileFor(const std::string& period_key,
                                  const std::string& severity) const {
    return file(DirectoryFor(period_key), severity);
}

std::string EngineConfig::RotationRoot(TimePoint now) const {
    std::string root = parent_path(DirectoryFor(PeriodKey(now)));
    return root.empty() ? std::string(".") : root;
}

} // namespace lumina
