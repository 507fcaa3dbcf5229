#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lumina {

// Built-in severities. Each one gets its own SeverityStrategy when an
// Engine is constructed; custom severities go through Engine::RegisterStrategy.
enum class LogLevel : uint8_t {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    Fatal = 4
};

constexpr size_t kLogLevelCount = 5;

constexpr std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

constexpr std::string_view default_color(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[0;32m";
        case LogLevel::Info:  return "\033[0;36m";
        case LogLevel::Warn:  return "\033[0;33m";
        case LogLevel::Error: return "\033[0;31m";
        case LogLevel::Fatal: return "\033[1;31m";
    }
    return "";
}

} // namespace lumina
