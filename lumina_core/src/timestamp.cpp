#include "lumina/timestamp.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <time.h>

namespace lumina {

TimePoint wall_clock_now() {
    return std::chrono::system_clock::now();
}

std::tm to_calendar(TimePoint t, bool use_utc) {
    std::time_t sec = std::chrono::system_clock::to_time_t(t);
    std::tm tm_buf{};
    if (use_utc) {
        ::gmtime_r(&sec, &tm_buf);
    } else {
        ::localtime_r(&sec, &tm_buf);
    }
    return tm_buf;
}

std::string format_instant(TimePoint t, std::string_view pattern, bool use_utc) {
    // system_clock::to_time_t truncates toward zero; keep the millisecond part
    // consistent with it.
    auto since_epoch = t.time_since_epoch();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;
    if (ms < 0) ms += 1000;

    std::string spec;
    spec.reserve(pattern.size() + 8);
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '%' && i + 1 < pattern.size()) {
            char c = pattern[i + 1];
            if (c == 'L') {
                spec += fmt::format("{:03d}", ms);
            } else {
                spec += '%';
                spec += c;
            }
            ++i;
        } else {
            spec += pattern[i];
        }
    }
    if (spec.empty()) {
        return {};
    }

    std::tm tm_val = to_calendar(t, use_utc);
    return fmt::format(fmt::runtime("{:" + spec + "}"), tm_val);
}

std::optional<TimePoint> parse_date(std::string_view text, std::string_view pattern,
                                    bool use_utc) {
    if (text.empty() || pattern.empty()) {
        return std::nullopt;
    }
    std::string input(text);
    std::string fmt_str(pattern);

    std::tm tm_val{};
    const char* rest = ::strptime(input.c_str(), fmt_str.c_str(), &tm_val);
    if (rest == nullptr || *rest != '\0') {
        return std::nullopt;
    }

    std::time_t sec;
    if (use_utc) {
        sec = ::timegm(&tm_val);
    } else {
        tm_val.tm_isdst = -1;
        sec = ::mktime(&tm_val);
    }
    if (sec == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(sec);
}

} // namespace lumina
