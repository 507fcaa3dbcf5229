#pragma once
#include <chrono>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace lumina
{

using TimePoint = std::chrono::system_clock::time_point;

TimePoint wall_clock_now();

std::tm to_calendar(TimePoint t, bool use_utc);

// strftime-style pattern with one extension: "%L" renders milliseconds
// (three digits).
std::string format_instant(TimePoint t, std::string_view pattern, bool use_utc);

// Inverse of format_instant for date-only patterns. The whole input must be
// consumed; returns nullopt otherwise.
std::optional<TimePoint> parse_date(std::string_view text, std::string_view pattern,
                                    bool use_utc);

}  // namespace lumina
