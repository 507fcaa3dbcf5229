#pragma once
#include <string>
#include <vector>

#include "timestamp.hpp"

namespace lumina {

class SeverityStrategy;

// One log call. Built at the call site, consumed exactly once by the
// dispatcher (or written synchronously during shutdown).
struct Message {
    SeverityStrategy*        strategy = nullptr;
    std::vector<std::string> lines;
    bool                     echo_to_console = true;
    TimePoint                created_at{};
};

} // namespace lumina
