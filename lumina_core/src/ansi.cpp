#include "lumina/ansi.hpp"

namespace lumina {

namespace ansi {

std::string_view code_for(char code) {
    if (code >= 'A' && code <= 'Z') {
        code = static_cast<char>(code - 'A' + 'a');
    }
    switch (code) {
        case '0': return kBlack;
        case '1': return kBlue;
        case '2': return kGreen;
        case '3': return kCyan;
        case '4': return kRed;
        case '5': return kPurple;
        case '6': return kYellow;
        case '7': return kWhite;
        case '8': return kHighBlack;
        case '9': return kHighBlue;
        case 'a': return kHighGreen;
        case 'b': return kHighCyan;
        case 'c': return kHighRed;
        case 'd': return kHighPurple;
        case 'e': return kHighYellow;
        case 'f': return kHighWhite;
        case 'g': return kYellow;
        case 'r': return kReset;
        default:  return {};
    }
}

} // namespace ansi

std::string to_display(std::string_view text) {
    if (text.find(ansi::kMarker) == std::string_view::npos &&
        text.find(ansi::kEscape) == std::string_view::npos) {
        return std::string(text);
    }

    std::string out;
    out.reserve(text.size() + 32);

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == ansi::kEscape && i + 1 < text.size() && text[i + 1] == ansi::kMarker) {
            out += ansi::kMarker;
            i += 2;
            continue;
        }
        if (c == ansi::kMarker && i + 1 < text.size()) {
            std::string_view seq = ansi::code_for(text[i + 1]);
            if (!seq.empty()) {
                out.append(seq.data(), seq.size());
                i += 2;
                continue;
            }
        }
        out += c;
        ++i;
    }
    return out;
}

std::string to_plain(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\033' && i + 1 < text.size() && text[i + 1] == '[') {
            size_t j = i + 2;
            while (j < text.size() && ((text[j] >= '0' && text[j] <= '9') || text[j] == ';')) {
                ++j;
            }
            if (j < text.size() && text[j] == 'm') {
                i = j + 1;
                continue;
            }
        }
        out += text[i];
        ++i;
    }
    return out;
}

} // namespace lumina
