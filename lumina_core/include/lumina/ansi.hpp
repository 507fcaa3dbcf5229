#pragma once
#include <string>
#include <string_view>

namespace lumina
{
namespace ansi
{

inline constexpr std::string_view kBlack = "\033[0;30m";
inline constexpr std::string_view kRed = "\033[0;31m";
inline constexpr std::string_view kGreen = "\033[0;32m";
inline constexpr std::string_view kYellow = "\033[0;33m";
inline constexpr std::string_view kBlue = "\033[0;34m";
inline constexpr std::string_view kPurple = "\033[0;35m";
inline constexpr std::string_view kCyan = "\033[0;36m";
inline constexpr std::string_view kWhite = "\033[0;37m";

inline constexpr std::string_view kBoldBlack = "\033[1;30m";
inline constexpr std::string_view kBoldRed = "\033[1;31m";
inline constexpr std::string_view kBoldGreen = "\033[1;32m";
inline constexpr std::string_view kBoldYellow = "\033[1;33m";
inline constexpr std::string_view kBoldBlue = "\033[1;34m";
inline constexpr std::string_view kBoldPurple = "\033[1;35m";
inline constexpr std::string_view kBoldCyan = "\033[1;36m";
inline constexpr std::string_view kBoldWhite = "\033[1;37m";

inline constexpr std::string_view kHighBlack = "\033[0;90m";
inline constexpr std::string_view kHighRed = "\033[0;91m";
inline constexpr std::string_view kHighGreen = "\033[0;92m";
inline constexpr std::string_view kHighYellow = "\033[0;93m";
inline constexpr std::string_view kHighBlue = "\033[0;94m";
inline constexpr std::string_view kHighPurple = "\033[0;95m";
inline constexpr std::string_view kHighCyan = "\033[0;96m";
inline constexpr std::string_view kHighWhite = "\033[0;97m";

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kItalic = "\033[3m";
inline constexpr std::string_view kUnderline = "\033[4m";

// 颜色标记字符，例如 "&c" -> 高亮红色，"\&" -> 字面量 '&'
inline constexpr char kMarker = '&';
inline constexpr char kEscape = '\\';

// Returns the sequence for a marker code (case-insensitive), or an empty
// view when the code is not in the table.
std::string_view code_for(char code);

}  // namespace ansi

// Replaces "&<code>" with its ANSI sequence and "\&" with a literal '&'.
// Unknown codes are copied unchanged.
std::string to_display(std::string_view text);

// Removes every "ESC [ <digits/;> m" sequence.
std::string to_plain(std::string_view text);

}  // namespace lumina
