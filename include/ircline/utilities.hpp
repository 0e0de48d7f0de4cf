#ifndef IRCLINE_UTILITIES_HPP
#define IRCLINE_UTILITIES_HPP

#include <string>
#include <string_view>

namespace ircline {

std::string changeToLower_copy(std::string str);

// "\r" -> "\\r", other control bytes as "\\xNN"
std::string escapeControl(std::string_view str);

// [YYYY-MM-DD HH:MM:SS] in UTC, prefixes every log line
std::string utcDateTime();

}  // namespace ircline

#endif  // IRCLINE_UTILITIES_HPP
