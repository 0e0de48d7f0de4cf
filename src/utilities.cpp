#include "ircline/utilities.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ircline {

std::string
changeToLower_copy(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string
escapeControl(std::string_view str)
{
    std::stringstream ss;
    for (char c : str) {
        auto byte = static_cast<unsigned char>(c);
        if (c == '\r') {
            ss << "\\r";
        } else if (c == '\n') {
            ss << "\\n";
        } else if (c == '\t') {
            ss << "\\t";
        } else if (byte < 0x20 || byte == 0x7f) {
            ss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
               << static_cast<int>(byte) << std::dec;
        } else {
            ss << c;
        }
    }
    return ss.str();
}

std::string
utcDateTime()
{
    std::time_t t = std::time(nullptr);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&t), "[%F %H:%M:%S]");
    return ss.str();
}

}  // namespace ircline
