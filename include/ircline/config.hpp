#ifndef IRCLINE_CONFIG_HPP
#define IRCLINE_CONFIG_HPP

#include <istream>
#include <string>

namespace ircline {

// Settings of ircline-dump, read from an INI file:
//
//   [dump]
//   format = fields | wire | joined
//   append_terminator = true
//   stop_on_error = false
//
//   [log]
//   report_errors = true
//   verbose = false
class Config
{
public:
    enum class Format {
        FIELDS,
        WIRE,
        JOINED,
    };

    Format format = Format::FIELDS;

    // Captures saved with plain "\n" lose the '\r' the parser needs.
    bool appendTerminator = true;
    bool stopOnError = false;

    bool reportErrors = true;
    bool verbose = false;

    // Both throw std::runtime_error on unreadable input or bad values.
    static Config read(std::istream &stream);
    static Config load(const std::string &path);

    std::string toString() const;
};

Config::Format parseFormat(const std::string &value);
const char *formatToString(Config::Format format) noexcept;

}  // namespace ircline

#endif  // IRCLINE_CONFIG_HPP
