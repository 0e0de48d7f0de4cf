#ifndef IRCLINE_DUMP_HPP
#define IRCLINE_DUMP_HPP

#include "ircline/config.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace ircline {

// Decodes capture lines one at a time and prints them in the configured
// format. Decode failures go to the log stream.
class LineDumper
{
public:
    LineDumper(const Config &_config, std::ostream &_out, std::ostream &_log);

    // false when the line did not decode; blank lines are skipped
    bool feed(std::string line);

    std::size_t decoded() const noexcept {
        return this->decodedCount;
    }

    std::size_t failed() const noexcept {
        return this->failedCount;
    }

    bool shouldStop() const noexcept {
        return this->config.stopOnError && this->failedCount > 0;
    }

private:
    const Config &config;
    std::ostream &out;
    std::ostream &log;
    std::size_t lineNo = 0;
    std::size_t decodedCount = 0;
    std::size_t failedCount = 0;
};

}  // namespace ircline

#endif  // IRCLINE_DUMP_HPP
