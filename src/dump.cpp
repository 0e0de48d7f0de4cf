#include "ircline/dump.hpp"

#include "ircline/parser.hpp"
#include "ircline/utilities.hpp"

namespace ircline {

LineDumper::LineDumper(const Config &_config, std::ostream &_out,
                       std::ostream &_log)
    : config(_config)
    , out(_out)
    , log(_log)
{
}

bool
LineDumper::feed(std::string line)
{
    ++this->lineNo;
    if (line.empty() || line == "\r") {
        return true;
    }
    if (this->config.appendTerminator && line.back() != '\r') {
        line.push_back('\r');
    }

    auto res = Parser::parseMessage(line);
    if (auto eval = res.error(); eval) {
        ++this->failedCount;
        if (this->config.reportErrors) {
            this->log << utcDateTime() << " line " << this->lineNo << ": "
                      << eval->toString() << std::endl;
        }
        return false;
    }

    ++this->decodedCount;
    const auto &ircMessage = *res.returned();
    switch (this->config.format) {
        case Config::Format::FIELDS:
            this->out << ircMessage << "\n\n";
            break;
        case Config::Format::WIRE:
            this->out << ircMessage.toString() << '\n';
            break;
        case Config::Format::JOINED:
            this->out << ircMessage.toWhitespaceSeparated() << '\n';
            break;
    }
    return true;
}

}  // namespace ircline
