#include "ircline/ircmessage.hpp"

#include <boost/algorithm/string/join.hpp>

namespace ircline {

std::string
IRCMessage::toString() const
{
    std::string ret;
    if (this->prefix) {
        ret += ":" + this->prefix->toString() + " ";
    }
    ret += this->command.toString() + " ";
    for (const auto &param : this->params) {
        ret += param + " ";
    }
    return ret;
}

std::string
IRCMessage::toWhitespaceSeparated() const
{
    std::string ret = this->command.toString();
    ret += " ";
    if (this->prefix) {
        ret += this->prefix->toString();
    }
    ret += " ";
    ret += boost::algorithm::join(this->params, " ");
    return ret;
}

}  // namespace ircline
