#ifndef IRCLINE_IRCMESSAGE_HPP
#define IRCLINE_IRCMESSAGE_HPP

#include "ircline/command.hpp"
#include "ircline/prefix.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ircline {

class IRCMessage
{
public:
    IRCMessage() = default;

    std::optional<Prefix> prefix;
    Command command;
    std::vector<std::string> params;

    // [":" prefix " "] command " " {param " "}
    // The trailing ':' marker is not restored, so the text does not
    // always reparse to the same message.
    std::string toString() const;

    // command " " [prefix] " " params joined by spaces
    std::string toWhitespaceSeparated() const;

    friend std::ostream &operator<<(std::ostream &stream, const IRCMessage &ircMessage) {
        stream << "prefix: ";
        if (ircMessage.prefix) {
            stream << *ircMessage.prefix;
        }
        stream << "\ncommand: " << ircMessage.command;
        for (std::vector<std::string>::size_type i = 0; i < ircMessage.params.size(); ++i) {
            stream << "\nparams[" << i << "]: " << ircMessage.params[i];
        }
        return stream;
    }
};

}  // namespace ircline

#endif  // IRCLINE_IRCMESSAGE_HPP
