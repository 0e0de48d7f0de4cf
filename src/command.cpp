#include "ircline/command.hpp"

#include <algorithm>
#include <charconv>

namespace ircline {

Command
Command::fromToken(std::string_view token)
{
    bool digits = !token.empty() &&
                  std::all_of(token.begin(), token.end(),
                              [](char c) { return c >= '0' && c <= '9'; });
    if (digits) {
        std::uint16_t code = 0;
        auto res = std::from_chars(token.data(), token.data() + token.size(), code);
        if (res.ec == std::errc() && res.ptr == token.data() + token.size()) {
            return Command::makeNumeric(code);
        }
    }
    return Command::makeNamed(token);
}

Command
Command::makeNamed(std::string_view name)
{
    Command command;
    command.type = Type::NAMED;
    command.name = std::string(name);
    return command;
}

Command
Command::makeNumeric(std::uint16_t code)
{
    Command command;
    command.type = Type::NUMERIC;
    command.code = code;
    return command;
}

std::string
Command::toString() const
{
    if (this->type == Type::NUMERIC) {
        return std::to_string(this->code);
    }
    return this->name;
}

bool
Command::operator==(const Command &other) const
{
    if (this->type != other.type) {
        return false;
    }
    if (this->type == Type::NUMERIC) {
        return this->code == other.code;
    }
    return this->name == other.name;
}

}  // namespace ircline
