#include "ircline/prefix.hpp"

namespace ircline {

Prefix
Prefix::makeServer(std::string_view name)
{
    Prefix prefix;
    prefix.type = Type::SERVER;
    prefix.name = std::string(name);
    return prefix;
}

Prefix
Prefix::makeUser(std::string_view nick, std::string_view user,
                 std::string_view host)
{
    Prefix prefix;
    prefix.type = Type::USER;
    prefix.nick = std::string(nick);
    prefix.user = std::string(user);
    prefix.host = std::string(host);
    return prefix;
}

std::string
Prefix::toString() const
{
    if (this->type == Type::USER) {
        return this->nick + "!" + this->user + "@" + this->host;
    }
    return this->name;
}

bool
Prefix::operator==(const Prefix &other) const
{
    if (this->type != other.type) {
        return false;
    }
    if (this->type == Type::USER) {
        return this->nick == other.nick && this->user == other.user &&
               this->host == other.host;
    }
    return this->name == other.name;
}

}  // namespace ircline
