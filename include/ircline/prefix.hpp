#ifndef IRCLINE_PREFIX_HPP
#define IRCLINE_PREFIX_HPP

#include <ostream>
#include <string>
#include <string_view>

namespace ircline {

class Prefix
{
public:
    enum class Type {
        SERVER,
        USER,
    };

    static Prefix makeServer(std::string_view name);
    static Prefix makeUser(std::string_view nick, std::string_view user,
                           std::string_view host);

    Type type = Type::SERVER;

    // SERVER
    std::string name;

    // USER
    std::string nick;
    std::string user;
    std::string host;

    bool isUser() const noexcept {
        return this->type == Type::USER;
    }

    // nick!user@host or the bare server name
    std::string toString() const;

    bool operator==(const Prefix &other) const;
    bool operator!=(const Prefix &other) const {
        return !(*this == other);
    }

    friend std::ostream &operator<<(std::ostream &stream, const Prefix &prefix) {
        return stream << prefix.toString();
    }
};

}  // namespace ircline

#endif  // IRCLINE_PREFIX_HPP
