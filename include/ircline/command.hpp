#ifndef IRCLINE_COMMAND_HPP
#define IRCLINE_COMMAND_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace ircline {

class Command
{
public:
    enum class Type {
        NAMED,
        NUMERIC,
    };

    // All-digit tokens that fit numeric become NUMERIC, everything else
    // stays NAMED exactly as written.
    static Command fromToken(std::string_view token);
    static Command makeNamed(std::string_view name);
    static Command makeNumeric(std::uint16_t code);

    Type type = Type::NAMED;
    std::string name;
    std::uint16_t code = 0;

    bool isNumeric() const noexcept {
        return this->type == Type::NUMERIC;
    }

    // Numerics are rendered without zero padding, 004 becomes "4".
    std::string toString() const;

    bool operator==(const Command &other) const;
    bool operator!=(const Command &other) const {
        return !(*this == other);
    }

    friend std::ostream &operator<<(std::ostream &stream, const Command &command) {
        return stream << command.toString();
    }
};

}  // namespace ircline

#endif  // IRCLINE_COMMAND_HPP
