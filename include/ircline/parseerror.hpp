#ifndef IRCLINE_PARSEERROR_HPP
#define IRCLINE_PARSEERROR_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace ircline {

class ParseError
{
public:
    enum class Kind {
        // No terminator yet, more bytes may complete the line.
        INCOMPLETE,
        // Can never form a message, whatever follows.
        MALFORMED,
    };

    constexpr static std::size_t maxFragment = 32;

    ParseError(Kind _kind, std::string _description, std::size_t _offset,
               std::string_view near);

    static ParseError incomplete(std::string description, std::size_t offset,
                                 std::string_view near);
    static ParseError malformed(std::string description, std::size_t offset,
                                std::string_view near);

    Kind kind() const noexcept {
        return this->errKind;
    }

    const std::string &error() const noexcept {
        return this->description;
    }

    std::size_t offset() const noexcept {
        return this->errOffset;
    }

    const std::string &fragment() const noexcept {
        return this->near;
    }

    bool isIncomplete() const noexcept {
        return this->errKind == Kind::INCOMPLETE;
    }

    std::string toString() const;

private:
    Kind errKind;
    std::string description;
    std::size_t errOffset;
    std::string near;
};

const char *kindToString(ParseError::Kind kind) noexcept;

}  // namespace ircline

#endif  // IRCLINE_PARSEERROR_HPP
