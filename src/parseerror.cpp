#include "ircline/parseerror.hpp"

#include "ircline/utilities.hpp"

#include <sstream>
#include <utility>

namespace ircline {

ParseError::ParseError(Kind _kind, std::string _description,
                       std::size_t _offset, std::string_view _near)
    : errKind(_kind)
    , description(std::move(_description))
    , errOffset(_offset)
    , near(_near.substr(0, maxFragment))
{
}

ParseError
ParseError::incomplete(std::string description, std::size_t offset,
                       std::string_view near)
{
    return ParseError(Kind::INCOMPLETE, std::move(description), offset, near);
}

ParseError
ParseError::malformed(std::string description, std::size_t offset,
                      std::string_view near)
{
    return ParseError(Kind::MALFORMED, std::move(description), offset, near);
}

std::string
ParseError::toString() const
{
    std::stringstream ss;
    ss << kindToString(this->errKind) << " at " << this->errOffset << ": "
       << this->description;
    if (!this->near.empty()) {
        ss << " (near '" << escapeControl(this->near) << "')";
    }
    return ss.str();
}

const char *
kindToString(ParseError::Kind kind) noexcept
{
    switch (kind) {
        case ParseError::Kind::INCOMPLETE:
            return "incomplete";
        case ParseError::Kind::MALFORMED:
            return "malformed";
    }
    return "malformed";
}

}  // namespace ircline
