#ifndef IRCLINE_RESULT_HPP
#define IRCLINE_RESULT_HPP

#include "ircline/parseerror.hpp"

#include <optional>
#include <utility>

namespace ircline {

// Either a decoded value or the ParseError that stopped decoding.
//
//   auto res = Parser::parseMessage(line);
//   if (auto eval = res.error(); eval) { ... }
//   else if (auto rval = res.returned(); rval) { ... }
template <typename T>
class Result
{
public:
    Result(T &&_value)
        : val(std::move(_value))
    {
    }

    Result(const T &_value)
        : val(_value)
    {
    }

    Result(ParseError &&_err)
        : err(std::move(_err))
    {
    }

    Result(const ParseError &_err)
        : err(_err)
    {
    }

    const ParseError *error() const noexcept {
        return this->err ? &*this->err : nullptr;
    }

    const T *returned() const noexcept {
        return this->val ? &*this->val : nullptr;
    }

    T *returned() noexcept {
        return this->val ? &*this->val : nullptr;
    }

    explicit operator bool() const noexcept {
        return this->val.has_value();
    }

private:
    std::optional<T> val;
    std::optional<ParseError> err;
};

}  // namespace ircline

#endif  // IRCLINE_RESULT_HPP
