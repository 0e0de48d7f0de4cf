#include "ircline/scanner.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <algorithm>

namespace ircline {

std::string_view
Cursor::remaining() const noexcept
{
    return this->input.substr(this->pos);
}

std::size_t
Cursor::position() const noexcept
{
    return this->pos;
}

bool
Cursor::empty() const noexcept
{
    return this->pos >= this->input.size();
}

bool
Cursor::startsWith(char c) const noexcept
{
    return !this->empty() && this->input[this->pos] == c;
}

bool
Cursor::consume(char c) noexcept
{
    if (!this->startsWith(c)) {
        return false;
    }
    ++this->pos;
    return true;
}

std::optional<std::string_view>
Cursor::takeUntil(char delim) noexcept
{
    auto found = this->input.find(delim, this->pos);
    if (found == std::string_view::npos) {
        return std::nullopt;
    }
    auto taken = this->input.substr(this->pos, found - this->pos);
    this->pos = found;
    return taken;
}

std::optional<std::string_view>
Cursor::takeThrough(char delim) noexcept
{
    auto taken = this->takeUntil(delim);
    if (taken) {
        ++this->pos;
    }
    return taken;
}

std::optional<std::string_view>
Cursor::takeWord() noexcept
{
    return this->takeUntil(' ');
}

void
Cursor::advance(std::size_t n) noexcept
{
    this->pos = std::min(this->pos + n, this->input.size());
}

namespace Scanner {

std::vector<std::string>
splitWhitespace(std::string_view text)
{
    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, text, boost::algorithm::is_space(),
                            boost::algorithm::token_compress_on);
    // compression still leaves an empty token at either end
    tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                [](const std::string &token) { return token.empty(); }),
                 tokens.end());
    return tokens;
}

}  // namespace Scanner

}  // namespace ircline
