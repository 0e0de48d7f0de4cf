#ifndef IRCLINE_SCANNER_HPP
#define IRCLINE_SCANNER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ircline {

// Read position over one protocol line. The cursor only views the bytes,
// the caller keeps the underlying buffer alive while it is in use.
class Cursor
{
public:
    explicit Cursor(std::string_view _input) noexcept
        : input(_input)
    {
    }

    std::string_view remaining() const noexcept;
    std::size_t position() const noexcept;
    bool empty() const noexcept;
    bool startsWith(char c) const noexcept;

    // Consumes one byte if it equals c.
    bool consume(char c) noexcept;

    // Bytes before the next delim. The cursor stops on the delimiter.
    // Returns nullopt and does not move if delim never occurs.
    std::optional<std::string_view> takeUntil(char delim) noexcept;

    // Same as takeUntil but the delimiter is consumed as well.
    std::optional<std::string_view> takeThrough(char delim) noexcept;

    // A word runs up to the next single space (0x20).
    std::optional<std::string_view> takeWord() noexcept;

    void advance(std::size_t n) noexcept;

private:
    std::string_view input;
    std::size_t pos = 0;
};

namespace Scanner {

// Splits on whitespace bytes, empty tokens are dropped.
std::vector<std::string> splitWhitespace(std::string_view text);

}  // namespace Scanner

}  // namespace ircline

#endif  // IRCLINE_SCANNER_HPP
