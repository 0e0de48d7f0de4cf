#include "ircline/parser.hpp"

#include <utility>

namespace ircline {
namespace Parser {

namespace {

// nick!user@host over the whole word, nullopt as soon as it cannot match
std::optional<Prefix>
parseUserPrefix(std::string_view word)
{
    Cursor sub(word);
    auto nick = sub.takeThrough('!');
    if (!nick) {
        return std::nullopt;
    }
    auto user = sub.takeThrough('@');
    if (!user) {
        return std::nullopt;
    }
    return Prefix::makeUser(*nick, *user, sub.remaining());
}

}  // namespace

Result<std::optional<Prefix>>
parsePrefix(Cursor &cursor)
{
    if (!cursor.startsWith(':')) {
        return std::optional<Prefix>();
    }

    const auto start = cursor.position();
    const auto rest = cursor.remaining();
    cursor.consume(':');

    auto word = cursor.takeWord();
    if (!word) {
        return ParseError::malformed("prefix is not followed by a space", start,
                                     rest);
    }
    if (word->find('\r') != std::string_view::npos) {
        return ParseError::malformed("line ends inside the prefix", start, rest);
    }
    cursor.consume(' ');

    if (auto user = parseUserPrefix(*word); user) {
        return std::optional<Prefix>(std::move(*user));
    }
    return std::optional<Prefix>(Prefix::makeServer(*word));
}

Result<Command>
parseCommand(Cursor &cursor)
{
    const auto start = cursor.position();
    const auto rest = cursor.remaining();

    auto end = rest.find_first_of(" \r");
    if (end == std::string_view::npos) {
        return ParseError::incomplete("no line terminator after the command",
                                      start, rest);
    }
    if (end == 0) {
        return ParseError::malformed("missing command", start, rest);
    }

    cursor.advance(end);
    return Command::fromToken(rest.substr(0, end));
}

Result<std::vector<std::string>>
parseParams(Cursor &cursor)
{
    const auto start = cursor.position();
    const auto rest = cursor.remaining();

    auto region = cursor.takeThrough('\r');
    if (!region) {
        return ParseError::incomplete("no line terminator", start + rest.size(),
                                      rest);
    }

    auto marker = region->find(':');
    if (marker == std::string_view::npos) {
        // without a ':' every word is its own param, including the last one
        return Scanner::splitWhitespace(*region);
    }

    auto params = Scanner::splitWhitespace(region->substr(0, marker));
    params.emplace_back(region->substr(marker + 1));
    return params;
}

Result<IRCMessage>
parseMessage(std::string_view line)
{
    Cursor cursor(line);
    IRCMessage ircMessage;

    auto prefix = parsePrefix(cursor);
    if (auto eval = prefix.error(); eval) {
        return *eval;
    }
    ircMessage.prefix = std::move(*prefix.returned());

    auto command = parseCommand(cursor);
    if (auto eval = command.error(); eval) {
        return *eval;
    }
    ircMessage.command = std::move(*command.returned());

    auto params = parseParams(cursor);
    if (auto eval = params.error(); eval) {
        return *eval;
    }
    ircMessage.params = std::move(*params.returned());

    return ircMessage;
}

}  // namespace Parser
}  // namespace ircline
