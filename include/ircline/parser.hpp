#ifndef IRCLINE_PARSER_HPP
#define IRCLINE_PARSER_HPP

#include "ircline/command.hpp"
#include "ircline/ircmessage.hpp"
#include "ircline/prefix.hpp"
#include "ircline/result.hpp"
#include "ircline/scanner.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ircline {
namespace Parser {

/*
    <message>  ::= [':' <prefix> ' '] <command> <params> '\r'
    <prefix>   ::= <nick> '!' <user> '@' <host> | <servername>
    <command>  ::= <number> | <word>
    <params>   ::= {<middle>} [':' <trailing>]

    The stages below share one Cursor and each leaves it just past what it
    decoded. On error the cursor position is unspecified.
*/

// No leading ':' yields an empty optional and an untouched cursor.
Result<std::optional<Prefix>> parsePrefix(Cursor &cursor);

Result<Command> parseCommand(Cursor &cursor);

// Consumes up to and including the '\r'.
Result<std::vector<std::string>> parseParams(Cursor &cursor);

// Decodes one line. Never throws, bytes after the '\r' are ignored.
Result<IRCMessage> parseMessage(std::string_view line);

}  // namespace Parser
}  // namespace ircline

#endif  // IRCLINE_PARSER_HPP
