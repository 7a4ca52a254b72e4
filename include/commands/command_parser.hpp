#ifndef TICKLER_COMMAND_PARSER_HPP
#define TICKLER_COMMAND_PARSER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "command.hpp"

namespace tickler {

struct ParseError {
    enum class Kind {
        Syntax,     // grammar mismatch, bad digits, unknown weekday
        Calendar    // expression parsed but could not be applied to "now"
    };

    Kind kind = Kind::Syntax;
    size_t position = 0;    // byte offset into the command text
    std::string token;      // nearest failing token
    std::string message;

    std::string describe() const;
};

// Recursive-descent parser for the `$keyword args` command language.
//
//   $r|remindme|reminder <time-expr>;[ ]<message>
//   $cr|cancelreminder <id>
//   $si|setinterval <id> <time-expr without branches>
//   $ci|clearinterval <id>
//   $rs|reminders
//   $tz|timezone <zone>
//   $tf|timeformat 12h|24h
//   $h|help
//
// A time expression is a space-separated list of modifiers; "(a, b)" is a
// branch that multiplies the candidate sequences. Expressions that would
// expand past kMaxCandidates are rejected at the offending branch.
class CommandParser {
public:
    static constexpr char kPrefix = '$';
    // Upper bound on the candidates a time expression may expand to.
    static constexpr size_t kMaxCandidates = 64;

    static bool isCommand(const std::string& text);

    // Time expressions are evaluated against the current time in `zone`.
    static bool parse(const std::string& text, const TimeZone& zone, Command& out, ParseError& error);
    static bool parse(const std::string& text, const ZonedTime& now, Command& out, ParseError& error);

    // The whole input must be a time expression.
    static bool parseTimeExpression(const std::string& text, std::vector<Modifier>& out, ParseError& error);

    // Iterative cross product: plain modifiers are appended to every
    // candidate, a branch of k alternatives turns n candidates into n*k.
    static std::vector<std::vector<TimeModifier>> expandPermutations(const std::vector<Modifier>& modifiers);
};

} // namespace tickler

#endif // TICKLER_COMMAND_PARSER_HPP
