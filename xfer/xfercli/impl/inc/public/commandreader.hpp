#ifndef XFERCLI_COMMANDREADER_HPP_
#define XFERCLI_COMMANDREADER_HPP_

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "command.hpp"

namespace xfercli
{
class CommandReader
{
public:
    explicit CommandReader(std::istream &input);

    // Next non-blank line as a command, std::nullopt once the input is exhausted
    [[nodiscard]] std::optional<Command> read_next_command() const;

    // argv[0] is the command name
    [[nodiscard]] static std::optional<Command> from_args(int argc, const char *const *argv);

    /**
     * Splits a line on whitespace. Double quotes keep whitespace inside a token and may enclose
     * only part of it; "" on its own is an empty token.
     */
    [[nodiscard]] static std::vector<std::string> tokenize(const std::string &line);

private:
    std::istream &input_;
};
}  // namespace xfercli

#endif  // XFERCLI_COMMANDREADER_HPP_
