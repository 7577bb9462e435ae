#include "commandreader.hpp"

#include <cctype>
#include <iterator>
#include <utility>

namespace xfercli
{
CommandReader::CommandReader(std::istream &input)
    : input_ {input}
{}

std::optional<Command> CommandReader::read_next_command() const
{
    std::string line;
    while (std::getline(input_, line))
    {
        auto tokens = tokenize(line);
        if (tokens.empty())
        {
            continue;
        }

        Command command;
        command.name = std::move(tokens.front());
        command.args.assign(
            std::make_move_iterator(tokens.begin() + 1), std::make_move_iterator(tokens.end()));
        return command;
    }
    return std::nullopt;
}

std::optional<Command> CommandReader::from_args(int argc, const char *const *argv)
{
    if (argc < 1)
    {
        return std::nullopt;
    }
    return Command {argv[0], std::vector<std::string>(argv + 1, argv + argc)};
}

std::vector<std::string> CommandReader::tokenize(const std::string &line)
{
    std::vector<std::string> tokens;
    std::string              token;
    bool                     token_started = false;
    bool                     quoted        = false;

    for (char c : line)
    {
        if (c == '"')
        {
            quoted        = !quoted;
            token_started = true;
        }
        else if (!quoted && std::isspace(static_cast<unsigned char>(c)))
        {
            if (token_started)
            {
                tokens.push_back(std::move(token));
                token.clear();
                token_started = false;
            }
        }
        else
        {
            token += c;
            token_started = true;
        }
    }

    if (token_started)
    {
        tokens.push_back(std::move(token));
    }
    return tokens;
}
}  // namespace xfercli
