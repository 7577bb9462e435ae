#include "commandinterpreter.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

#include "copycommand.hpp"
#include "exitcommand.hpp"
#include "makebucketcommand.hpp"

namespace xfercli
{
namespace
{
using Args           = std::vector<std::string>;
using CommandFactory = std::unique_ptr<ExecutableCommand> (*)(
    const Args &args, std::ostream &out_stream, std::ostream &err_stream);

std::unique_ptr<ExecutableCommand> make_copy_command(
    const Args &args, std::ostream &out_stream, std::ostream &err_stream)
{
    return std::make_unique<CopyCommand>(args[0], args[1], out_stream, err_stream);
}

std::unique_ptr<ExecutableCommand> make_make_bucket_command(
    const Args &args, std::ostream &out_stream, std::ostream &)
{
    return std::make_unique<MakeBucketCommand>(args[0], out_stream);
}

std::unique_ptr<ExecutableCommand> make_exit_command(const Args &, std::ostream &, std::ostream &)
{
    return std::make_unique<ExitCommand>();
}

struct CommandSyntax
{
    const char *   name;
    size_t         arg_count;
    const char *   usage;
    CommandFactory make;
};

const CommandSyntax command_table[] {
    {"cp", 2, "cp {src} {dest}", make_copy_command},
    {"mb", 1, "mb s3://{bucket}", make_make_bucket_command},
    {"exit", 0, "exit", make_exit_command}};
}  // namespace

CommandInterpreter::CommandInterpreter(std::ostream &out_stream, std::ostream &err_stream)
    : out_stream_ {out_stream}
    , err_stream_ {err_stream}
{}

std::unique_ptr<ExecutableCommand> CommandInterpreter::interpret(
    const Command &command, std::string &err) const
{
    auto syntax = std::find_if(std::begin(command_table), std::end(command_table),
        [&command](const CommandSyntax &s) { return command.name == s.name; });
    if (syntax == std::end(command_table))
    {
        err = "Unknown command " + command.name;
        return nullptr;
    }

    if (command.args.size() != syntax->arg_count)
    {
        err = std::string {"Usage: "} + syntax->usage;
        return nullptr;
    }

    return syntax->make(command.args, out_stream_, err_stream_);
}

std::string CommandInterpreter::usage()
{
    std::string text;
    for (const auto &syntax : command_table)
    {
        text.append("  ").append(syntax.usage).append("\n");
    }
    return text;
}
}  // namespace xfercli
