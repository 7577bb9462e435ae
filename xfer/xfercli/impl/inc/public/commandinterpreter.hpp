#ifndef XFERCLI_COMMANDINTERPRETER_HPP_
#define XFERCLI_COMMANDINTERPRETER_HPP_

#include <memory>
#include <ostream>
#include <string>

#include "command.hpp"
#include "executablecommand.hpp"

namespace xfercli
{
/**
 * Turns parsed commands into executable ones. Known commands:
 *   cp {src} {dest}
 *   mb s3://{bucket}
 *   exit
 */
class CommandInterpreter
{
public:
    CommandInterpreter(std::ostream &out_stream, std::ostream &err_stream);

    // nullptr for unknown commands and wrong argument counts, err then holds the reason
    [[nodiscard]] std::unique_ptr<ExecutableCommand> interpret(
        const Command &command, std::string &err) const;

    // One line per known command
    [[nodiscard]] static std::string usage();

private:
    std::ostream &out_stream_;
    std::ostream &err_stream_;
};
}  // namespace xfercli

#endif  // XFERCLI_COMMANDINTERPRETER_HPP_
