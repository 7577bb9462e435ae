#ifndef XFERCLI_EXECUTABLECOMMAND_HPP_
#define XFERCLI_EXECUTABLECOMMAND_HPP_

#include <string>

namespace xfer
{
// Forward declarations
class XferSession;
}  // namespace xfer

namespace xfercli
{
class ExecutableCommand
{
public:
    virtual ~ExecutableCommand() = default;

    // Exit status of the command, 0 on success. error_message explains a non-zero status.
    [[nodiscard]] virtual int execute(
        xfer::XferSession &session, std::string &error_message) const = 0;

    // True if the interactive session ends after this command
    [[nodiscard]] virtual bool ends_session() const
    {
        return false;
    }
};
}  // namespace xfercli

#endif  // XFERCLI_EXECUTABLECOMMAND_HPP_
