#ifndef XFERCLI_EXITCOMMAND_HPP_
#define XFERCLI_EXITCOMMAND_HPP_

#include "executablecommand.hpp"

namespace xfercli
{
class ExitCommand : public ExecutableCommand
{
public:
    [[nodiscard]] int  execute(xfer::XferSession &, std::string &) const override;
    [[nodiscard]] bool ends_session() const override;
};
}  // namespace xfercli

#endif  // XFERCLI_EXITCOMMAND_HPP_
