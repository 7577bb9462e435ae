#include "exitcommand.hpp"

namespace xfercli
{
int ExitCommand::execute(xfer::XferSession &, std::string &) const
{
    return 0;
}

bool ExitCommand::ends_session() const
{
    return true;
}
}  // namespace xfercli
