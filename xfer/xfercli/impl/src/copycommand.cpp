#include "copycommand.hpp"

#include <utility>

#include "xfersession.hpp"

namespace xfercli
{
CopyCommand::CopyCommand(
    std::string src, std::string dest, std::ostream &out_stream, std::ostream &err_stream)
    : src_ {std::move(src)}
    , dest_ {std::move(dest)}
    , out_stream_ {out_stream}
    , err_stream_ {err_stream}
{}

int CopyCommand::execute(xfer::XferSession &session, std::string &error_message) const
{
    auto result = session.copy(src_, dest_, out_stream_, err_stream_);
    if (result.total_failed() != 0)
    {
        error_message = std::to_string(result.total_failed()) + " transfer(s) failed";
    }
    return result.exit_status();
}

const std::string &CopyCommand::src() const
{
    return src_;
}

const std::string &CopyCommand::dest() const
{
    return dest_;
}
}  // namespace xfercli
