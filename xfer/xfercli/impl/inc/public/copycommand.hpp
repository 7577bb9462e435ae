#ifndef XFERCLI_COPYCOMMAND_HPP_
#define XFERCLI_COPYCOMMAND_HPP_

#include <ostream>
#include <string>

#include "executablecommand.hpp"

namespace xfercli
{
class CopyCommand : public ExecutableCommand
{
public:
    CopyCommand(std::string src, std::string dest, std::ostream &out_stream,
        std::ostream &err_stream);
    [[nodiscard]] int execute(
        xfer::XferSession &session, std::string &error_message) const override;

    [[nodiscard]] const std::string &src() const;
    [[nodiscard]] const std::string &dest() const;

private:
    std::string   src_;
    std::string   dest_;
    std::ostream &out_stream_;
    std::ostream &err_stream_;
};
}  // namespace xfercli

#endif  // XFERCLI_COPYCOMMAND_HPP_
