#ifndef XFERCLI_MAKEBUCKETCOMMAND_HPP_
#define XFERCLI_MAKEBUCKETCOMMAND_HPP_

#include <ostream>
#include <string>

#include "executablecommand.hpp"

namespace xfercli
{
class MakeBucketCommand : public ExecutableCommand
{
public:
    MakeBucketCommand(std::string bucket_uri, std::ostream &out_stream);
    [[nodiscard]] int execute(
        xfer::XferSession &session, std::string &error_message) const override;

private:
    std::string   bucket_uri_;
    std::ostream &out_stream_;
};
}  // namespace xfercli

#endif  // XFERCLI_MAKEBUCKETCOMMAND_HPP_
