#include "makebucketcommand.hpp"

#include <utility>

#include "xfersession.hpp"

namespace xfercli
{
MakeBucketCommand::MakeBucketCommand(std::string bucket_uri, std::ostream &out_stream)
    : bucket_uri_ {std::move(bucket_uri)}
    , out_stream_ {out_stream}
{}

int MakeBucketCommand::execute(xfer::XferSession &session, std::string &error_message) const
{
    if (!session.make_bucket(bucket_uri_, error_message))
    {
        error_message = "make_bucket failed: " + bucket_uri_ + " " + error_message;
        return 1;
    }
    out_stream_ << "make_bucket: " << bucket_uri_ << '\n';
    return 0;
}
}  // namespace xfercli
