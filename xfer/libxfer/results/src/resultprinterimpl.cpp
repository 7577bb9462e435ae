#include "resultprinterimpl.hpp"

#include <ios>
#include <sstream>

#include "resultrecorder.hpp"

namespace xfer::results
{
ResultPrinterImpl::ResultPrinterImpl(
    const ResultRecorder &result_recorder, std::ostream &out_stream, std::ostream &err_stream)
    : result_recorder_ {result_recorder}
    , out_stream_ {out_stream}
    , err_stream_ {err_stream}
    , progress_length_ {0}
{}

void ResultPrinterImpl::print(const Result &result)
{
    std::visit([this](const auto &r) { print_result(r); }, result);
}

void ResultPrinterImpl::print_result(const ProgressResult & /*result*/)
{
    print_progress();
}

void ResultPrinterImpl::print_result(const SuccessResult &result)
{
    print_success(result);
}

void ResultPrinterImpl::print_result(const FailureResult &result)
{
    print_failure(result);
}

void ResultPrinterImpl::print_result(const WarningResult &result)
{
    print_statement(err_stream_, "warning: " + result.message);
}

void ResultPrinterImpl::print_result(const ErrorResult &result)
{
    print_statement(err_stream_, "fatal error: " + result.message);
}

void ResultPrinterImpl::print_progress()
{
    std::ostringstream ss;
    ss << "Completed " << size_formatter_.format_human_readable(result_recorder_.completed_bytes())
       << '/'
       << size_formatter_.format_human_readable(result_recorder_.expected_bytes_transferred())
       << " with " << result_recorder_.remaining_files() << " files remaining.";

    std::string statement = pad(ss.str());
    progress_length_      = statement.size();
    write(out_stream_, statement + '\r');
}

void ResultPrinterImpl::print_success(const SuccessResult &result)
{
    print_statement(
        out_stream_, to_string(result.transfer_type) + ": " + result.src + " to " + result.dest);
}

void ResultPrinterImpl::print_failure(const FailureResult &result)
{
    print_statement(err_stream_, to_string(result.transfer_type) + " failed: " + result.src +
                                     " to " + result.dest + ' ' + result.exception);
}

void ResultPrinterImpl::print_statement(std::ostream &stream, const std::string &statement)
{
    write(stream, pad(statement) + '\n');
    redisplay_progress();
}

void ResultPrinterImpl::redisplay_progress()
{
    // The previous statement ended with a new line, there is nothing left to overwrite
    progress_length_ = 0;
    if (result_recorder_.has_remaining_progress())
    {
        print_progress();
    }
}

std::string ResultPrinterImpl::pad(std::string statement) const
{
    if (statement.size() < progress_length_)
    {
        statement.append(progress_length_ - statement.size(), ' ');
    }
    return statement;
}

void ResultPrinterImpl::write(std::ostream &stream, const std::string &text) const
{
    stream << text;
    stream.flush();
    if (!stream)
    {
        throw std::ios_base::failure {"Cannot write to output stream"};
    }
}
}  // namespace xfer::results
