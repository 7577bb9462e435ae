#ifndef XFER_RESULTS_RESULTPRINTERIMPL_HPP_
#define XFER_RESULTS_RESULTPRINTERIMPL_HPP_

#include <cstddef>
#include <ostream>
#include <string>

#include "datasizeformatter.hpp"
#include "resultprinter.hpp"

namespace xfer::results
{
// Forward declarations
class ResultRecorder;

/**
 * Prints transfer status to the terminal.
 *
 * Progress is kept on a single line which is overwritten in place (terminated by a carriage
 * return). Success statements go to the output stream, failures, warnings and errors go to the
 * error stream, each of them on its own line, after which the progress line is displayed again.
 */
class ResultPrinterImpl : public ResultPrinter
{
public:
    ResultPrinterImpl(
        const ResultRecorder &result_recorder, std::ostream &out_stream, std::ostream &err_stream);

    void print(const Result &result) override;

protected:
    virtual void print_progress();
    virtual void print_success(const SuccessResult &result);

private:
    void print_result(const ProgressResult &result);
    void print_result(const SuccessResult &result);
    void print_result(const FailureResult &result);
    void print_result(const WarningResult &result);
    void print_result(const ErrorResult &result);

    template<typename R>
    void print_result(const R & /*result*/)
    {
        // Nothing to print for this kind of result
    }

    void                      print_failure(const FailureResult &result);
    void                      print_statement(std::ostream &stream, const std::string &statement);
    void                      redisplay_progress();
    [[nodiscard]] std::string pad(std::string statement) const;
    void                      write(std::ostream &stream, const std::string &text) const;

    const ResultRecorder &   result_recorder_;
    std::ostream &           out_stream_;
    std::ostream &           err_stream_;
    size_t                   progress_length_;
    utils::DataSizeFormatter size_formatter_;
};
}  // namespace xfer::results

#endif  // XFER_RESULTS_RESULTPRINTERIMPL_HPP_
