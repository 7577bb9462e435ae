#ifndef XFER_RESULTS_ONLYSHOWERRORSRESULTPRINTER_HPP_
#define XFER_RESULTS_ONLYSHOWERRORSRESULTPRINTER_HPP_

#include "resultprinterimpl.hpp"

namespace xfer::results
{
// Prints failures, warnings and errors only
class OnlyShowErrorsResultPrinter : public ResultPrinterImpl
{
public:
    using ResultPrinterImpl::ResultPrinterImpl;

protected:
    void print_progress() override;
    void print_success(const SuccessResult &result) override;
};
}  // namespace xfer::results

#endif  // XFER_RESULTS_ONLYSHOWERRORSRESULTPRINTER_HPP_
