#include "onlyshowerrorsresultprinter.hpp"

namespace xfer::results
{
void OnlyShowErrorsResultPrinter::print_progress()
{
}

void OnlyShowErrorsResultPrinter::print_success(const SuccessResult & /*result*/)
{
}
}  // namespace xfer::results
