#ifndef XFER_RESULTS_RESULTPRINTER_HPP_
#define XFER_RESULTS_RESULTPRINTER_HPP_

#include "results.hpp"

namespace xfer::results
{
class ResultPrinter
{
public:
    virtual ~ResultPrinter() = default;

    /**
     * Renders a result.
     *
     * Throws std::ios_base::failure if an output stream can no longer be written to.
     */
    virtual void print(const Result &result) = 0;
};
}  // namespace xfer::results

#endif  // XFER_RESULTS_RESULTPRINTER_HPP_
