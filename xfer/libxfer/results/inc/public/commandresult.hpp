#ifndef XFER_RESULTS_COMMANDRESULT_HPP_
#define XFER_RESULTS_COMMANDRESULT_HPP_

#include <cstddef>

namespace xfer::results
{
struct CommandResult
{
    size_t files_failed = 0;
    size_t files_warned = 0;
    size_t errors       = 0;

    [[nodiscard]] size_t total_failed() const
    {
        return files_failed + errors;
    }

    // 1 if anything failed, 2 if there were only warnings, 0 otherwise
    [[nodiscard]] int exit_status() const
    {
        if (total_failed() != 0)
        {
            return 1;
        }
        if (files_warned != 0)
        {
            return 2;
        }
        return 0;
    }
};
}  // namespace xfer::results

#endif  // XFER_RESULTS_COMMANDRESULT_HPP_
