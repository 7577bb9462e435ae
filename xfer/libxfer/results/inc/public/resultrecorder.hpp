#ifndef XFER_RESULTS_RESULTRECORDER_HPP_
#define XFER_RESULTS_RESULTRECORDER_HPP_

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <utility>

#include "results.hpp"

namespace xfer::results
{
/**
 * Folds transfer results into cumulative statistics.
 *
 * Not thread safe, meant to be owned by the result processing thread.
 */
class ResultRecorder
{
public:
    ResultRecorder();

    void record(const Result &result);

    [[nodiscard]] uint64_t bytes_transferred() const;
    [[nodiscard]] uint64_t bytes_failed_to_transfer() const;
    [[nodiscard]] uint64_t expected_bytes_transferred() const;
    [[nodiscard]] size_t   files_transferred() const;
    [[nodiscard]] size_t   files_failed() const;
    [[nodiscard]] size_t   files_warned() const;
    [[nodiscard]] size_t   expected_files_transferred() const;
    [[nodiscard]] size_t   errors() const;

    // Bytes that will not move anymore, either because they were transferred or because their
    // transfer failed
    [[nodiscard]] uint64_t completed_bytes() const;
    [[nodiscard]] size_t   remaining_files() const;
    [[nodiscard]] bool     has_remaining_progress() const;

private:
    using TransferKey = std::pair<std::string, std::string>;

    struct InFlightTransfer
    {
        uint64_t total_transfer_size;
        uint64_t bytes_transferred;
    };

    void finish_in_flight_transfer(const TransferKey &key, bool failed);

    void record_result(const QueuedResult &result);
    void record_result(const ProgressResult &result);
    void record_result(const SuccessResult &result);
    void record_result(const FailureResult &result);
    void record_result(const WarningResult &result);
    void record_result(const ErrorResult &result);

    template<typename R>
    void record_result(const R & /*result*/)
    {
        // Nothing to record for this kind of result
    }

    uint64_t bytes_transferred_;
    uint64_t bytes_failed_to_transfer_;
    uint64_t expected_bytes_transferred_;
    size_t   files_transferred_;
    size_t   files_failed_;
    size_t   files_warned_;
    size_t   expected_files_transferred_;
    size_t   errors_;

    // Transfers sharing a source and destination are kept in the order they were queued
    std::map<TransferKey, std::deque<InFlightTransfer>> in_flight_transfers_;
};
}  // namespace xfer::results

#endif  // XFER_RESULTS_RESULTRECORDER_HPP_
