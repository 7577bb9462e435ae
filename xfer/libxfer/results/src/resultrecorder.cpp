#include "resultrecorder.hpp"

#include <algorithm>
#include <iterator>

#include <glog/logging.h>

namespace xfer::results
{
ResultRecorder::ResultRecorder()
    : bytes_transferred_ {0}
    , bytes_failed_to_transfer_ {0}
    , expected_bytes_transferred_ {0}
    , files_transferred_ {0}
    , files_failed_ {0}
    , files_warned_ {0}
    , expected_files_transferred_ {0}
    , errors_ {0}
{}

void ResultRecorder::record(const Result &result)
{
    std::visit([this](const auto &r) { record_result(r); }, result);
}

uint64_t ResultRecorder::bytes_transferred() const
{
    return bytes_transferred_;
}

uint64_t ResultRecorder::bytes_failed_to_transfer() const
{
    return bytes_failed_to_transfer_;
}

uint64_t ResultRecorder::expected_bytes_transferred() const
{
    return expected_bytes_transferred_;
}

size_t ResultRecorder::files_transferred() const
{
    return files_transferred_;
}

size_t ResultRecorder::files_failed() const
{
    return files_failed_;
}

size_t ResultRecorder::files_warned() const
{
    return files_warned_;
}

size_t ResultRecorder::expected_files_transferred() const
{
    return expected_files_transferred_;
}

size_t ResultRecorder::errors() const
{
    return errors_;
}

uint64_t ResultRecorder::completed_bytes() const
{
    return bytes_transferred_ + bytes_failed_to_transfer_;
}

size_t ResultRecorder::remaining_files() const
{
    return files_transferred_ < expected_files_transferred_ ?
               expected_files_transferred_ - files_transferred_ :
               0;
}

bool ResultRecorder::has_remaining_progress() const
{
    return files_transferred_ != expected_files_transferred_ ||
           completed_bytes() != expected_bytes_transferred_;
}

void ResultRecorder::finish_in_flight_transfer(const TransferKey &key, bool failed)
{
    auto it = in_flight_transfers_.find(key);
    if (it == in_flight_transfers_.end())
    {
        return;
    }

    auto &transfers = it->second;
    auto  transfer  = transfers.front();
    transfers.pop_front();
    if (transfers.empty())
    {
        in_flight_transfers_.erase(it);
    }

    // Whatever was not transferred before the failure never will be
    if (failed && transfer.bytes_transferred < transfer.total_transfer_size)
    {
        bytes_failed_to_transfer_ += transfer.total_transfer_size - transfer.bytes_transferred;
    }
}

void ResultRecorder::record_result(const QueuedResult &result)
{
    ++expected_files_transferred_;
    expected_bytes_transferred_ += result.total_transfer_size;

    auto &transfers = in_flight_transfers_[{result.src, result.dest}];
    if (!transfers.empty())
    {
        LOG(WARNING) << "Transfer " << result.src << " -> " << result.dest
                     << " queued while a transfer with the same source and destination is still "
                        "in progress";
    }
    transfers.push_back({result.total_transfer_size, 0});
}

void ResultRecorder::record_result(const ProgressResult &result)
{
    bytes_transferred_ += result.bytes_transferred;

    auto it = in_flight_transfers_.find({result.src, result.dest});
    if (it == in_flight_transfers_.end())
    {
        return;
    }

    // Progress goes to the oldest transfer still expecting bytes
    auto &transfers = it->second;
    auto  target    = std::find_if(transfers.begin(), transfers.end(),
        [](const InFlightTransfer &t) { return t.bytes_transferred < t.total_transfer_size; });
    if (target == transfers.end())
    {
        target = std::prev(transfers.end());
    }
    target->bytes_transferred += result.bytes_transferred;
}

void ResultRecorder::record_result(const SuccessResult &result)
{
    ++files_transferred_;
    finish_in_flight_transfer({result.src, result.dest}, false);
}

void ResultRecorder::record_result(const FailureResult &result)
{
    ++files_transferred_;
    ++files_failed_;
    finish_in_flight_transfer({result.src, result.dest}, true);
}

void ResultRecorder::record_result(const WarningResult & /*result*/)
{
    ++files_warned_;
}

void ResultRecorder::record_result(const ErrorResult & /*result*/)
{
    ++errors_;
}
}  // namespace xfer::results
