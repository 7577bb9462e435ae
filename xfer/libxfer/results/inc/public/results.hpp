#ifndef XFER_RESULTS_RESULTS_HPP_
#define XFER_RESULTS_RESULTS_HPP_

#include <cstdint>
#include <string>
#include <variant>

namespace xfer::results
{
enum class TransferType
{
    UPLOAD,
    DOWNLOAD,
    COPY
};

[[nodiscard]] std::string to_string(TransferType transfer_type);

// A transfer has been accepted by the engine, no bytes were moved yet
struct QueuedResult
{
    TransferType transfer_type;
    std::string  src;
    std::string  dest;
    uint64_t     total_transfer_size;
};

// bytes_transferred is the amount moved since the previous progress notification
struct ProgressResult
{
    TransferType transfer_type;
    std::string  src;
    std::string  dest;
    uint64_t     bytes_transferred;
    uint64_t     total_transfer_size;
};

struct SuccessResult
{
    TransferType transfer_type;
    std::string  src;
    std::string  dest;
};

struct FailureResult
{
    TransferType transfer_type;
    std::string  src;
    std::string  dest;
    std::string  exception;
};

struct WarningResult
{
    std::string message;
};

// Command level error which cannot be attributed to a single transfer
struct ErrorResult
{
    std::string message;
};

// Stops the result processing loop
struct ShutdownRequest
{};

using Result = std::variant<QueuedResult, ProgressResult, SuccessResult, FailureResult,
    WarningResult, ErrorResult, ShutdownRequest>;

/**
 * Creates the warning emitted when a file is skipped.
 *
 * @param path The file that will not be transferred
 * @param message Reason for skipping it
 * @return A warning with the message "Skipping file {path}. {message}"
 */
[[nodiscard]] WarningResult make_warning(const std::string &path, const std::string &message);
}  // namespace xfer::results

#endif  // XFER_RESULTS_RESULTS_HPP_
