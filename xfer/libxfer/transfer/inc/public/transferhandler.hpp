#ifndef XFER_TRANSFER_TRANSFERHANDLER_HPP_
#define XFER_TRANSFER_TRANSFERHANDLER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <vector>

#include "commandresult.hpp"
#include "fileinfo.hpp"
#include "resultprinter.hpp"
#include "resultprocessor.hpp"
#include "resultprocessorthread.hpp"
#include "resultqueue.hpp"
#include "resultrecorder.hpp"
#include "resultsubscribers.hpp"

namespace xfer::transfer
{
// Forward declarations
class TransferManager;

struct TransferHandlerParams
{
    bool quiet            = false;
    bool only_show_errors = false;
};

/**
 * Runs the transfers of one command and reports their results.
 *
 * Results are processed on a dedicated thread for the whole duration of call(). A handler
 * serves a single call.
 */
class TransferHandler
{
public:
    // Produces the files of the command, invoking its argument once per file
    using FileInfoProvider = std::function<void(const FileInfoCallback &)>;

    static constexpr uint64_t max_upload_size = 5ULL * 1024 * 1024 * 1024 * 1024;  // 5 TiB

    TransferHandler(TransferManager &transfer_manager, results::ResultQueue &result_queue,
        const TransferHandlerParams &params, std::ostream &out_stream, std::ostream &err_stream);
    TransferHandler(const TransferHandler &) = delete;
    TransferHandler &operator=(const TransferHandler &) = delete;

    results::CommandResult call(const FileInfoProvider &file_info_provider);
    results::CommandResult call(const std::vector<FileInfo> &file_infos);

    [[nodiscard]] const results::ResultRecorder &result_recorder() const;

private:
    void               enqueue(const FileInfo &file_info);
    [[nodiscard]] bool warn_and_signal_if_skip(const FileInfo &file_info);
    void               shutdown();

    TransferManager &                                  transfer_manager_;
    results::ResultQueue &                             result_queue_;
    results::ResultRecorder                            result_recorder_;
    std::unique_ptr<results::ResultPrinter>            result_printer_;
    results::ResultProcessor                           result_processor_;
    results::ResultProcessorThread                     result_processor_thread_;
    std::shared_ptr<results::UploadResultSubscriber>   upload_subscriber_;
    std::shared_ptr<results::DownloadResultSubscriber> download_subscriber_;
    std::shared_ptr<results::CopyResultSubscriber>     copy_subscriber_;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERHANDLER_HPP_
