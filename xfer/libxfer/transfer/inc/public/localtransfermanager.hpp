#ifndef XFER_TRANSFER_LOCALTRANSFERMANAGER_HPP_
#define XFER_TRANSFER_LOCALTRANSFERMANAGER_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include "datasizeformatter.hpp"
#include "threadpool.hpp"
#include "transfermanager.hpp"

namespace xfer::transfer
{
/**
 * Transfers files to, from and within an object store kept in a local directory. Bucket "b"
 * is the directory {object_store_dir}/b and key "k" of that bucket is the file
 * {object_store_dir}/b/k.
 *
 * Transfers run concurrently on a thread pool, data is moved in chunks of chunk_size bytes and
 * subscribers are notified after each chunk.
 */
class LocalTransferManager : public TransferManager
{
public:
    LocalTransferManager(
        std::string object_store_dir, size_t max_concurrent_requests, uint64_t chunk_size);

    std::shared_ptr<TransferFuture> upload(const std::string &fileobj, const std::string &bucket,
        const std::string &key, const Subscribers &subscribers) override;
    std::shared_ptr<TransferFuture> download(const std::string &bucket, const std::string &key,
        const std::string &fileobj, const Subscribers &subscribers) override;
    std::shared_ptr<TransferFuture> copy(const CopySource &copy_source, const std::string &bucket,
        const std::string &key, const Subscribers &subscribers) override;
    void                            wait_for_all() override;

    [[nodiscard]] std::string object_path(const std::string &bucket, const std::string &key) const;

private:
    std::shared_ptr<TransferFuture> submit(CallArgs call_args, std::string src_path,
        std::string dest_path, const std::string &dest_bucket, const Subscribers &subscribers);
    void transfer_file(const std::string &src_path, const std::string &dest_path,
        const std::string &dest_bucket, const TransferFuture &future,
        const Subscribers &subscribers) const;

    const std::string        object_store_dir_;
    const uint64_t           chunk_size_;
    utils::DataSizeFormatter size_formatter_;
    utils::ThreadPool        thread_pool_;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_LOCALTRANSFERMANAGER_HPP_
