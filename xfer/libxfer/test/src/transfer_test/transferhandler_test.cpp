#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "transferhandler.hpp"

#include "testutils.hpp"
#include "transfermanager_mock.hpp"

using namespace ::testing;
using namespace ::xfer::transfer;
using ::xfer::results::ResultQueue;
using ::xfer::results::TransferType;

namespace
{
class TransferHandlerTest : public Test
{
protected:
    // Runs the whole transfer synchronously: queued, a single progress notification, done
    static std::shared_ptr<TransferFuture> run_transfer(
        TransferMeta meta, const TransferManager::Subscribers &subscribers,
        const std::string &error_message = "")
    {
        auto future = std::make_shared<TransferFuture>(
            testutils::make_done_future(std::move(meta), error_message));
        for (const auto &subscriber : subscribers)
        {
            subscriber->on_queued(*future);
            if (error_message.empty())
            {
                subscriber->on_progress(*future, future->meta().size);
            }
            subscriber->on_done(*future);
        }
        return future;
    }

    static TransferMeta make_meta(const std::string &fileobj, const std::string &bucket,
        const std::string &key, uint64_t size)
    {
        TransferMeta meta;
        meta.call_args.fileobj = fileobj;
        meta.call_args.bucket  = bucket;
        meta.call_args.key     = key;
        meta.size              = size;
        return meta;
    }

    NiceMock<TransferManagerMock> transfer_manager_;
    ResultQueue                   result_queue_;
    std::ostringstream            out_;
    std::ostringstream            err_;
};
}  // namespace

TEST_F(TransferHandlerTest, Upload)
{
    EXPECT_CALL(transfer_manager_, upload("file.txt", "bucket", "dir/file.txt", _))
        .WillOnce([](const std::string &fileobj, const std::string &bucket, const std::string &key,
                      const TransferManager::Subscribers &subscribers) {
            return run_transfer(make_meta(fileobj, bucket, key, 2048), subscribers);
        });
    EXPECT_CALL(transfer_manager_, wait_for_all()).Times(1);

    TransferHandlerParams params;
    TransferHandler       handler {transfer_manager_, result_queue_, params, out_, err_};
    auto                  result =
        handler.call({FileInfo {TransferType::UPLOAD, "file.txt", "bucket/dir/file.txt", 2048}});

    EXPECT_EQ(result.files_failed, 0);
    EXPECT_EQ(result.files_warned, 0);
    EXPECT_EQ(result.exit_status(), 0);
    EXPECT_EQ(handler.result_recorder().bytes_transferred(), 2048);
    EXPECT_EQ(handler.result_recorder().files_transferred(), 1);
    EXPECT_THAT(out_.str(), HasSubstr("upload: file.txt to s3://bucket/dir/file.txt"));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(TransferHandlerTest, DownloadAndCopy)
{
    EXPECT_CALL(transfer_manager_, download("bucket", "k.txt", "out.txt", _))
        .WillOnce([](const std::string &bucket, const std::string &key, const std::string &fileobj,
                      const TransferManager::Subscribers &subscribers) {
            return run_transfer(make_meta(fileobj, bucket, key, 10), subscribers);
        });
    EXPECT_CALL(transfer_manager_, copy(_, "other", "k.txt", _))
        .WillOnce([](const CopySource &copy_source, const std::string &bucket,
                      const std::string &key, const TransferManager::Subscribers &subscribers) {
            EXPECT_EQ(copy_source.bucket, "bucket");
            EXPECT_EQ(copy_source.key, "k.txt");
            auto meta                  = make_meta("", bucket, key, 10);
            meta.call_args.copy_source = copy_source;
            return run_transfer(std::move(meta), subscribers);
        });

    TransferHandlerParams params;
    TransferHandler       handler {transfer_manager_, result_queue_, params, out_, err_};
    auto                  result =
        handler.call({FileInfo {TransferType::DOWNLOAD, "bucket/k.txt", "out.txt", 10},
            FileInfo {TransferType::COPY, "bucket/k.txt", "other/k.txt", 10}});

    EXPECT_EQ(result.exit_status(), 0);
    EXPECT_EQ(handler.result_recorder().files_transferred(), 2);
    EXPECT_THAT(out_.str(), HasSubstr("download: s3://bucket/k.txt to out.txt"));
    EXPECT_THAT(out_.str(), HasSubstr("copy: s3://bucket/k.txt to s3://other/k.txt"));
}

TEST_F(TransferHandlerTest, FailedTransfer)
{
    ON_CALL(transfer_manager_, upload(_, _, _, _))
        .WillByDefault([](const std::string &fileobj, const std::string &bucket,
                           const std::string &                 key,
                           const TransferManager::Subscribers &subscribers) {
            return run_transfer(make_meta(fileobj, bucket, key, 100), subscribers, "boom");
        });

    TransferHandlerParams params;
    TransferHandler       handler {transfer_manager_, result_queue_, params, out_, err_};
    auto result = handler.call({FileInfo {TransferType::UPLOAD, "f", "bucket/f", 100}});

    EXPECT_EQ(result.files_failed, 1);
    EXPECT_EQ(result.exit_status(), 1);
    EXPECT_EQ(handler.result_recorder().bytes_failed_to_transfer(), 100);
    EXPECT_EQ(err_.str(), "upload failed: f to s3://bucket/f boom\n");
}

TEST_F(TransferHandlerTest, TooLargeUploadIsSkipped)
{
    EXPECT_CALL(transfer_manager_, upload(_, _, _, _)).Times(0);

    TransferHandlerParams params;
    TransferHandler       handler {transfer_manager_, result_queue_, params, out_, err_};
    auto                  result = handler.call({FileInfo {TransferType::UPLOAD, "huge.bin",
        "bucket/huge.bin", TransferHandler::max_upload_size + 1}});

    EXPECT_EQ(result.files_warned, 1);
    EXPECT_EQ(result.exit_status(), 2);
    EXPECT_EQ(err_.str(),
        "warning: Skipping file huge.bin. File exceeds s3 upload limit of 5 TB.\n");
}

TEST_F(TransferHandlerTest, ProviderExceptionBecomesError)
{
    TransferHandlerParams params;
    TransferHandler       handler {transfer_manager_, result_queue_, params, out_, err_};
    auto                  result = handler.call([](const FileInfoCallback &) {
        throw std::runtime_error {"listing failed"};
    });

    EXPECT_EQ(result.errors, 1);
    EXPECT_EQ(result.exit_status(), 1);
    EXPECT_EQ(err_.str(), "fatal error: listing failed\n");
}

TEST_F(TransferHandlerTest, Quiet)
{
    ON_CALL(transfer_manager_, upload(_, _, _, _))
        .WillByDefault([](const std::string &fileobj, const std::string &bucket,
                           const std::string &                 key,
                           const TransferManager::Subscribers &subscribers) {
            return run_transfer(make_meta(fileobj, bucket, key, 100), subscribers, "boom");
        });

    TransferHandlerParams params;
    params.quiet = true;
    TransferHandler handler {transfer_manager_, result_queue_, params, out_, err_};
    auto result = handler.call({FileInfo {TransferType::UPLOAD, "f", "bucket/f", 100}});

    EXPECT_EQ(result.files_failed, 1);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(TransferHandlerTest, OnlyShowErrors)
{
    ON_CALL(transfer_manager_, upload(_, _, _, _))
        .WillByDefault([](const std::string &fileobj, const std::string &bucket,
                           const std::string &                 key,
                           const TransferManager::Subscribers &subscribers) {
            return run_transfer(make_meta(fileobj, bucket, key, 100), subscribers);
        });

    TransferHandlerParams params;
    params.only_show_errors = true;
    TransferHandler handler {transfer_manager_, result_queue_, params, out_, err_};
    auto            result = handler.call({FileInfo {TransferType::UPLOAD, "f", "bucket/f", 100},
        FileInfo {
            TransferType::UPLOAD, "huge", "bucket/huge", TransferHandler::max_upload_size + 1}});

    EXPECT_EQ(result.files_warned, 1);
    EXPECT_TRUE(out_.str().empty());
    EXPECT_THAT(err_.str(), HasSubstr("warning: Skipping file huge."));
}

TEST_F(TransferHandlerTest, CalledTwice)
{
    TransferHandlerParams params;
    TransferHandler       handler {transfer_manager_, result_queue_, params, out_, err_};
    EXPECT_EQ(handler.call(std::vector<FileInfo> {}).exit_status(), 0);
    EXPECT_EQ(handler.call(std::vector<FileInfo> {}).errors, 1);
}
