#include <gtest/gtest.h>

#include <ios>
#include <sstream>
#include <string>

#include "onlyshowerrorsresultprinter.hpp"
#include "resultprinterimpl.hpp"
#include "resultrecorder.hpp"

using namespace ::testing;
using namespace ::xfer::results;

namespace
{
class ResultPrinterTest : public Test
{
protected:
    static constexpr uint64_t mib = 1024 * 1024;

    void record_and_print(ResultPrinter &printer, const Result &result)
    {
        recorder_.record(result);
        printer.print(result);
    }

    static std::string padded(std::string statement, size_t length)
    {
        if (statement.size() < length)
        {
            statement.append(length - statement.size(), ' ');
        }
        return statement;
    }

    ResultRecorder     recorder_;
    std::ostringstream out_;
    std::ostringstream err_;
};
}  // namespace

TEST_F(ResultPrinterTest, QueuedPrintsNothing)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    record_and_print(printer, QueuedResult {TransferType::UPLOAD, "file", "s3://b/k", 20 * mib});

    EXPECT_TRUE(out_.str().empty());
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ResultPrinterTest, Progress)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    record_and_print(printer, QueuedResult {TransferType::UPLOAD, "file", "s3://b/k", 20 * mib});
    record_and_print(
        printer, ProgressResult {TransferType::UPLOAD, "file", "s3://b/k", 5 * mib, 20 * mib});

    EXPECT_EQ(out_.str(), "Completed 5.0 MiB/20.0 MiB with 1 files remaining.\r");
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ResultPrinterTest, SuccessAfterProgress)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    record_and_print(printer, QueuedResult {TransferType::UPLOAD, "file", "s3://b/k", 20 * mib});
    record_and_print(
        printer, ProgressResult {TransferType::UPLOAD, "file", "s3://b/k", 5 * mib, 20 * mib});
    record_and_print(printer, SuccessResult {TransferType::UPLOAD, "file", "s3://b/k"});

    const std::string progress1 = "Completed 5.0 MiB/20.0 MiB with 1 files remaining.";
    const std::string progress2 = "Completed 5.0 MiB/20.0 MiB with 0 files remaining.";

    EXPECT_EQ(out_.str(), progress1 + '\r' +
                              padded("upload: file to s3://b/k", progress1.size()) + '\n' +
                              progress2 + '\r');
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ResultPrinterTest, FailureAfterProgress)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    record_and_print(printer, QueuedResult {TransferType::UPLOAD, "file", "s3://b/k", 20 * mib});
    record_and_print(
        printer, ProgressResult {TransferType::UPLOAD, "file", "s3://b/k", 5 * mib, 20 * mib});
    record_and_print(printer, FailureResult {TransferType::UPLOAD, "file", "s3://b/k", "boom"});

    const std::string progress = "Completed 5.0 MiB/20.0 MiB with 1 files remaining.";

    // Every byte is accounted for once the transfer failed, so progress is not displayed again
    EXPECT_EQ(out_.str(), progress + '\r');
    EXPECT_EQ(err_.str(), padded("upload failed: file to s3://b/k boom", progress.size()) + '\n');
    EXPECT_EQ(recorder_.bytes_failed_to_transfer(), 15 * mib);
}

TEST_F(ResultPrinterTest, WarningAlone)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    record_and_print(printer, WarningResult {"disk full"});

    EXPECT_EQ(recorder_.files_warned(), 1);
    EXPECT_EQ(err_.str(), "warning: disk full\n");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ResultPrinterTest, Error)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    record_and_print(printer, ErrorResult {"The user-provided path x does not exist."});

    EXPECT_EQ(err_.str(), "fatal error: The user-provided path x does not exist.\n");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(ResultPrinterTest, WarningRedisplaysProgress)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    record_and_print(printer, QueuedResult {TransferType::DOWNLOAD, "s3://b/k", "file", 2048});
    record_and_print(
        printer, ProgressResult {TransferType::DOWNLOAD, "s3://b/k", "file", 1024, 2048});
    record_and_print(printer, WarningResult {"Skipping file x. File is not a regular file."});

    const std::string progress = "Completed 1.0 KiB/2.0 KiB with 1 files remaining.";

    EXPECT_EQ(out_.str(), progress + '\r' + progress + '\r');
    EXPECT_EQ(err_.str(),
        padded("warning: Skipping file x. File is not a regular file.", progress.size()) + '\n');
}

TEST_F(ResultPrinterTest, LongStatementIsNotTruncated)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    record_and_print(printer, QueuedResult {TransferType::COPY, "s3://b/k", "s3://c/k", 1});
    record_and_print(printer, ProgressResult {TransferType::COPY, "s3://b/k", "s3://c/k", 1, 1});

    const std::string long_dest = "s3://c/" + std::string(100, 'x');
    record_and_print(printer, SuccessResult {TransferType::COPY, "s3://b/k", long_dest});

    const std::string progress = "Completed 1 Byte/1 Byte with 1 files remaining.";
    EXPECT_EQ(out_.str(), progress + '\r' + "copy: s3://b/k to " + long_dest + '\n');
}

TEST_F(ResultPrinterTest, StatementWithoutPriorProgressIsNotPadded)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    record_and_print(printer, QueuedResult {TransferType::COPY, "s3://b/k", "s3://c/k", 0});
    record_and_print(printer, SuccessResult {TransferType::COPY, "s3://b/k", "s3://c/k"});

    EXPECT_EQ(out_.str(), "copy: s3://b/k to s3://c/k\n");
}

TEST_F(ResultPrinterTest, ShutdownRequestPrintsNothing)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    printer.print(ShutdownRequest {});

    EXPECT_TRUE(out_.str().empty());
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(ResultPrinterTest, BrokenStreamThrows)
{
    ResultPrinterImpl printer {recorder_, out_, err_};
    err_.setstate(std::ios_base::badbit);

    EXPECT_THROW(printer.print(WarningResult {"disk full"}), std::ios_base::failure);
}

TEST_F(ResultPrinterTest, OnlyShowErrors)
{
    OnlyShowErrorsResultPrinter printer {recorder_, out_, err_};
    record_and_print(printer, QueuedResult {TransferType::UPLOAD, "a", "s3://b/a", 20 * mib});
    record_and_print(printer, QueuedResult {TransferType::UPLOAD, "c", "s3://b/c", 20 * mib});
    record_and_print(
        printer, ProgressResult {TransferType::UPLOAD, "a", "s3://b/a", 20 * mib, 20 * mib});
    record_and_print(printer, SuccessResult {TransferType::UPLOAD, "a", "s3://b/a"});
    record_and_print(printer, FailureResult {TransferType::UPLOAD, "c", "s3://b/c", "boom"});
    record_and_print(printer, WarningResult {"disk full"});

    EXPECT_TRUE(out_.str().empty());
    EXPECT_EQ(err_.str(), "upload failed: c to s3://b/c boom\nwarning: disk full\n");
}
