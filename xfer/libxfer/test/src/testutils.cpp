#include "testutils.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace testutils
{
bool wait_for(const std::function<bool()> &predicate, unsigned timeout_ms)
{
    using namespace std::chrono;
    auto start = steady_clock::now();
    while (!predicate() &&
           (timeout_ms == 0 ||
               duration_cast<milliseconds>(steady_clock::now() - start).count() <= timeout_ms))
    {
        std::this_thread::yield();
    }
    return predicate();
}

bool write_file(const std::filesystem::path &path, uint64_t size)
{
    std::ofstream fs {path, std::ios::binary | std::ios::trunc};
    for (uint64_t i = 0; i != size && fs; ++i)
    {
        fs.put(char(i % 251));
    }
    return bool(fs);
}

bool write_file(const std::filesystem::path &path, const std::string &content)
{
    std::ofstream fs {path, std::ios::binary | std::ios::trunc};
    fs << content;
    return bool(fs);
}

std::string read_file(const std::filesystem::path &path)
{
    std::ifstream fs {path, std::ios::binary};
    return {std::istreambuf_iterator<char> {fs}, std::istreambuf_iterator<char> {}};
}

xfer::transfer::TransferFuture make_done_future(
    xfer::transfer::TransferMeta meta, const std::string &error_message)
{
    std::promise<void> promise;
    if (error_message.empty())
    {
        promise.set_value();
    }
    else
    {
        promise.set_exception(std::make_exception_ptr(std::runtime_error {error_message}));
    }
    return {std::move(meta), promise.get_future().share()};
}

TemporaryDirectory::TemporaryDirectory()
{
    static std::atomic_uint counter {0};
    std::random_device      rd;

    path_ = std::filesystem::temp_directory_path() /
            ("xfer_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TemporaryDirectory::~TemporaryDirectory()
{
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

const std::filesystem::path &TemporaryDirectory::path() const
{
    return path_;
}
}  // namespace testutils
