#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

#include <glog/logging.h>

#include "commandinterpreter.hpp"
#include "commandreader.hpp"
#include "xfersession.hpp"

namespace
{
constexpr char const *config_file_name = "config.json";
constexpr char const *default_configuration =
    "{\n"
    "    \"transfer\": {\n"
    "        \"max_concurrent_requests\": 10,\n"
    "        \"multipart_chunksize\": 8388608,\n"
    "        \"max_queue_size\": 1000\n"
    "    },\n"
    "    \"output\": {\n"
    "        \"quiet\": false,\n"
    "        \"only_show_errors\": false\n"
    "    }\n"
    "}\n";

// Exit status for command lines which cannot be interpreted
constexpr int usage_error_status = 2;

std::filesystem::path app_data_dir()
{
    const char *home = std::getenv("HOME");
    return std::filesystem::path {home ? home : "."} / ".xfer";
}

bool prepare_app_data_dir(const std::filesystem::path &dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec || !std::filesystem::is_directory(dir))
    {
        std::cerr << "Cannot create app data directory " << dir << ": "
                  << (ec ? ec.message() : "a file with this name exists") << '\n';
        return false;
    }

    auto config_path = dir / config_file_name;
    if (std::filesystem::exists(config_path, ec))
    {
        return true;
    }

    std::ofstream fs {config_path};
    if (!(fs << default_configuration))
    {
        std::cerr << "Cannot write default configuration to " << config_path << '\n';
        return false;
    }
    LOG(INFO) << "Wrote default configuration to " << config_path;
    return true;
}

int run_command(const xfercli::CommandInterpreter &interpreter, const xfercli::Command &command,
    xfer::XferSession &session, bool &ends_session)
{
    std::string error_message;
    auto        executable = interpreter.interpret(command, error_message);
    if (!executable)
    {
        std::cerr << error_message << '\n';
        return usage_error_status;
    }

    int exit_status = executable->execute(session, error_message);
    if (exit_status != 0 && !error_message.empty())
    {
        std::cerr << error_message << '\n';
    }

    ends_session = executable->ends_session();
    return exit_status;
}
}  // namespace

int main(int argc, char **argv)
{
    google::InitGoogleLogging(argv[0]);

    auto data_dir = app_data_dir();
    if (!prepare_app_data_dir(data_dir))
    {
        return EXIT_FAILURE;
    }

    xfer::XferSession           session {data_dir.string(), config_file_name};
    xfercli::CommandInterpreter interpreter {std::cout, std::cerr};
    bool                        ends_session = false;

    // One-shot mode, e.g. xfercli cp SRC DEST
    if (argc > 1)
    {
        auto command = xfercli::CommandReader::from_args(argc - 1, argv + 1);
        return run_command(interpreter, *command, session, ends_session);
    }

    std::cout << "xfer command line utility " << XFERCLI_VERSION << "\n\nCommands:\n"
              << xfercli::CommandInterpreter::usage() << '\n';

    xfercli::CommandReader reader {std::cin};
    int                    exit_status = EXIT_SUCCESS;
    while (!ends_session)
    {
        std::cout << "> " << std::flush;
        auto command = reader.read_next_command();
        if (!command)
        {
            break;
        }
        exit_status = run_command(interpreter, *command, session, ends_session);
    }
    return exit_status;
}
