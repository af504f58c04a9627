#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <boost/asio.hpp>
#include <glog/logging.h>

#include "lansharenode.hpp"

namespace
{
constexpr char const *config_file_name = "config.json";

std::string get_app_data_dir()
{
    const char *home = std::getenv("HOME");
    return (std::filesystem::path {home ? home : "."} / ".lanshare").string();
}

bool write_file_if_not_exists(const std::string &path, const std::string &content)
{
    if (!std::filesystem::is_regular_file(path))
    {
        // A non regular file with the same name is in the way
        std::error_code ec;
        std::filesystem::remove_all(path, ec);

        std::ofstream fs {path};
        if (!fs)
        {
            std::cout << "Cannot open " << path << " for writing\n";
            return false;
        }
        fs << content;
    }
    return true;
}
}  // namespace

int main(int /*argc*/, char **argv)
{
    google::InitGoogleLogging(argv[0]);

    std::string app_data_dir {get_app_data_dir()};

    if (!std::filesystem::is_directory(app_data_dir))
    {
        std::error_code ec;
        std::filesystem::remove(app_data_dir, ec);
        std::filesystem::create_directories(app_data_dir, ec);
        if (ec)
        {
            std::cout << "Error while creating app data directory " << app_data_dir << ": "
                      << ec.message() << "\n";
            return EXIT_FAILURE;
        }
    }

    if (!write_file_if_not_exists(
            (std::filesystem::path {app_data_dir} / config_file_name).string(),
            lanshare::LanShareNode::default_configuration(app_data_dir)))
    {
        return EXIT_FAILURE;
    }

    lanshare::LanShareNode node {app_data_dir, config_file_name};
    if (!node.start())
    {
        std::cout << "Failed to start node, check the log file for details.\n";
        return EXIT_FAILURE;
    }
    std::cout << "LanShare node " << node.device_name() << " listening on port " << node.port()
              << "\n";

    boost::asio::io_context signals_io_ctx;
    boost::asio::signal_set signals {signals_io_ctx, SIGINT, SIGTERM};
    signals.async_wait([](const boost::system::error_code &ec, int signal_number) {
        if (!ec)
        {
            LOG(INFO) << "Received signal " << signal_number << ", shutting down";
        }
    });
    signals_io_ctx.run();

    if (!node.stop())
    {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
