#include <cstdlib>
#include <exception>
#include <iostream>

#include "bucketsync/daemon/config.hpp"
#include "bucketsync/daemon/daemon.hpp"
#include "bucketsync/daemon/logging.hpp"
#include "bucketsync/daemon/notifier.hpp"
#include "bucketsync/error_codes.hpp"
#include "bucketsync/version.hpp"

#include <spdlog/spdlog.h>

int main(int argc, char *argv[])
{
    using bucketsync::daemon::Daemon;

    bucketsync::daemon::CommandLine command_line;
    try
    {
        command_line = bucketsync::daemon::parse_arguments(argc, argv);
    }
    catch (const bucketsync::ConfigError &ex)
    {
        std::cerr << "Configuration error: " << ex.what() << "\n\n"
                  << bucketsync::daemon::usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (command_line.show_help)
    {
        std::cout << "BucketSync " << bucketsync::version() << "\n"
                  << bucketsync::daemon::usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (command_line.show_version)
    {
        std::cout << bucketsync::version() << std::endl;
        return EXIT_SUCCESS;
    }

    auto &config = command_line.config;
    try
    {
        bucketsync::daemon::configure_logging(config.log_file, config.log_level);
        spdlog::info("Starting BucketSync {}", bucketsync::version());
        spdlog::info("Uploading {} -> {}, downloading {} -> {}", config.input.string(), config.upload_bucket,
                     config.download_bucket, config.output.string());
        std::cout << "Press Ctrl+C to stop. Shutdown waits for running transfers to finish." << std::endl;

        auto store = bucketsync::daemon::make_blob_store(config);
        auto notifier = bucketsync::daemon::make_notifier(config.notify_command);
        Daemon daemon(std::move(config), std::move(store), std::move(notifier));
        daemon.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "BucketSync failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
