#include <iostream>
#include <string>

#include "api/downloader.hpp"
#include "cli/cli.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

void print_usage() {
    std::cout << "Usage: dlr [config.json]\n"
              << "  config.json  - JSON configuration (default: " << DownloaderConfig::DEFAULT_CONFIG_FILE << ")\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = DownloaderConfig::DEFAULT_CONFIG_FILE;
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        }
        config_path = arg;
    }

    try {
        DownloaderConfig config = load_config(config_path);
        Logger::instance().init(config.log_file);
        Logger::instance().set_debug(config.debug);
        LOG_INFO("Starting dlr with database ", config.database);

        auto downloader = Downloader::initialize(config);
        {
            CLI cli(*downloader, std::cin, std::cout);
            cli.run();
            // Drain notifications while the CLI can still print them
            downloader->shutdown();
        }
    } catch (const DownloaderError& e) {
        LOG_ERR("Fatal: ", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERR("Unexpected error: ", e.what());
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }

    LOG_INFO("dlr exited cleanly.");
    return 0;
}
