#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "sharerelay/crypto.hpp"
#include "sharerelay/server/config.hpp"
#include "sharerelay/server/server.hpp"
#include "sharerelay/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char *argv[])
{
    using sharerelay::server::Server;
    using sharerelay::server::ServerConfig;

    ServerConfig config;
    try
    {
        config = sharerelay::server::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << sharerelay::server::usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.show_help)
    {
        std::cout << sharerelay::server::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting ShareRelay server {} on {}:{}", sharerelay::version(), config.address, config.port);

        sharerelay::crypto::ensure_sodium_init();

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
