#include "core/Config.hpp"
#include "core/Logging.hpp"
#include "core/Server.hpp"
#include "core/ThreadPool.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

int main(int argc, char *argv[])
{
    broker::ServerConfig config;
    try
    {
        config = broker::parse_args(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << e.what() << "\n\n"
                  << broker::usage(argv[0]);
        return 2;
    }

    if (config.show_help)
    {
        std::cout << broker::usage(argv[0]);
        return 0;
    }

    auto logger = broker::make_logger("broker", config.log_level);

    try
    {
        auto threadPool = std::make_shared<broker::ThreadPool>(config.worker_threads, config.max_threads);
        logger->info("Thread pool with {} workers created", config.worker_threads);

        broker::Server server(config, threadPool, logger);
        server.start();
    }
    catch (const std::exception &e)
    {
        logger->critical("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
