#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <spdlog/spdlog.h>

namespace broker
{
    struct ServerConfig
    {
        std::string host = "127.0.0.1";
        int port = 9092;
        size_t worker_threads = 4;
        size_t max_threads = 0; // 0: unbounded
        spdlog::level::level_enum log_level = spdlog::level::info;
        bool show_help = false;
    };

    // Parses --host, --port, --threads, --max-threads, --log-level and --help.
    // Throws std::invalid_argument on unknown options or bad values.
    ServerConfig parse_args(int argc, char *argv[]);

    std::string usage(const std::string &program);

    // Options of the broker_client command-line tool.
    struct ClientConfig
    {
        std::string host = "127.0.0.1";
        int port = 9092;
        int32_t correlation_id = 7;
        uint16_t api_key = 18;
        uint16_t api_version = 4;
        int count = 1;
        bool show_help = false;
    };

    ClientConfig parse_client_args(int argc, char *argv[]);

    std::string client_usage(const std::string &program);
}
