#include "core/Config.hpp"
#include <cstdint>
#include <stdexcept>

namespace
{
    long parse_number(const std::string &option, const std::string &value, long min, long max)
    {
        size_t consumed = 0;
        long parsed = 0;
        try
        {
            parsed = std::stol(value, &consumed);
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
        }
        if (consumed != value.size())
        {
            throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
        }
        if (parsed < min || parsed > max)
        {
            throw std::invalid_argument(option + " must be between " + std::to_string(min) + " and " +
                                        std::to_string(max) + ", got " + value);
        }
        return parsed;
    }

    spdlog::level::level_enum parse_level(const std::string &value)
    {
        // from_str maps anything it does not know to "off", so check the
        // round trip.
        auto level = spdlog::level::from_str(value);
        if (level == spdlog::level::off && value != "off")
        {
            throw std::invalid_argument("Unknown log level: '" + value + "'");
        }
        return level;
    }
}

namespace broker
{
    ServerConfig parse_args(int argc, char *argv[])
    {
        ServerConfig config;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                continue;
            }

            if (arg != "--host" && arg != "--port" && arg != "--threads" && arg != "--max-threads" &&
                arg != "--log-level")
            {
                throw std::invalid_argument("Unknown option: " + arg);
            }
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("Missing value for " + arg);
            }
            std::string value = argv[++i];

            if (arg == "--host")
            {
                config.host = value;
            }
            else if (arg == "--port")
            {
                config.port = static_cast<int>(parse_number(arg, value, 0, 65535));
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<size_t>(parse_number(arg, value, 1, 1024));
            }
            else if (arg == "--max-threads")
            {
                config.max_threads = static_cast<size_t>(parse_number(arg, value, 0, 65536));
            }
            else
            {
                config.log_level = parse_level(value);
            }
        }
        if (config.max_threads != 0 && config.max_threads < config.worker_threads)
        {
            throw std::invalid_argument("--max-threads must not be below --threads");
        }
        return config;
    }

    std::string usage(const std::string &program)
    {
        return "Usage: " + program + " [options]\n"
               "  --host <addr>        IPv4 address to listen on (default 127.0.0.1)\n"
               "  --port <n>           TCP port, 0 for any free port (default 9092)\n"
               "  --threads <n>        initial connection worker threads (default 4)\n"
               "  --max-threads <n>    cap on worker threads, 0 for none (default 0)\n"
               "  --log-level <level>  trace|debug|info|warn|error|critical|off (default info)\n"
               "  -h, --help           show this help\n";
    }

    ClientConfig parse_client_args(int argc, char *argv[])
    {
        ClientConfig config;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                continue;
            }

            if (arg != "--host" && arg != "--port" && arg != "--correlation-id" && arg != "--api-key" &&
                arg != "--api-version" && arg != "--count")
            {
                throw std::invalid_argument("Unknown option: " + arg);
            }
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("Missing value for " + arg);
            }
            std::string value = argv[++i];

            if (arg == "--host")
                config.host = value;
            else if (arg == "--port")
                config.port = static_cast<int>(parse_number(arg, value, 1, 65535));
            else if (arg == "--correlation-id")
                config.correlation_id = static_cast<int32_t>(parse_number(arg, value, INT32_MIN, INT32_MAX));
            else if (arg == "--api-key")
                config.api_key = static_cast<uint16_t>(parse_number(arg, value, 0, UINT16_MAX));
            else if (arg == "--api-version")
                config.api_version = static_cast<uint16_t>(parse_number(arg, value, 0, UINT16_MAX));
            else
                config.count = static_cast<int>(parse_number(arg, value, 1, 1000000));
        }
        return config;
    }

    std::string client_usage(const std::string &program)
    {
        return "Usage: " + program + " [options]\n"
               "  --host <addr>          broker address (default 127.0.0.1)\n"
               "  --port <n>             broker port (default 9092)\n"
               "  --correlation-id <n>   first correlation id (default 7)\n"
               "  --api-key <n>          request api key (default 18)\n"
               "  --api-version <n>      request api version (default 4)\n"
               "  --count <n>            requests to send (default 1)\n"
               "  -h, --help             show this help\n";
    }
}
