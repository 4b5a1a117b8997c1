#include "core/Config.hpp"
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

using broker::ClientConfig;
using broker::parse_args;
using broker::parse_client_args;
using broker::ServerConfig;

namespace
{
    // Owns argv storage for a parser call.
    template <typename Parser>
    auto run_parser(Parser parser, const char *program, std::initializer_list<std::string> args)
    {
        std::vector<std::string> storage{program};
        storage.insert(storage.end(), args.begin(), args.end());
        std::vector<char *> argv;
        for (auto &arg : storage)
            argv.push_back(arg.data());
        return parser(static_cast<int>(argv.size()), argv.data());
    }

    ServerConfig parse(std::initializer_list<std::string> args)
    {
        return run_parser(parse_args, "broker_server", args);
    }

    ClientConfig parse_client(std::initializer_list<std::string> args)
    {
        return run_parser(parse_client_args, "broker_client", args);
    }
}

TEST(ConfigTest, DefaultsMatchConventionalEndpoint)
{
    ServerConfig config = parse({});
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 9092);
    EXPECT_EQ(config.worker_threads, 4u);
    EXPECT_EQ(config.max_threads, 0u);
    EXPECT_EQ(config.log_level, spdlog::level::info);
    EXPECT_FALSE(config.show_help);
}

TEST(ConfigTest, ParsesAllOptions)
{
    ServerConfig config = parse({"--host", "0.0.0.0", "--port", "0", "--threads", "8", "--log-level", "debug"});
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 0);
    EXPECT_EQ(config.worker_threads, 8u);
    EXPECT_EQ(config.log_level, spdlog::level::debug);
}

TEST(ConfigTest, HelpFlag)
{
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"-h"}).show_help);
    EXPECT_NE(broker::usage("broker_server").find("--port"), std::string::npos);
}

TEST(ConfigTest, RejectsBadInput)
{
    EXPECT_THROW(parse({"--port", "65536"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port", "-1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port", "90x"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port"}), std::invalid_argument);
    EXPECT_THROW(parse({"--threads", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"--log-level", "loud"}), std::invalid_argument);
    EXPECT_THROW(parse({"--verbose"}), std::invalid_argument);
}

TEST(ConfigTest, OffIsAValidLevel)
{
    EXPECT_EQ(parse({"--log-level", "off"}).log_level, spdlog::level::off);
}

TEST(ConfigTest, MaxThreadsMustCoverInitialWorkers)
{
    EXPECT_EQ(parse({"--threads", "2", "--max-threads", "16"}).max_threads, 16u);
    EXPECT_EQ(parse({"--max-threads", "0"}).max_threads, 0u);
    EXPECT_THROW(parse({"--threads", "8", "--max-threads", "4"}), std::invalid_argument);
    EXPECT_THROW(parse({"--max-threads", "many"}), std::invalid_argument);
}

TEST(ClientConfigTest, Defaults)
{
    ClientConfig config = parse_client({});
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 9092);
    EXPECT_EQ(config.correlation_id, 7);
    EXPECT_EQ(config.api_key, 18);
    EXPECT_EQ(config.api_version, 4);
    EXPECT_EQ(config.count, 1);
    EXPECT_FALSE(config.show_help);
}

TEST(ClientConfigTest, HelpFlagTakesNoValue)
{
    EXPECT_TRUE(parse_client({"--help"}).show_help);
    EXPECT_TRUE(parse_client({"-h"}).show_help);
    EXPECT_TRUE(parse_client({"--port", "9000", "--help"}).show_help);
    EXPECT_NE(broker::client_usage("broker_client").find("--correlation-id"), std::string::npos);
}

TEST(ClientConfigTest, ParsesAllOptions)
{
    ClientConfig config = parse_client({"--host", "10.0.0.1", "--port", "19092", "--correlation-id", "-5",
                                        "--api-key", "1", "--api-version", "12", "--count", "3"});
    EXPECT_EQ(config.host, "10.0.0.1");
    EXPECT_EQ(config.port, 19092);
    EXPECT_EQ(config.correlation_id, -5);
    EXPECT_EQ(config.api_key, 1);
    EXPECT_EQ(config.api_version, 12);
    EXPECT_EQ(config.count, 3);
}

TEST(ClientConfigTest, RejectsBadInput)
{
    EXPECT_THROW(parse_client({"--port", "0"}), std::invalid_argument);
    EXPECT_THROW(parse_client({"--correlation-id", "2147483648"}), std::invalid_argument);
    EXPECT_THROW(parse_client({"--api-key", "65536"}), std::invalid_argument);
    EXPECT_THROW(parse_client({"--count", "0"}), std::invalid_argument);
    EXPECT_THROW(parse_client({"--count"}), std::invalid_argument);
    EXPECT_THROW(parse_client({"--threads", "2"}), std::invalid_argument);
}
