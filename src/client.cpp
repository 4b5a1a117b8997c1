#include "core/Config.hpp"
#include "core/Logging.hpp"
#include "net/SocketStream.hpp"
#include "protocol/Errors.hpp"
#include "protocol/Protocol.hpp"
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    // Print data in hex, like hexdump -C
    void printHex(const char *data, size_t len)
    {
        for (size_t i = 0; i < len; i++)
        {
            printf("%02x ", static_cast<unsigned char>(data[i]));
            if ((i + 1) % 16 == 0)
                printf("\n");
        }
        if (len % 16 != 0)
            printf("\n");
    }
}

int main(int argc, char *argv[])
{
    auto logger = broker::make_logger("client", spdlog::level::info);

    broker::ClientConfig options;
    try
    {
        options = broker::parse_client_args(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        logger->error("{}", e.what());
        std::cerr << broker::client_usage(argv[0]);
        return 2;
    }

    if (options.show_help)
    {
        std::cout << broker::client_usage(argv[0]);
        return 0;
    }

    try
    {
        auto stream = broker::net::SocketStream::connect_to(options.host, options.port);
        logger->info("Connected to {}:{}", options.host, options.port);

        for (int i = 0; i < options.count; i++)
        {
            broker::protocol::RequestHeader request;
            request.message_size = 8;
            request.request_api_key = options.api_key;
            request.request_api_version = options.api_version;
            // Wraps around past INT32_MAX.
            request.correlation_id = static_cast<int32_t>(static_cast<uint32_t>(options.correlation_id) +
                                                          static_cast<uint32_t>(i));

            broker::protocol::write_request_header(stream, request);
            logger->info("Sent request {} with correlation id {}", i + 1, request.correlation_id);

            std::vector<char> raw(broker::protocol::ResponseHeader::kWireSize);
            stream.read_exact(raw.data(), raw.size());
            printHex(raw.data(), raw.size());

            broker::protocol::ResponseHeader response =
                broker::protocol::parse_response_header(raw.data(), raw.size());
            if (response.correlation_id != request.correlation_id)
            {
                logger->error("Correlation id mismatch: sent {}, received {}", request.correlation_id,
                              response.correlation_id);
                return 1;
            }
            logger->info("Response {}: message_size={} correlation_id={}", i + 1, response.message_size,
                         response.correlation_id);
        }
    }
    catch (const broker::protocol::ProtocolError &e)
    {
        logger->error("Connection failed: {}", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        logger->error("{}", e.what());
        return 1;
    }

    return 0;
}
