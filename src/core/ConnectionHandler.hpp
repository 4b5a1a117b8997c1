#pragma once
#include "protocol/ByteStream.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace broker
{
    enum class ConnectionState
    {
        AwaitingRequest,
        Processing,
        Closed
    };

    const char *to_string(ConnectionState state);

    struct ConnectionStats
    {
        size_t requests_served = 0;
        ConnectionState state = ConnectionState::AwaitingRequest;
    };

    // Serves one connection: reads a request header, answers with a response
    // header carrying the same correlation id, and repeats until the stream
    // ends or fails. Holds no state between connections, so one instance per
    // connection thread is safe.
    class ConnectionHandler
    {
    public:
        ConnectionHandler(std::shared_ptr<spdlog::logger> logger, std::string peer = "client");

        // Never throws a ProtocolError; all I/O failures close the connection.
        ConnectionStats run(protocol::ByteStream &stream);

    private:
        std::shared_ptr<spdlog::logger> logger;
        std::string peer;
    };
}
