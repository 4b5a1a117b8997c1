#include "core/ConnectionHandler.hpp"
#include "protocol/Errors.hpp"
#include "protocol/Protocol.hpp"
#include <utility>

namespace broker
{
    const char *to_string(ConnectionState state)
    {
        switch (state)
        {
        case ConnectionState::AwaitingRequest:
            return "awaiting-request";
        case ConnectionState::Processing:
            return "processing";
        case ConnectionState::Closed:
            return "closed";
        }
        return "unknown";
    }

    ConnectionHandler::ConnectionHandler(std::shared_ptr<spdlog::logger> logger, std::string peer)
        : logger(std::move(logger)), peer(std::move(peer)) {}

    ConnectionStats ConnectionHandler::run(protocol::ByteStream &stream)
    {
        ConnectionStats stats;
        protocol::RequestHeader request;

        while (stats.state != ConnectionState::Closed)
        {
            switch (stats.state)
            {
            case ConnectionState::AwaitingRequest:
                try
                {
                    request = protocol::read_request_header(stream);
                    logger->debug("{}: header message_size={} api_key={} api_version={}", peer,
                                  request.message_size, request.request_api_key, request.request_api_version);
                    logger->info("{}: received request with correlation id {}", peer, request.correlation_id);
                    stats.state = ConnectionState::Processing;
                }
                catch (const protocol::ReadFailure &e)
                {
                    if (e.at_boundary())
                    {
                        logger->info("{}: peer closed connection after {} request(s)", peer,
                                     stats.requests_served);
                    }
                    else
                    {
                        logger->error("{}: could not read request header: {}", peer, e.what());
                    }
                    stats.state = ConnectionState::Closed;
                }
                catch (const protocol::ProtocolError &e)
                {
                    logger->error("{}: could not read request header: {}", peer, e.what());
                    stats.state = ConnectionState::Closed;
                }
                break;

            case ConnectionState::Processing:
                try
                {
                    protocol::ResponseHeader response;
                    response.correlation_id = request.correlation_id;
                    protocol::write_response_header(stream, response);
                    ++stats.requests_served;
                    stats.state = ConnectionState::AwaitingRequest;
                }
                catch (const protocol::ProtocolError &e)
                {
                    logger->error("{}: could not write response for correlation id {}: {}", peer,
                                  request.correlation_id, e.what());
                    stats.state = ConnectionState::Closed;
                }
                break;

            case ConnectionState::Closed:
                break;
            }
        }
        logger->debug("{}: connection {}", peer, to_string(stats.state));
        return stats;
    }
}
