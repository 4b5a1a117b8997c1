#include "core/ConnectionHandler.hpp"
#include "protocol/Protocol.hpp"
#include "MemoryStream.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

using broker::ConnectionHandler;
using broker::ConnectionState;
using broker::ConnectionStats;
using broker::test::bytes;
using broker::test::MemoryStream;

namespace
{
    class ConnectionHandlerTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_output);
            logger = std::make_shared<spdlog::logger>("test", sink);
            logger->set_pattern("%l %v");
            logger->set_level(spdlog::level::trace);
        }

        std::string logs() const { return log_output.str(); }

        std::ostringstream log_output;
        std::shared_ptr<spdlog::logger> logger;
    };

    std::vector<char> request(int32_t correlation_id)
    {
        broker::protocol::RequestHeader header;
        header.message_size = 8;
        header.request_api_key = 18;
        header.request_api_version = 4;
        header.correlation_id = correlation_id;
        return broker::protocol::serialize_request_header(header);
    }
}

TEST_F(ConnectionHandlerTest, EchoesCorrelationId)
{
    MemoryStream stream(bytes({0x00, 0x00, 0x00, 0x08, 0x00, 0x12, 0x00, 0x04, 0x00, 0x00, 0x00, 0x07}));
    ConnectionStats stats = ConnectionHandler(logger).run(stream);

    EXPECT_EQ(stream.output, bytes({0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x07}));
    EXPECT_EQ(stats.requests_served, 1u);
    EXPECT_EQ(stats.state, ConnectionState::Closed);
    EXPECT_NE(logs().find("correlation id 7"), std::string::npos);
}

TEST_F(ConnectionHandlerTest, ServesRequestsUntilPeerCloses)
{
    std::vector<char> input;
    for (int32_t id : {1, 2, 3})
    {
        auto r = request(id);
        input.insert(input.end(), r.begin(), r.end());
    }
    MemoryStream stream(input);

    ConnectionStats stats = ConnectionHandler(logger, "peer-a").run(stream);

    EXPECT_EQ(stats.requests_served, 3u);
    EXPECT_EQ(stream.flushes, 3);
    EXPECT_EQ(stream.output, bytes({0, 0, 0, 0, 0, 0, 0, 1,
                                    0, 0, 0, 0, 0, 0, 0, 2,
                                    0, 0, 0, 0, 0, 0, 0, 3}));
    EXPECT_NE(logs().find("info peer-a: peer closed connection after 3 request(s)"), std::string::npos);
    EXPECT_EQ(logs().find("error"), std::string::npos);
}

TEST_F(ConnectionHandlerTest, TruncatedHeaderAbandonsConnection)
{
    MemoryStream stream(bytes({0x00, 0x00, 0x00, 0x08, 0x00, 0x12}));
    ConnectionStats stats = ConnectionHandler(logger).run(stream);

    EXPECT_EQ(stats.requests_served, 0u);
    EXPECT_EQ(stats.state, ConnectionState::Closed);
    EXPECT_TRUE(stream.output.empty());
    EXPECT_TRUE(stream.pending.empty());
    EXPECT_NE(logs().find("error client: could not read request header"), std::string::npos);
}

TEST_F(ConnectionHandlerTest, StopsReadingAfterReadFailure)
{
    std::vector<char> input = request(5);
    input.push_back(0x00);
    input.push_back(0x00);
    MemoryStream stream(input);

    ConnectionStats stats = ConnectionHandler(logger).run(stream);

    EXPECT_EQ(stats.requests_served, 1u);
    EXPECT_EQ(stream.reads, 2);
    EXPECT_EQ(stream.output, bytes({0, 0, 0, 0, 0, 0, 0, 5}));
    EXPECT_NE(logs().find("error"), std::string::npos);
}

TEST_F(ConnectionHandlerTest, WriteFailureClosesConnection)
{
    std::vector<char> input = request(11);
    auto second = request(12);
    input.insert(input.end(), second.begin(), second.end());
    MemoryStream stream(input);
    stream.fail_flush = true;

    ConnectionStats stats = ConnectionHandler(logger).run(stream);

    EXPECT_EQ(stats.requests_served, 0u);
    EXPECT_EQ(stats.state, ConnectionState::Closed);
    EXPECT_EQ(stream.reads, 1);
    EXPECT_NE(logs().find("could not write response for correlation id 11"), std::string::npos);
}

TEST_F(ConnectionHandlerTest, LogsDecodedHeaderAtDebug)
{
    MemoryStream stream(request(3));
    ConnectionHandler(logger).run(stream);
    EXPECT_NE(logs().find("debug client: header message_size=8 api_key=18 api_version=4"), std::string::npos);
}

TEST(ConnectionStateTest, Names)
{
    EXPECT_STREQ(broker::to_string(ConnectionState::AwaitingRequest), "awaiting-request");
    EXPECT_STREQ(broker::to_string(ConnectionState::Processing), "processing");
    EXPECT_STREQ(broker::to_string(ConnectionState::Closed), "closed");
}
