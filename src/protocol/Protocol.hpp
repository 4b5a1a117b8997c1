#pragma once
#include "protocol/ByteStream.hpp"
#include "protocol/Request.hpp"
#include "protocol/Response.hpp"
#include <vector>
#include <cstdint>

namespace broker::protocol
{
    // Decodes the 12-byte request header prefix. Throws ReadFailure if fewer
    // than RequestHeader::kWireSize bytes are supplied.
    RequestHeader parse_request_header(const char *data, size_t size);

    // Encodes a response header into its 8-byte wire form.
    std::vector<char> serialize_response_header(const ResponseHeader &header);

    // Reads exactly one request header prefix from the stream. Any body bytes
    // that follow are left unread.
    RequestHeader read_request_header(ByteStream &stream);

    // Writes a response header and flushes the stream.
    void write_response_header(ByteStream &stream, const ResponseHeader &header);

    // Client side of the same framing.
    std::vector<char> serialize_request_header(const RequestHeader &header);
    ResponseHeader parse_response_header(const char *data, size_t size);
    void write_request_header(ByteStream &stream, const RequestHeader &header);
    ResponseHeader read_response_header(ByteStream &stream);
}
