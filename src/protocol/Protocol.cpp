#include "protocol/Protocol.hpp"
#include "protocol/BufferReader.hpp"
#include "protocol/BufferWriter.hpp"
#include "protocol/Errors.hpp"
#include <array>
#include <string>

namespace
{
    void ensure_size(size_t size, size_t required, const char *what)
    {
        if (size < required)
        {
            throw broker::protocol::ReadFailure(std::string(what) + " needs " + std::to_string(required) +
                                                    " bytes, got " + std::to_string(size),
                                                size, required);
        }
    }
}

namespace broker::protocol
{

    RequestHeader parse_request_header(const char *data, size_t size)
    {
        ensure_size(size, RequestHeader::kWireSize, "Request header");

        RequestHeader header;
        BufferReader reader(data, RequestHeader::kWireSize);

        header.message_size = reader.readInt32();
        header.request_api_key = reader.readUInt16();
        header.request_api_version = reader.readUInt16();
        header.correlation_id = reader.readInt32();
        return header;
    }

    std::vector<char> serialize_response_header(const ResponseHeader &header)
    {
        BufferWriter writer(ResponseHeader::kWireSize);
        writer.writeInt32(header.message_size);
        writer.writeInt32(header.correlation_id);
        return writer.release();
    }

    RequestHeader read_request_header(ByteStream &stream)
    {
        std::array<char, RequestHeader::kWireSize> buf;
        stream.read_exact(buf.data(), buf.size());
        return parse_request_header(buf.data(), buf.size());
    }

    void write_response_header(ByteStream &stream, const ResponseHeader &header)
    {
        std::vector<char> bytes = serialize_response_header(header);
        stream.write_all(bytes.data(), bytes.size());
        stream.flush();
    }

    std::vector<char> serialize_request_header(const RequestHeader &header)
    {
        BufferWriter writer(RequestHeader::kWireSize);
        writer.writeInt32(header.message_size);
        writer.writeUInt16(header.request_api_key);
        writer.writeUInt16(header.request_api_version);
        writer.writeInt32(header.correlation_id);
        return writer.release();
    }

    ResponseHeader parse_response_header(const char *data, size_t size)
    {
        ensure_size(size, ResponseHeader::kWireSize, "Response header");

        ResponseHeader header;
        BufferReader reader(data, ResponseHeader::kWireSize);
        header.message_size = reader.readInt32();
        header.correlation_id = reader.readInt32();
        return header;
    }

    void write_request_header(ByteStream &stream, const RequestHeader &header)
    {
        std::vector<char> bytes = serialize_request_header(header);
        stream.write_all(bytes.data(), bytes.size());
        stream.flush();
    }

    ResponseHeader read_response_header(ByteStream &stream)
    {
        std::array<char, ResponseHeader::kWireSize> buf;
        stream.read_exact(buf.data(), buf.size());
        return parse_response_header(buf.data(), buf.size());
    }

} // namespace broker::protocol
