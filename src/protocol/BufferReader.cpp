#include "protocol/BufferReader.hpp"
#include "protocol/Errors.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <string>

namespace broker::protocol
{

    BufferReader::BufferReader(const char *data, size_t size)
        : m_data(data), m_size(size), m_pos(0) {}

    void BufferReader::ensure_can_read(size_t bytes) const
    {
        if (bytes > m_size - m_pos)
        {
            throw ReadFailure("Attempt to read " + std::to_string(bytes) + " bytes with only " +
                                  std::to_string(m_size - m_pos) + " remaining in buffer",
                              m_size - m_pos, bytes);
        }
    }

    uint16_t BufferReader::readUInt16()
    {
        ensure_can_read(2);
        uint16_t val;
        memcpy(&val, m_data + m_pos, 2);
        m_pos += 2;
        return ntohs(val);
    }

    int32_t BufferReader::readInt32()
    {
        ensure_can_read(4);
        uint32_t val;
        memcpy(&val, m_data + m_pos, 4);
        m_pos += 4;
        return static_cast<int32_t>(ntohl(val));
    }

} // namespace broker::protocol
