#include "protocol/BufferWriter.hpp"
#include <arpa/inet.h>

namespace broker::protocol
{

    BufferWriter::BufferWriter(size_t reserve)
    {
        m_data.reserve(reserve);
    }

    void BufferWriter::writeUInt16(uint16_t val)
    {
        uint16_t be_val = htons(val);
        const char *p = reinterpret_cast<const char *>(&be_val);
        m_data.insert(m_data.end(), p, p + sizeof(be_val));
    }

    void BufferWriter::writeInt32(int32_t val)
    {
        uint32_t be_val = htonl(static_cast<uint32_t>(val));
        const char *p = reinterpret_cast<const char *>(&be_val);
        m_data.insert(m_data.end(), p, p + sizeof(be_val));
    }

} // namespace broker::protocol
