#pragma once
#include <cstdint>
#include <cstddef>

namespace broker::protocol
{

    // Sequential big-endian reader over a borrowed byte range.
    class BufferReader
    {
    public:
        BufferReader(const char *data, size_t size);

        uint16_t readUInt16();
        int32_t readInt32();

    private:
        void ensure_can_read(size_t bytes) const;

        const char *m_data;
        size_t m_size;
        size_t m_pos;
    };

} // namespace broker::protocol
