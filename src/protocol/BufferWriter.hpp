#pragma once
#include <vector>
#include <cstdint>
#include <cstddef>
#include <utility>

namespace broker::protocol
{

    // Appends big-endian integers to a growable byte buffer.
    class BufferWriter
    {
    public:
        BufferWriter() = default;
        explicit BufferWriter(size_t reserve);

        void writeUInt16(uint16_t val);
        void writeInt32(int32_t val);

        std::vector<char> release() { return std::move(m_data); }

    private:
        std::vector<char> m_data;
    };

} // namespace broker::protocol
