#pragma once
#include <cstddef>

namespace broker::protocol
{

    // Blocking, bidirectional byte stream that the codec reads requests from
    // and writes responses to. Implementations report failures by throwing
    // ReadFailure / WriteFailure.
    class ByteStream
    {
    public:
        virtual ~ByteStream() = default;

        // Fills exactly `len` bytes or throws ReadFailure.
        virtual void read_exact(char *buf, size_t len) = 0;

        virtual void write_all(const char *data, size_t len) = 0;

        // Pushes any buffered output to the peer.
        virtual void flush() = 0;
    };

} // namespace broker::protocol
