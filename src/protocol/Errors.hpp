#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace broker::protocol
{

    // Base of all errors that are fatal to a single connection.
    class ProtocolError : public std::runtime_error
    {
    public:
        explicit ProtocolError(const std::string &what) : std::runtime_error(what) {}
    };

    class ReadFailure : public ProtocolError
    {
    public:
        ReadFailure(const std::string &what, size_t bytes_read, size_t bytes_expected, bool end_of_stream = true)
            : ProtocolError(what), m_bytes_read(bytes_read), m_bytes_expected(bytes_expected),
              m_end_of_stream(end_of_stream) {}

        size_t bytes_read() const noexcept { return m_bytes_read; }
        size_t bytes_expected() const noexcept { return m_bytes_expected; }
        bool end_of_stream() const noexcept { return m_end_of_stream; }

        // True when the peer closed before sending any byte of the item.
        bool at_boundary() const noexcept { return m_end_of_stream && m_bytes_read == 0; }

    private:
        size_t m_bytes_read;
        size_t m_bytes_expected;
        bool m_end_of_stream;
    };

    class WriteFailure : public ProtocolError
    {
    public:
        explicit WriteFailure(const std::string &what) : ProtocolError(what) {}
    };

} // namespace broker::protocol
