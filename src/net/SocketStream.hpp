#pragma once
#include "protocol/ByteStream.hpp"
#include <string>
#include <vector>

namespace broker::net
{

    // ByteStream over a connected TCP socket. Owns the descriptor and closes
    // it on destruction. Writes are buffered until flush().
    class SocketStream : public protocol::ByteStream
    {
    public:
        explicit SocketStream(int fd);
        ~SocketStream() override;

        SocketStream(SocketStream &&other) noexcept;
        SocketStream &operator=(SocketStream &&other) noexcept;
        SocketStream(const SocketStream &) = delete;
        SocketStream &operator=(const SocketStream &) = delete;

        void read_exact(char *buf, size_t len) override;
        void write_all(const char *data, size_t len) override;
        void flush() override;

        int fd() const { return m_fd; }

        // Connects to host:port over IPv4. Throws std::runtime_error.
        static SocketStream connect_to(const std::string &host, int port);

    private:
        void close_fd();

        int m_fd;
        std::vector<char> m_out;
    };

} // namespace broker::net
