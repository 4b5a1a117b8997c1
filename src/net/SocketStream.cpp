#include "net/SocketStream.hpp"
#include "protocol/Errors.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace broker::net
{

    SocketStream::SocketStream(int fd) : m_fd(fd) {}

    SocketStream::~SocketStream()
    {
        close_fd();
    }

    SocketStream::SocketStream(SocketStream &&other) noexcept
        : m_fd(other.m_fd), m_out(std::move(other.m_out))
    {
        other.m_fd = -1;
    }

    SocketStream &SocketStream::operator=(SocketStream &&other) noexcept
    {
        if (this != &other)
        {
            close_fd();
            m_fd = other.m_fd;
            m_out = std::move(other.m_out);
            other.m_fd = -1;
        }
        return *this;
    }

    void SocketStream::close_fd()
    {
        if (m_fd != -1)
        {
            close(m_fd);
            m_fd = -1;
        }
    }

    void SocketStream::read_exact(char *buf, size_t len)
    {
        size_t total = 0;
        while (total < len)
        {
            ssize_t n = recv(m_fd, buf + total, len - total, 0);
            if (n == 0)
            {
                throw protocol::ReadFailure("Connection closed after " + std::to_string(total) + " of " +
                                                std::to_string(len) + " bytes",
                                            total, len);
            }
            if (n < 0)
            {
                int err = errno;
                if (err == EINTR)
                    continue;
                throw protocol::ReadFailure(std::string("recv failed: ") + strerror(err), total, len, false);
            }
            total += static_cast<size_t>(n);
        }
    }

    void SocketStream::write_all(const char *data, size_t len)
    {
        if (m_fd == -1)
        {
            throw protocol::WriteFailure("write on closed socket");
        }
        m_out.insert(m_out.end(), data, data + len);
    }

    void SocketStream::flush()
    {
        size_t total = 0;
        while (total < m_out.size())
        {
            ssize_t sent = send(m_fd, m_out.data() + total, m_out.size() - total, MSG_NOSIGNAL);
            if (sent < 0)
            {
                int err = errno;
                if (err == EINTR)
                    continue;
                m_out.clear();
                throw protocol::WriteFailure(std::string("send failed: ") + strerror(err));
            }
            total += static_cast<size_t>(sent);
        }
        m_out.clear();
    }

    SocketStream SocketStream::connect_to(const std::string &host, int port)
    {
        sockaddr_in server_addr{};
        server_addr.sin_family = AF_INET;
        server_addr.sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, host.c_str(), &server_addr.sin_addr) != 1)
        {
            throw std::runtime_error("Invalid IPv4 address: " + host);
        }

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
        {
            throw std::runtime_error("Failed to create socket");
        }
        SocketStream stream(fd);

        if (connect(fd, reinterpret_cast<struct sockaddr *>(&server_addr), sizeof(server_addr)) != 0)
        {
            int err = errno;
            throw std::runtime_error("Failed to connect to " + host + ":" + std::to_string(port) + ": " +
                                     strerror(err));
        }
        return stream;
    }

} // namespace broker::net
