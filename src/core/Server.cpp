#include "core/Server.hpp"
#include "core/ConnectionHandler.hpp"
#include "net/SocketStream.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>
#include <string>
#include <utility>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

namespace
{
    // Pause after a failed accept() so a persistent error such as EMFILE
    // does not spin the loop.
    constexpr std::chrono::milliseconds kAcceptRetryDelay(100);

    std::string describe_peer(const sockaddr_in &addr)
    {
        char ip[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
        return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
    }

    void handle_connection(int client_fd, const std::string &peer, std::shared_ptr<spdlog::logger> logger)
    {
        // The stream owns client_fd and closes it when this scope ends.
        broker::net::SocketStream stream(client_fd);
        broker::ConnectionHandler handler(logger, peer);
        broker::ConnectionStats stats = handler.run(stream);
        logger->info("Client {} disconnected ({} request(s) served)", peer, stats.requests_served);
    }
}

namespace broker
{
    Server::Server(const ServerConfig &config, std::shared_ptr<ThreadPool> pool, std::shared_ptr<spdlog::logger> logger)
        : config(config), server_fd(-1), bound_port(config.port), running(false), thread_pool(std::move(pool)),
          logger(std::move(logger)) {}

    Server::~Server()
    {
        int fd = server_fd.exchange(-1);
        if (fd != -1)
        {
            close(fd);
        }
    }

    void Server::start()
    {
        bind();
        accept_loop();
    }

    void Server::bind()
    {
        sockaddr_in server_addr{};
        server_addr.sin_family = AF_INET;
        server_addr.sin_port = htons(static_cast<uint16_t>(config.port));
        if (inet_pton(AF_INET, config.host.c_str(), &server_addr.sin_addr) != 1)
        {
            throw std::runtime_error("Invalid listen address: " + config.host);
        }

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
        {
            throw std::runtime_error("Failed to create server socket");
        }

        int reuse = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
        {
            close(fd);
            throw std::runtime_error("setsockopt failed");
        }

        if (::bind(fd, reinterpret_cast<struct sockaddr *>(&server_addr), sizeof(server_addr)) != 0)
        {
            int err = errno;
            close(fd);
            throw std::runtime_error("Failed to bind to " + config.host + ":" + std::to_string(config.port) + ": " +
                                     strerror(err));
        }

        if (listen(fd, 10) != 0)
        {
            close(fd);
            throw std::runtime_error("listen failed");
        }

        sockaddr_in bound_addr{};
        socklen_t len = sizeof(bound_addr);
        if (getsockname(fd, reinterpret_cast<struct sockaddr *>(&bound_addr), &len) != 0)
        {
            close(fd);
            throw std::runtime_error("getsockname failed");
        }
        bound_port = ntohs(bound_addr.sin_port);
        server_fd = fd;
        running = true;
        logger->info("Listening on {}:{}", config.host, bound_port.load());
    }

    void Server::accept_loop()
    {
        logger->info("Waiting for connections...");
        while (running)
        {
            sockaddr_in client_addr{};
            socklen_t addr_len = sizeof(client_addr);
            int client_fd = accept(server_fd, reinterpret_cast<struct sockaddr *>(&client_addr), &addr_len);
            if (client_fd < 0)
            {
                // stop() shuts the socket down to get us out of accept().
                if (running)
                {
                    int err = errno;
                    logger->error("accept failed: {}", strerror(err));
                    std::this_thread::sleep_for(kAcceptRetryDelay);
                }
                continue;
            }

            std::string peer = describe_peer(client_addr);
            logger->info("Accepted new connection from {}", peer);

            try
            {
                thread_pool->enqueue([client_fd, peer, logger = this->logger]
                                     { handle_connection(client_fd, peer, logger); });
            }
            catch (const std::exception &e)
            {
                logger->error("Could not dispatch connection from {}: {}", peer, e.what());
                close(client_fd);
            }
        }
        logger->info("Accept loop stopped");
    }

    void Server::stop()
    {
        running = false;
        int fd = server_fd.load();
        if (fd != -1)
        {
            shutdown(fd, SHUT_RDWR);
        }
    }
}
