#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "core/Config.hpp"
#include "core/ThreadPool.hpp"

namespace broker
{
    class Server
    {
    public:
        Server(const ServerConfig &config, std::shared_ptr<ThreadPool> pool, std::shared_ptr<spdlog::logger> logger);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        // bind() then accept_loop(). Blocks until stop() is called.
        void start();

        // Creates the listening socket. Throws std::runtime_error on failure.
        void bind();
        void accept_loop();

        // Safe to call from another thread; makes accept_loop() return.
        void stop();

        // Port actually bound; differs from the configured one when that is 0.
        int port() const { return bound_port; }

    private:
        ServerConfig config;
        std::atomic<int> server_fd;
        std::atomic<int> bound_port;
        std::atomic<bool> running;
        std::shared_ptr<ThreadPool> thread_pool;
        std::shared_ptr<spdlog::logger> logger;
    };
}
