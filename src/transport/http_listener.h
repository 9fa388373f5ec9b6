#pragma once

#if defined(_WIN32) && !defined(_WIN32_WINNT)
#define _WIN32_WINNT 0x0601
#endif

#include "core/io_context_pool.hpp"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace eio::core {
    class EngineServer;
}// namespace eio::core

namespace eio::transport {

    /**
     * @brief TCP acceptor feeding HTTP connections to an EngineServer.
     * Accepting runs on a dedicated io_context; each connection runs on a
     * context taken from the pool.
     */
    class HttpListener {
    public:
        /**
         * @param address IP address to bind to
         * @param port Port to listen on, 0 for an ephemeral port
         * @param path Request path served by the engine, e.g. "/engine.io/"
         * @param server Engine server handling the requests
         * @param io_threads Number of pool threads serving connections
         * @param max_request_size Largest accepted request, headers plus body
         */
        HttpListener(const std::string &address, unsigned short port, std::string path, core::EngineServer &server,
                     std::size_t io_threads = 2, std::size_t max_request_size = 1024 * 1024);
        ~HttpListener();

        HttpListener(const HttpListener &) = delete;
        HttpListener &operator=(const HttpListener &) = delete;

        /**
         * @brief Start accepting connections in the background.
         * @return False if already running
         */
        bool start();

        /**
         * @brief Stop accepting and shut down all connections.
         */
        void stop();

        unsigned short port() const;

    private:
        asio::awaitable<void> accept_loop();

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        core::IoContextPool pool_;
        std::string path_;
        core::EngineServer &server_;
        std::size_t max_request_size_;
        std::thread accept_thread_;
        std::atomic<bool> is_running_{false};
    };

}// namespace eio::transport
