#pragma once

#if defined(_WIN32) && !defined(_WIN32_WINNT)
#define _WIN32_WINNT 0x0601
#endif

#include "http_message.h"
#include <array>
#include <asio.hpp>
#include <memory>
#include <string>

namespace eio::core {
    class EngineServer;
}// namespace eio::core

namespace eio::transport {

    /**
     * @brief One accepted TCP connection speaking HTTP/1.1.
     * Reads complete requests, routes those for the engine path to the server
     * and writes the responses back, until the peer or the server closes.
     */
    class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
    public:
        HttpConnection(asio::ip::tcp::socket socket, core::EngineServer &server, std::string path, size_t max_request_size);
        ~HttpConnection();

        /**
         * @brief Read and serve requests until the connection closes.
         */
        asio::awaitable<void> start();

        void close();
        bool is_closed() const { return closed_ || !socket_.is_open(); }
        const std::string &peer() const { return peer_; }

    private:
        HttpResponse route(const HttpRequest &request);
        asio::awaitable<void> write_response(const HttpResponse &response, bool keep_alive);
        static bool wants_keep_alive(const HttpRequest &request);

        asio::ip::tcp::socket socket_;
        core::EngineServer &server_;
        std::string path_;
        size_t max_request_size_;
        std::array<char, 8192> buffer_;
        std::string peer_;
        bool closed_ = false;
    };

}// namespace eio::transport
