#include "http_listener.h"
#include "core/engine_server.h"
#include "core/logger.h"
#include "http_connection.h"

using asio::use_awaitable;

namespace eio::transport {

    HttpListener::HttpListener(const std::string &address, unsigned short port, std::string path, core::EngineServer &server,
                               std::size_t io_threads, std::size_t max_request_size)
        : acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address(address), port)),
          pool_(io_threads),
          path_(std::move(path)),
          server_(server),
          max_request_size_(max_request_size) {
        EIO_INFO("HTTP listener bound to {}:{} ({} io threads)", address, this->port(), pool_.size());
    }

    HttpListener::~HttpListener() {
        stop();
    }

    unsigned short HttpListener::port() const {
        asio::error_code ec;
        auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? 0 : endpoint.port();
    }

    bool HttpListener::start() {
        if (is_running_.exchange(true)) {
            return false;
        }

        asio::co_spawn(io_context_, accept_loop(), asio::detached);
        accept_thread_ = std::thread([this]() {
            try {
                io_context_.run();
            } catch (const std::exception &e) {
                EIO_ERROR("Error in HTTP accept loop: {}", e.what());
            }
        });

        EIO_INFO("Serving engine requests on {}", path_);
        return true;
    }

    asio::awaitable<void> HttpListener::accept_loop() {
        try {
            while (is_running_) {
                auto &connection_io = pool_.get_io_context();
                auto socket = co_await acceptor_.async_accept(connection_io, use_awaitable);
                auto connection = std::make_shared<HttpConnection>(std::move(socket), server_, path_, max_request_size_);
                EIO_DEBUG("HTTP client connected from {}", connection->peer());
                asio::co_spawn(connection_io, [connection]() -> asio::awaitable<void> {
                        co_await connection->start();
                        co_return; }, asio::detached);
            }
        } catch (const std::exception &e) {
            if (is_running_) {
                EIO_ERROR("Error accepting HTTP connections: {}", e.what());
            }
        }
    }

    void HttpListener::stop() {
        if (!is_running_.exchange(false)) {
            return;
        }
        asio::error_code ec;
        acceptor_.close(ec);
        io_context_.stop();
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        pool_.stop();
        EIO_INFO("HTTP listener stopped");
    }

}// namespace eio::transport
