#include "http_connection.h"
#include "core/engine_server.h"
#include "core/logger.h"
#include <optional>
#include <string_view>

using asio::use_awaitable;

namespace eio::transport {

    namespace {

        std::string_view without_trailing_slash(std::string_view path) {
            while (path.size() > 1 && path.back() == '/') {
                path.remove_suffix(1);
            }
            return path;
        }

        HttpResponse plain_response(int status, const std::string &body) {
            HttpResponse response;
            response.status = status;
            response.set_header("Content-Type", "text/plain; charset=UTF-8");
            response.body = body;
            return response;
        }

    }// namespace

    HttpConnection::HttpConnection(asio::ip::tcp::socket socket, core::EngineServer &server, std::string path, size_t max_request_size)
        : socket_(std::move(socket)),
          server_(server),
          path_(std::move(path)),
          max_request_size_(max_request_size) {
        asio::error_code ec;
        auto endpoint = socket_.remote_endpoint(ec);
        peer_ = ec ? "unknown" : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    HttpConnection::~HttpConnection() {
        close();
    }

    asio::awaitable<void> HttpConnection::start() {
        auto self = shared_from_this();
        try {
            std::string request_buffer;
            while (socket_.is_open()) {
                auto n = co_await socket_.async_read_some(asio::buffer(buffer_), use_awaitable);
                if (n == 0) break;
                request_buffer.append(buffer_.data(), n);

                // Serve every complete request in the buffer
                while (!request_buffer.empty()) {
                    size_t header_end = request_buffer.find("\r\n\r\n");
                    if (header_end == std::string::npos) {
                        if (request_buffer.size() > max_request_size_) {
                            co_await write_response(plain_response(413, "Payload Too Large"), false);
                            close();
                        }
                        break;
                    }

                    auto content_length = parse_content_length(std::string_view(request_buffer).substr(0, header_end));
                    if (!content_length) {
                        co_await write_response(plain_response(400, "Bad Request"), false);
                        close();
                        break;
                    }
                    if (*content_length > max_request_size_) {
                        co_await write_response(plain_response(413, "Payload Too Large"), false);
                        close();
                        break;
                    }

                    size_t total_required = header_end + 4 + *content_length;
                    if (request_buffer.size() < total_required) {
                        break;// wait for the rest of the body
                    }

                    auto request = parse_request(request_buffer.substr(0, total_required));
                    request_buffer.erase(0, total_required);
                    if (!request) {
                        EIO_WARN("Malformed HTTP request from {}", peer_);
                        co_await write_response(plain_response(400, "Bad Request"), false);
                        close();
                        break;
                    }

                    bool keep_alive = wants_keep_alive(*request);
                    co_await write_response(route(*request), keep_alive);
                    if (!keep_alive) {
                        close();
                        break;
                    }
                }
            }
        } catch (const std::exception &e) {
            if (!closed_) {
                EIO_WARN("HTTP connection {} failed: {}", peer_, e.what());
            }
        }
        close();
        co_return;
    }

    HttpResponse HttpConnection::route(const HttpRequest &request) {
        if (without_trailing_slash(request.path()) != without_trailing_slash(path_)) {
            EIO_DEBUG("No route for {} {} from {}", request.method, request.target, peer_);
            return plain_response(404, "Not Found");
        }

        HttpResponse response;
        try {
            server_.handle_request(request, response);
        } catch (const std::exception &e) {
            EIO_ERROR("Request {} {} failed: {}", request.method, request.target, e.what());
            return plain_response(500, "Internal Server Error");
        }
        return response;
    }

    asio::awaitable<void> HttpConnection::write_response(const HttpResponse &response, bool keep_alive) {
        std::string wire = response.serialize(keep_alive);
        EIO_TRACE("{} <- {} ({} bytes)", peer_, response.status, wire.size());
        co_await asio::async_write(socket_, asio::buffer(wire), use_awaitable);
    }

    bool HttpConnection::wants_keep_alive(const HttpRequest &request) {
        auto connection = request.header("Connection");
        if (connection) {
            if (iequals(*connection, "close")) return false;
            if (iequals(*connection, "keep-alive")) return true;
        }
        return request.version != "HTTP/1.0";
    }

    void HttpConnection::close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

}// namespace eio::transport
