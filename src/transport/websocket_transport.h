#pragma once

#include "transport.h"
#include "utils/query_string.h"
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace eio::transport {

    /**
     * @brief Adapter over an accepted WebSocket connection.
     * Implemented by the embedding application on top of its WebSocket library;
     * the transport installs the callbacks and the application fires them.
     */
    class WebSocketConnection {
    public:
        using MessageCallback = std::function<void(const std::string &)>;
        using CloseCallback = std::function<void()>;
        using ErrorCallback = std::function<void(const std::string &)>;

        virtual ~WebSocketConnection() = default;

        /**
         * @brief Query parameters of the upgrade request.
         */
        virtual const utils::QueryMap &query() const = 0;

        /**
         * @brief Send one text frame.
         */
        virtual void write(const std::string &text) = 0;

        /**
         * @brief Close the connection. Implementations may fire the close callback
         * from inside this call; repeats are ignored by the transport.
         */
        virtual void close() = 0;

        void set_message_callback(MessageCallback callback) { on_message_ = std::move(callback); }
        void set_close_callback(CloseCallback callback) { on_close_ = std::move(callback); }
        void set_error_callback(ErrorCallback callback) { on_error_ = std::move(callback); }

    protected:
        MessageCallback on_message_;
        CloseCallback on_close_;
        ErrorCallback on_error_;
    };

    /**
     * @brief Persistent transport: one packet per WebSocket text frame.
     */
    class WebSocketTransport : public Transport, public std::enable_shared_from_this<WebSocketTransport> {
    public:
        static std::shared_ptr<WebSocketTransport> create(std::shared_ptr<WebSocketConnection> connection);

        TransportKind kind() const override { return TransportKind::WEBSOCKET; }

        void send(const std::vector<protocol::Packet> &packets) override;
        void close() override;
        bool is_closed() const override { return closed_.load(); }

    private:
        explicit WebSocketTransport(std::shared_ptr<WebSocketConnection> connection);

        void attach();
        void on_message(const std::string &text);
        void on_peer_close();

        std::shared_ptr<WebSocketConnection> connection_;
        std::atomic<bool> closed_{false};
    };

}// namespace eio::transport
