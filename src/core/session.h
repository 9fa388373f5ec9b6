#pragma once

#include "transport/http_message.h"
#include "transport/transport.h"
#include <functional>
#include <memory>
#include <string>

namespace eio::core {

    /**
     * @brief A logical client session, independent of the transport carrying it.
     * The server routes requests and upgrades to it; the host application talks
     * to the client through send() and the message callback.
     */
    class Session {
    public:
        using CloseCallback = std::function<void(const std::string &reason)>;
        using MessageCallback = std::function<void(const std::string &message)>;

        virtual ~Session() = default;

        virtual const std::string &id() const = 0;

        /**
         * @brief Bind the initial transport and emit the handshake.
         * @param transport Transport the session starts on
         * @param exchange The handshake request, or nullptr for a WebSocket handshake
         */
        virtual void init(std::shared_ptr<transport::Transport> transport, transport::HttpExchange *exchange) = 0;

        /**
         * @brief Serve a follow-up polling request.
         */
        virtual void handle_request(transport::HttpExchange &exchange) = 0;

        virtual transport::TransportKind current_transport() const = 0;

        /**
         * @brief Whether the session accepts an upgrade to the given transport now.
         */
        virtual bool can_upgrade(transport::TransportKind kind) const = 0;

        /**
         * @brief Start moving the session onto a new transport.
         */
        virtual void upgrade(std::shared_ptr<transport::Transport> transport) = 0;

        /**
         * @brief Subscribe to the close notification.
         * The callback runs exactly once: when the session closes, or immediately
         * if it has already closed.
         */
        virtual void once_close(CloseCallback callback) = 0;

        virtual void send(const std::string &message) = 0;
        virtual void set_message_callback(MessageCallback callback) = 0;

        virtual void close() = 0;
    };

}// namespace eio::core
