#pragma once

#include "server_options.h"
#include "session.h"
#include "session_registry.h"
#include "transport/http_message.h"
#include "transport/websocket_transport.h"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace eio::core {

    /**
     * @brief Entry point for all client traffic.
     *
     * Polling requests arrive through handle_request() and WebSocket connections
     * through handle_websocket(). Each one is either routed to a registered
     * session, rejected, or turned into a new session by the handshake. Every
     * new session is announced once through the connection callback and leaves
     * the registry when it closes.
     *
     * All public members may be called concurrently from the I/O threads.
     */
    class EngineServer {
    public:
        using ConnectionCallback = std::function<void(const std::shared_ptr<Session> &)>;
        using SessionFactory = std::function<std::shared_ptr<Session>(const std::string &id, const ServerOptions &options)>;
        using IdGenerator = std::function<std::string()>;

        explicit EngineServer(ServerOptions options = {});

        /**
         * @brief Construct with custom session creation and id generation.
         * @param options Server options
         * @param session_factory Creates the session object for a new id
         * @param id_generator Produces ids unique among live sessions
         */
        EngineServer(ServerOptions options, SessionFactory session_factory, IdGenerator id_generator);

        /**
         * @brief Closes every live session.
         */
        ~EngineServer();

        EngineServer(const EngineServer &) = delete;
        EngineServer &operator=(const EngineServer &) = delete;

        std::chrono::milliseconds ping_timeout() const { return options_.ping_timeout; }
        std::chrono::milliseconds ping_interval() const { return options_.ping_interval; }

        void set_connection_callback(ConnectionCallback callback);

        /**
         * @brief Handle a polling request.
         *
         * The transport query parameter must be "polling", with or without a sid.
         * A request with a sid is forwarded to that session if it exists and is
         * still on the requested transport. A request without a sid is a
         * handshake and must be a GET. Every other case fills the response with
         * the matching protocol error.
         *
         * @param request Parsed request
         * @param response Response to fill
         */
        void handle_request(const transport::HttpRequest &request, transport::HttpResponse &response);

        /**
         * @brief Handle a newly accepted WebSocket connection.
         *
         * With a sid, the connection becomes the upgrade target of that session;
         * an unknown sid or a session that refuses the upgrade gets the
         * connection closed without any payload. Without a sid, a new session
         * starts directly on the WebSocket.
         */
        void handle_websocket(const std::shared_ptr<transport::WebSocketConnection> &connection);

        const SessionRegistry &sessions() const { return registry_; }

        /**
         * @brief Close all live sessions; each removes itself from the registry.
         */
        void close_all();

    private:
        std::shared_ptr<Session> handshake(std::shared_ptr<transport::Transport> transport, transport::HttpExchange *exchange);
        bool admit(const transport::HttpRequest &request, transport::HttpResponse &response) const;

        const ServerOptions options_;
        SessionFactory session_factory_;
        IdGenerator id_generator_;
        SessionRegistry registry_;

        mutable std::mutex callback_mutex_;
        ConnectionCallback on_connection_;
    };

}// namespace eio::core
