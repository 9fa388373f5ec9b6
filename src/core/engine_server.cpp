#include "engine_server.h"
#include "core/logger.h"
#include "engine_socket.h"
#include "transport/error_responder.h"
#include "transport/polling_transport.h"
#include "utils/query_string.h"
#include "utils/session_id.h"
#include <stdexcept>

namespace eio::core {

    using protocol::ServerError;
    using transport::HttpMethod;
    using transport::TransportKind;

    EngineServer::EngineServer(ServerOptions options)
        : EngineServer(
                  std::move(options),
                  [](const std::string &id, const ServerOptions &opts) -> std::shared_ptr<Session> {
                      return std::make_shared<EngineSocket>(id, opts);
                  },
                  utils::generate_session_id) {
    }

    EngineServer::EngineServer(ServerOptions options, SessionFactory session_factory, IdGenerator id_generator)
        : options_(std::move(options)),
          session_factory_(std::move(session_factory)),
          id_generator_(std::move(id_generator)) {
        EIO_DEBUG("Engine server created (pingTimeout={}ms, pingInterval={}ms)",
                  options_.ping_timeout.count(), options_.ping_interval.count());
    }

    EngineServer::~EngineServer() {
        close_all();
    }

    void EngineServer::set_connection_callback(ConnectionCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_connection_ = std::move(callback);
    }

    void EngineServer::handle_request(const transport::HttpRequest &request, transport::HttpResponse &response) {
        const auto query = utils::decode_query(request.query_string());

        // Only polling is served here, even for sessions that already upgraded
        auto transport_it = query.find("transport");
        std::optional<TransportKind> requested;
        if (transport_it != query.end()) {
            requested = transport::parse_transport(transport_it->second);
        }
        if (requested != TransportKind::POLLING) {
            transport::send_error(request, response, ServerError::UNKNOWN_TRANSPORT);
            return;
        }

        transport::HttpExchange exchange{request, response};

        auto sid_it = query.find("sid");
        if (sid_it != query.end()) {
            auto session = registry_.get(sid_it->second);
            if (!session) {
                transport::send_error(request, response, ServerError::UNKNOWN_SID);
            } else if (session->current_transport() != *requested) {
                transport::send_error(request, response, ServerError::BAD_REQUEST);
            } else if (admit(request, response)) {
                session->handle_request(exchange);
            }
            return;
        }

        if (request.method_kind() != HttpMethod::GET) {
            transport::send_error(request, response, ServerError::BAD_HANDSHAKE_METHOD);
            return;
        }
        if (!admit(request, response)) {
            return;
        }
        handshake(std::make_shared<transport::PollingTransport>(), &exchange);
    }

    void EngineServer::handle_websocket(const std::shared_ptr<transport::WebSocketConnection> &connection) {
        const auto &query = connection->query();

        auto sid_it = query.find("sid");
        if (sid_it == query.end()) {
            handshake(transport::WebSocketTransport::create(connection), nullptr);
            return;
        }

        // There is no response channel before the WebSocket is established, so
        // rejected upgrades just close the connection.
        const std::string &sid = sid_it->second;
        auto session = registry_.get(sid);
        if (!session) {
            EIO_DEBUG("Upgrade rejected: unknown session '{}'", sid);
            connection->close();
            return;
        }
        if (!session->can_upgrade(TransportKind::WEBSOCKET)) {
            EIO_DEBUG("Upgrade rejected: session '{}' cannot upgrade", sid);
            connection->close();
            return;
        }
        session->upgrade(transport::WebSocketTransport::create(connection));
    }

    bool EngineServer::admit(const transport::HttpRequest &request, transport::HttpResponse &response) const {
        if (options_.allow_request && !options_.allow_request(request)) {
            transport::send_error(request, response, ServerError::FORBIDDEN);
            return false;
        }
        return true;
    }

    std::shared_ptr<Session> EngineServer::handshake(std::shared_ptr<transport::Transport> transport, transport::HttpExchange *exchange) {
        const std::string id = id_generator_();
        auto session = session_factory_(id, options_);

        // Registration and the close subscription both precede init(), so the
        // session cannot close before its removal is wired.
        if (!registry_.put(id, session)) {
            transport->close();
            throw std::logic_error("session id collision: " + id);
        }
        session->once_close([this, id](const std::string &reason) {
            if (registry_.remove(id)) {
                EIO_DEBUG("Session '{}' left the registry ({}), live: {}", id, reason, registry_.size());
            }
        });

        const auto kind = transport->kind();
        try {
            session->init(std::move(transport), exchange);
        } catch (const std::exception &e) {
            EIO_ERROR("Failed to initialise session '{}': {}", id, e.what());
            session->close();
            throw;
        }

        EIO_INFO("Handshake complete: session '{}' on {} (live: {})", id, transport::transport_name(kind), registry_.size());

        ConnectionCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = on_connection_;
        }
        if (callback) {
            callback(session);
        }
        return session;
    }

    void EngineServer::close_all() {
        auto live = registry_.snapshot();
        if (!live.empty()) {
            EIO_INFO("Closing {} live session(s)", live.size());
        }
        for (const auto &session: live) {
            session->close();
        }
    }

}// namespace eio::core
