#include "websocket_transport.h"
#include "core/logger.h"

namespace eio::transport {

    std::shared_ptr<WebSocketTransport> WebSocketTransport::create(std::shared_ptr<WebSocketConnection> connection) {
        auto transport = std::shared_ptr<WebSocketTransport>(new WebSocketTransport(std::move(connection)));
        transport->attach();
        return transport;
    }

    WebSocketTransport::WebSocketTransport(std::shared_ptr<WebSocketConnection> connection)
        : connection_(std::move(connection)) {
    }

    // Callbacks hold weak references so the connection never keeps the transport alive
    void WebSocketTransport::attach() {
        std::weak_ptr<WebSocketTransport> weak = shared_from_this();
        connection_->set_message_callback([weak](const std::string &text) {
            if (auto self = weak.lock()) {
                self->on_message(text);
            }
        });
        connection_->set_close_callback([weak]() {
            if (auto self = weak.lock()) {
                self->on_peer_close();
            }
        });
        connection_->set_error_callback([weak](const std::string &error) {
            EIO_WARN("WebSocket error: {}", error);
            if (auto self = weak.lock()) {
                self->on_peer_close();
            }
        });
    }

    void WebSocketTransport::on_message(const std::string &text) {
        auto packet = protocol::decode_packet(text);
        if (!packet) {
            EIO_WARN("Dropping undecodable WebSocket frame ({} bytes)", text.size());
            return;
        }
        emit_packet(*packet);
    }

    void WebSocketTransport::on_peer_close() {
        if (closed_.exchange(true)) {
            return;
        }
        emit_close();
    }

    void WebSocketTransport::send(const std::vector<protocol::Packet> &packets) {
        if (closed_.load()) {
            return;
        }
        for (const auto &packet: packets) {
            connection_->write(protocol::encode_packet(packet));
        }
    }

    void WebSocketTransport::close() {
        if (closed_.exchange(true)) {
            return;
        }
        connection_->close();
        emit_close();
    }

}// namespace eio::transport
