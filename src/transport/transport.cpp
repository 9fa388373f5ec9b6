#include "transport.h"
#include "core/logger.h"
#include "error_responder.h"

namespace eio::transport {

    std::string_view transport_name(TransportKind kind) noexcept {
        switch (kind) {
            case TransportKind::POLLING:
                return "polling";
            case TransportKind::WEBSOCKET:
                return "websocket";
        }
        return "unknown";
    }

    std::optional<TransportKind> parse_transport(std::string_view name) noexcept {
        if (name == "polling") return TransportKind::POLLING;
        if (name == "websocket") return TransportKind::WEBSOCKET;
        return std::nullopt;
    }

    void Transport::on_request(HttpExchange &exchange) {
        EIO_WARN("{} transport cannot serve HTTP requests", name());
        send_error(exchange.request, exchange.response, protocol::ServerError::BAD_REQUEST);
    }

    void Transport::set_packet_handler(PacketHandler handler) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        packet_handler_ = std::move(handler);
    }

    void Transport::set_close_handler(CloseHandler handler) {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        close_handler_ = std::move(handler);
    }

    void Transport::clear_handlers() {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        packet_handler_ = nullptr;
        close_handler_ = nullptr;
    }

    void Transport::emit_packet(const protocol::Packet &packet) {
        PacketHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = packet_handler_;
        }
        if (handler) {
            handler(packet);
        }
    }

    void Transport::emit_close() {
        CloseHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = std::move(close_handler_);
            close_handler_ = nullptr;
        }
        if (handler) {
            handler();
        }
    }

}// namespace eio::transport
