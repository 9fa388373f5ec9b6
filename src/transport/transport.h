#pragma once

#include "http_message.h"
#include "protocol/packet.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace eio::transport {

    enum class TransportKind {
        POLLING,
        WEBSOCKET
    };

    /**
     * @brief Query-string identifier of a transport kind ("polling", "websocket").
     */
    std::string_view transport_name(TransportKind kind) noexcept;

    /**
     * @brief Inverse of transport_name(); std::nullopt for unknown names.
     */
    std::optional<TransportKind> parse_transport(std::string_view name) noexcept;

    /**
     * @brief Base class for the channels that carry a session's packets.
     * Handlers are installed by the owning session and invoked without any
     * transport lock held.
     */
    class Transport {
    public:
        using PacketHandler = std::function<void(const protocol::Packet &)>;
        using CloseHandler = std::function<void()>;

        virtual ~Transport() = default;

        virtual TransportKind kind() const = 0;

        std::string_view name() const { return transport_name(kind()); }

        /**
         * @brief Serve an HTTP exchange addressed to this transport.
         * Transports without a request channel answer BAD_REQUEST.
         */
        virtual void on_request(HttpExchange &exchange);

        /**
         * @brief Queue or write packets to the client, in order.
         */
        virtual void send(const std::vector<protocol::Packet> &packets) = 0;

        /**
         * @brief Remove and return packets queued but not yet delivered.
         */
        virtual std::vector<protocol::Packet> drain() { return {}; }

        /**
         * @brief Close the channel. Safe to call more than once.
         */
        virtual void close() = 0;

        virtual bool is_closed() const = 0;

        void set_packet_handler(PacketHandler handler);
        void set_close_handler(CloseHandler handler);

        /**
         * @brief Drop both handlers, detaching the transport from its session.
         */
        void clear_handlers();

    protected:
        Transport() = default;

        void emit_packet(const protocol::Packet &packet);
        void emit_close();

    private:
        std::mutex handlers_mutex_;
        PacketHandler packet_handler_;
        CloseHandler close_handler_;
    };

}// namespace eio::transport
