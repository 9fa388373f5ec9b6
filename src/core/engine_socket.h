#pragma once

#include "server_options.h"
#include "session.h"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace eio::core {

    /**
     * @brief Default Session implementation.
     *
     * Starts on the transport given to init() and can move once from polling to
     * websocket. During an upgrade the client probes the new transport with
     * PING "probe"; on the UPGRADE packet the transports are swapped and any
     * packets still queued on the polling transport are forwarded, in order,
     * on the new one.
     */
    class EngineSocket : public Session, public std::enable_shared_from_this<EngineSocket> {
    public:
        enum class ReadyState {
            OPENING,
            OPEN,
            CLOSING,
            CLOSED
        };

        EngineSocket(std::string id, const ServerOptions &options);
        ~EngineSocket() override;

        const std::string &id() const override { return id_; }

        void init(std::shared_ptr<transport::Transport> transport, transport::HttpExchange *exchange) override;
        void handle_request(transport::HttpExchange &exchange) override;
        transport::TransportKind current_transport() const override;
        bool can_upgrade(transport::TransportKind kind) const override;
        void upgrade(std::shared_ptr<transport::Transport> transport) override;
        void once_close(CloseCallback callback) override;
        void send(const std::string &message) override;
        void set_message_callback(MessageCallback callback) override;
        void close() override;

        ReadyState ready_state() const;
        bool is_upgrading() const;

    private:
        void attach(const std::shared_ptr<transport::Transport> &transport);
        void on_packet(const protocol::Packet &packet);
        void on_upgrade_packet(const std::shared_ptr<transport::Transport> &candidate, const protocol::Packet &packet);
        void complete_upgrade(const std::shared_ptr<transport::Transport> &candidate);
        void abandon_upgrade(const std::shared_ptr<transport::Transport> &candidate);
        void send_packets(const std::vector<protocol::Packet> &packets);
        void close_with(const std::string &reason);
        std::string handshake_payload(transport::TransportKind kind) const;

        const std::string id_;
        const std::chrono::milliseconds ping_timeout_;
        const std::chrono::milliseconds ping_interval_;
        const bool allow_upgrades_;

        mutable std::mutex mutex_;///< guards the members below
        ReadyState state_ = ReadyState::OPENING;
        transport::TransportKind kind_ = transport::TransportKind::POLLING;
        std::shared_ptr<transport::Transport> transport_;
        std::shared_ptr<transport::Transport> upgrading_;
        std::vector<CloseCallback> close_callbacks_;
        std::string close_reason_;
        MessageCallback message_callback_;

        // Serialises writes with the transport swap so drained packets keep their order.
        // Recursive because a failing write may close the session, and close
        // callbacks are free to call send().
        std::recursive_mutex send_mutex_;
    };

}// namespace eio::core
