#include "engine_socket.h"
#include "core/logger.h"
#include "transport/error_responder.h"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace eio::core {

    using protocol::Packet;
    using protocol::PacketType;
    using transport::TransportKind;

    EngineSocket::EngineSocket(std::string id, const ServerOptions &options)
        : id_(std::move(id)),
          ping_timeout_(options.ping_timeout),
          ping_interval_(options.ping_interval),
          allow_upgrades_(options.allow_upgrades) {
    }

    EngineSocket::~EngineSocket() {
        EIO_TRACE("Session '{}' destroyed", id_);
    }

    std::string EngineSocket::handshake_payload(TransportKind kind) const {
        nlohmann::json upgrades = nlohmann::json::array();
        if (allow_upgrades_ && kind == TransportKind::POLLING) {
            upgrades.push_back(std::string(transport::transport_name(TransportKind::WEBSOCKET)));
        }
        nlohmann::json payload = {
                {"sid", id_},
                {"upgrades", upgrades},
                {"pingInterval", ping_interval_.count()},
                {"pingTimeout", ping_timeout_.count()}};
        return payload.dump();
    }

    void EngineSocket::init(std::shared_ptr<transport::Transport> transport, transport::HttpExchange *exchange) {
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == ReadyState::OPENING) {
                transport_ = transport;
                kind_ = transport->kind();
                state_ = ReadyState::OPEN;
                accepted = true;
            }
        }
        if (!accepted) {
            EIO_WARN("Session '{}' initialised twice or after close", id_);
            transport->close();
            return;
        }

        attach(transport);
        transport->send({{PacketType::OPEN, handshake_payload(transport->kind())}});
        if (exchange) {
            transport->on_request(*exchange);
        }
        EIO_DEBUG("Session '{}' opened on {}", id_, transport->name());
    }

    void EngineSocket::attach(const std::shared_ptr<transport::Transport> &transport) {
        std::weak_ptr<EngineSocket> weak = weak_from_this();
        transport->set_packet_handler([weak](const Packet &packet) {
            if (auto self = weak.lock()) {
                self->on_packet(packet);
            }
        });
        transport->set_close_handler([weak]() {
            if (auto self = weak.lock()) {
                self->close_with("transport close");
            }
        });
    }

    void EngineSocket::handle_request(transport::HttpExchange &exchange) {
        std::shared_ptr<transport::Transport> current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current = transport_;
        }
        if (!current) {
            transport::send_error(exchange.request, exchange.response, protocol::ServerError::BAD_REQUEST);
            return;
        }
        current->on_request(exchange);
    }

    TransportKind EngineSocket::current_transport() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return kind_;
    }

    bool EngineSocket::can_upgrade(TransportKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return allow_upgrades_ && state_ == ReadyState::OPEN && !upgrading_ &&
               kind_ == TransportKind::POLLING && kind == TransportKind::WEBSOCKET;
    }

    void EngineSocket::upgrade(std::shared_ptr<transport::Transport> candidate) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!allow_upgrades_ || state_ != ReadyState::OPEN || upgrading_ || kind_ != TransportKind::POLLING) {
                EIO_WARN("Session '{}' refused an upgrade to {}", id_, candidate->name());
                candidate->close();
                return;
            }
            upgrading_ = candidate;
        }

        std::weak_ptr<EngineSocket> weak = weak_from_this();
        std::weak_ptr<transport::Transport> weak_candidate = candidate;
        candidate->set_packet_handler([weak, weak_candidate](const Packet &packet) {
            auto self = weak.lock();
            auto target = weak_candidate.lock();
            if (self && target) {
                self->on_upgrade_packet(target, packet);
            }
        });
        candidate->set_close_handler([weak, weak_candidate]() {
            auto self = weak.lock();
            auto target = weak_candidate.lock();
            if (self && target) {
                self->abandon_upgrade(target);
            }
        });
        EIO_DEBUG("Session '{}' upgrading to {}", id_, candidate->name());
    }

    void EngineSocket::on_upgrade_packet(const std::shared_ptr<transport::Transport> &candidate, const Packet &packet) {
        if (packet.type == PacketType::PING && packet.data == "probe") {
            candidate->send({{PacketType::PONG, "probe"}});
            // release a client blocked on the old transport so it can pause polling
            send_packets({{PacketType::NOOP, ""}});
        } else if (packet.type == PacketType::UPGRADE) {
            complete_upgrade(candidate);
        } else {
            EIO_DEBUG("Session '{}' got packet {} while probing, aborting upgrade",
                      id_, static_cast<int>(packet.type));
            candidate->close();
        }
    }

    void EngineSocket::complete_upgrade(const std::shared_ptr<transport::Transport> &candidate) {
        std::shared_ptr<transport::Transport> previous;
        {
            std::lock_guard<std::recursive_mutex> send_lock(send_mutex_);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (upgrading_ != candidate || state_ != ReadyState::OPEN) {
                    return;
                }
                previous = transport_;
                transport_ = candidate;
                kind_ = candidate->kind();
                upgrading_.reset();
            }

            previous->clear_handlers();
            attach(candidate);

            auto buffered = previous->drain();
            buffered.erase(std::remove_if(buffered.begin(), buffered.end(),
                                          [](const Packet &p) { return p.type == PacketType::NOOP; }),
                           buffered.end());
            if (!buffered.empty()) {
                candidate->send(buffered);
            }
            EIO_DEBUG("Session '{}' upgraded to {} ({} buffered packet(s) moved)",
                      id_, candidate->name(), buffered.size());
        }
        previous->close();
    }

    void EngineSocket::abandon_upgrade(const std::shared_ptr<transport::Transport> &candidate) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (upgrading_ != candidate) {
                return;
            }
            upgrading_.reset();
        }
        candidate->clear_handlers();
        EIO_DEBUG("Session '{}' abandoned upgrade to {}", id_, candidate->name());
    }

    void EngineSocket::on_packet(const Packet &packet) {
        switch (packet.type) {
            case PacketType::PING:
                send_packets({{PacketType::PONG, packet.data}});
                break;
            case PacketType::MESSAGE: {
                MessageCallback callback;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    callback = message_callback_;
                }
                if (callback) {
                    callback(packet.data);
                }
                break;
            }
            case PacketType::CLOSE:
                close_with("transport close");
                break;
            case PacketType::OPEN:
            case PacketType::PONG:
            case PacketType::UPGRADE:
            case PacketType::NOOP:
                EIO_TRACE("Session '{}' ignoring packet {}", id_, static_cast<int>(packet.type));
                break;
        }
    }

    void EngineSocket::send(const std::string &message) {
        send_packets({{PacketType::MESSAGE, message}});
    }

    void EngineSocket::send_packets(const std::vector<Packet> &packets) {
        std::lock_guard<std::recursive_mutex> send_lock(send_mutex_);
        std::shared_ptr<transport::Transport> current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != ReadyState::OPEN) {
                return;
            }
            current = transport_;
        }
        current->send(packets);
    }

    void EngineSocket::set_message_callback(MessageCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        message_callback_ = std::move(callback);
    }

    void EngineSocket::once_close(CloseCallback callback) {
        std::string reason;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != ReadyState::CLOSED) {
                close_callbacks_.push_back(std::move(callback));
                return;
            }
            reason = close_reason_;
        }
        callback(reason);
    }

    void EngineSocket::close() {
        close_with("forced close");
    }

    void EngineSocket::close_with(const std::string &reason) {
        std::shared_ptr<transport::Transport> current;
        std::shared_ptr<transport::Transport> candidate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == ReadyState::CLOSING || state_ == ReadyState::CLOSED) {
                return;
            }
            state_ = ReadyState::CLOSING;
            current = transport_;
            candidate = std::move(upgrading_);
            upgrading_.reset();
        }

        for (const auto &transport: {candidate, current}) {
            if (transport) {
                transport->clear_handlers();
                transport->close();
            }
        }

        std::vector<CloseCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = ReadyState::CLOSED;
            close_reason_ = reason;
            callbacks.swap(close_callbacks_);
            message_callback_ = nullptr;
        }
        EIO_DEBUG("Session '{}' closed: {}", id_, reason);
        for (auto &callback: callbacks) {
            callback(reason);
        }
    }

    EngineSocket::ReadyState EngineSocket::ready_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool EngineSocket::is_upgrading() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return upgrading_ != nullptr;
    }

}// namespace eio::core
