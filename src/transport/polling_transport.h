#pragma once

#include "transport.h"
#include <deque>
#include <mutex>

namespace eio::transport {

    /**
     * @brief HTTP polling transport.
     * Outgoing packets wait in a queue until the client's next GET;
     * POST bodies carry the client's packets.
     */
    class PollingTransport : public Transport {
    public:
        PollingTransport() = default;

        TransportKind kind() const override { return TransportKind::POLLING; }

        void on_request(HttpExchange &exchange) override;
        void send(const std::vector<protocol::Packet> &packets) override;
        std::vector<protocol::Packet> drain() override;
        void close() override;
        bool is_closed() const override;

        size_t pending_count() const;

    private:
        void on_poll_request(HttpExchange &exchange);
        void on_data_request(HttpExchange &exchange);

        mutable std::mutex mutex_;
        std::deque<protocol::Packet> pending_;
        bool closed_ = false;
    };

}// namespace eio::transport
