#include "polling_transport.h"
#include "core/logger.h"
#include "error_responder.h"

namespace eio::transport {

    void PollingTransport::on_request(HttpExchange &exchange) {
        switch (exchange.request.method_kind()) {
            case HttpMethod::GET:
                on_poll_request(exchange);
                break;
            case HttpMethod::POST:
                on_data_request(exchange);
                break;
            case HttpMethod::HEAD:
            case HttpMethod::PUT:
            case HttpMethod::PATCH:
            case HttpMethod::OPTIONS:
            case HttpMethod::OTHER:
                send_error(exchange.request, exchange.response, protocol::ServerError::BAD_REQUEST);
                break;
        }
    }

    // GET: flush everything queued so far, or a NOOP so the client polls again
    void PollingTransport::on_poll_request(HttpExchange &exchange) {
        std::vector<protocol::Packet> packets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            packets.assign(std::make_move_iterator(pending_.begin()), std::make_move_iterator(pending_.end()));
            pending_.clear();
        }
        if (packets.empty()) {
            packets.push_back({protocol::PacketType::NOOP, ""});
        }

        auto &response = exchange.response;
        response.status = 200;
        response.set_header("Content-Type", "text/plain; charset=UTF-8");
        add_cors_headers(exchange.request, response);
        response.body = protocol::encode_payload(packets);
        EIO_TRACE("Polling flushed {} packet(s)", packets.size());
    }

    // POST: decode the client's payload and hand each packet to the session
    void PollingTransport::on_data_request(HttpExchange &exchange) {
        auto packets = protocol::decode_payload(exchange.request.body);
        if (!packets) {
            EIO_WARN("Malformed polling payload ({} bytes)", exchange.request.body.size());
            send_error(exchange.request, exchange.response, protocol::ServerError::BAD_REQUEST);
            return;
        }

        auto &response = exchange.response;
        response.status = 200;
        response.set_header("Content-Type", "text/html");
        add_cors_headers(exchange.request, response);
        response.body = "ok";

        for (const auto &packet: *packets) {
            emit_packet(packet);
        }
    }

    void PollingTransport::send(const std::vector<protocol::Packet> &packets) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        pending_.insert(pending_.end(), packets.begin(), packets.end());
    }

    std::vector<protocol::Packet> PollingTransport::drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<protocol::Packet> packets(std::make_move_iterator(pending_.begin()),
                                              std::make_move_iterator(pending_.end()));
        pending_.clear();
        return packets;
    }

    void PollingTransport::close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            pending_.push_back({protocol::PacketType::CLOSE, ""});
            closed_ = true;
        }
        emit_close();
    }

    bool PollingTransport::is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t PollingTransport::pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

}// namespace eio::transport
