#pragma once

#include "core/session.h"
#include "transport/http_message.h"
#include "transport/websocket_transport.h"
#include "utils/query_string.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace eio::testing {

    inline transport::HttpRequest make_request(const std::string &method, const std::string &target,
                                               const std::string &body = "") {
        transport::HttpRequest request;
        request.method = method;
        request.target = target;
        request.version = "HTTP/1.1";
        request.body = body;
        if (!body.empty()) {
            request.headers["Content-Length"] = std::to_string(body.size());
        }
        return request;
    }

    // In-memory stand-in for a WebSocket library connection
    class FakeWebSocketConnection : public transport::WebSocketConnection {
    public:
        explicit FakeWebSocketConnection(utils::QueryMap query = {}) : query_(std::move(query)) {}

        const utils::QueryMap &query() const override { return query_; }

        void write(const std::string &text) override { written.push_back(text); }

        // Like most libraries, closing locally also reports the close
        void close() override {
            ++close_calls;
            if (on_close_) on_close_();
        }

        void receive(const std::string &text) {
            if (on_message_) on_message_(text);
        }

        void peer_close() {
            if (on_close_) on_close_();
        }

        void fail(const std::string &error) {
            if (on_error_) on_error_(error);
        }

        std::vector<std::string> written;
        int close_calls = 0;

    private:
        utils::QueryMap query_;
    };

    // Session that records what the server asks of it
    class FakeSession : public core::Session {
    public:
        explicit FakeSession(std::string id) : id_(std::move(id)) {}

        const std::string &id() const override { return id_; }

        void init(std::shared_ptr<transport::Transport> transport, transport::HttpExchange *exchange) override {
            ++init_calls;
            if (fail_init) {
                throw std::runtime_error("init failed");
            }
            kind_ = transport->kind();
            transport_ = std::move(transport);
            if (exchange) {
                exchange->response.status = 200;
                exchange->response.body = "handshake:" + id_;
            }
        }

        void handle_request(transport::HttpExchange &exchange) override {
            ++forwarded_requests;
            exchange.response.status = 200;
            exchange.response.body = "forwarded:" + id_;
        }

        transport::TransportKind current_transport() const override { return kind_; }

        bool can_upgrade(transport::TransportKind kind) const override {
            return allow_upgrade && !closed_ && kind_ == transport::TransportKind::POLLING &&
                   kind == transport::TransportKind::WEBSOCKET;
        }

        void upgrade(std::shared_ptr<transport::Transport> transport) override {
            ++upgrade_calls;
            upgrade_target = std::move(transport);
        }

        void once_close(CloseCallback callback) override {
            if (closed_) {
                callback(reason_);
                return;
            }
            close_callbacks_.push_back(std::move(callback));
        }

        void send(const std::string &message) override { sent.push_back(message); }
        void set_message_callback(MessageCallback callback) override { message_callback_ = std::move(callback); }

        void close() override { close_with("forced close"); }

        void close_with(const std::string &reason) {
            ++close_calls;
            if (closed_) return;
            closed_ = true;
            reason_ = reason;
            auto callbacks = std::move(close_callbacks_);
            close_callbacks_.clear();
            for (auto &callback: callbacks) {
                callback(reason);
            }
        }

        void set_kind(transport::TransportKind kind) { kind_ = kind; }
        bool closed() const { return closed_; }

        int init_calls = 0;
        int forwarded_requests = 0;
        int upgrade_calls = 0;
        int close_calls = 0;
        bool allow_upgrade = true;
        bool fail_init = false;
        std::shared_ptr<transport::Transport> upgrade_target;
        std::vector<std::string> sent;

    private:
        std::string id_;
        transport::TransportKind kind_ = transport::TransportKind::POLLING;
        std::shared_ptr<transport::Transport> transport_;
        std::vector<CloseCallback> close_callbacks_;
        MessageCallback message_callback_;
        bool closed_ = false;
        std::string reason_;
    };

}// namespace eio::testing
