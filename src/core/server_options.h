#pragma once

#include "transport/http_message.h"
#include <chrono>
#include <functional>

namespace eio::core {

    struct ServerOptions {
        // time without a heartbeat before a session counts as dead
        std::chrono::milliseconds ping_timeout{5000};
        // time between heartbeats
        std::chrono::milliseconds ping_interval{25000};
        // advertise and accept the polling to websocket upgrade
        bool allow_upgrades = true;
        // optional admission check for polling requests; false answers FORBIDDEN
        std::function<bool(const transport::HttpRequest &)> allow_request;
    };

}// namespace eio::core
