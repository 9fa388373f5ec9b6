#pragma once

#include <string_view>

namespace eio::protocol {

    /**
     * @brief Protocol errors reported to polling clients.
     * Numeric values are the wire codes and must stay stable.
     */
    enum class ServerError {
        UNKNOWN_TRANSPORT = 0,
        UNKNOWN_SID = 1,
        BAD_HANDSHAKE_METHOD = 2,
        BAD_REQUEST = 3,
        FORBIDDEN = 4
    };

    struct ErrorDescriptor {
        int code;
        std::string_view message;
    };

    /**
     * @brief Look up the code and message sent for an error kind.
     */
    ErrorDescriptor describe(ServerError error) noexcept;

    /**
     * @brief Enumerator name, for logs.
     */
    std::string_view to_string(ServerError error) noexcept;

    /**
     * @brief HTTP status carried by an error response: 403 for FORBIDDEN, 400 otherwise.
     */
    int http_status(ServerError error) noexcept;

}// namespace eio::protocol
