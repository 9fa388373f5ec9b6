#include "server_errors.h"

namespace eio::protocol {

    ErrorDescriptor describe(ServerError error) noexcept {
        switch (error) {
            case ServerError::UNKNOWN_TRANSPORT:
                return {0, "Transport unknown"};
            case ServerError::UNKNOWN_SID:
                return {1, "Session ID unknown"};
            case ServerError::BAD_HANDSHAKE_METHOD:
                return {2, "Bad handshake method"};
            case ServerError::BAD_REQUEST:
                return {3, "Bad request"};
            case ServerError::FORBIDDEN:
                return {4, "Forbidden"};
        }
        return {3, "Bad request"};
    }

    std::string_view to_string(ServerError error) noexcept {
        switch (error) {
            case ServerError::UNKNOWN_TRANSPORT:
                return "UNKNOWN_TRANSPORT";
            case ServerError::UNKNOWN_SID:
                return "UNKNOWN_SID";
            case ServerError::BAD_HANDSHAKE_METHOD:
                return "BAD_HANDSHAKE_METHOD";
            case ServerError::BAD_REQUEST:
                return "BAD_REQUEST";
            case ServerError::FORBIDDEN:
                return "FORBIDDEN";
        }
        return "UNKNOWN";
    }

    int http_status(ServerError error) noexcept {
        return error == ServerError::FORBIDDEN ? 403 : 400;
    }

}// namespace eio::protocol
