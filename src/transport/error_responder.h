#pragma once

#include "http_message.h"
#include "protocol/server_errors.h"

namespace eio::transport {

    inline constexpr const char *kJsonContentType = "application/json; charset=utf-8";

    /**
     * @brief Fill a response with the structured error for a protocol failure.
     *
     * Protocol errors answer 400 with CORS headers: the request's Origin is echoed
     * together with Access-Control-Allow-Credentials, or "*" is allowed when the
     * request has no Origin. FORBIDDEN answers 403 without CORS headers.
     * The body is {"code": <int>, "message": <string>}.
     *
     * @param request The request being rejected
     * @param response Response to overwrite
     * @param error Error kind
     */
    void send_error(const HttpRequest &request, HttpResponse &response, protocol::ServerError error);

    /**
     * @brief Add the CORS headers used by polling responses and 400 errors.
     */
    void add_cors_headers(const HttpRequest &request, HttpResponse &response);

}// namespace eio::transport
