#include "error_responder.h"
#include "core/logger.h"
#include <nlohmann/json.hpp>

namespace eio::transport {

    void add_cors_headers(const HttpRequest &request, HttpResponse &response) {
        if (auto origin = request.header("Origin")) {
            response.set_header("Access-Control-Allow-Credentials", "true");
            response.set_header("Access-Control-Allow-Origin", *origin);
        } else {
            response.set_header("Access-Control-Allow-Origin", "*");
        }
    }

    void send_error(const HttpRequest &request, HttpResponse &response, protocol::ServerError error) {
        const auto descriptor = protocol::describe(error);

        response.headers.clear();
        response.status = protocol::http_status(error);
        response.set_header("Content-Type", kJsonContentType);
        if (error != protocol::ServerError::FORBIDDEN) {
            add_cors_headers(request, response);
        }

        nlohmann::json body = {
                {"code", descriptor.code},
                {"message", std::string(descriptor.message)}};
        response.body = body.dump();

        EIO_DEBUG("Rejected {} {} with {} ({})", request.method, request.target,
                  protocol::to_string(error), response.status);
    }

}// namespace eio::transport
