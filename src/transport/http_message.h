#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace eio::transport {

    enum class HttpMethod {
        GET,
        HEAD,
        POST,
        PUT,
        PATCH,
        OPTIONS,
        OTHER
    };

    /**
     * @brief Map a method token to HttpMethod, ignoring case.
     */
    HttpMethod parse_method(std::string_view method);

    /**
     * @brief Case-insensitive ASCII comparison.
     */
    bool iequals(std::string_view lhs, std::string_view rhs);

    /**
     * @brief Parsed HTTP request.
     */
    struct HttpRequest {
        std::string method;                                  ///< HTTP method as received
        std::string target;                                  ///< Request target (path plus query)
        std::string version;                                 ///< HTTP version
        std::unordered_map<std::string, std::string> headers;///< HTTP headers, original case
        std::string body;                                    ///< Request body

        HttpMethod method_kind() const { return parse_method(method); }

        /**
         * @brief Header value by case-insensitive name.
         */
        std::optional<std::string> header(std::string_view name) const;

        /**
         * @brief Target without the query string.
         */
        std::string_view path() const;

        /**
         * @brief Query string without the leading '?', empty if none.
         */
        std::string_view query_string() const;
    };

    /**
     * @brief HTTP response under construction.
     * Headers keep insertion order and may repeat.
     */
    struct HttpResponse {
        int status = 200;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;

        /**
         * @brief Replace any header with this name, then add it.
         */
        void set_header(const std::string &name, const std::string &value);

        void add_header(const std::string &name, const std::string &value) { headers.emplace_back(name, value); }

        std::optional<std::string> header(std::string_view name) const;

        /**
         * @brief Render the status line, headers, Content-Length and body.
         * @param keep_alive Selects the Connection header
         */
        std::string serialize(bool keep_alive) const;
    };

    /**
     * @brief One request/response round trip handed to sessions and transports.
     */
    struct HttpExchange {
        const HttpRequest &request;
        HttpResponse &response;
    };

    /**
     * @brief Content-Length of a raw header block.
     * Repeated headers must agree.
     * @return 0 when absent, std::nullopt when malformed or conflicting
     */
    std::optional<size_t> parse_content_length(std::string_view header_block);

    /**
     * @brief Parse a complete raw HTTP request (headers and Content-Length body).
     * @return std::nullopt on a malformed request line or Content-Length
     */
    std::optional<HttpRequest> parse_request(const std::string &raw_request);

    /**
     * @brief Reason phrase for a status code.
     */
    const char *status_text(int status_code);

}// namespace eio::transport
