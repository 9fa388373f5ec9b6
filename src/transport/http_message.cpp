#include "http_message.h"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace eio::transport {

    bool iequals(std::string_view lhs, std::string_view rhs) {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
               });
    }

    HttpMethod parse_method(std::string_view method) {
        if (iequals(method, "GET")) return HttpMethod::GET;
        if (iequals(method, "HEAD")) return HttpMethod::HEAD;
        if (iequals(method, "POST")) return HttpMethod::POST;
        if (iequals(method, "PUT")) return HttpMethod::PUT;
        if (iequals(method, "PATCH")) return HttpMethod::PATCH;
        if (iequals(method, "OPTIONS")) return HttpMethod::OPTIONS;
        return HttpMethod::OTHER;
    }

    std::optional<std::string> HttpRequest::header(std::string_view name) const {
        for (const auto &[key, value]: headers) {
            if (iequals(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::string_view HttpRequest::path() const {
        std::string_view view(target);
        return view.substr(0, view.find('?'));
    }

    std::string_view HttpRequest::query_string() const {
        std::string_view view(target);
        size_t pos = view.find('?');
        return pos == std::string_view::npos ? std::string_view{} : view.substr(pos + 1);
    }

    void HttpResponse::set_header(const std::string &name, const std::string &value) {
        headers.erase(std::remove_if(headers.begin(), headers.end(),
                                     [&name](const auto &entry) { return iequals(entry.first, name); }),
                      headers.end());
        headers.emplace_back(name, value);
    }

    std::optional<std::string> HttpResponse::header(std::string_view name) const {
        for (const auto &[key, value]: headers) {
            if (iequals(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    std::string HttpResponse::serialize(bool keep_alive) const {
        std::ostringstream oss;
        oss << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
        for (const auto &[name, value]: headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << body.size() << "\r\n";
        oss << (keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
        oss << "\r\n";
        oss << body;
        return oss.str();
    }

    std::optional<size_t> parse_content_length(std::string_view header_block) {
        std::optional<size_t> found;
        size_t pos = 0;
        while (pos < header_block.size()) {
            size_t eol = header_block.find('\n', pos);
            std::string_view line = header_block.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
            pos = eol == std::string_view::npos ? header_block.size() : eol + 1;

            size_t colon = line.find(':');
            if (colon == std::string_view::npos || !iequals(line.substr(0, colon), "Content-Length")) {
                continue;
            }
            std::string_view value = line.substr(colon + 1);
            size_t start = value.find_first_not_of(" \t");
            size_t end = value.find_last_not_of(" \t\r");
            if (start == std::string_view::npos) {
                return std::nullopt;
            }
            value = value.substr(start, end - start + 1);

            size_t length = 0;
            for (char c: value) {
                if (c < '0' || c > '9' || length > (SIZE_MAX - 9) / 10) {
                    return std::nullopt;
                }
                length = length * 10 + static_cast<size_t>(c - '0');
            }
            if (found && *found != length) {
                return std::nullopt;
            }
            found = length;
        }
        return found.value_or(0);
    }

    std::optional<HttpRequest> parse_request(const std::string &raw_request) {
        HttpRequest req;
        size_t header_end = raw_request.find("\r\n\r\n");
        std::istringstream iss(raw_request.substr(0, header_end));
        std::string line;

        // Request line (method, target, version)
        if (!std::getline(iss, line)) {
            return std::nullopt;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::istringstream request_line(line);
        request_line >> req.method >> req.target >> req.version;
        if (request_line.fail()) {
            return std::nullopt;
        }

        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                break;
            }
            size_t colon_pos = line.find(':');
            if (colon_pos == std::string::npos) {
                continue;// Invalid header format, skip
            }
            std::string key = line.substr(0, colon_pos);
            std::string value = line.substr(colon_pos + 1);
            size_t start = value.find_first_not_of(" \t");
            size_t end = value.find_last_not_of(" \t");
            req.headers[key] = start == std::string::npos ? "" : value.substr(start, end - start + 1);
        }

        // every Content-Length header is checked, not just the one kept in the map
        auto length = parse_content_length(std::string_view(raw_request).substr(0, header_end));
        if (!length) {
            return std::nullopt;
        }
        if (*length > 0) {
            if (header_end == std::string::npos || raw_request.size() < header_end + 4 + *length) {
                return std::nullopt;
            }
            req.body = raw_request.substr(header_end + 4, *length);
        }

        return req;
    }

    const char *status_text(int status_code) {
        switch (status_code) {
            case 200:
                return "OK";
            case 204:
                return "No Content";
            case 400:
                return "Bad Request";
            case 403:
                return "Forbidden";
            case 404:
                return "Not Found";
            case 405:
                return "Method Not Allowed";
            case 413:
                return "Payload Too Large";
            case 500:
                return "Internal Server Error";
            case 503:
                return "Service Unavailable";
            default:
                return "Unknown";
        }
    }

}// namespace eio::transport
