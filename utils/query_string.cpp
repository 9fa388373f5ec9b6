#include "query_string.h"

namespace eio::utils {

    namespace {

        int hex_value(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

    }// namespace

    std::string url_decode(std::string_view text) {
        std::string decoded;
        decoded.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c == '+') {
                decoded.push_back(' ');
            } else if (c == '%' && i + 2 < text.size()) {
                int hi = hex_value(text[i + 1]);
                int lo = hex_value(text[i + 2]);
                if (hi < 0 || lo < 0) {
                    decoded.push_back(c);
                    continue;
                }
                decoded.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
            } else {
                decoded.push_back(c);
            }
        }
        return decoded;
    }

    QueryMap decode_query(std::string_view query) {
        QueryMap result;
        if (!query.empty() && query.front() == '?') {
            query.remove_prefix(1);
        }

        while (!query.empty()) {
            size_t amp = query.find('&');
            std::string_view pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
            if (pair.empty()) {
                continue;
            }

            size_t eq = pair.find('=');
            if (eq == std::string_view::npos) {
                result[url_decode(pair)] = "";
            } else {
                result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        return result;
    }

}// namespace eio::utils
