#include "packet.h"

namespace eio::protocol {

    namespace {

        bool is_continuation_byte(char c) {
            return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
        }

        size_t count_code_points(std::string_view text) {
            size_t count = 0;
            for (char c: text) {
                if (!is_continuation_byte(c)) {
                    ++count;
                }
            }
            return count;
        }

        // Byte length of the first `code_points` code points of text, or npos if text is shorter.
        size_t byte_length_of(std::string_view text, size_t code_points) {
            size_t pos = 0;
            while (code_points > 0) {
                if (pos >= text.size()) {
                    return std::string_view::npos;
                }
                ++pos;
                while (pos < text.size() && is_continuation_byte(text[pos])) {
                    ++pos;
                }
                --code_points;
            }
            return pos;
        }

    }// namespace

    std::string encode_packet(const Packet &packet) {
        std::string encoded;
        encoded.reserve(packet.data.size() + 1);
        encoded.push_back(static_cast<char>('0' + static_cast<int>(packet.type)));
        encoded.append(packet.data);
        return encoded;
    }

    std::optional<Packet> decode_packet(std::string_view encoded) {
        if (encoded.empty()) {
            return std::nullopt;
        }
        char type = encoded.front();
        if (type < '0' || type > '6') {
            return std::nullopt;
        }
        return Packet{static_cast<PacketType>(type - '0'), std::string(encoded.substr(1))};
    }

    std::string encode_payload(const std::vector<Packet> &packets) {
        std::string payload;
        for (const auto &packet: packets) {
            std::string encoded = encode_packet(packet);
            payload.append(std::to_string(count_code_points(encoded)));
            payload.push_back(':');
            payload.append(encoded);
        }
        return payload;
    }

    std::optional<std::vector<Packet>> decode_payload(std::string_view payload) {
        std::vector<Packet> packets;
        size_t pos = 0;
        while (pos < payload.size()) {
            size_t colon = payload.find(':', pos);
            if (colon == std::string_view::npos || colon == pos) {
                return std::nullopt;
            }

            size_t length = 0;
            for (size_t i = pos; i < colon; ++i) {
                char c = payload[i];
                if (c < '0' || c > '9') {
                    return std::nullopt;
                }
                // a record can never be longer than the payload holding it
                if (length > payload.size() / 10) {
                    return std::nullopt;
                }
                length = length * 10 + static_cast<size_t>(c - '0');
                if (length > payload.size()) {
                    return std::nullopt;
                }
            }

            std::string_view rest = payload.substr(colon + 1);
            size_t bytes = byte_length_of(rest, length);
            if (bytes == std::string_view::npos) {
                return std::nullopt;
            }

            auto packet = decode_packet(rest.substr(0, bytes));
            if (!packet) {
                return std::nullopt;
            }
            packets.push_back(std::move(*packet));
            pos = colon + 1 + bytes;
        }
        return packets;
    }

}// namespace eio::protocol
