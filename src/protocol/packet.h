#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace eio::protocol {

    enum class PacketType {
        OPEN = 0,
        CLOSE = 1,
        PING = 2,
        PONG = 3,
        MESSAGE = 4,
        UPGRADE = 5,
        NOOP = 6
    };

    struct Packet {
        PacketType type;
        std::string data;
    };

    inline bool operator==(const Packet &lhs, const Packet &rhs) {
        return lhs.type == rhs.type && lhs.data == rhs.data;
    }

    /**
     * @brief Encode a string packet: type digit followed by its data.
     */
    std::string encode_packet(const Packet &packet);

    /**
     * @brief Decode a single string packet.
     * @return std::nullopt if the input is empty or the type digit is unknown
     */
    std::optional<Packet> decode_packet(std::string_view encoded);

    /**
     * @brief Encode packets as a polling payload of "<length>:<packet>" records.
     * Lengths count code points, not bytes.
     */
    std::string encode_payload(const std::vector<Packet> &packets);

    /**
     * @brief Decode a polling payload.
     * @return std::nullopt on a malformed length prefix or packet
     */
    std::optional<std::vector<Packet>> decode_payload(std::string_view payload);

}// namespace eio::protocol
