#include "protocol/packet.h"
#include <gtest/gtest.h>

using namespace eio::protocol;

TEST(PacketTest, EncodesTypeDigitThenData) {
    EXPECT_EQ(encode_packet({PacketType::MESSAGE, "hello"}), "4hello");
    EXPECT_EQ(encode_packet({PacketType::PING, "probe"}), "2probe");
    EXPECT_EQ(encode_packet({PacketType::NOOP, ""}), "6");
}

TEST(PacketTest, DecodesKnownTypes) {
    auto packet = decode_packet("3probe");
    ASSERT_TRUE(packet.has_value());
    EXPECT_EQ(packet->type, PacketType::PONG);
    EXPECT_EQ(packet->data, "probe");

    auto upgrade = decode_packet("5");
    ASSERT_TRUE(upgrade.has_value());
    EXPECT_EQ(upgrade->type, PacketType::UPGRADE);
    EXPECT_TRUE(upgrade->data.empty());
}

TEST(PacketTest, RejectsEmptyAndUnknownTypes) {
    EXPECT_FALSE(decode_packet("").has_value());
    EXPECT_FALSE(decode_packet("7data").has_value());
    EXPECT_FALSE(decode_packet("xhello").has_value());
}

TEST(PacketTest, PayloadLengthsCountCodePoints) {
    // "4é" is two code points but three bytes
    std::string payload = encode_payload({{PacketType::MESSAGE, "\xC3\xA9"}, {PacketType::PING, ""}});
    EXPECT_EQ(payload, "2:4\xC3\xA9" "1:2");

    auto packets = decode_payload(payload);
    ASSERT_TRUE(packets.has_value());
    ASSERT_EQ(packets->size(), 2u);
    EXPECT_EQ((*packets)[0], (Packet{PacketType::MESSAGE, "\xC3\xA9"}));
    EXPECT_EQ((*packets)[1], (Packet{PacketType::PING, ""}));
}

TEST(PacketTest, PayloadKeepsColonsInsideData) {
    auto packets = decode_payload("6:4a:b:c1:6");
    ASSERT_TRUE(packets.has_value());
    ASSERT_EQ(packets->size(), 2u);
    EXPECT_EQ((*packets)[0].data, "a:b:c");
    EXPECT_EQ((*packets)[1].type, PacketType::NOOP);
}

TEST(PacketTest, EmptyPayloadHasNoPackets) {
    auto packets = decode_payload("");
    ASSERT_TRUE(packets.has_value());
    EXPECT_TRUE(packets->empty());
}

TEST(PacketTest, MalformedPayloadsAreRejected) {
    EXPECT_FALSE(decode_payload("4hello").has_value()); // no length prefix
    EXPECT_FALSE(decode_payload(":4hello").has_value());// empty length
    EXPECT_FALSE(decode_payload("1x:4").has_value());   // non-digit length
    EXPECT_FALSE(decode_payload("10:4hi").has_value()); // length past the end
    EXPECT_FALSE(decode_payload("2:9x").has_value());   // unknown packet type
    EXPECT_FALSE(decode_payload("0:").has_value());     // empty packet
    EXPECT_FALSE(decode_payload("18446744073709551618:4x").has_value());// wraps past SIZE_MAX
    EXPECT_FALSE(decode_payload("99999999999999999999999999:4x").has_value());
}
