#include <gtest/gtest.h>
#include "hdhomerun/packet.hpp"
#include "agents/packet_dumper.hpp"

namespace
{

// type, length, payload, then a little endian CRC
std::vector<uint8_t> make_packet(uint16_t type, const std::vector<uint8_t> &payload, uint32_t crc = 0x11223344)
{
    std::vector<uint8_t> packet = {
        static_cast<uint8_t>(type >> 8), static_cast<uint8_t>(type),
        static_cast<uint8_t>(payload.size() >> 8), static_cast<uint8_t>(payload.size())};
    packet.insert(packet.end(), payload.begin(), payload.end());
    packet.push_back(static_cast<uint8_t>(crc));
    packet.push_back(static_cast<uint8_t>(crc >> 8));
    packet.push_back(static_cast<uint8_t>(crc >> 16));
    packet.push_back(static_cast<uint8_t>(crc >> 24));
    return packet;
}

// What the HDHomeRun app broadcasts: wildcard device type and device id
const std::vector<uint8_t> DISCOVER_PAYLOAD = {
    0x01, 0x04, 0xFF, 0xFF, 0xFF, 0xFF,
    0x02, 0x04, 0xFF, 0xFF, 0xFF, 0xFF};

}

TEST(PacketTest, ParsesDiscoverRequest)
{
    auto data = make_packet(2, DISCOVER_PAYLOAD);
    Packet packet = parse_packet(data.data(), data.size());

    EXPECT_EQ(packet.type, 2);
    EXPECT_EQ(packet.length, DISCOVER_PAYLOAD.size());
    EXPECT_EQ(packet.crc, 0x11223344u);
    ASSERT_EQ(packet.tags.size(), 2u);
    EXPECT_EQ(packet.tags[0].tag, static_cast<uint8_t>(Tag::DEVICE_TYPE));
    EXPECT_EQ(format_tag_value(packet.tags[0]), "WILDCARD");
    EXPECT_EQ(packet.tags[1].tag, static_cast<uint8_t>(Tag::DEVICE_ID));
    EXPECT_EQ(format_tag_value(packet.tags[1]), "0xFFFFFFFF");
}

TEST(PacketTest, TwoByteTagLength)
{
    // 0x81 0x01: low seven bits 1, high bits 1 << 7, so 129 bytes follow
    std::vector<uint8_t> payload = {0x27, 0x81, 0x01};
    std::string url(128, 'u');
    payload.insert(payload.end(), url.begin(), url.end());
    payload.push_back(0);

    auto tags = parse_tags(payload.data(), payload.size());
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tag_name(tags[0].tag), "LINEUP_URL");
    EXPECT_EQ(tags[0].value.size(), 129u);
    EXPECT_EQ(format_tag_value(tags[0]), "\"" + url + "\"");
}

TEST(PacketTest, ConsecutiveTagsAreNotSkipped)
{
    std::vector<uint8_t> payload = {0x10, 0x01, 0x04, 0x2A, 0x03, 'a', 'b', 'c'};
    auto tags = parse_tags(payload.data(), payload.size());

    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tag_name(tags[0].tag), "TUNER_COUNT");
    EXPECT_EQ(format_tag_value(tags[0]), "4");
    EXPECT_EQ(tag_name(tags[1].tag), "BASE_URL");
    EXPECT_EQ(format_tag_value(tags[1]), "\"abc\"");
}

TEST(PacketTest, MultiTypeListsDeviceTypes)
{
    TagValue tv;
    tv.tag = static_cast<uint8_t>(Tag::MULTI_TYPE);
    tv.value = {0, 0, 0, 1, 0, 0, 0, 5};
    EXPECT_EQ(format_tag_value(tv), "TUNER,STORAGE");
}

TEST(PacketTest, MalformedPackets)
{
    std::vector<uint8_t> tiny = {0, 2, 0};
    EXPECT_THROW(parse_packet(tiny.data(), tiny.size()), MalformedPacket);

    auto overlong = make_packet(2, DISCOVER_PAYLOAD);
    overlong[3] = 0x40;
    EXPECT_THROW(parse_packet(overlong.data(), overlong.size()), MalformedPacket);

    std::vector<uint8_t> truncated_tag = {0x01, 0x04, 0xFF};
    auto data = make_packet(3, truncated_tag);
    EXPECT_THROW(parse_packet(data.data(), data.size()), MalformedPacket);
}

TEST(PacketTest, UnknownTypesKeepTheirPayloadUndecoded)
{
    auto data = make_packet(9, {0xAA, 0xBB});
    Packet packet = parse_packet(data.data(), data.size());

    EXPECT_FALSE(packet.has_tags());
    EXPECT_TRUE(packet.tags.empty());
    EXPECT_EQ(packet.payload.size(), 2u);
    EXPECT_EQ(packet_type_name(9), "UNKNOWN(9)");
}

TEST(PacketTest, NamesForUnknownCodes)
{
    EXPECT_EQ(tag_name(0x99), "0x99");
    EXPECT_EQ(device_type_name(7), "0x00000007");
    EXPECT_EQ(packet_type_name(5), "GETSET_RPY");
}

TEST(PacketDumperTest, DescribesEveryTag)
{
    auto data = make_packet(2, DISCOVER_PAYLOAD, 0xDEADBEEF);
    auto lines = describe_packet(data.data(), data.size());

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "DISCOVER_REQ len(12) CRC:0xdeadbeef");
    EXPECT_EQ(lines[1], "TAG: DEVICE_TYPE  Length: 4  Value: WILDCARD");
    EXPECT_EQ(lines[2], "TAG: DEVICE_ID  Length: 4  Value: 0xFFFFFFFF");
}

TEST(PacketDumperTest, ReportsUnsupportedAndMalformed)
{
    auto data = make_packet(1, {});
    auto lines = describe_packet(data.data(), data.size());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "Unsupported packet type: 1");

    std::vector<uint8_t> garbage = {1, 2};
    lines = describe_packet(garbage.data(), garbage.size());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].rfind("Malformed packet", 0), 0u);
}
