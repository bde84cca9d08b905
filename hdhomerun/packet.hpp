#ifndef HDHOMERUN_PACKET_HPP
#define HDHOMERUN_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Framing of HDHomeRun discovery and control packets (libhdhomerun
// hdhomerun_pkt.h): type and payload length big endian, a payload of
// tag-length-value records, then a little endian CRC32.

constexpr size_t PACKET_HEADER_SIZE = 4;
constexpr size_t PACKET_CRC_SIZE = 4;

enum class PacketType : uint16_t
{
    DISCOVER_REQ = 2,
    DISCOVER_RPY = 3,
    GETSET_REQ = 4,
    GETSET_RPY = 5,
    UPGRADE_REQ = 6,
    UPGRADE_RPY = 7
};

enum class Tag : uint8_t
{
    DEVICE_TYPE = 0x01,
    DEVICE_ID = 0x02,
    GETSET_NAME = 0x03,
    GETSET_VALUE = 0x04,
    ERROR_MESSAGE = 0x05,
    TUNER_COUNT = 0x10,
    GETSET_LOCKKEY = 0x15,
    LINEUP_URL = 0x27,
    STORAGE_URL = 0x28,
    DEVICE_AUTH_BIN_DEPRECATED = 0x29,
    BASE_URL = 0x2A,
    DEVICE_AUTH_STR = 0x2B,
    STORAGE_ID = 0x2C,
    MULTI_TYPE = 0x2D
};

constexpr uint32_t DEVICE_TYPE_WILDCARD = 0xFFFFFFFF;
constexpr uint32_t DEVICE_TYPE_TUNER = 1;
constexpr uint32_t DEVICE_TYPE_STORAGE = 5;

class MalformedPacket : public std::runtime_error
{
public:
    explicit MalformedPacket(const std::string &what) : std::runtime_error(what) {}
};

struct TagValue
{
    uint8_t tag;
    std::vector<uint8_t> value;
};

struct Packet
{
    uint16_t type;
    uint16_t length;
    std::vector<uint8_t> payload;
    uint32_t crc;
    // Decoded only for the get/set and discover families
    std::vector<TagValue> tags;

    bool has_tags() const;
};

Packet parse_packet(const uint8_t *data, size_t len);

// Splits a payload into tag-length-value records. A length byte with the
// top bit set continues into a second byte holding the high seven bits.
std::vector<TagValue> parse_tags(const uint8_t *data, size_t len);

std::string packet_type_name(uint16_t type);
std::string tag_name(uint8_t tag);
std::string device_type_name(uint32_t device_type);

// Human readable rendering of a tag value: device types and ids as
// numbers, printable strings as text, anything else as hex
std::string format_tag_value(const TagValue &tv);

#endif
