#include "hdhomerun/packet.hpp"
#include <cctype>
#include <cstdio>

namespace
{

uint16_t read_be16(const uint8_t *p)
{
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t read_be32(const uint8_t *p)
{
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

uint32_t read_le32(const uint8_t *p)
{
    return (static_cast<uint32_t>(p[3]) << 24) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[1]) << 8) | p[0];
}

std::string hex(uint32_t value, int width)
{
    char buf[16];
    snprintf(buf, sizeof(buf), "0x%0*X", width, value);
    return buf;
}

}

bool Packet::has_tags() const
{
    return type >= static_cast<uint16_t>(PacketType::DISCOVER_REQ) &&
           type <= static_cast<uint16_t>(PacketType::UPGRADE_RPY);
}

Packet parse_packet(const uint8_t *data, size_t len)
{
    if (len < PACKET_HEADER_SIZE + PACKET_CRC_SIZE)
    {
        throw MalformedPacket("Packet of " + std::to_string(len) + " bytes is too short");
    }

    Packet packet;
    packet.type = read_be16(data);
    packet.length = read_be16(data + 2);

    if (PACKET_HEADER_SIZE + packet.length + PACKET_CRC_SIZE > len)
    {
        throw MalformedPacket("Declared payload of " + std::to_string(packet.length) +
                              " bytes exceeds the " + std::to_string(len) + " byte packet");
    }

    const uint8_t *payload = data + PACKET_HEADER_SIZE;
    packet.payload.assign(payload, payload + packet.length);
    packet.crc = read_le32(payload + packet.length);

    if (packet.has_tags())
    {
        packet.tags = parse_tags(packet.payload.data(), packet.payload.size());
    }
    return packet;
}

std::vector<TagValue> parse_tags(const uint8_t *data, size_t len)
{
    std::vector<TagValue> tags;
    size_t i = 0;

    while (i < len)
    {
        if (len - i < 2)
            throw MalformedPacket("Truncated tag header at offset " + std::to_string(i));

        TagValue tv;
        tv.tag = data[i];
        size_t value_len = data[i + 1];
        i += 2;

        if (value_len & 0x80)
        {
            if (i >= len)
                throw MalformedPacket("Truncated tag length at offset " + std::to_string(i));
            value_len = (value_len & 0x7F) | (static_cast<size_t>(data[i]) << 7);
            i++;
        }

        if (value_len > len - i)
        {
            throw MalformedPacket("Tag " + tag_name(tv.tag) + " needs " + std::to_string(value_len) +
                                  " bytes, " + std::to_string(len - i) + " left");
        }

        tv.value.assign(data + i, data + i + value_len);
        i += value_len;
        tags.push_back(std::move(tv));
    }
    return tags;
}

std::string packet_type_name(uint16_t type)
{
    switch (static_cast<PacketType>(type))
    {
    case PacketType::DISCOVER_REQ:
        return "DISCOVER_REQ";
    case PacketType::DISCOVER_RPY:
        return "DISCOVER_RPY";
    case PacketType::GETSET_REQ:
        return "GETSET_REQ";
    case PacketType::GETSET_RPY:
        return "GETSET_RPY";
    case PacketType::UPGRADE_REQ:
        return "UPGRADE_REQ";
    case PacketType::UPGRADE_RPY:
        return "UPGRADE_RPY";
    }
    return "UNKNOWN(" + std::to_string(type) + ")";
}

std::string tag_name(uint8_t tag)
{
    switch (static_cast<Tag>(tag))
    {
    case Tag::DEVICE_TYPE:
        return "DEVICE_TYPE";
    case Tag::DEVICE_ID:
        return "DEVICE_ID";
    case Tag::GETSET_NAME:
        return "GETSET_NAME";
    case Tag::GETSET_VALUE:
        return "GETSET_VALUE";
    case Tag::ERROR_MESSAGE:
        return "ERROR_MESSAGE";
    case Tag::TUNER_COUNT:
        return "TUNER_COUNT";
    case Tag::GETSET_LOCKKEY:
        return "GETSET_LOCKKEY";
    case Tag::LINEUP_URL:
        return "LINEUP_URL";
    case Tag::STORAGE_URL:
        return "STORAGE_URL";
    case Tag::DEVICE_AUTH_BIN_DEPRECATED:
        return "DEVICE_AUTH_BIN_DEPRECATED";
    case Tag::BASE_URL:
        return "BASE_URL";
    case Tag::DEVICE_AUTH_STR:
        return "DEVICE_AUTH_STR";
    case Tag::STORAGE_ID:
        return "STORAGE_ID";
    case Tag::MULTI_TYPE:
        return "MULTI_TYPE";
    }
    return hex(tag, 2);
}

std::string device_type_name(uint32_t device_type)
{
    switch (device_type)
    {
    case DEVICE_TYPE_WILDCARD:
        return "WILDCARD";
    case DEVICE_TYPE_TUNER:
        return "TUNER";
    case DEVICE_TYPE_STORAGE:
        return "STORAGE";
    }
    return hex(device_type, 8);
}

std::string format_tag_value(const TagValue &tv)
{
    const auto &v = tv.value;

    switch (static_cast<Tag>(tv.tag))
    {
    case Tag::DEVICE_TYPE:
        if (v.size() == 4)
            return device_type_name(read_be32(v.data()));
        break;
    case Tag::MULTI_TYPE:
        if (!v.empty() && v.size() % 4 == 0)
        {
            std::string out;
            for (size_t i = 0; i < v.size(); i += 4)
            {
                if (i)
                    out += ",";
                out += device_type_name(read_be32(v.data() + i));
            }
            return out;
        }
        break;
    case Tag::DEVICE_ID:
        if (v.size() == 4)
            return hex(read_be32(v.data()), 8);
        break;
    case Tag::TUNER_COUNT:
        if (v.size() == 1)
            return std::to_string(v[0]);
        break;
    default:
        break;
    }

    bool printable = !v.empty();
    for (size_t i = 0; i < v.size(); ++i)
    {
        // Strings are usually NUL terminated
        if (v[i] == 0 && i + 1 == v.size())
            break;
        if (!std::isprint(v[i]))
        {
            printable = false;
            break;
        }
    }

    if (printable)
    {
        std::string text(v.begin(), v.end());
        if (!text.empty() && text.back() == '\0')
            text.pop_back();
        return "\"" + text + "\"";
    }

    std::string out;
    char byte[4];
    for (size_t i = 0; i < v.size(); ++i)
    {
        snprintf(byte, sizeof(byte), i ? " %02x" : "%02x", v[i]);
        out += byte;
    }
    return out;
}
