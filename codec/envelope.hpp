#ifndef ENVELOPE_HPP
#define ENVELOPE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <netinet/in.h>
#include "codec/codec_error.hpp"

// Address and port prefix in front of the payload
constexpr size_t ENVELOPE_HEADER_SIZE = 6;

// A UDP datagram together with the endpoint that originally sent it.
// The payload length is implied by the frame carrying the envelope.
struct Envelope
{
    std::array<uint8_t, 4> address{};
    uint16_t port = 0;
    std::vector<uint8_t> payload;

    static Envelope from_datagram(const sockaddr_in &source, const uint8_t *data, size_t len);

    sockaddr_in source() const;
    std::string source_string() const;

    bool operator==(const Envelope &other) const
    {
        return address == other.address && port == other.port && payload == other.payload;
    }
};

std::vector<uint8_t> encode_envelope(const std::array<uint8_t, 4> &address, uint16_t port,
                                     const uint8_t *payload, size_t len);

inline std::vector<uint8_t> encode_envelope(const Envelope &envelope)
{
    return encode_envelope(envelope.address, envelope.port,
                           envelope.payload.data(), envelope.payload.size());
}

// Throws MalformedEnvelope when the body is shorter than the header.
Envelope decode_envelope(const uint8_t *body, size_t len);

inline Envelope decode_envelope(const std::vector<uint8_t> &body)
{
    return decode_envelope(body.data(), body.size());
}

#endif
