#include "codec/envelope.hpp"
#include <cstring>
#include <arpa/inet.h>
#include "network_utils.hpp"

Envelope Envelope::from_datagram(const sockaddr_in &source, const uint8_t *data, size_t len)
{
    Envelope envelope;
    memcpy(envelope.address.data(), &source.sin_addr.s_addr, 4);
    envelope.port = ntohs(source.sin_port);
    envelope.payload.assign(data, data + len);
    return envelope;
}

sockaddr_in Envelope::source() const
{
    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    memcpy(&addr.sin_addr.s_addr, address.data(), 4);
    addr.sin_port = htons(port);
    return addr;
}

std::string Envelope::source_string() const
{
    return endpoint_to_string(source());
}

std::vector<uint8_t> encode_envelope(const std::array<uint8_t, 4> &address, uint16_t port,
                                     const uint8_t *payload, size_t len)
{
    std::vector<uint8_t> body(ENVELOPE_HEADER_SIZE + len);
    memcpy(body.data(), address.data(), 4);
    body[4] = static_cast<uint8_t>(port >> 8);
    body[5] = static_cast<uint8_t>(port & 0xFF);
    if (len)
        memcpy(body.data() + ENVELOPE_HEADER_SIZE, payload, len);
    return body;
}

Envelope decode_envelope(const uint8_t *body, size_t len)
{
    if (len < ENVELOPE_HEADER_SIZE)
    {
        throw MalformedEnvelope("Envelope of " + std::to_string(len) +
                                " bytes is shorter than its address header");
    }

    Envelope envelope;
    memcpy(envelope.address.data(), body, 4);
    envelope.port = static_cast<uint16_t>((body[4] << 8) | body[5]);
    envelope.payload.assign(body + ENVELOPE_HEADER_SIZE, body + len);
    return envelope;
}
