#include <gtest/gtest.h>
#include "codec/envelope.hpp"
#include "network_utils.hpp"

TEST(EnvelopeTest, EncodeLaysOutAddressPortPayload)
{
    std::array<uint8_t, 4> address = {10, 0, 0, 5};
    std::vector<uint8_t> payload = {0xDE, 0xAD};

    auto body = encode_envelope(address, 54321, payload.data(), payload.size());

    std::vector<uint8_t> expected = {10, 0, 0, 5, 0xD4, 0x31, 0xDE, 0xAD};
    EXPECT_EQ(body, expected);
}

TEST(EnvelopeTest, DecodeOfEncodeIsIdentity)
{
    Envelope envelope;
    envelope.address = {192, 168, 1, 20};
    envelope.port = 65001;
    envelope.payload = {0, 2, 0, 12, 1, 4, 0, 0, 0, 1};

    EXPECT_EQ(decode_envelope(encode_envelope(envelope)), envelope);

    envelope.port = 0;
    envelope.payload.clear();
    EXPECT_EQ(decode_envelope(encode_envelope(envelope)), envelope);

    envelope.address = {255, 255, 255, 255};
    envelope.port = 0xFFFF;
    envelope.payload.assign(1400, 0x5A);
    EXPECT_EQ(decode_envelope(encode_envelope(envelope)), envelope);
}

TEST(EnvelopeTest, HeaderOnlyBodyHasEmptyPayload)
{
    std::vector<uint8_t> body = {127, 0, 0, 1, 0x00, 0x50};
    auto envelope = decode_envelope(body);

    EXPECT_EQ(envelope.port, 80);
    EXPECT_TRUE(envelope.payload.empty());
    EXPECT_EQ(envelope.source_string(), "127.0.0.1:80");
}

TEST(EnvelopeTest, ShortBodiesAreMalformed)
{
    for (size_t len = 0; len < ENVELOPE_HEADER_SIZE; ++len)
    {
        std::vector<uint8_t> body(len, 1);
        EXPECT_THROW(decode_envelope(body), MalformedEnvelope) << "length " << len;
    }
}

TEST(EnvelopeTest, MalformedIsACodecError)
{
    std::vector<uint8_t> body = {1, 2, 3};
    EXPECT_THROW(decode_envelope(body), CodecError);
}

TEST(EnvelopeTest, DatagramSourceSurvivesTheTrip)
{
    sockaddr_in source;
    setup_sockaddr(source, "10.0.0.5", 54321);
    std::vector<uint8_t> data = {'Q'};

    auto envelope = Envelope::from_datagram(source, data.data(), data.size());
    auto decoded = decode_envelope(encode_envelope(envelope));

    sockaddr_in back = decoded.source();
    EXPECT_EQ(back.sin_family, AF_INET);
    EXPECT_EQ(back.sin_addr.s_addr, source.sin_addr.s_addr);
    EXPECT_EQ(back.sin_port, source.sin_port);
    EXPECT_EQ(decoded.source_string(), "10.0.0.5:54321");
    EXPECT_EQ(decoded.payload, data);
}
