#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>
#include "codec/codec_error.hpp"

constexpr size_t FRAME_LENGTH_SIZE = 2;
constexpr size_t MAX_FRAME_BODY = 0xFFFF;

// Prepends the 2-byte big-endian body length. Throws FrameTooLarge when
// the body does not fit the length field.
std::vector<uint8_t> encode_frame(const uint8_t *body, size_t len);

inline std::vector<uint8_t> encode_frame(const std::vector<uint8_t> &body)
{
    return encode_frame(body.data(), body.size());
}

// Turns one direction of the tunnel byte stream back into frame bodies.
//
// Chunks may split frames anywhere. A body is delivered only once all of
// its bytes have arrived, and the decoder is back in the "awaiting length"
// state before the callback runs, so the callback may feed the decoder
// again or tear down the stream it came from.
class FrameDecoder
{
public:
    using MessageCallback = std::function<void(std::vector<uint8_t> &&)>;

    void decode(const uint8_t *data, size_t len, const MessageCallback &on_message);
    void reset();

    // True while a frame is partially received
    bool mid_frame() const;

private:
    size_t length_bytes_remaining = FRAME_LENGTH_SIZE;
    size_t body_bytes_remaining = 0;
    std::vector<uint8_t> body;
};

#endif
