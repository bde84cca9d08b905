#include "codec/frame_codec.hpp"
#include <algorithm>
#include <string>

std::vector<uint8_t> encode_frame(const uint8_t *body, size_t len)
{
    if (len > MAX_FRAME_BODY)
    {
        throw FrameTooLarge("Frame body of " + std::to_string(len) + " bytes exceeds " +
                            std::to_string(MAX_FRAME_BODY));
    }

    std::vector<uint8_t> frame;
    frame.reserve(FRAME_LENGTH_SIZE + len);
    frame.push_back(static_cast<uint8_t>(len >> 8));
    frame.push_back(static_cast<uint8_t>(len & 0xFF));
    frame.insert(frame.end(), body, body + len);
    return frame;
}

void FrameDecoder::decode(const uint8_t *data, size_t len, const MessageCallback &on_message)
{
    size_t i = 0;

    while (true)
    {
        while (length_bytes_remaining)
        {
            if (i >= len)
                return;

            length_bytes_remaining--;
            body_bytes_remaining |= static_cast<size_t>(data[i]) << (length_bytes_remaining * 8);
            i++;
        }

        if (body_bytes_remaining)
        {
            size_t take = std::min(body_bytes_remaining, len - i);
            body.insert(body.end(), data + i, data + i + take);
            body_bytes_remaining -= take;
            i += take;

            if (body_bytes_remaining)
                return;
        }

        std::vector<uint8_t> message;
        message.swap(body);
        reset();

        on_message(std::move(message));
    }
}

void FrameDecoder::reset()
{
    length_bytes_remaining = FRAME_LENGTH_SIZE;
    body_bytes_remaining = 0;
    body.clear();
}

bool FrameDecoder::mid_frame() const
{
    return length_bytes_remaining != FRAME_LENGTH_SIZE || body_bytes_remaining != 0;
}
