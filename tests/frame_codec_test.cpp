#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <random>
#include "codec/frame_codec.hpp"

namespace
{

std::vector<std::vector<uint8_t>> feed(FrameDecoder &decoder, const std::vector<uint8_t> &stream,
                                       const std::vector<size_t> &cuts)
{
    std::vector<std::vector<uint8_t>> messages;
    auto collect = [&messages](std::vector<uint8_t> &&body)
    {
        messages.push_back(std::move(body));
    };

    size_t start = 0;
    for (size_t cut : cuts)
    {
        decoder.decode(stream.data() + start, cut - start, collect);
        start = cut;
    }
    decoder.decode(stream.data() + start, stream.size() - start, collect);
    return messages;
}

}

TEST(FrameCodecTest, EncodePrependsBigEndianLength)
{
    std::vector<uint8_t> body(0x0102, 0xAB);
    auto frame = encode_frame(body);

    ASSERT_EQ(frame.size(), body.size() + 2);
    EXPECT_EQ(frame[0], 0x01);
    EXPECT_EQ(frame[1], 0x02);
    EXPECT_EQ(std::vector<uint8_t>(frame.begin() + 2, frame.end()), body);
}

TEST(FrameCodecTest, EncodeRejectsBodiesBeyondLengthField)
{
    std::vector<uint8_t> largest(MAX_FRAME_BODY);
    EXPECT_NO_THROW(encode_frame(largest));

    std::vector<uint8_t> too_large(MAX_FRAME_BODY + 1);
    EXPECT_THROW(encode_frame(too_large), FrameTooLarge);
}

TEST(FrameCodecTest, RoundTripAcrossRandomSplits)
{
    std::mt19937 rng(1234);
    std::vector<size_t> sizes = {0, 1, 2, 6, 255, 256, 1500, 65535};

    for (size_t size : sizes)
    {
        std::vector<uint8_t> body(size);
        for (auto &b : body)
            b = static_cast<uint8_t>(rng());
        auto frame = encode_frame(body);

        for (int trial = 0; trial < 10; ++trial)
        {
            std::vector<size_t> cuts;
            std::uniform_int_distribution<size_t> pick(0, frame.size());
            for (int i = 0; i < 4; ++i)
                cuts.push_back(pick(rng));
            std::sort(cuts.begin(), cuts.end());

            FrameDecoder decoder;
            auto messages = feed(decoder, frame, cuts);
            ASSERT_EQ(messages.size(), 1u) << "size " << size;
            EXPECT_EQ(messages[0], body);
            EXPECT_FALSE(decoder.mid_frame());
        }
    }
}

TEST(FrameCodecTest, TwoFramesInOneChunkKeepTheirBoundaries)
{
    std::vector<uint8_t> first = {'f', 'i', 'r', 's', 't'};
    std::vector<uint8_t> second = {'2'};

    auto stream = encode_frame(first);
    auto tail = encode_frame(second);
    stream.insert(stream.end(), tail.begin(), tail.end());

    FrameDecoder decoder;
    auto messages = feed(decoder, stream, {});
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], first);
    EXPECT_EQ(messages[1], second);
}

TEST(FrameCodecTest, NothingIsDeliveredUntilTheLastByte)
{
    std::vector<uint8_t> body = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    auto frame = encode_frame(body);

    FrameDecoder decoder;
    int calls = 0;
    std::vector<uint8_t> delivered;
    auto collect = [&](std::vector<uint8_t> &&message)
    {
        calls++;
        delivered = message;
    };

    for (size_t i = 0; i + 1 < frame.size(); ++i)
    {
        decoder.decode(&frame[i], 1, collect);
        EXPECT_EQ(calls, 0) << "after byte " << i;
        EXPECT_TRUE(decoder.mid_frame());
    }

    decoder.decode(&frame.back(), 1, collect);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(delivered, body);
}

TEST(FrameCodecTest, EmptyBodyIsAMessage)
{
    auto stream = encode_frame(std::vector<uint8_t>());
    ASSERT_EQ(stream.size(), 2u);

    FrameDecoder decoder;
    auto messages = feed(decoder, stream, {1});
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_TRUE(messages[0].empty());
}

TEST(FrameCodecTest, StateIsResetBeforeTheCallbackRuns)
{
    std::vector<uint8_t> outer = {'o', 'u', 't'};
    std::vector<uint8_t> inner = {'i', 'n'};
    auto outer_frame = encode_frame(outer);
    auto inner_frame = encode_frame(inner);

    FrameDecoder decoder;
    std::vector<std::vector<uint8_t>> messages;
    bool fed = false;

    std::function<void(std::vector<uint8_t> &&)> on_message = [&](std::vector<uint8_t> &&body)
    {
        EXPECT_FALSE(decoder.mid_frame());
        messages.push_back(body);
        if (!fed)
        {
            // A callback that drives the same decoder sees a clean frame boundary
            fed = true;
            decoder.decode(inner_frame.data(), inner_frame.size(), on_message);
        }
    };

    decoder.decode(outer_frame.data(), outer_frame.size(), on_message);

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], outer);
    EXPECT_EQ(messages[1], inner);
}

TEST(FrameCodecTest, ResetDiscardsAPartialFrame)
{
    auto frame = encode_frame(std::vector<uint8_t>{1, 2, 3});
    FrameDecoder decoder;
    int calls = 0;
    auto count = [&](std::vector<uint8_t> &&)
    {
        calls++;
    };

    decoder.decode(frame.data(), 3, count);
    EXPECT_TRUE(decoder.mid_frame());
    decoder.reset();
    EXPECT_FALSE(decoder.mid_frame());

    auto fresh = encode_frame(std::vector<uint8_t>{9});
    decoder.decode(fresh.data(), fresh.size(), count);
    EXPECT_EQ(calls, 1);
}
