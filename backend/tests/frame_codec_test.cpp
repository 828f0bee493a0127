// GoogleTest unit tests for the frame codec
#include "network/frame_codec.h"
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>

namespace {

nlohmann::json sample_value()
{
    return {
        {"type", "move"},
        {"player", 2},
        {"position", {3.5, -1.25}},
        {"tiles", {{1, 2, 3}, {4, 5, 6}}},
        {"flags", {{"ranked", true}, {"note", nullptr}}},
        {"name", "caf\xc3\xa9"},
    };
}

template <typename Fn>
void expect_frame_error(Fn&& fn, NetError expected)
{
    try {
        fn();
        FAIL() << "expected FrameError";
    } catch (const FrameError& e) {
        EXPECT_EQ(e.code(), make_error_code(expected)) << e.what();
    }
}

}  // namespace

class FrameCodecFormatTest : public ::testing::TestWithParam<PayloadFormat> {};

TEST_P(FrameCodecFormatTest, RoundTripsNestedValues)
{
    const FrameCodec codec(GetParam());
    const nlohmann::json value = sample_value();
    EXPECT_EQ(codec.decode_frame(codec.encode(value)), value);
}

INSTANTIATE_TEST_SUITE_P(AllFormats, FrameCodecFormatTest,
                         ::testing::Values(PayloadFormat::msgpack,
                                           PayloadFormat::cbor,
                                           PayloadFormat::json));

TEST(FrameCodecTest, HeaderIsBigEndianPayloadLength)
{
    const FrameCodec codec;
    const auto frame = codec.encode(std::string(300, 'x'));
    const auto payload = codec.serialize(std::string(300, 'x'));

    ASSERT_EQ(frame.size(), FrameCodec::kHeaderSize + payload.size());
    FrameCodec::Header header{frame[0], frame[1], frame[2], frame[3]};
    EXPECT_EQ(FrameCodec::decode_header(header), static_cast<std::int32_t>(payload.size()));
    EXPECT_EQ(frame[0], 0x00);
    EXPECT_EQ(frame[1], 0x00);
    EXPECT_EQ(frame[2], static_cast<std::uint8_t>(payload.size() >> 8));
    EXPECT_EQ(frame[3], static_cast<std::uint8_t>(payload.size() & 0xff));
}

TEST(FrameCodecTest, HeaderEncodingIsFixed)
{
    const FrameCodec::Header expected{0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(FrameCodec::encode_header(0x01020304), expected);
    EXPECT_EQ(FrameCodec::decode_header(expected), 0x01020304);
}

TEST(FrameCodecTest, DecodeRejectsShortPayload)
{
    const FrameCodec codec;
    auto payload = codec.serialize({1, 2, 3});
    const auto header = FrameCodec::encode_header(static_cast<std::int32_t>(payload.size()));
    payload.pop_back();
    expect_frame_error([&] { codec.decode(header, payload); }, NetError::length_mismatch);
}

TEST(FrameCodecTest, DecodeRejectsTrailingBytes)
{
    const FrameCodec codec;
    auto frame = codec.encode("hello");
    frame.push_back(0x00);
    expect_frame_error([&] { codec.decode_frame(frame); }, NetError::length_mismatch);
}

TEST(FrameCodecTest, DecodeRejectsTruncatedHeader)
{
    const FrameCodec codec;
    expect_frame_error([&] { codec.decode_frame({0x00, 0x00}); }, NetError::length_mismatch);
}

TEST(FrameCodecTest, NegativeLengthIsRejected)
{
    const FrameCodec codec;
    const FrameCodec::Header header{0xff, 0xff, 0xff, 0xfe};
    EXPECT_EQ(FrameCodec::decode_header(header), -2);
    expect_frame_error([&] { codec.payload_length(header); }, NetError::negative_length);
}

TEST(FrameCodecTest, OversizedFramesAreRejected)
{
    const FrameCodec codec(PayloadFormat::msgpack, 16);
    expect_frame_error([&] { codec.encode(std::string(64, 'a')); }, NetError::frame_too_large);
    expect_frame_error([&] { codec.payload_length(FrameCodec::encode_header(17)); },
                       NetError::frame_too_large);
    EXPECT_EQ(codec.payload_length(FrameCodec::encode_header(16)), 16u);
}

TEST(FrameCodecTest, MaxPayloadIsClampedToHeaderRange)
{
    const FrameCodec codec(PayloadFormat::msgpack, std::numeric_limits<std::size_t>::max());
    EXPECT_EQ(codec.max_payload(),
              static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()));
}

TEST(FrameCodecTest, MalformedPayloadIsRejected)
{
    const FrameCodec codec;
    // 0xc1 is never used by MessagePack.
    const FrameCodec::Bytes payload{0xc1};
    expect_frame_error([&] { codec.decode(FrameCodec::encode_header(1), payload); },
                       NetError::malformed_payload);
}

TEST(FrameCodecTest, EmptyPayloadIsMalformed)
{
    const FrameCodec codec;
    expect_frame_error([&] { codec.decode(FrameCodec::encode_header(0), {}); },
                       NetError::malformed_payload);
}

TEST(FrameCodecTest, JsonFormatWritesText)
{
    const FrameCodec codec(PayloadFormat::json);
    const auto payload = codec.serialize({{"a", 1}});
    EXPECT_EQ(std::string(payload.begin(), payload.end()), R"({"a":1})");
}

TEST(FrameCodecTest, InvalidUtf8CannotBeSentAsJsonText)
{
    const FrameCodec codec(PayloadFormat::json);
    expect_frame_error([&] { codec.encode(std::string("\xff\xfe")); },
                       NetError::malformed_payload);
}
