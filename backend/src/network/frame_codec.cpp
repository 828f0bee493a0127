/**
 * FrameCodec — Length-prefixed framing for the stream protocol.
 *
 * The header is always written big-endian so that peers on different
 * architectures agree on it. The payload encoding is picked per session;
 * MessagePack is the default.
 */

#include "network/frame_codec.h"

#include <algorithm>
#include <limits>
#include <string>

#include <spdlog/fmt/fmt.h>

namespace {

constexpr std::size_t kMaxRepresentable =
    static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());

}  // namespace

FrameCodec::FrameCodec(PayloadFormat format, std::size_t max_payload)
    : format_(format), max_payload_(std::min(max_payload, kMaxRepresentable)) {}

FrameCodec::Header FrameCodec::encode_header(std::int32_t length) {
    const auto value = static_cast<std::uint32_t>(length);
    return {static_cast<std::uint8_t>(value >> 24),
            static_cast<std::uint8_t>(value >> 16),
            static_cast<std::uint8_t>(value >> 8),
            static_cast<std::uint8_t>(value)};
}

std::int32_t FrameCodec::decode_header(const Header& header) {
    const std::uint32_t value = (static_cast<std::uint32_t>(header[0]) << 24) |
                                (static_cast<std::uint32_t>(header[1]) << 16) |
                                (static_cast<std::uint32_t>(header[2]) << 8) |
                                static_cast<std::uint32_t>(header[3]);
    return static_cast<std::int32_t>(value);
}

FrameCodec::Bytes FrameCodec::serialize(const nlohmann::json& value) const {
    try {
        switch (format_) {
        case PayloadFormat::msgpack:
            return nlohmann::json::to_msgpack(value);
        case PayloadFormat::cbor:
            return nlohmann::json::to_cbor(value);
        case PayloadFormat::json: {
            const std::string text = value.dump();
            return Bytes(text.begin(), text.end());
        }
        }
    } catch (const nlohmann::json::exception& e) {
        throw FrameError(NetError::malformed_payload,
                         fmt::format("cannot serialize payload: {}", e.what()));
    }
    throw FrameError(NetError::malformed_payload, "unknown payload format");
}

nlohmann::json FrameCodec::deserialize(const std::uint8_t* data, std::size_t size) const {
    try {
        switch (format_) {
        case PayloadFormat::msgpack:
            return nlohmann::json::from_msgpack(data, data + size);
        case PayloadFormat::cbor:
            return nlohmann::json::from_cbor(data, data + size);
        case PayloadFormat::json:
            return nlohmann::json::parse(data, data + size);
        }
    } catch (const nlohmann::json::exception& e) {
        throw FrameError(NetError::malformed_payload,
                         fmt::format("cannot decode payload: {}", e.what()));
    }
    throw FrameError(NetError::malformed_payload, "unknown payload format");
}

FrameCodec::Bytes FrameCodec::encode(const nlohmann::json& value) const {
    Bytes payload = serialize(value);
    if (payload.size() > max_payload_) {
        throw FrameError(NetError::frame_too_large,
                         fmt::format("payload of {} bytes exceeds the {} byte limit",
                                     payload.size(), max_payload_));
    }

    const Header header = encode_header(static_cast<std::int32_t>(payload.size()));
    Bytes frame;
    frame.reserve(kHeaderSize + payload.size());
    frame.insert(frame.end(), header.begin(), header.end());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

std::size_t FrameCodec::payload_length(const Header& header) const {
    const std::int32_t length = decode_header(header);
    if (length < 0) {
        throw FrameError(NetError::negative_length,
                         fmt::format("frame header announces {} bytes", length));
    }
    if (static_cast<std::size_t>(length) > max_payload_) {
        throw FrameError(NetError::frame_too_large,
                         fmt::format("frame header announces {} bytes, limit is {}",
                                     length, max_payload_));
    }
    return static_cast<std::size_t>(length);
}

nlohmann::json FrameCodec::decode(const Header& header, const Bytes& payload) const {
    const std::size_t expected = payload_length(header);
    if (payload.size() != expected) {
        throw FrameError(NetError::length_mismatch,
                         fmt::format("header announces {} bytes, got {}",
                                     expected, payload.size()));
    }
    return deserialize(payload.data(), payload.size());
}

nlohmann::json FrameCodec::decode_frame(const Bytes& frame) const {
    if (frame.size() < kHeaderSize) {
        throw FrameError(NetError::length_mismatch,
                         fmt::format("frame of {} bytes is shorter than its header",
                                     frame.size()));
    }
    Header header;
    std::copy_n(frame.begin(), kHeaderSize, header.begin());
    const Bytes payload(frame.begin() + kHeaderSize, frame.end());
    return decode(header, payload);
}
