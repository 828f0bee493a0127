#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

#include "network/errors.h"

/// Serialization used for message bodies. Both peers must use the same one.
enum class PayloadFormat {
    msgpack,
    cbor,
    json,
};

/**
 * Length-prefixed framing for the stream protocol.
 *
 * A frame is a 4-byte signed length in network byte order followed by exactly
 * that many bytes of serialized payload. Payloads are nlohmann::json values
 * encoded in a self-describing format, so nested arrays and objects survive
 * the trip without a schema.
 */
class FrameCodec {
public:
    static constexpr std::size_t kHeaderSize = 4;
    static constexpr std::size_t kDefaultMaxPayload = 16 * 1024 * 1024;

    using Header = std::array<std::uint8_t, kHeaderSize>;
    using Bytes  = std::vector<std::uint8_t>;

    explicit FrameCodec(PayloadFormat format = PayloadFormat::msgpack,
                        std::size_t max_payload = kDefaultMaxPayload);

    /// header || payload. Throws FrameError if the payload is too large.
    Bytes encode(const nlohmann::json& value) const;

    /// Validate a received header and return the payload length it announces.
    std::size_t payload_length(const Header& header) const;

    /// Inverse of encode, given the header and the payload read after it.
    nlohmann::json decode(const Header& header, const Bytes& payload) const;

    /// Decode a complete frame held in one buffer.
    nlohmann::json decode_frame(const Bytes& frame) const;

    /// Payload-only conversions, without the length header.
    Bytes serialize(const nlohmann::json& value) const;
    nlohmann::json deserialize(const std::uint8_t* data, std::size_t size) const;

    static Header encode_header(std::int32_t length);
    static std::int32_t decode_header(const Header& header);

    [[nodiscard]] PayloadFormat format() const { return format_; }
    [[nodiscard]] std::size_t max_payload() const { return max_payload_; }

private:
    PayloadFormat format_;
    std::size_t   max_payload_;
};
