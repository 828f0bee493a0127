#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>

#include "network/frame_codec.h"

/// A discovery datagram together with the address it came from.
struct Announcement {
    nlohmann::json          value;
    asio::ip::udp::endpoint sender;
};

/**
 * One-shot UDP broadcast exchange used to find peers on the local network.
 *
 * Stateless: every call opens its own socket and closes it before returning.
 * The datagram body is the serialized value with no length header.
 */
class Discovery {
public:
    static constexpr std::uint16_t kDefaultPort = 10130;
    static constexpr std::size_t kMaxDatagramSize = 1024;

    explicit Discovery(PayloadFormat format = PayloadFormat::msgpack);

    /// Send `data` once to 255.255.255.255:port. Fire-and-forget.
    bool broadcast(const nlohmann::json& data, std::uint16_t port = kDefaultPort) const;

    /// Send `data` once to an explicit address (subnet broadcast or unicast).
    bool broadcast_to(const nlohmann::json& data,
                      const asio::ip::address_v4& address,
                      std::uint16_t port) const;

    /// Block until one datagram arrives on `port`.
    std::optional<Announcement> receive_broadcast(std::uint16_t port = kDefaultPort) const;

    /// As above, giving up after `timeout`.
    std::optional<Announcement> receive_broadcast(std::uint16_t port,
                                                  std::chrono::milliseconds timeout) const;

private:
    std::optional<Announcement> receive(std::uint16_t port,
                                        std::optional<std::chrono::milliseconds> timeout) const;

    FrameCodec codec_;
};
