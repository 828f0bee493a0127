/**
 * Discovery — Announce this node or look for peers with UDP broadcast.
 *
 * Each call is independent of any session: open a datagram socket with
 * SO_BROADCAST, send or receive exactly one datagram, close it.
 */

#include "network/discovery.h"

#include <array>

#include <spdlog/spdlog.h>

Discovery::Discovery(PayloadFormat format) : codec_(format) {}

bool Discovery::broadcast(const nlohmann::json& data, std::uint16_t port) const {
    return broadcast_to(data, asio::ip::address_v4::broadcast(), port);
}

bool Discovery::broadcast_to(const nlohmann::json& data,
                             const asio::ip::address_v4& address,
                             std::uint16_t port) const {
    FrameCodec::Bytes body;
    try {
        body = codec_.serialize(data);
    } catch (const FrameError& e) {
        spdlog::warn("Discovery message not sent: {}", e.what());
        return false;
    }
    if (body.size() > kMaxDatagramSize) {
        spdlog::warn("Discovery message of {} bytes exceeds the {} byte datagram limit",
                     body.size(), kMaxDatagramSize);
        return false;
    }

    asio::io_context io;
    asio::ip::udp::socket socket(io);
    std::error_code ec;
    socket.open(asio::ip::udp::v4(), ec);
    if (!ec) socket.set_option(asio::socket_base::broadcast(true), ec);
    if (!ec) socket.send_to(asio::buffer(body), asio::ip::udp::endpoint(address, port), 0, ec);

    std::error_code ignored;
    socket.close(ignored);

    if (ec) {
        spdlog::warn("Broadcast to {}:{} failed: {}", address.to_string(), port, ec.message());
        return false;
    }
    spdlog::debug("Broadcast {} bytes to {}:{}", body.size(), address.to_string(), port);
    return true;
}

std::optional<Announcement> Discovery::receive_broadcast(std::uint16_t port) const {
    return receive(port, std::nullopt);
}

std::optional<Announcement> Discovery::receive_broadcast(std::uint16_t port,
                                                         std::chrono::milliseconds timeout) const {
    return receive(port, timeout);
}

std::optional<Announcement> Discovery::receive(
    std::uint16_t port, std::optional<std::chrono::milliseconds> timeout) const {
    asio::io_context io;
    asio::ip::udp::socket socket(io);
    std::error_code ec;
    socket.open(asio::ip::udp::v4(), ec);
    if (!ec) socket.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) socket.set_option(asio::socket_base::broadcast(true), ec);
    if (!ec) socket.bind(asio::ip::udp::endpoint(asio::ip::address_v4::any(), port), ec);
    if (ec) {
        spdlog::warn("Cannot listen for discovery messages on port {}: {}", port, ec.message());
        return std::nullopt;
    }

    std::array<std::uint8_t, kMaxDatagramSize> buffer{};
    asio::ip::udp::endpoint sender;
    std::error_code result = asio::error::timed_out;
    std::size_t received = 0;

    socket.async_receive_from(asio::buffer(buffer), sender,
        [&](const std::error_code& error, std::size_t bytes) {
            result = error;
            received = bytes;
        });

    if (timeout) {
        io.run_for(*timeout);
    } else {
        io.run();
    }

    std::error_code ignored;
    if (!io.stopped()) {
        // Deadline passed with the receive still pending: cancel and drain it.
        socket.close(ignored);
        io.run();
        spdlog::debug("No discovery message on port {} within {} ms", port, timeout->count());
        return std::nullopt;
    }
    socket.close(ignored);

    if (result) {
        spdlog::warn("Receiving discovery message failed: {}", result.message());
        return std::nullopt;
    }

    try {
        Announcement announcement{codec_.deserialize(buffer.data(), received), sender};
        spdlog::debug("Discovery message from {}:{}",
                      sender.address().to_string(), sender.port());
        return announcement;
    } catch (const FrameError& e) {
        spdlog::warn("Discarding discovery message from {}: {}",
                     sender.address().to_string(), e.what());
        return std::nullopt;
    }
}
