// GoogleTest tests for the UDP discovery exchange.
// Datagrams go to 127.0.0.1 so the tests do not depend on a broadcast route.
#include "network/discovery.h"
#include "network/session.h"
#include <gtest/gtest.h>
#include <array>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

const asio::ip::address_v4 kLoopback = asio::ip::make_address_v4("127.0.0.1");

// Keep sending until the receiver has something: the receiver binds
// asynchronously, so a single datagram could arrive before it exists.
template <typename Send>
std::optional<Announcement> exchange(std::future<std::optional<Announcement>>& pending, Send send)
{
    for (int i = 0; i < 100; ++i) {
        send();
        if (pending.wait_for(50ms) == std::future_status::ready) {
            return pending.get();
        }
    }
    return pending.get();
}

}  // namespace

TEST(DiscoveryTest, DatagramCarriesValueAndSender)
{
    constexpr std::uint16_t kPort = 47811;
    const Discovery discovery;
    const nlohmann::json hello = {{"service", "peerlink"}, {"port", 11111}, {"tags", {"a", "b"}}};

    auto pending = std::async(std::launch::async,
                              [&] { return discovery.receive_broadcast(kPort, 5000ms); });
    const auto received = exchange(pending, [&] {
        EXPECT_TRUE(discovery.broadcast_to(hello, kLoopback, kPort));
    });

    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->value, hello);
    EXPECT_EQ(received->sender.address().to_string(), "127.0.0.1");
    EXPECT_NE(received->sender.port(), 0);
}

TEST(DiscoveryTest, ReceiveGivesUpAfterTimeout)
{
    const Discovery discovery;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(discovery.receive_broadcast(47812, 100ms).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 90ms);
    EXPECT_LT(elapsed, 5s);
}

TEST(DiscoveryTest, OversizedMessageIsNotSent)
{
    const Discovery discovery;
    const nlohmann::json big = std::string(Discovery::kMaxDatagramSize, 'x');
    EXPECT_FALSE(discovery.broadcast_to(big, kLoopback, 47813));
}

TEST(DiscoveryTest, MalformedDatagramIsDiscarded)
{
    constexpr std::uint16_t kPort = 47814;
    const Discovery discovery;

    asio::io_context io;
    asio::ip::udp::socket raw(io, asio::ip::udp::endpoint(asio::ip::udp::v4(), 0));
    const std::array<std::uint8_t, 2> garbage{0xc1, 0xc1};

    auto pending = std::async(std::launch::async,
                              [&] { return discovery.receive_broadcast(kPort, 5000ms); });
    for (int i = 0; i < 100; ++i) {
        raw.send_to(asio::buffer(garbage), asio::ip::udp::endpoint(kLoopback, kPort));
        if (pending.wait_for(50ms) == std::future_status::ready) {
            break;
        }
    }
    EXPECT_FALSE(pending.get().has_value());
}

TEST(DiscoveryTest, JsonTextDatagramsAreUnderstood)
{
    constexpr std::uint16_t kPort = 47815;
    const Discovery sender(PayloadFormat::json);
    const Discovery receiver(PayloadFormat::json);

    auto pending = std::async(std::launch::async,
                              [&] { return receiver.receive_broadcast(kPort, 5000ms); });
    const auto received = exchange(pending, [&] {
        sender.broadcast_to({{"hi", true}}, kLoopback, kPort);
    });

    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->value, nlohmann::json({{"hi", true}}));
}

TEST(DiscoveryTest, SessionBroadcastNeverThrows)
{
    SessionConfig config;
    config.host = "127.0.0.1";
    Session session(config);
    // Whether a limited-broadcast route exists depends on the host.
    EXPECT_NO_THROW(session.broadcast({{"service", "peerlink"}}, 47816));
}
