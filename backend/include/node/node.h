#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "config/session_config.h"
#include "network/discovery.h"
#include "network/session.h"

/**
 * Represents the local peer.
 *
 * Owns the identity (username) and the session, and coordinates between the
 * discovery exchange and the stream session: a listener announces itself
 * while it waits, an initiator listens for that announcement to learn where
 * to connect.
 */
class Node {
public:
    explicit Node(const nlohmann::json& config);

    /// Find the peer (if discovery is enabled) and establish the session.
    bool start(std::chrono::milliseconds timeout);

    /// Send a chat line to the peer.
    bool send_message(const std::string& text);

    /// Next message from the peer, waiting up to `timeout`.
    std::optional<nlohmann::json> next_message(std::chrono::milliseconds timeout);

    /// Everything received so far.
    std::vector<nlohmann::json> poll_messages();

    void stop();

    [[nodiscard]] bool connected() const;
    [[nodiscard]] const std::string& username() const { return username_; }
    [[nodiscard]] const SessionConfig& session_config() const { return session_config_; }
    [[nodiscard]] const DiscoveryConfig& discovery_config() const { return discovery_config_; }

private:
    nlohmann::json announcement() const;
    void announce() const;
    std::optional<Announcement> discover_peer(std::chrono::steady_clock::time_point deadline) const;

    std::string              username_;
    SessionConfig            session_config_;
    DiscoveryConfig          discovery_config_;
    Discovery                discovery_;
    std::unique_ptr<Session> session_;
};

/// One received message as a printable line: "[from] text" for chat
/// messages, the JSON text for anything else.
std::string format_message(const nlohmann::json& message);
