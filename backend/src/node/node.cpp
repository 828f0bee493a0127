/**
 * Node — Represents the local peer.
 *
 * Owns the identity (username) and the session, announces or discovers the
 * peer over UDP broadcast, and exchanges chat messages of the form
 * {"from": <username>, "text": <line>}.
 */

#include "node/node.h"

#include <future>
#include <limits>

#include <spdlog/spdlog.h>

namespace {

constexpr const char* kServiceName = "peerlink";

// Strings from the network are only trusted when they really are strings.
std::string string_field(const nlohmann::json& value, const char* key, const std::string& fallback) {
    if (value.is_object()) {
        const auto it = value.find(key);
        if (it != value.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return fallback;
}

bool is_announcement(const nlohmann::json& value) {
    if (!value.is_object() || string_field(value, "service", "") != kServiceName) {
        return false;
    }
    const auto port = value.find("port");
    return port != value.end() && port->is_number_integer() &&
           port->get<std::int64_t>() >= 0 &&
           port->get<std::int64_t>() <= std::numeric_limits<std::uint16_t>::max();
}

}  // namespace

Node::Node(const nlohmann::json& config)
    : username_(config.value(nlohmann::json::json_pointer("/node/username"), std::string("anonymous"))),
      session_config_(config.value("session", nlohmann::json::object()).get<SessionConfig>()),
      discovery_config_(config.value("discovery", nlohmann::json::object()).get<DiscoveryConfig>()),
      discovery_(session_config_.payload_format) {}

bool Node::start(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    SessionConfig config = session_config_;

    if (config.role == Role::initiator && discovery_config_.enabled) {
        const auto found = discover_peer(deadline);
        if (!found) {
            spdlog::warn("No peer announced itself on port {}", discovery_config_.port);
            return false;
        }
        config.host = found->sender.address().to_string();
        config.port = static_cast<std::uint16_t>(found->value["port"].get<std::int64_t>());
        spdlog::info("Found peer '{}' at {}:{}",
                     string_field(found->value, "username", "?"), config.host, config.port);
    }

    session_ = std::make_unique<Session>(config);
    session_->set_on_closed([](std::error_code ec) {
        spdlog::info("Peer went away ({})", ec.message());
    });

    auto result = std::make_shared<std::promise<std::error_code>>();
    auto outcome = result->get_future();
    session_->connect([result](std::error_code ec) { result->set_value(ec); });

    const bool announcing = config.role == Role::listener && discovery_config_.enabled;
    while (true) {
        if (announcing && session_->listening_port() != 0) {
            announce();
        }
        if (outcome.wait_for(discovery_config_.interval) == std::future_status::ready) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Timed out waiting for the peer");
            session_->disconnect();
            return false;
        }
    }

    const std::error_code ec = outcome.get();
    if (ec) {
        spdlog::warn("Could not reach the peer: {}", ec.message());
        return false;
    }
    return true;
}

bool Node::send_message(const std::string& text) {
    if (!session_) {
        spdlog::warn("Node not started, cannot send");
        return false;
    }
    return session_->send({{"from", username_}, {"text", text}}) == SendStatus::ok;
}

std::optional<nlohmann::json> Node::next_message(std::chrono::milliseconds timeout) {
    if (!session_) {
        return std::nullopt;
    }
    return session_->recv_for(timeout);
}

std::vector<nlohmann::json> Node::poll_messages() {
    std::vector<nlohmann::json> messages;
    if (!session_) {
        return messages;
    }
    while (auto message = session_->recv()) {
        messages.push_back(std::move(*message));
    }
    return messages;
}

void Node::stop() {
    if (session_) {
        session_->disconnect();
    }
}

bool Node::connected() const {
    return session_ && session_->is_connected();
}

nlohmann::json Node::announcement() const {
    return {{"service", kServiceName},
            {"username", username_},
            {"port", session_->listening_port()}};
}

void Node::announce() const {
    std::error_code ec;
    const auto address = asio::ip::make_address_v4(discovery_config_.address, ec);
    if (ec) {
        spdlog::warn("Invalid discovery address '{}': {}", discovery_config_.address, ec.message());
        return;
    }
    discovery_.broadcast_to(announcement(), address, discovery_config_.port);
}

std::optional<Announcement> Node::discover_peer(std::chrono::steady_clock::time_point deadline) const {
    spdlog::info("Looking for a peer on discovery port {}", discovery_config_.port);
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }
        auto found = discovery_.receive_broadcast(discovery_config_.port, remaining);
        if (!found) {
            return std::nullopt;
        }
        if (is_announcement(found->value)) {
            return found;
        }
        spdlog::debug("Ignoring unrelated discovery message from {}",
                      found->sender.address().to_string());
    }
}

std::string format_message(const nlohmann::json& message) {
    const auto dump = [](const nlohmann::json& value) {
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    };
    if (message.is_object() && message.contains("text")) {
        const auto& text = message["text"];
        return "[" + string_field(message, "from", "?") + "] " +
               (text.is_string() ? text.get<std::string>() : dump(text));
    }
    return dump(message);
}
