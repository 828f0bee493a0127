#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "network/frame_codec.h"

/// Which side of the connection a session plays.
enum class Role {
    listener,
    initiator,
};

/**
 * Settings of one stream session, read from the "session" object of the
 * configuration file. Missing keys keep the defaults below.
 */
struct SessionConfig {
    Role          role = Role::listener;
    std::string   host;                 // empty: local host name
    std::uint16_t port = 11111;
    int           backlog = 3;
    PayloadFormat payload_format = PayloadFormat::msgpack;
    std::size_t   max_frame_bytes = FrameCodec::kDefaultMaxPayload;
    bool          tcp_no_delay = true;
};

/**
 * Settings of the broadcast discovery exchange ("discovery" object).
 */
struct DiscoveryConfig {
    bool                      enabled = true;
    std::uint16_t             port = 10130;
    std::string               address = "255.255.255.255";
    std::chrono::milliseconds interval{500};
    std::chrono::milliseconds timeout{10000};
};

const char* to_string(Role role);
const char* to_string(PayloadFormat format);

/// Throws std::invalid_argument for names that are not a known role / format.
Role parse_role(const std::string& name);
PayloadFormat parse_payload_format(const std::string& name);

void from_json(const nlohmann::json& j, SessionConfig& config);
void from_json(const nlohmann::json& j, DiscoveryConfig& config);

/// Parse a JSON configuration file. Logs and returns nullopt on failure.
std::optional<nlohmann::json> load_config_file(const std::string& path);
