/**
 * Configuration — JSON settings for the session and discovery layers.
 */

#include "config/session_config.h"

#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

const char* to_string(Role role) {
    switch (role) {
    case Role::listener:  return "listener";
    case Role::initiator: return "initiator";
    }
    return "unknown";
}

const char* to_string(PayloadFormat format) {
    switch (format) {
    case PayloadFormat::msgpack: return "msgpack";
    case PayloadFormat::cbor:    return "cbor";
    case PayloadFormat::json:    return "json";
    }
    return "unknown";
}

Role parse_role(const std::string& name) {
    if (name == "listener")  return Role::listener;
    if (name == "initiator") return Role::initiator;
    throw std::invalid_argument("session.role: unknown role '" + name + "'");
}

PayloadFormat parse_payload_format(const std::string& name) {
    if (name == "msgpack") return PayloadFormat::msgpack;
    if (name == "cbor")    return PayloadFormat::cbor;
    if (name == "json")    return PayloadFormat::json;
    throw std::invalid_argument("session.payload_format: unknown format '" + name + "'");
}

namespace {

std::uint16_t read_port(const nlohmann::json& j, const std::string& key, std::uint16_t fallback) {
    const auto it = j.find("port");
    if (it == j.end()) {
        return fallback;
    }
    const bool in_range = it->is_number_unsigned()
        ? it->get<std::uint64_t>() <= std::numeric_limits<std::uint16_t>::max()
        : it->is_number_integer() && it->get<std::int64_t>() >= 0 &&
              it->get<std::int64_t>() <= std::numeric_limits<std::uint16_t>::max();
    if (!in_range) {
        throw std::invalid_argument(key + ": " + it->dump() + " is not a port number");
    }
    return static_cast<std::uint16_t>(it->get<std::uint64_t>());
}

}  // namespace

void from_json(const nlohmann::json& j, SessionConfig& config) {
    const SessionConfig defaults;
    config.role            = parse_role(j.value("role", std::string(to_string(defaults.role))));
    config.host            = j.value("host", defaults.host);
    config.port            = read_port(j, "session.port", defaults.port);
    config.backlog         = j.value("backlog", defaults.backlog);
    config.payload_format  = parse_payload_format(
        j.value("payload_format", std::string(to_string(defaults.payload_format))));
    config.max_frame_bytes = j.value("max_frame_bytes", defaults.max_frame_bytes);
    config.tcp_no_delay    = j.value("tcp_no_delay", defaults.tcp_no_delay);
}

void from_json(const nlohmann::json& j, DiscoveryConfig& config) {
    const DiscoveryConfig defaults;
    config.enabled  = j.value("enabled", defaults.enabled);
    config.port     = read_port(j, "discovery.port", defaults.port);
    config.address  = j.value("address", defaults.address);
    config.interval = std::chrono::milliseconds(j.value("interval_ms", defaults.interval.count()));
    config.timeout  = std::chrono::milliseconds(j.value("timeout_ms", defaults.timeout.count()));
}

std::optional<nlohmann::json> load_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Cannot open config file: {}", path);
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Invalid config file {}: {}", path, e.what());
        return std::nullopt;
    }
}
