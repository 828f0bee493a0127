/**
 * peerlink — Demo peer entry point
 *
 * Loads config, finds the peer over UDP broadcast (or uses the configured
 * address), establishes the session, then forwards stdin lines to the peer
 * and prints whatever the peer sends until either side goes away.
 */

#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config/session_config.h"
#include "node/node.h"

using json = nlohmann::json;

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    std::string config_path = (argc > 1) ? argv[1] : "config.json";
    auto config = load_config_file(config_path);
    if (!config) {
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(
        config->value(json::json_pointer("/log/level"), std::string("info"))));
    spdlog::info("Loaded config from {}", config_path);

    std::unique_ptr<Node> node;
    try {
        node = std::make_unique<Node>(*config);
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    spdlog::info("peerlink node '{}' starting as {}", node->username(),
                 to_string(node->session_config().role));

    if (!node->start(node->discovery_config().timeout)) {
        spdlog::error("No session established, exiting");
        return 1;
    }

    spdlog::info("Session ready. Type a line to send it, Ctrl+D to quit.");

    std::atomic<bool> running{true};
    std::thread printer([&] {
        while (running) {
            if (auto message = node->next_message(std::chrono::milliseconds(100))) {
                std::cout << format_message(*message) << std::endl;
            } else if (!node->connected()) {
                spdlog::info("Session closed, press Enter to exit");
                running = false;
            }
        }
    });

    std::string line;
    while (running && std::getline(std::cin, line)) {
        if (!line.empty() && !node->send_message(line)) {
            spdlog::warn("Message not delivered");
        }
    }

    running = false;
    node->stop();
    printer.join();
    return 0;
}
