#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <nlohmann/json.hpp>

#include "config/session_config.h"
#include "network/discovery.h"
#include "network/frame_codec.h"
#include "network/inbound_queue.h"

enum class SessionState {
    idle,
    connecting,
    connected,
    closed,
};

enum class SendStatus {
    ok = 0,
    not_connected = 1,
    failed = 2,
};

const char* to_string(SessionState state);
const char* to_string(SendStatus status);

/**
 * One point-to-point connection with a single peer.
 *
 * The session owns its socket and an I/O thread. connect() starts listening
 * (listener role) or dialing (initiator role) in the background and reports
 * the outcome once through the callback. Once connected, frames read from the
 * peer are decoded into the inbound queue, which recv() polls. send() and
 * recv() may be called from any thread.
 */
class Session {
public:
    using ConnectCallback = std::function<void(std::error_code)>;
    using CloseCallback   = std::function<void(std::error_code)>;

    explicit Session(SessionConfig config);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Start a connection attempt. No-op while one is connecting or connected.
    void connect(ConnectCallback on_result);

    /// Stop the attempt or connection and wait for the teardown. Idempotent.
    void disconnect();

    [[nodiscard]] bool is_connected() const { return state_ == SessionState::connected; }
    [[nodiscard]] SessionState state() const { return state_; }

    /// Frame and write `data`. Blocks until the frame is written.
    SendStatus send(const nlohmann::json& data);

    /// Oldest received value, or nullopt if none is waiting.
    std::optional<nlohmann::json> recv();
    std::optional<nlohmann::json> recv_for(std::chrono::milliseconds timeout);

    /// Values received but not yet consumed.
    [[nodiscard]] std::size_t pending() const { return inbound_.size(); }

    /// Called when an established connection is lost (not on disconnect()).
    void set_on_closed(CloseCallback cb);

    /// Port bound while the listener waits for its peer, otherwise 0.
    [[nodiscard]] std::uint16_t listening_port() const { return listening_port_; }

    /// Peer address while connected.
    std::optional<asio::ip::tcp::endpoint> remote_endpoint() const;

    bool broadcast(const nlohmann::json& data,
                   std::uint16_t port = Discovery::kDefaultPort) const;
    std::optional<Announcement> receive_broadcast(
        std::uint16_t port = Discovery::kDefaultPort) const;

    [[nodiscard]] const SessionConfig& config() const { return config_; }

private:
    struct PendingWrite {
        std::shared_ptr<FrameCodec::Bytes>        frame;
        std::shared_ptr<std::promise<SendStatus>> done;
    };

    // Everything below runs on the I/O thread.
    bool stale(std::uint64_t attempt) const;
    std::string target_host() const;
    void start_listening(std::uint64_t attempt, ConnectCallback on_result);
    void start_dialing(std::uint64_t attempt, ConnectCallback on_result);
    void on_established(std::uint64_t attempt, ConnectCallback on_result, std::error_code ec);
    void fail_attempt(ConnectCallback on_result, std::error_code ec);
    void read_header(std::uint64_t attempt);
    void read_payload(std::uint64_t attempt);
    void end_receive_loop(std::error_code ec);
    void close_transport();
    void queue_write(std::shared_ptr<FrameCodec::Bytes> frame,
                     std::shared_ptr<std::promise<SendStatus>> done);
    void write_next(std::uint64_t attempt);

    SessionConfig config_;
    FrameCodec    codec_;
    Discovery     discovery_;

    asio::io_context                                          io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    asio::ip::tcp::acceptor                                   acceptor_;
    asio::ip::tcp::socket                                     socket_;
    asio::ip::tcp::resolver                                   resolver_;

    std::atomic<SessionState>  state_{SessionState::idle};
    std::atomic<bool>          stop_requested_{false};
    std::atomic<std::uint64_t> attempt_{0};
    std::atomic<std::uint16_t> listening_port_{0};

    FrameCodec::Header       header_{};
    FrameCodec::Bytes        payload_;
    std::deque<PendingWrite> writes_;

    InboundQueue<nlohmann::json> inbound_;

    mutable std::mutex callback_mutex_;
    CloseCallback      on_closed_;

    mutable std::mutex                     peer_mutex_;
    std::optional<asio::ip::tcp::endpoint> peer_;

    std::thread worker_;
};
