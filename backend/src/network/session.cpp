/**
 * Session — One persistent stream connection with a single peer.
 *
 * Uses standalone ASIO. Every socket operation (accept, connect, reads,
 * writes, close) runs on the session's own I/O thread, so the socket is never
 * touched from two threads. Consumers talk to that thread through the atomic
 * state, the inbound queue and posted work.
 *
 * A connection attempt is the chain of handlers started by connect(). Each
 * attempt carries a number; handlers belonging to an older attempt, or running
 * after a stop was requested, return without doing anything.
 */

#include "network/session.h"

#include <exception>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

template <typename Callback>
void notify(const char* what, const Callback& cb, std::error_code ec) {
    if (!cb) {
        return;
    }
    try {
        cb(ec);
    } catch (const std::exception& e) {
        spdlog::error("{} handler threw: {}", what, e.what());
    }
}

}  // namespace

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::idle:       return "idle";
    case SessionState::connecting: return "connecting";
    case SessionState::connected:  return "connected";
    case SessionState::closed:     return "closed";
    }
    return "unknown";
}

const char* to_string(SendStatus status) {
    switch (status) {
    case SendStatus::ok:            return "ok";
    case SendStatus::not_connected: return "not connected";
    case SendStatus::failed:        return "failed";
    }
    return "unknown";
}

Session::Session(SessionConfig config)
    : config_(std::move(config)),
      codec_(config_.payload_format, config_.max_frame_bytes),
      discovery_(config_.payload_format),
      work_(asio::make_work_guard(io_)),
      acceptor_(io_),
      socket_(io_),
      resolver_(io_) {
    worker_ = std::thread([this] { io_.run(); });
}

Session::~Session() {
    disconnect();
    work_.reset();
    io_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}

// ── Consumer-facing API ─────────────────────────────────────────────────────

void Session::connect(ConnectCallback on_result) {
    SessionState current = state_.load();
    do {
        if (current == SessionState::connecting || current == SessionState::connected) {
            spdlog::debug("connect() ignored, session is already {}", to_string(current));
            return;
        }
    } while (!state_.compare_exchange_weak(current, SessionState::connecting));

    // Bump the attempt before clearing the stop flag so that leftover handlers
    // of the previous attempt can never pass the stale() check.
    const std::uint64_t attempt = ++attempt_;
    stop_requested_ = false;

    asio::post(io_, [this, attempt, cb = std::move(on_result)]() mutable {
        if (config_.role == Role::listener) {
            start_listening(attempt, std::move(cb));
        } else {
            start_dialing(attempt, std::move(cb));
        }
    });
}

void Session::disconnect() {
    stop_requested_ = true;

    if (io_.get_executor().running_in_this_thread()) {
        close_transport();
        return;
    }

    std::promise<void> finished;
    auto teardown = finished.get_future();
    asio::post(io_, [this, &finished] {
        close_transport();
        finished.set_value();
    });
    teardown.wait();
}

SendStatus Session::send(const nlohmann::json& data) {
    if (!is_connected()) {
        spdlog::warn("Connection not established, cannot send data");
        return SendStatus::not_connected;
    }

    std::shared_ptr<FrameCodec::Bytes> frame;
    try {
        frame = std::make_shared<FrameCodec::Bytes>(codec_.encode(data));
    } catch (const FrameError& e) {
        spdlog::warn("Failed to send data: {}", e.what());
        return SendStatus::failed;
    }

    if (io_.get_executor().running_in_this_thread()) {
        // Called from a session callback: waiting here would stall the thread
        // that performs the write.
        queue_write(std::move(frame), nullptr);
        return SendStatus::ok;
    }

    auto done = std::make_shared<std::promise<SendStatus>>();
    auto result = done->get_future();
    asio::post(io_, [this, frame = std::move(frame), done]() mutable {
        queue_write(std::move(frame), std::move(done));
    });
    return result.get();
}

std::optional<nlohmann::json> Session::recv() {
    return inbound_.try_pop();
}

std::optional<nlohmann::json> Session::recv_for(std::chrono::milliseconds timeout) {
    return inbound_.pop_for(timeout);
}

void Session::set_on_closed(CloseCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_closed_ = std::move(cb);
}

std::optional<asio::ip::tcp::endpoint> Session::remote_endpoint() const {
    std::lock_guard<std::mutex> lock(peer_mutex_);
    return peer_;
}

bool Session::broadcast(const nlohmann::json& data, std::uint16_t port) const {
    return discovery_.broadcast(data, port);
}

std::optional<Announcement> Session::receive_broadcast(std::uint16_t port) const {
    return discovery_.receive_broadcast(port);
}

// ── Establishment ───────────────────────────────────────────────────────────

bool Session::stale(std::uint64_t attempt) const {
    if (stop_requested_ || attempt != attempt_) {
        return true;
    }
    const SessionState current = state_.load();
    return current != SessionState::connecting && current != SessionState::connected;
}

std::string Session::target_host() const {
    if (!config_.host.empty()) {
        return config_.host;
    }
    std::error_code ec;
    std::string name = asio::ip::host_name(ec);
    if (ec) {
        spdlog::warn("Cannot read the local host name ({}), using localhost", ec.message());
        return "localhost";
    }
    return name;
}

void Session::start_listening(std::uint64_t attempt, ConnectCallback on_result) {
    if (stale(attempt)) {
        return;
    }

    const std::string host = target_host();
    std::error_code ec;
    const auto results = resolver_.resolve(asio::ip::tcp::v4(), host,
                                           std::to_string(config_.port), ec);

    asio::ip::tcp::endpoint endpoint;
    if (!ec) {
        endpoint = results.begin()->endpoint();
        acceptor_.open(endpoint.protocol(), ec);
    }
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(config_.backlog, ec);
    if (ec) {
        spdlog::warn("Cannot listen on {}:{}: {}", host, config_.port, ec.message());
        fail_attempt(std::move(on_result), ec);
        return;
    }

    std::error_code ignored;
    listening_port_ = acceptor_.local_endpoint(ignored).port();
    spdlog::info("Waiting for a peer on {}:{}",
                 endpoint.address().to_string(), listening_port_.load());

    acceptor_.async_accept(socket_,
        [this, attempt, cb = std::move(on_result)](std::error_code error) mutable {
            on_established(attempt, std::move(cb), error);
        });
}

void Session::start_dialing(std::uint64_t attempt, ConnectCallback on_result) {
    if (stale(attempt)) {
        return;
    }

    const std::string host = target_host();
    spdlog::info("Connecting to {}:{}", host, config_.port);

    resolver_.async_resolve(asio::ip::tcp::v4(), host, std::to_string(config_.port),
        [this, attempt, host, cb = std::move(on_result)](
            std::error_code ec, asio::ip::tcp::resolver::results_type results) mutable {
            if (stale(attempt)) {
                return;
            }
            if (ec) {
                spdlog::warn("Cannot resolve {}: {}", host, ec.message());
                fail_attempt(std::move(cb), ec);
                return;
            }
            asio::async_connect(socket_, results,
                [this, attempt, cb = std::move(cb)](
                    std::error_code error, const asio::ip::tcp::endpoint&) mutable {
                    on_established(attempt, std::move(cb), error);
                });
        });
}

void Session::on_established(std::uint64_t attempt, ConnectCallback on_result,
                             std::error_code ec) {
    if (stale(attempt)) {
        spdlog::debug("Connection attempt abandoned");
        return;
    }

    std::error_code ignored;
    acceptor_.close(ignored);
    listening_port_ = 0;

    if (ec) {
        spdlog::warn("Connection failed: {}", ec.message());
        fail_attempt(std::move(on_result), ec);
        return;
    }

    if (config_.tcp_no_delay) {
        socket_.set_option(asio::ip::tcp::no_delay(true), ignored);
    }
    const auto peer = socket_.remote_endpoint(ignored);
    {
        std::lock_guard<std::mutex> lock(peer_mutex_);
        peer_ = peer;
    }

    state_ = SessionState::connected;
    spdlog::info("Connected to peer {}:{}", peer.address().to_string(), peer.port());
    notify("connect", on_result, std::error_code{});

    // The callback may have disconnected us.
    if (stale(attempt)) {
        return;
    }
    read_header(attempt);
}

void Session::fail_attempt(ConnectCallback on_result, std::error_code ec) {
    close_transport();
    notify("connect", on_result, ec);
}

// ── Receive loop ────────────────────────────────────────────────────────────

void Session::read_header(std::uint64_t attempt) {
    asio::async_read(socket_, asio::buffer(header_),
        [this, attempt](std::error_code ec, std::size_t) {
            if (stale(attempt)) {
                return;
            }
            if (ec) {
                end_receive_loop(ec);
                return;
            }
            try {
                payload_.resize(codec_.payload_length(header_));
            } catch (const FrameError& e) {
                spdlog::warn("Failed to receive data: {}", e.what());
                end_receive_loop(e.code());
                return;
            }
            read_payload(attempt);
        });
}

void Session::read_payload(std::uint64_t attempt) {
    asio::async_read(socket_, asio::buffer(payload_),
        [this, attempt](std::error_code ec, std::size_t) {
            if (stale(attempt)) {
                return;
            }
            if (ec) {
                end_receive_loop(ec);
                return;
            }
            try {
                inbound_.push(codec_.decode(header_, payload_));
            } catch (const FrameError& e) {
                spdlog::warn("Failed to receive data: {}", e.what());
                end_receive_loop(e.code());
                return;
            }
            read_header(attempt);
        });
}

void Session::end_receive_loop(std::error_code ec) {
    if (ec == asio::error::eof) {
        spdlog::info("Peer closed the connection");
    } else {
        spdlog::warn("Connection lost: {}", ec.message());
    }
    close_transport();

    CloseCallback handler;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        handler = on_closed_;
    }
    notify("close", handler, ec);
}

// Runs on every exit path: failed attempt, receive loop end, disconnect().
void Session::close_transport() {
    std::error_code ignored;
    resolver_.cancel();
    if (acceptor_.is_open()) {
        acceptor_.close(ignored);
    }
    if (socket_.is_open()) {
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }
    listening_port_ = 0;
    {
        std::lock_guard<std::mutex> lock(peer_mutex_);
        peer_.reset();
    }

    for (auto& write : writes_) {
        if (write.done) {
            write.done->set_value(SendStatus::not_connected);
        }
    }
    writes_.clear();

    const SessionState current = state_.load();
    if (current == SessionState::connecting || current == SessionState::connected) {
        state_ = SessionState::closed;
        spdlog::debug("Session closed");
    }
}

// ── Send path ───────────────────────────────────────────────────────────────

void Session::queue_write(std::shared_ptr<FrameCodec::Bytes> frame,
                          std::shared_ptr<std::promise<SendStatus>> done) {
    if (state_ != SessionState::connected || !socket_.is_open()) {
        spdlog::warn("Connection not established, cannot send data");
        if (done) {
            done->set_value(SendStatus::not_connected);
        }
        return;
    }
    const bool idle = writes_.empty();
    writes_.push_back(PendingWrite{std::move(frame), std::move(done)});
    if (idle) {
        write_next(attempt_);
    }
}

void Session::write_next(std::uint64_t attempt) {
    auto frame = writes_.front().frame;
    asio::async_write(socket_, asio::buffer(*frame),
        [this, attempt, frame](std::error_code ec, std::size_t) {
            // close_transport() already answered every queued write.
            if (attempt != attempt_ || writes_.empty()) {
                return;
            }
            auto done = std::move(writes_.front().done);
            writes_.pop_front();
            if (ec) {
                spdlog::warn("Failed to send data: {}", ec.message());
            }
            if (done) {
                done->set_value(ec ? SendStatus::failed : SendStatus::ok);
            }
            if (!writes_.empty()) {
                write_next(attempt);
            }
        });
}
