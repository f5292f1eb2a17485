#pragma once

#include "mcpwire/transport.hpp"

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpwire {

// ═══════════════════════════════════════════════════════════════════════════
// Framing
// ═══════════════════════════════════════════════════════════════════════════
//
//   +----------------+--------+---------------------+
//   | length (u32 BE)|  type  | payload (length - 1)|
//   +----------------+--------+---------------------+
//
// The length covers the type byte and the payload.

enum class FrameType : std::uint8_t {
    Data  = 0x01,
    Close = 0x08,
    Ping  = 0x09,
    Pong  = 0x0A,
    Auth  = 0x0B
};

[[nodiscard]] std::string_view to_string(FrameType type) noexcept;

struct Frame {
    FrameType type{FrameType::Data};
    std::string payload;
};

constexpr std::size_t kFrameHeaderSize = 5;
constexpr std::size_t kDefaultMaxFrameSize = 4 * 1024 * 1024;

[[nodiscard]] std::string encode_frame(FrameType type, std::string_view payload = {});

// Reassembles frames from arbitrarily split reads.
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_frame_size = kDefaultMaxFrameSize)
        : max_frame_size_(max_frame_size) {}

    // Returns every frame completed by `bytes`. A zero length, an unknown type
    // or a payload over max_frame_size is a Protocol error; the stream cannot
    // be resynchronized afterwards.
    [[nodiscard]] TransportResult<std::vector<Frame>> feed(std::string_view bytes);

    void reset() { buffer_.clear(); }

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

private:
    std::size_t max_frame_size_;
    std::string buffer_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Socket Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════

enum class SocketMode {
    Connect,  // dial host:port
    Listen    // bind host:port and accept exactly one peer
};

struct SocketTransportConfig {
    std::string host{"127.0.0.1"};
    std::uint16_t port{0};  // Listen mode: 0 picks an ephemeral port
    SocketMode mode{SocketMode::Connect};

    std::chrono::milliseconds connect_timeout{10000};  // also bounds accept(); 0 = no limit
    std::chrono::milliseconds read_timeout{0};         // receive(); 0 = wait indefinitely
    std::chrono::milliseconds write_timeout{10000};    // one frame; 0 = no limit
    std::size_t max_frame_size{kDefaultMaxFrameSize};
};

// ═══════════════════════════════════════════════════════════════════════════
// Socket Transport
// ═══════════════════════════════════════════════════════════════════════════
// Synchronous asio TCP. Connect and accept are bounded by run_for() on a
// private io_context. The connected socket is non-blocking: reads and writes
// poll() the native handle, so close() (shutdown) ends a blocked receive() or
// send(), and every frame write has a deadline. A frame abandoned half-written
// shuts the connection down, as does a framing error on the inbound side.

class SocketTransport final : public ITransport {
public:
    explicit SocketTransport(SocketTransportConfig config);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;
    SocketTransport(SocketTransport&&) = delete;
    SocketTransport& operator=(SocketTransport&&) = delete;

    [[nodiscard]] TransportKind kind() const noexcept override { return TransportKind::Socket; }

    [[nodiscard]] TransportResult<void> open() override;
    [[nodiscard]] TransportResult<void> send(std::string_view payload) override;
    [[nodiscard]] TransportResult<std::string> receive() override;
    [[nodiscard]] TransportResult<void> probe(std::chrono::milliseconds deadline) override;
    TransportResult<void> close() override;
    [[nodiscard]] bool is_open() const noexcept override;

    void set_auth_token(std::optional<std::string> token) override;

    // Token from the peer's Auth frame, if one has arrived.
    [[nodiscard]] std::optional<std::string> peer_auth_token() const;

    // Bound port once a Listen-mode open() is waiting for or has accepted a
    // peer; 0 otherwise.
    [[nodiscard]] std::uint16_t local_port() const noexcept { return local_port_.load(); }

    [[nodiscard]] const SocketTransportConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] TransportResult<void> connect_peer();
    [[nodiscard]] TransportResult<void> accept_peer();
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    [[nodiscard]] TransportResult<void> write_frame(FrameType type, std::string_view payload, Deadline deadline);
    // Requires write_mutex_.
    [[nodiscard]] TransportResult<void> write_locked(FrameType type, std::string_view frame, Deadline deadline);
    [[nodiscard]] Deadline write_deadline() const;

    // Both require read_mutex_.
    [[nodiscard]] TransportResult<void> read_into_decoder(std::optional<std::chrono::milliseconds> timeout);
    // Returns a Data payload, or nullopt when the frame was handled in place.
    [[nodiscard]] TransportResult<std::optional<std::string>> handle_frame(Frame frame);

    SocketTransportConfig config_;

    asio::io_context io_context_;
    asio::ip::tcp::socket socket_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::atomic<std::uint16_t> local_port_{0};

    mutable std::mutex mutex_;
    bool open_{false};
    std::optional<std::string> auth_token_;
    std::optional<std::string> peer_auth_token_;

    // Timed so probe() gives up on a write stalled behind a full send buffer.
    std::timed_mutex write_mutex_;

    // Held by whoever is reading: receive(), or probe() when no receive() is.
    std::mutex read_mutex_;
    FrameDecoder decoder_;
    std::deque<Frame> ready_frames_;
    std::deque<std::string> stashed_data_;  // Data read by probe(), for receive()

    std::mutex pong_mutex_;
    std::condition_variable pong_cv_;
    std::uint64_t pongs_seen_{0};
};

}  // namespace mcpwire
