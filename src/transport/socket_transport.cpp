#include "mcpwire/transport/socket_transport.hpp"
#include "mcpwire/log/logger.hpp"

#include <asio/connect.hpp>
#include <asio/write.hpp>

#include <poll.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>

namespace mcpwire {

namespace {

constexpr std::string_view kLog = "socket";
constexpr std::size_t kReadChunkSize = 8192;
constexpr auto kCloseFrameTimeout = std::chrono::milliseconds(100);

bool is_known_frame_type(std::uint8_t value) {
    switch (static_cast<FrameType>(value)) {
        case FrameType::Data:
        case FrameType::Close:
        case FrameType::Ping:
        case FrameType::Pong:
        case FrameType::Auth:
            return true;
    }
    return false;
}

// Drives io_context until the pending operation (whose result lands in
// `result`) completes or `timeout` passes. On timeout `cancel` aborts the
// operation and its handler is drained so nothing outlives `result`.
template <typename Cancel>
bool run_with_timeout(asio::io_context& io_context,
                      const asio::error_code& result,
                      std::chrono::milliseconds timeout,
                      Cancel cancel) {
    io_context.restart();
    if (timeout.count() > 0) {
        io_context.run_for(timeout);
    } else {
        io_context.run();
    }

    const bool completed = (result != asio::error::would_block);
    if (completed == false) {
        cancel();
        io_context.restart();
        io_context.run();
    }
    return completed;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Framing
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(FrameType type) noexcept {
    switch (type) {
        case FrameType::Data:  return "data";
        case FrameType::Close: return "close";
        case FrameType::Ping:  return "ping";
        case FrameType::Pong:  return "pong";
        case FrameType::Auth:  return "auth";
    }
    return "unknown";
}

std::string encode_frame(FrameType type, std::string_view payload) {
    const auto length = static_cast<std::uint32_t>(payload.size() + 1);

    std::string frame;
    frame.reserve(kFrameHeaderSize + payload.size());
    frame.push_back(static_cast<char>((length >> 24) & 0xFF));
    frame.push_back(static_cast<char>((length >> 16) & 0xFF));
    frame.push_back(static_cast<char>((length >> 8) & 0xFF));
    frame.push_back(static_cast<char>(length & 0xFF));
    frame.push_back(static_cast<char>(type));
    frame.append(payload);
    return frame;
}

TransportResult<std::vector<Frame>> FrameDecoder::feed(std::string_view bytes) {
    buffer_.append(bytes);

    std::vector<Frame> frames;
    std::size_t pos = 0;
    while ((buffer_.size() - pos) >= 4) {
        const auto* header = reinterpret_cast<const unsigned char*>(buffer_.data() + pos);
        const std::uint32_t length = (static_cast<std::uint32_t>(header[0]) << 24) |
                                     (static_cast<std::uint32_t>(header[1]) << 16) |
                                     (static_cast<std::uint32_t>(header[2]) << 8) |
                                     static_cast<std::uint32_t>(header[3]);
        if (length == 0) {
            buffer_.clear();
            return tl::unexpected(TransportError::protocol("frame with zero length"));
        }
        if ((length - 1) > max_frame_size_) {
            buffer_.clear();
            return tl::unexpected(TransportError::protocol(
                "frame of " + std::to_string(length - 1) + " bytes exceeds limit of " +
                std::to_string(max_frame_size_)));
        }
        if ((buffer_.size() - pos - 4) < length) {
            break;
        }

        const auto type = static_cast<std::uint8_t>(buffer_[pos + 4]);
        if (is_known_frame_type(type) == false) {
            buffer_.clear();
            return tl::unexpected(TransportError::protocol(
                "unknown frame type " + std::to_string(type)));
        }

        frames.push_back(Frame{
            static_cast<FrameType>(type),
            buffer_.substr(pos + kFrameHeaderSize, length - 1)
        });
        pos += 4 + length;
    }

    buffer_.erase(0, pos);
    return frames;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SocketTransport::SocketTransport(SocketTransportConfig config)
    : config_(std::move(config))
    , socket_(io_context_)
    , decoder_(config_.max_frame_size) {}

SocketTransport::~SocketTransport() {
    (void)close();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> SocketTransport::open() {
    std::optional<std::string> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_) {
            return {};
        }
        token = auth_token_;
        peer_auth_token_.reset();
    }

    {
        std::lock_guard<std::mutex> lock(read_mutex_);
        decoder_.reset();
        ready_frames_.clear();
        stashed_data_.clear();
    }

    const bool listening = (config_.mode == SocketMode::Listen);
    auto established = listening ? accept_peer() : connect_peer();
    if (established.has_value() == false) {
        get_logger().warn_fmt(kLog, "open failed: {}", established.error().message);
        return established;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
    }

    if (token.has_value()) {
        auto sent = write_frame(FrameType::Auth, *token, write_deadline());
        if (sent.has_value() == false) {
            (void)close();
            return tl::unexpected(sent.error());
        }
    }

    get_logger().info_fmt(kLog, "{} {}:{}", listening ? "accepted peer on" : "connected to",
                          config_.host, listening ? local_port_.load() : config_.port);
    return {};
}

TransportResult<void> SocketTransport::connect_peer() {
    asio::error_code ec;
    asio::ip::tcp::resolver resolver(io_context_);
    const auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port), ec);
    if (ec) {
        return tl::unexpected(TransportError::network(
            "cannot resolve " + config_.host + ": " + ec.message()));
    }

    asio::error_code connect_result = asio::error::would_block;
    asio::async_connect(socket_, endpoints,
        [&connect_result](const asio::error_code& result, const asio::ip::tcp::endpoint&) {
            connect_result = result;
        });

    const bool completed = run_with_timeout(io_context_, connect_result, config_.connect_timeout,
        [this]() {
            asio::error_code ignored;
            socket_.close(ignored);
        });
    if (completed == false) {
        return tl::unexpected(TransportError::timeout(
            "connect to " + config_.host + ":" + std::to_string(config_.port) + " timed out"));
    }
    if (connect_result) {
        asio::error_code ignored;
        socket_.close(ignored);
        return tl::unexpected(TransportError::network(
            "connect to " + config_.host + ":" + std::to_string(config_.port) + " failed: " +
            connect_result.message()));
    }

    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    socket_.non_blocking(true, ec);
    if (ec) {
        socket_.close(ec);
        return tl::unexpected(TransportError::network("cannot make socket non-blocking"));
    }
    return {};
}

TransportResult<void> SocketTransport::accept_peer() {
    asio::error_code ec;
    const auto address = asio::ip::make_address(config_.host, ec);
    if (ec) {
        return tl::unexpected(TransportError::protocol("invalid listen address: " + config_.host));
    }
    const asio::ip::tcp::endpoint endpoint(address, config_.port);

    acceptor_ = std::make_unique<asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_->set_option(asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_->listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        acceptor_.reset();
        return tl::unexpected(TransportError::network(
            "cannot listen on " + config_.host + ":" + std::to_string(config_.port) + ": " +
            ec.message()));
    }

    const auto bound = acceptor_->local_endpoint(ec);
    local_port_.store(ec ? 0 : bound.port());
    get_logger().debug_fmt(kLog, "listening on {}:{}", config_.host, local_port_.load());

    asio::error_code accept_result = asio::error::would_block;
    acceptor_->async_accept(socket_, [&accept_result](const asio::error_code& result) {
        accept_result = result;
    });

    const bool completed = run_with_timeout(io_context_, accept_result, config_.connect_timeout,
        [this]() {
            asio::error_code ignored;
            acceptor_->close(ignored);
        });

    // Exactly one peer per open().
    acceptor_->close(ec);
    acceptor_.reset();

    if (completed == false) {
        local_port_.store(0);
        return tl::unexpected(TransportError::timeout("no peer connected before the accept timeout"));
    }
    if (accept_result) {
        local_port_.store(0);
        return tl::unexpected(TransportError::network("accept failed: " + accept_result.message()));
    }

    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    socket_.non_blocking(true, ec);
    if (ec) {
        socket_.close(ec);
        local_port_.store(0);
        return tl::unexpected(TransportError::network("cannot make socket non-blocking"));
    }
    return {};
}

TransportResult<void> SocketTransport::close() {
    // Ends a connect/accept another thread is blocked in.
    io_context_.stop();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (open_ == false) {
            return {};
        }
        open_ = false;
    }

    // One short attempt at a Close frame, skipped while another write holds
    // the socket: that writer may be stalled and the frame would interleave.
    {
        std::unique_lock<std::timed_mutex> write_lock(write_mutex_, std::try_to_lock);
        if (write_lock.owns_lock()) {
            const auto frame = encode_frame(FrameType::Close);
            auto goodbye = write_locked(FrameType::Close, frame,
                                        std::chrono::steady_clock::now() + kCloseFrameTimeout);
            if (goodbye.has_value() == false) {
                get_logger().debug_fmt(kLog, "close frame not delivered: {}", goodbye.error().message);
            }
        } else {
            MCPWIRE_LOG_DEBUG(kLog, "close frame skipped, a write is in progress");
        }
    }

    // Wakes a reader or writer parked in poll().
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    pong_cv_.notify_all();

    // Wait for both to leave the socket before the handle goes.
    std::lock_guard<std::mutex> read_lock(read_mutex_);
    std::lock_guard<std::timed_mutex> write_lock(write_mutex_);
    socket_.close(ec);
    decoder_.reset();
    ready_frames_.clear();
    local_port_.store(0);

    MCPWIRE_LOG_INFO(kLog, "closed");
    return {};
}

bool SocketTransport::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void SocketTransport::set_auth_token(std::optional<std::string> token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auth_token_ = std::move(token);
}

std::optional<std::string> SocketTransport::peer_auth_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_auth_token_;
}

// ─────────────────────────────────────────────────────────────────────────────
// I/O
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> SocketTransport::send(std::string_view payload) {
    const bool open = is_open();
    if (open == false) {
        return tl::unexpected(TransportError::closed());
    }
    if (payload.size() > config_.max_frame_size) {
        return tl::unexpected(TransportError::protocol(
            "payload of " + std::to_string(payload.size()) + " bytes exceeds frame limit of " +
            std::to_string(config_.max_frame_size)));
    }
    return write_frame(FrameType::Data, payload, write_deadline());
}

SocketTransport::Deadline SocketTransport::write_deadline() const {
    if (config_.write_timeout.count() <= 0) {
        return std::nullopt;
    }
    return std::chrono::steady_clock::now() + config_.write_timeout;
}

TransportResult<void> SocketTransport::write_frame(FrameType type, std::string_view payload, Deadline deadline) {
    const std::string frame = encode_frame(type, payload);

    std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
    if (deadline.has_value()) {
        if (lock.try_lock_until(*deadline) == false) {
            return tl::unexpected(TransportError::timeout(
                std::string(to_string(type)) + " frame waited too long behind another write"));
        }
    } else {
        lock.lock();
    }
    return write_locked(type, frame, deadline);
}

TransportResult<void> SocketTransport::write_locked(FrameType type, std::string_view frame, Deadline deadline) {
    const std::size_t frame_size = frame.size();
    std::string_view remaining = frame;

    while (remaining.empty() == false) {
        int timeout_ms = -1;
        if (deadline.has_value()) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now());
            timeout_ms = static_cast<int>(std::clamp<std::int64_t>(left.count(), 0, std::numeric_limits<int>::max()));
        }

        pollfd pfd{};
        pfd.fd = socket_.native_handle();
        pfd.events = POLLOUT;
        int ready = 0;
        do {
            ready = ::poll(&pfd, 1, timeout_ms);
        } while ((ready < 0) && (errno == EINTR));

        if (ready < 0) {
            return tl::unexpected(TransportError::network(std::string("poll failed: ") + std::strerror(errno)));
        }
        if (ready == 0) {
            if (remaining.size() == frame_size) {
                return tl::unexpected(TransportError::timeout(
                    std::string(to_string(type)) + " frame not accepted before its deadline"));
            }
            // The peer has part of a frame; nothing sent after it could be parsed.
            asio::error_code ignored;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            get_logger().error_fmt(kLog, "{} frame stalled after {} of {} bytes, connection abandoned",
                                   to_string(type), frame_size - remaining.size(), frame_size);
            return tl::unexpected(TransportError::closed("write stalled mid-frame"));
        }

        asio::error_code ec;
        const std::size_t n = socket_.write_some(asio::buffer(remaining.data(), remaining.size()), ec);
        if (ec == asio::error::would_block) {
            continue;
        }
        if (ec) {
            const bool peer_gone = (ec == asio::error::broken_pipe) ||
                                   (ec == asio::error::connection_reset) ||
                                   (ec == asio::error::bad_descriptor) ||
                                   (ec == asio::error::shut_down);
            if (peer_gone) {
                return tl::unexpected(TransportError::closed("write failed: " + ec.message()));
            }
            return tl::unexpected(TransportError::network("write failed: " + ec.message()));
        }
        remaining.remove_prefix(n);
    }

    get_logger().trace_fmt(kLog, "sent {} frame ({} bytes)", to_string(type), frame_size - kFrameHeaderSize);
    return {};
}

TransportResult<std::string> SocketTransport::receive() {
    std::lock_guard<std::mutex> lock(read_mutex_);
    const bool open = is_open();
    if (open == false) {
        return tl::unexpected(TransportError::closed());
    }

    const auto timeout = (config_.read_timeout.count() > 0)
        ? std::optional<std::chrono::milliseconds>(config_.read_timeout)
        : std::nullopt;

    while (true) {
        if (stashed_data_.empty() == false) {
            std::string payload = std::move(stashed_data_.front());
            stashed_data_.pop_front();
            return payload;
        }

        if (ready_frames_.empty() == false) {
            Frame frame = std::move(ready_frames_.front());
            ready_frames_.pop_front();
            auto handled = handle_frame(std::move(frame));
            if (handled.has_value() == false) {
                return tl::unexpected(handled.error());
            }
            if (handled->has_value()) {
                return std::move(**handled);
            }
            continue;
        }

        auto filled = read_into_decoder(timeout);
        if (filled.has_value() == false) {
            return tl::unexpected(filled.error());
        }
    }
}

TransportResult<void> SocketTransport::read_into_decoder(std::optional<std::chrono::milliseconds> timeout) {
    pollfd pfd{};
    pfd.fd = socket_.native_handle();
    pfd.events = POLLIN;
    const int timeout_ms = timeout.has_value()
        ? static_cast<int>(std::min<std::int64_t>(timeout->count(), std::numeric_limits<int>::max()))
        : -1;

    int ready = 0;
    do {
        ready = ::poll(&pfd, 1, timeout_ms);
    } while ((ready < 0) && (errno == EINTR));

    if (ready == 0) {
        return tl::unexpected(TransportError::timeout("no frame within read timeout"));
    }
    if (ready < 0) {
        return tl::unexpected(TransportError::network(std::string("poll failed: ") + std::strerror(errno)));
    }

    std::array<char, kReadChunkSize> buffer{};
    asio::error_code ec;
    const std::size_t n = socket_.read_some(asio::buffer(buffer), ec);
    if (ec == asio::error::would_block) {
        return {};
    }
    if (ec == asio::error::eof) {
        return tl::unexpected(TransportError::closed("peer closed the connection"));
    }
    if (ec) {
        const bool open = is_open();
        if (open == false) {
            return tl::unexpected(TransportError::closed());
        }
        return tl::unexpected(TransportError::network("read failed: " + ec.message()));
    }

    auto frames = decoder_.feed(std::string_view(buffer.data(), n));
    if (frames.has_value() == false) {
        // Frame boundaries are lost for good; the connection cannot continue.
        get_logger().error_fmt(kLog, "framing error: {}", frames.error().message);
        asio::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        return tl::unexpected(TransportError::closed("framing error: " + frames.error().message));
    }
    for (auto& frame : *frames) {
        ready_frames_.push_back(std::move(frame));
    }
    return {};
}

TransportResult<std::optional<std::string>> SocketTransport::handle_frame(Frame frame) {
    switch (frame.type) {
        case FrameType::Data:
            return std::optional<std::string>(std::move(frame.payload));

        case FrameType::Ping: {
            auto replied = write_frame(FrameType::Pong, frame.payload, write_deadline());
            if (replied.has_value() == false) {
                return tl::unexpected(replied.error());
            }
            return std::optional<std::string>{};
        }

        case FrameType::Pong: {
            {
                std::lock_guard<std::mutex> lock(pong_mutex_);
                ++pongs_seen_;
            }
            pong_cv_.notify_all();
            return std::optional<std::string>{};
        }

        case FrameType::Auth: {
            std::lock_guard<std::mutex> lock(mutex_);
            peer_auth_token_ = std::move(frame.payload);
            MCPWIRE_LOG_DEBUG(kLog, "peer authenticated");
            return std::optional<std::string>{};
        }

        case FrameType::Close:
            break;
    }
    return tl::unexpected(TransportError::closed("peer sent close frame"));
}

TransportResult<void> SocketTransport::probe(std::chrono::milliseconds deadline) {
    const bool open = is_open();
    if (open == false) {
        return tl::unexpected(TransportError::closed());
    }

    std::uint64_t pongs_before = 0;
    {
        std::lock_guard<std::mutex> lock(pong_mutex_);
        pongs_before = pongs_seen_;
    }

    const auto until = std::chrono::steady_clock::now() + deadline;
    const auto stalled = [&deadline]() {
        return TransportError::timeout(
            "no pong within " + std::to_string(deadline.count()) + "ms, socket stalled");
    };

    // A peer that stopped reading leaves the ping unsent; that is a stall too.
    auto sent = write_frame(FrameType::Ping, {}, until);
    if (sent.has_value() == false) {
        if (sent.error().is_transient()) {
            return tl::unexpected(stalled());
        }
        return sent;
    }
    const auto pong_arrived = [this, pongs_before]() {
        std::lock_guard<std::mutex> lock(pong_mutex_);
        return pongs_seen_ > pongs_before;
    };

    // With no receive() in progress nobody else will see the pong.
    std::unique_lock<std::mutex> reader(read_mutex_, std::try_to_lock);
    if (reader.owns_lock()) {
        while (pong_arrived() == false) {
            if (ready_frames_.empty() == false) {
                Frame frame = std::move(ready_frames_.front());
                ready_frames_.pop_front();
                if (frame.type == FrameType::Data) {
                    stashed_data_.push_back(std::move(frame.payload));
                    continue;
                }
                auto handled = handle_frame(std::move(frame));
                if (handled.has_value() == false) {
                    return tl::unexpected(handled.error());
                }
                continue;
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                until - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return tl::unexpected(stalled());
            }
            auto filled = read_into_decoder(remaining);
            if (filled.has_value() == false) {
                return filled.error().is_transient() ? tl::unexpected(stalled())
                                                     : tl::unexpected(filled.error());
            }
        }
        return {};
    }

    std::unique_lock<std::mutex> lock(pong_mutex_);
    const bool answered = pong_cv_.wait_until(lock, until, [this, pongs_before]() {
        return pongs_seen_ > pongs_before;
    });
    if (answered == false) {
        return tl::unexpected(stalled());
    }
    return {};
}

}  // namespace mcpwire
