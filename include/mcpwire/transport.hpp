#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Interface
// ═══════════════════════════════════════════════════════════════════════════
// Every substrate (pipe, event stream, socket) implements ITransport. The
// payloads passing through it are already-encoded messages; each transport
// adds and strips its own framing.
//
//   mcpwire/transport/pipe_transport.hpp          subordinate process, NDJSON
//   mcpwire/transport/event_stream_transport.hpp  SSE inbound + HTTP POST outbound
//   mcpwire/transport/socket_transport.hpp        TCP, length-prefixed frames

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <tl/expected.hpp>

namespace mcpwire {

using HeaderMap = std::unordered_map<std::string, std::string>;

enum class TransportKind {
    Pipe,
    EventStream,
    Socket
};

[[nodiscard]] std::string_view to_string(TransportKind kind) noexcept;

// "pipe" / "stdio", "event_stream" / "sse", "socket" / "tcp"
[[nodiscard]] std::optional<TransportKind> parse_transport_kind(std::string_view text) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Transport Error
// ─────────────────────────────────────────────────────────────────────────────

struct TransportError {
    enum class Category {
        Network,   // I/O failure on the underlying channel
        Timeout,   // nothing arrived in time; the channel is still usable
        Protocol,  // framing violation or unexpected peer behaviour
        Closed     // channel is gone (EOF, peer exit, close() called)
    };

    Category category{Category::Network};
    std::string message;
    std::optional<int> status_code{};

    static TransportError network(std::string msg) {
        return {Category::Network, std::move(msg), std::nullopt};
    }
    static TransportError timeout(std::string msg) {
        return {Category::Timeout, std::move(msg), std::nullopt};
    }
    static TransportError protocol(std::string msg) {
        return {Category::Protocol, std::move(msg), std::nullopt};
    }
    static TransportError closed(std::string msg = "transport is closed") {
        return {Category::Closed, std::move(msg), std::nullopt};
    }
    static TransportError http_status(int status, std::string msg) {
        return {Category::Network, std::move(msg), status};
    }

    // A transient failure leaves the channel intact; receive() may be retried.
    [[nodiscard]] bool is_transient() const noexcept {
        return category == Category::Timeout;
    }
};

[[nodiscard]] std::string_view to_string(TransportError::Category category) noexcept;

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

// ─────────────────────────────────────────────────────────────────────────────
// ITransport
// ─────────────────────────────────────────────────────────────────────────────
// Threading contract (enforced by ConnectionManager, not by transports):
// - receive() has exactly one caller thread at a time
// - send() calls are serialized by the caller
// - probe() may run concurrently with receive()
// - close() may be called from any thread and must unblock receive()

class ITransport {
public:
    virtual ~ITransport() = default;

    [[nodiscard]] virtual TransportKind kind() const noexcept = 0;

    // Establish the channel. Calling open() after close() re-establishes it.
    [[nodiscard]] virtual TransportResult<void> open() = 0;

    // Send one encoded message.
    [[nodiscard]] virtual TransportResult<void> send(std::string_view payload) = 0;

    // Block until one complete message payload is available.
    [[nodiscard]] virtual TransportResult<std::string> receive() = 0;

    // Liveness check bounded by `deadline`.
    [[nodiscard]] virtual TransportResult<void> probe(std::chrono::milliseconds deadline) = 0;

    // Idempotent.
    virtual TransportResult<void> close() = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;

    // Credentials attached at the transport level on the next open(). Only the
    // socket and event-stream transports use it.
    virtual void set_auth_token(std::optional<std::string> token) {
        (void)token;
    }
};

}  // namespace mcpwire
