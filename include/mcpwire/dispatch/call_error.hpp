#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Call Error
// ═══════════════════════════════════════════════════════════════════════════
// How an outbound call can end without a result. Shared by the correlation
// table (which resolves pending calls) and the dispatcher (which hands them
// to callers).

#include "mcpwire/protocol/message.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpwire {

enum class CallErrorCode {
    NotConnected,        ///< Connection not Active or Degraded when the call was sent
    Transport,           ///< Transport rejected the outbound message
    Timeout,             ///< No reply before the call's deadline
    ConnectionReset,     ///< Connection was re-established; the old exchange is gone
    ConnectionClosed,    ///< Connection shut down while the call was pending
    ReconnectExhausted,  ///< Reconnect attempts ran out
    Cancelled,           ///< Caller cancelled the call
    Remote,              ///< Peer answered with an error object
    DuplicateId,         ///< Id already in flight on this connection
    Encode               ///< Message could not be encoded
};

[[nodiscard]] constexpr std::string_view to_string(CallErrorCode code) noexcept {
    switch (code) {
        case CallErrorCode::NotConnected:       return "NotConnected";
        case CallErrorCode::Transport:          return "Transport";
        case CallErrorCode::Timeout:            return "Timeout";
        case CallErrorCode::ConnectionReset:    return "ConnectionReset";
        case CallErrorCode::ConnectionClosed:   return "ConnectionClosed";
        case CallErrorCode::ReconnectExhausted: return "ReconnectExhausted";
        case CallErrorCode::Cancelled:          return "Cancelled";
        case CallErrorCode::Remote:             return "Remote";
        case CallErrorCode::DuplicateId:        return "DuplicateId";
        case CallErrorCode::Encode:             return "Encode";
    }
    return "Unknown";
}

struct CallError {
    CallErrorCode code{CallErrorCode::Transport};
    std::string message;
    std::optional<ErrorObject> remote;  ///< Set when code == Remote

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static CallError not_connected(std::string msg = "connection is not active") {
        return {CallErrorCode::NotConnected, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static CallError transport(std::string msg) {
        return {CallErrorCode::Transport, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static CallError timeout(std::string msg = "no reply before deadline") {
        return {CallErrorCode::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static CallError connection_reset() {
        return {CallErrorCode::ConnectionReset, "connection was re-established", std::nullopt};
    }

    [[nodiscard]] static CallError connection_closed() {
        return {CallErrorCode::ConnectionClosed, "connection closed", std::nullopt};
    }

    [[nodiscard]] static CallError reconnect_exhausted(std::string msg = "reconnect attempts exhausted") {
        return {CallErrorCode::ReconnectExhausted, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static CallError cancelled() {
        return {CallErrorCode::Cancelled, "call cancelled", std::nullopt};
    }

    [[nodiscard]] static CallError from_remote(ErrorObject error) {
        std::string msg = error.message;
        return {CallErrorCode::Remote, std::move(msg), std::move(error)};
    }

    [[nodiscard]] static CallError duplicate_id(const RequestId& id) {
        return {CallErrorCode::DuplicateId, "id " + to_string(id) + " is already pending", std::nullopt};
    }

    [[nodiscard]] static CallError encode(std::string msg) {
        return {CallErrorCode::Encode, std::move(msg), std::nullopt};
    }
};

template <typename T>
using CallResult = tl::expected<T, CallError>;

}  // namespace mcpwire
