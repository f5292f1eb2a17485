#pragma once

#include <string_view>

namespace mcpwire {

// ─────────────────────────────────────────────────────────────────────────────
// Connection State
// ─────────────────────────────────────────────────────────────────────────────
///
///   ┌──────────────┐  open ok   ┌──────────┐  fault   ┌──────────┐
///   │ Initializing │───────────▶│  Active  │─────────▶│ Degraded │
///   └──────┬───────┘            └──────────┘◀─────────└────┬─────┘
///          │ open failed              ▲        probe ok    │ probes failed
///          ▼                          │ open ok            ▼
///   ┌──────────────┐                  │             ┌──────────────┐
///   │    Failed    │◀─────────────────┼─────────────│ Reconnecting │
///   └──────────────┘   attempts       └─────────────└──────────────┘
///                      exhausted
///
/// Initializing goes straight to Reconnecting when the first open() fails and
/// reconnects are allowed. Every non-terminal state may go to Closed on
/// shutdown(). Closed and Failed are terminal.
///
enum class ConnectionState {
    Initializing,
    Active,
    Degraded,
    Reconnecting,
    Closed,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Initializing: return "Initializing";
        case ConnectionState::Active:       return "Active";
        case ConnectionState::Degraded:     return "Degraded";
        case ConnectionState::Reconnecting: return "Reconnecting";
        case ConnectionState::Closed:       return "Closed";
        case ConnectionState::Failed:       return "Failed";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool is_terminal(ConnectionState state) noexcept {
    return (state == ConnectionState::Closed) || (state == ConnectionState::Failed);
}

// Calls may be sent in these states.
[[nodiscard]] constexpr bool accepts_traffic(ConnectionState state) noexcept {
    return (state == ConnectionState::Active) || (state == ConnectionState::Degraded);
}

[[nodiscard]] constexpr bool is_valid_transition(ConnectionState from, ConnectionState to) noexcept {
    if (is_terminal(from)) {
        return false;
    }
    if (to == ConnectionState::Closed) {
        return true;
    }
    switch (from) {
        case ConnectionState::Initializing:
            return (to == ConnectionState::Active) ||
                   (to == ConnectionState::Reconnecting) ||
                   (to == ConnectionState::Failed);
        case ConnectionState::Active:
            return to == ConnectionState::Degraded;
        case ConnectionState::Degraded:
            return (to == ConnectionState::Active) || (to == ConnectionState::Reconnecting);
        case ConnectionState::Reconnecting:
            return (to == ConnectionState::Active) || (to == ConnectionState::Failed);
        case ConnectionState::Closed:
        case ConnectionState::Failed:
            break;
    }
    return false;
}

}  // namespace mcpwire
