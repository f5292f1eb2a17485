#pragma once

#include "mcpwire/connection/backoff_policy.hpp"
#include "mcpwire/connection/connection_options.hpp"
#include "mcpwire/connection/connection_state.hpp"
#include "mcpwire/connection/correlation_table.hpp"
#include "mcpwire/dispatch/call_error.hpp"
#include "mcpwire/protocol/message.hpp"
#include "mcpwire/transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpwire {

// ═══════════════════════════════════════════════════════════════════════════
// Connection Manager
// ═══════════════════════════════════════════════════════════════════════════
// Owns one transport and keeps it usable:
//
//   control thread  runs the state machine (open, heartbeat, confirmation
//                   probes, backoff and reopen)
//   reader thread   the only caller of transport->receive(); decodes and
//                   hands messages to the inbound handler
//   sweeper thread  fails overdue calls in correlation() every
//                   sweep_interval, whatever the state
//
// Faults observed by the reader, by send() or by a missed heartbeat are
// recorded and acted on by the control thread; nothing else changes state.
// Callbacks are invoked without the internal lock held, so they may call
// back into the manager.

class ConnectionManager {
public:
    using StateChangeCallback = std::function<void(ConnectionState old_state, ConnectionState new_state)>;
    using FailedCallback = std::function<void(const std::string& reason)>;
    using InboundHandler = std::function<void(const Message& message)>;

    ConnectionManager(std::unique_ptr<ITransport> transport,
                      ConnectionOptions options = {},
                      AuthTokenProvider auth = {});

    ConnectionManager(std::unique_ptr<ITransport> transport,
                      ConnectionOptions options,
                      AuthTokenProvider auth,
                      std::unique_ptr<IBackoffPolicy> backoff);

    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;
    ConnectionManager(ConnectionManager&&) = delete;
    ConnectionManager& operator=(ConnectionManager&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Begins Initializing on the control thread and returns immediately.
    /// Use wait_for_state() to block until Active (or Failed).
    void start();

    /// Enters Closed, closes the transport, joins every thread and fails
    /// pending calls with ConnectionClosed. Safe to call more than once.
    void shutdown();

    // ─────────────────────────────────────────────────────────────────────────
    // Traffic
    // ─────────────────────────────────────────────────────────────────────────

    /// Encodes and sends one message; sends are serialized. Fails with
    /// NotConnected outside Active/Degraded and with Transport when the
    /// transport rejects it (which also records a fault).
    [[nodiscard]] CallResult<void> send(const Message& message);

    /// Replaces the inbound handler. Once this returns the previous handler is
    /// neither running nor called again, so its owner may be destroyed. Called
    /// from inside a handler it does not wait, as that handler is still running.
    void set_inbound_handler(InboundHandler handler);

    [[nodiscard]] CorrelationTable& correlation() noexcept { return correlation_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Observation
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] TransportKind transport_kind() const noexcept { return transport_->kind(); }
    [[nodiscard]] std::size_t reconnect_attempts() const;

    /// Delays actually waited before reconnect attempts, oldest first.
    [[nodiscard]] std::vector<std::chrono::milliseconds> backoff_history() const;

    [[nodiscard]] std::string last_error() const;

    /// True when `target` is reached within `timeout`.
    [[nodiscard]] bool wait_for_state(ConnectionState target, std::chrono::milliseconds timeout) const;

    void on_state_change(StateChangeCallback callback);
    void on_failed(FailedCallback callback);

    [[nodiscard]] const ConnectionOptions& options() const noexcept { return options_; }

private:
    // Control thread
    void control_loop();
    void run_active();
    void run_degraded();
    void run_reconnecting();
    void enter_failed(const std::string& reason);
    [[nodiscard]] bool try_open();

    // Returns false if shutdown was requested before `delay` passed.
    [[nodiscard]] bool wait_unless_shutdown(std::chrono::milliseconds delay);

    bool transition_to(ConnectionState next);
    void report_fault(std::string reason);

    // Reader thread
    void start_reader();
    void stop_reader();
    void reader_loop();
    void deliver(const Message& message);

    // Sweeper thread
    void sweeper_loop();

    std::unique_ptr<ITransport> transport_;
    ConnectionOptions options_;
    AuthTokenProvider auth_;
    std::unique_ptr<IBackoffPolicy> backoff_;
    CorrelationTable correlation_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    ConnectionState state_{ConnectionState::Initializing};
    bool started_{false};
    bool shutdown_requested_{false};
    bool fault_pending_{false};
    std::string fault_reason_;
    std::string last_error_;
    std::size_t reconnect_attempts_{0};
    std::vector<std::chrono::milliseconds> backoff_history_;
    std::vector<StateChangeCallback> state_callbacks_;
    std::vector<FailedCallback> failed_callbacks_;
    InboundHandler inbound_handler_;
    std::size_t deliveries_in_flight_{0};
    std::condition_variable delivery_cv_;

    std::mutex send_mutex_;
    std::mutex shutdown_mutex_;

    std::thread control_thread_;
    std::thread reader_thread_;
    std::thread sweeper_thread_;
    std::atomic<bool> reader_stop_{false};
    std::atomic<bool> reader_running_{false};
};

}  // namespace mcpwire
