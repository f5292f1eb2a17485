#pragma once

#include "mcpwire/config/transport_config.hpp"
#include "mcpwire/connection/correlation_table.hpp"
#include "mcpwire/dispatch/call_error.hpp"
#include "mcpwire/protocol/message.hpp"
#include "mcpwire/routing/transport_router.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace mcpwire {

// ═══════════════════════════════════════════════════════════════════════════
// Message Dispatcher
// ═══════════════════════════════════════════════════════════════════════════
// Request/response correlation on top of the router. Outbound calls get a
// fresh integer id and a correlation entry on the connection serving their
// capability; inbound replies complete those entries. Everything else that
// arrives (notifications, peer requests, replies nobody is waiting for) goes
// to the inbound sink. The dispatcher never interprets method names.

inline constexpr std::chrono::milliseconds kDefaultCallTimeout{30000};

struct PendingCallHandle {
    RequestId id;
    TransportKind transport{TransportKind::Pipe};
    CallFuture future;
};

using InboundSink = std::function<void(const Message& message, TransportKind source)>;

class MessageDispatcher {
public:
    /// Installs itself as the inbound handler of every connection in `router`.
    explicit MessageDispatcher(TransportRouter& router);
    ~MessageDispatcher();

    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    /// Sends a request and blocks until its reply, deadline, cancellation or
    /// connection loss.
    [[nodiscard]] CallResult<Json> call(CapabilityKind capability,
                                        std::string method,
                                        std::optional<Json> params = std::nullopt,
                                        std::chrono::milliseconds timeout = kDefaultCallTimeout);

    /// Sends a request and returns at once. A call that could not be sent
    /// comes back with its future already holding the error.
    [[nodiscard]] PendingCallHandle async_call(CapabilityKind capability,
                                               std::string method,
                                               std::optional<Json> params = std::nullopt,
                                               std::chrono::milliseconds timeout = kDefaultCallTimeout);

    /// Completes the call with Cancelled. Local only: the peer is not told and
    /// may still process the request. False if it had already completed.
    bool cancel(const PendingCallHandle& handle);

    [[nodiscard]] CallResult<void> notify(CapabilityKind capability,
                                          std::string method,
                                          std::optional<Json> params = std::nullopt);

    void set_inbound_sink(InboundSink sink);

    [[nodiscard]] std::size_t pending_calls();

private:
    void on_inbound(TransportKind source, const Message& message);
    void to_sink(TransportKind source, const Message& message);
    [[nodiscard]] RequestId next_id();

    TransportRouter& router_;
    std::atomic<std::int64_t> next_id_{1};

    std::mutex sink_mutex_;
    InboundSink sink_;
};

}  // namespace mcpwire
