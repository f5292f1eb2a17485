#include "mcpwire/dispatch/message_dispatcher.hpp"
#include "mcpwire/log/logger.hpp"

#include <exception>
#include <future>
#include <type_traits>
#include <variant>

namespace mcpwire {

namespace {

constexpr std::string_view kLog = "dispatch";

// Slack over the call timeout before call() stops relying on the sweeper.
constexpr std::chrono::milliseconds kSweepGrace{250};

CallFuture ready_future(CallError error) {
    std::promise<CallResult<Json>> promise;
    promise.set_value(tl::unexpected(std::move(error)));
    return promise.get_future();
}

std::optional<CallError> check_params(const std::optional<Json>& params) {
    const bool structured = (params.has_value() == false) || params->is_object() || params->is_array();
    if (structured == false) {
        return CallError::encode("params must be an object or an array");
    }
    return std::nullopt;
}

}  // namespace

MessageDispatcher::MessageDispatcher(TransportRouter& router)
    : router_(router) {
    for (auto* connection : router_.connections()) {
        const TransportKind source = connection->transport_kind();
        connection->set_inbound_handler([this, source](const Message& message) {
            on_inbound(source, message);
        });
    }
}

MessageDispatcher::~MessageDispatcher() {
    for (auto* connection : router_.connections()) {
        connection->set_inbound_handler(nullptr);
    }
}

RequestId MessageDispatcher::next_id() {
    return RequestId::integer(next_id_.fetch_add(1));
}

// ─────────────────────────────────────────────────────────────────────────────
// Outbound
// ─────────────────────────────────────────────────────────────────────────────

PendingCallHandle MessageDispatcher::async_call(CapabilityKind capability,
                                                std::string method,
                                                std::optional<Json> params,
                                                std::chrono::milliseconds timeout) {
    ConnectionManager& connection = router_.resolve(capability);
    PendingCallHandle handle{next_id(), connection.transport_kind(), {}};

    auto invalid = check_params(params);
    if (invalid.has_value()) {
        handle.future = ready_future(std::move(*invalid));
        return handle;
    }

    const auto deadline = CorrelationTable::Clock::now() + timeout;
    auto registered = connection.correlation().add(handle.id, method, deadline);
    if (registered.has_value() == false) {
        handle.future = ready_future(registered.error());
        return handle;
    }
    handle.future = std::move(*registered);

    get_logger().debug_fmt(kLog, "call {} (id {}) via {}", method, to_string(handle.id),
                           to_string(handle.transport));

    auto sent = connection.send(Request{handle.id, std::move(method), std::move(params)});
    if (sent.has_value() == false) {
        connection.correlation().complete(handle.id, tl::unexpected(sent.error()));
    }
    return handle;
}

CallResult<Json> MessageDispatcher::call(CapabilityKind capability,
                                         std::string method,
                                         std::optional<Json> params,
                                         std::chrono::milliseconds timeout) {
    auto handle = async_call(capability, std::move(method), std::move(params), timeout);

    // Normally the connection's sweeper fails the call at its deadline; this
    // covers a connection whose sweeper is not running.
    const auto status = handle.future.wait_for(timeout + kSweepGrace);
    if (status != std::future_status::ready) {
        router_.connection(handle.transport).correlation().complete(
            handle.id, tl::unexpected(CallError::timeout()));
    }
    return handle.future.get();
}

bool MessageDispatcher::cancel(const PendingCallHandle& handle) {
    return router_.connection(handle.transport).correlation().cancel(handle.id);
}

CallResult<void> MessageDispatcher::notify(CapabilityKind capability,
                                           std::string method,
                                           std::optional<Json> params) {
    auto invalid = check_params(params);
    if (invalid.has_value()) {
        return tl::unexpected(std::move(*invalid));
    }
    get_logger().trace_fmt(kLog, "notify {}", method);
    return router_.resolve(capability).send(Notification{std::move(method), std::move(params)});
}

std::size_t MessageDispatcher::pending_calls() {
    std::size_t total = 0;
    for (auto* connection : router_.connections()) {
        total += connection->correlation().size();
    }
    return total;
}

// ─────────────────────────────────────────────────────────────────────────────
// Inbound
// ─────────────────────────────────────────────────────────────────────────────

void MessageDispatcher::set_inbound_sink(InboundSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void MessageDispatcher::on_inbound(TransportKind source, const Message& message) {
    CorrelationTable& table = router_.connection(source).correlation();

    const bool matched = std::visit([&table](const auto& m) -> bool {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Response>) {
            return table.complete(m.id, CallResult<Json>(tl::in_place, m.result));
        } else if constexpr (std::is_same_v<T, ErrorResponse>) {
            if (m.id.has_value() == false) {
                return false;
            }
            return table.complete(*m.id, tl::unexpected(CallError::from_remote(m.error)));
        } else {
            return false;
        }
    }, message);

    if (matched == false) {
        to_sink(source, message);
    }
}

void MessageDispatcher::to_sink(TransportKind source, const Message& message) {
    InboundSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (sink == nullptr) {
        get_logger().debug_fmt(kLog, "no sink, dropping inbound {} from {}", message_kind(message), to_string(source));
        return;
    }

    try {
        sink(message, source);
    } catch (const std::exception& e) {
        get_logger().error_fmt(kLog, "inbound sink threw on {}: {}", message_kind(message), e.what());
    }
}

}  // namespace mcpwire
