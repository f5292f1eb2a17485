#pragma once

#include "mcpwire/dispatch/call_error.hpp"
#include "mcpwire/protocol/message.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace mcpwire {

// ═══════════════════════════════════════════════════════════════════════════
// Correlation Table
// ═══════════════════════════════════════════════════════════════════════════
// Outbound calls awaiting a reply on one connection, keyed by request id.
//
// Every way a call can end (reply, cancel, deadline, connection loss) goes
// through removing its entry under the lock; whoever removes the entry
// fulfils the promise, after the lock is released. An entry is therefore
// completed exactly once, and late replies for removed ids are simply not
// found.

using CallFuture = std::future<CallResult<Json>>;

struct PendingCall {
    RequestId id;
    std::string method;
    std::chrono::steady_clock::time_point deadline;
    std::promise<CallResult<Json>> promise;
};

class CorrelationTable {
public:
    using Clock = std::chrono::steady_clock;

    CorrelationTable() = default;
    CorrelationTable(const CorrelationTable&) = delete;
    CorrelationTable& operator=(const CorrelationTable&) = delete;

    // Fails with DuplicateId when `id` is already pending.
    [[nodiscard]] tl::expected<CallFuture, CallError> add(const RequestId& id,
                                                          std::string method,
                                                          Clock::time_point deadline);

    // False when the id is unknown (already completed, cancelled or expired).
    bool complete(const RequestId& id, CallResult<Json> result);

    bool cancel(const RequestId& id);

    // Fails every call whose deadline is at or before `now` with Timeout.
    std::size_t expire(Clock::time_point now);

    std::size_t fail_all(const CallError& error);

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(const RequestId& id) const;
    [[nodiscard]] std::optional<Clock::time_point> next_deadline() const;

private:
    [[nodiscard]] std::optional<PendingCall> take(const RequestId& id);

    mutable std::mutex mutex_;
    std::map<RequestId, PendingCall> pending_;
};

}  // namespace mcpwire
