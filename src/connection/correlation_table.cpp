#include "mcpwire/connection/correlation_table.hpp"
#include "mcpwire/log/logger.hpp"

#include <algorithm>
#include <vector>

namespace mcpwire {

namespace {

constexpr std::string_view kLog = "correlation";

}  // namespace

tl::expected<CallFuture, CallError> CorrelationTable::add(const RequestId& id,
                                                          std::string method,
                                                          Clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool duplicate = pending_.contains(id);
    if (duplicate) {
        return tl::unexpected(CallError::duplicate_id(id));
    }

    PendingCall call{id, std::move(method), deadline, {}};
    auto future = call.promise.get_future();
    pending_.emplace(id, std::move(call));
    return future;
}

std::optional<PendingCall> CorrelationTable::take(const RequestId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    PendingCall call = std::move(it->second);
    pending_.erase(it);
    return call;
}

bool CorrelationTable::complete(const RequestId& id, CallResult<Json> result) {
    auto call = take(id);
    if (call.has_value() == false) {
        get_logger().debug_fmt(kLog, "no pending call for id {}", to_string(id));
        return false;
    }
    call->promise.set_value(std::move(result));
    return true;
}

bool CorrelationTable::cancel(const RequestId& id) {
    auto call = take(id);
    if (call.has_value() == false) {
        return false;
    }
    get_logger().debug_fmt(kLog, "cancelled {} (id {})", call->method, to_string(id));
    call->promise.set_value(tl::unexpected(CallError::cancelled()));
    return true;
}

std::size_t CorrelationTable::expire(Clock::time_point now) {
    std::vector<PendingCall> overdue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline <= now) {
                overdue.push_back(std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& call : overdue) {
        get_logger().warn_fmt(kLog, "{} (id {}) timed out", call.method, to_string(call.id));
        call.promise.set_value(tl::unexpected(
            CallError::timeout("no reply to " + call.method + " before deadline")));
    }
    return overdue.size();
}

std::size_t CorrelationTable::fail_all(const CallError& error) {
    std::map<RequestId, PendingCall> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(pending_);
    }

    if (drained.empty() == false) {
        get_logger().info_fmt(kLog, "failing {} pending call(s): {}", drained.size(), error.message);
    }
    for (auto& [id, call] : drained) {
        call.promise.set_value(tl::unexpected(error));
    }
    return drained.size();
}

std::size_t CorrelationTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool CorrelationTable::contains(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.contains(id);
}

std::optional<CorrelationTable::Clock::time_point> CorrelationTable::next_deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }
    const auto earliest = std::min_element(pending_.begin(), pending_.end(),
        [](const auto& a, const auto& b) { return a.second.deadline < b.second.deadline; });
    return earliest->second.deadline;
}

}  // namespace mcpwire
