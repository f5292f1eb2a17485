#pragma once

#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace mcpwire {

// Produces the credential attached to the transport before each open().
// An error aborts that open() attempt like a transport failure would.
using AuthTokenProvider = std::function<tl::expected<std::string, std::string>()>;

struct ConnectionOptions {
    /// Idle interval between liveness probes while Active; 0 disables them.
    std::chrono::milliseconds heartbeat_interval{15000};
    /// Deadline handed to each probe.
    std::chrono::milliseconds heartbeat_timeout{5000};

    /// Probes tried in Degraded before the connection is declared dead.
    std::size_t confirmation_probes{2};
    std::chrono::milliseconds probe_interval{500};

    /// 0 means the first failure is final.
    std::size_t max_reconnect_attempts{5};
    std::chrono::milliseconds backoff_base{500};
    double backoff_multiplier{2.0};
    std::chrono::milliseconds backoff_cap{30000};
    double backoff_jitter{0.2};

    /// How often overdue calls are swept.
    std::chrono::milliseconds sweep_interval{25};

    ConnectionOptions& with_heartbeat(std::chrono::milliseconds interval, std::chrono::milliseconds timeout) {
        heartbeat_interval = interval;
        heartbeat_timeout = timeout;
        return *this;
    }

    ConnectionOptions& with_confirmation(std::size_t probes, std::chrono::milliseconds interval) {
        confirmation_probes = probes;
        probe_interval = interval;
        return *this;
    }

    ConnectionOptions& with_reconnect(std::size_t attempts,
                                      std::chrono::milliseconds base,
                                      std::chrono::milliseconds cap) {
        max_reconnect_attempts = attempts;
        backoff_base = base;
        backoff_cap = cap;
        return *this;
    }

    ConnectionOptions& with_backoff_jitter(double factor) {
        backoff_jitter = factor;
        return *this;
    }

    ConnectionOptions& with_sweep_interval(std::chrono::milliseconds interval) {
        sweep_interval = interval;
        return *this;
    }
};

}  // namespace mcpwire
