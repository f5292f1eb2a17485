#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>

namespace mcpwire {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Delay before reconnect attempt `attempt` (0 = first attempt after the
// connection was lost). ConnectionManager calls reset() once a reconnect
// succeeds.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    [[nodiscard]] virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;
    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
//   delay(n) = min(base * multiplier^n + jitter, cap),  0 <= jitter <= factor * delay
//
// Jitter only ever lengthens a delay, and the result is never shorter than the
// previous one handed out since the last reset(), so a series of attempts
// waits monotonically longer up to the cap.

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(std::chrono::milliseconds{100}, 2.0, std::chrono::milliseconds{30'000}, 0.2) {}

    ExponentialBackoff(std::chrono::milliseconds base,
                       double multiplier,
                       std::chrono::milliseconds cap,
                       double jitter_factor)
        : base_(base)
        , multiplier_(std::max(1.0, multiplier))
        , cap_(std::max(base, cap))
        , jitter_factor_(std::max(0.0, jitter_factor))
        , rng_(std::random_device{}()) {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double base_ms = static_cast<double>(base_.count());
        const double cap_ms = static_cast<double>(cap_.count());
        const double grown_ms = std::min(base_ms * std::pow(multiplier_, static_cast<double>(attempt)), cap_ms);

        double delay_ms = grown_ms;
        const bool has_jitter = (jitter_factor_ > 0.0);
        if (has_jitter) {
            std::uniform_real_distribution<double> dist(0.0, jitter_factor_);
            delay_ms += grown_ms * dist(rng_);
        }
        delay_ms = std::min(delay_ms, cap_ms);

        auto delay = std::chrono::milliseconds{static_cast<std::int64_t>(delay_ms)};
        delay = std::max(delay, last_delay_);
        last_delay_ = delay;
        return delay;
    }

    void reset() override {
        last_delay_ = std::chrono::milliseconds{0};
    }

    [[nodiscard]] std::chrono::milliseconds base() const noexcept { return base_; }
    [[nodiscard]] std::chrono::milliseconds cap() const noexcept { return cap_; }

private:
    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds cap_;
    double jitter_factor_;
    std::chrono::milliseconds last_delay_{0};
    std::mt19937 rng_;
};

// Fixed delay.
class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay) : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override { return delay_; }
    void reset() override {}

private:
    std::chrono::milliseconds delay_;
};

// Zero delay, for tests.
class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }
    void reset() override {}
};

}  // namespace mcpwire
