#ifndef MAUDEPP_BACKEND_BACKOFF_POLICY_HPP
#define MAUDEPP_BACKEND_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>

namespace maudepp {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy - delay between connection attempts
// ─────────────────────────────────────────────────────────────────────────────
// The host side of the bridge waits a fixed delay between accept attempts;
// the bridge side backs off exponentially while dialing the host.
//
//   for (std::size_t attempt = 0; attempt < retries; ++attempt) {
//       if (try_connect()) break;
//       std::this_thread::sleep_for(policy.next_delay(attempt));
//   }

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    // attempt: 0-indexed number of the attempt that just failed
    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;

    virtual void reset() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ConstantBackoff
// ─────────────────────────────────────────────────────────────────────────────

class ConstantBackoff : public IBackoffPolicy {
public:
    explicit ConstantBackoff(std::chrono::milliseconds delay)
        : delay_(delay) {}

    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return delay_;
    }

    void reset() override {}

private:
    std::chrono::milliseconds delay_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(base * multiplier^attempt, max), optionally scaled by a random
// factor in [1 - jitter, 1 + jitter].
//
// With the bridge defaults (100ms, x2, 2s cap, no jitter):
//   100ms, 200ms, 400ms, 800ms, 1600ms, 2000ms, 2000ms, ...

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff()
        : ExponentialBackoff(
              std::chrono::milliseconds{100},
              2.0,
              std::chrono::milliseconds{2'000},
              0.0
          ) {}

    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max,
        double jitter_factor
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(max)
        , jitter_factor_(jitter_factor)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double grown = static_cast<double>(base_.count()) *
                             std::pow(multiplier_, static_cast<double>(attempt));
        double delay_ms = std::min(grown, static_cast<double>(max_.count()));

        if (jitter_factor_ > 0.0) {
            std::uniform_real_distribution<double> dist(1.0 - jitter_factor_, 1.0 + jitter_factor_);
            delay_ms *= dist(rng_);
        }

        return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, delay_ms))};
    }

    void reset() override {}

private:
    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mt19937 rng_;
};

}  // namespace maudepp

#endif  // MAUDEPP_BACKEND_BACKOFF_POLICY_HPP
