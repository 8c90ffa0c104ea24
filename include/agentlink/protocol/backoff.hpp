#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace agentlink::protocol {

/// Exponential reconnect backoff: min(base * 2^(attempt-1) + jitter, max).
struct BackoffPolicy {
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{16000};
    std::chrono::milliseconds max_jitter{500};
    int max_attempts = 5;

    /// Delay before retry `attempt` (1-based) with an explicit jitter.
    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt,
                                                      std::chrono::milliseconds jitter) const {
        const int exponent = std::clamp(attempt - 1, 0, 30);
        const int64_t scaled = base_delay.count() * (int64_t{1} << exponent);
        const int64_t capped = std::min(scaled, max_delay.count());
        return std::chrono::milliseconds(std::min(capped + jitter.count(), max_delay.count()));
    }

    /// Delay before retry `attempt` with jitter drawn uniformly from [0, max_jitter].
    template <typename Rng>
    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt, Rng &rng) const {
        std::uniform_int_distribution<int64_t> dist(0, std::max<int64_t>(0, max_jitter.count()));
        return delay_for(attempt, std::chrono::milliseconds(dist(rng)));
    }

    [[nodiscard]] bool exhausted(int attempt) const { return attempt > max_attempts; }
};

} // namespace agentlink::protocol
