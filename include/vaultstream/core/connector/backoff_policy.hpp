#pragma once
#include <chrono>
#include <cstdint>

namespace VaultStream {

/**
 * @class BackoffPolicy
 * @brief Reconnection delay: min(initial * 2^attempt, max).
 *
 * Pure and deterministic, no jitter. Attempts past the point where the delay
 * reaches the ceiling saturate at max instead of overflowing.
 */
class BackoffPolicy {
public:
    BackoffPolicy(std::chrono::milliseconds initial, std::chrono::milliseconds max) noexcept;

    std::chrono::milliseconds nextDelay(uint32_t attempt) const noexcept;

    std::chrono::milliseconds initialDelay() const noexcept { return initial_; }
    std::chrono::milliseconds maxDelay() const noexcept { return max_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
};

} // namespace VaultStream
