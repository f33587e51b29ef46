#include <vaultstream/core/connector/backoff_policy.hpp>
#include <algorithm>

namespace VaultStream {

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds initial, std::chrono::milliseconds max) noexcept
    : initial_(std::max(initial, std::chrono::milliseconds::zero())),
      max_(std::max(max, std::chrono::milliseconds::zero())) {
}

std::chrono::milliseconds BackoffPolicy::nextDelay(uint32_t attempt) const noexcept {
    if (initial_.count() == 0 || initial_ >= max_) {
        return std::min(initial_, max_);
    }

    // Double until the ceiling is reached; at most ~63 iterations for any attempt
    auto delay = initial_;
    for (uint32_t i = 0; i < attempt; ++i) {
        if (delay.count() > max_.count() / 2) {
            return max_;
        }
        delay *= 2;
    }
    return std::min(delay, max_);
}

} // namespace VaultStream
