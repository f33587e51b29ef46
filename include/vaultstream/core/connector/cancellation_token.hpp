#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace VaultStream {

/**
 * One per connector run. Owned by the run, shared read-only with every
 * session and the dispatcher; only the run calls requestStop().
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void requestStop();

    bool stopRequested() const noexcept {
        return stopped_.load(std::memory_order_acquire);
    }

    /**
     * @brief Interruptible sleep
     * @return true if stop was requested before the timeout elapsed
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> stopped_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace VaultStream
