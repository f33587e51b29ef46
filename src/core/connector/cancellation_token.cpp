#include <vaultstream/core/connector/cancellation_token.hpp>

namespace VaultStream {

void CancellationToken::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        return stopped_.load(std::memory_order_acquire);
    });
}

} // namespace VaultStream
