#pragma once

#include <atomic>

namespace mx {

/**
 * @brief Cooperative stop signal shared by every upload worker
 *
 * Tripped from a signal handler; workers and in-flight HTTP transfers
 * poll it. Once cancelled it stays cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace mx
