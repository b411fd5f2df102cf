#pragma once

#include <atomic>

/**
 * @brief Cooperative stop request for a running backtest.
 *
 * May be set from any thread; the runner checks it between bars.
 */
class CancellationToken {
   public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

   private:
    std::atomic<bool> cancelled_{false};
};
