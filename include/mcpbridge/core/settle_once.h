#pragma once

#include <mcpbridge/core/types.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mcpbridge::core {

/**
 * @brief Single-settlement slot for racing completion signals.
 *
 * Any number of producers may call settle(); exactly one of them wins and its
 * Result becomes the value observed by every waiter. Later calls are no-ops and
 * report false, so a producer can tell whether it decided the outcome.
 *
 * Thread-safe: Yes
 *
 * @example
 *   auto slot = std::make_shared<SettleOnce<int>>();
 *   timer.onFire([slot] { slot->settle(Error{ErrorCode::Timeout}, "timeout"); });
 *   worker.onDone([slot](int v) { slot->settle(v, "worker"); });
 *   auto r = slot->wait(); // whichever fired first
 */
template <typename T> class SettleOnce {
public:
    SettleOnce() : future_(promise_.get_future().share()) {}

    SettleOnce(const SettleOnce&) = delete;
    SettleOnce& operator=(const SettleOnce&) = delete;

    bool settle(Result<T> outcome, std::string_view source = {}) {
        bool expected = false;
        if (!settled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lk(sourceMutex_);
            source_ = std::string(source);
        }
        promise_.set_value(std::move(outcome));
        return true;
    }

    bool settled() const noexcept { return settled_.load(std::memory_order_acquire); }

    Result<T> wait() const { return future_.get(); }

    std::optional<Result<T>> waitFor(std::chrono::milliseconds timeout) const {
        if (future_.wait_for(timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return future_.get();
    }

    // Label passed by the winning settle() call; empty until settled.
    std::string source() const {
        std::lock_guard<std::mutex> lk(sourceMutex_);
        return source_;
    }

private:
    std::atomic<bool> settled_{false};
    std::promise<Result<T>> promise_;
    std::shared_future<Result<T>> future_;
    mutable std::mutex sourceMutex_;
    std::string source_;
};

} // namespace mcpbridge::core
