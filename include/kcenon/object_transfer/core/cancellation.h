/**
 * @file cancellation.h
 * @brief Cooperative cancellation for batch execution
 */

#ifndef KCENON_OBJECT_TRANSFER_CORE_CANCELLATION_H
#define KCENON_OBJECT_TRANSFER_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace kcenon::object_transfer {

namespace detail {

struct cancellation_state {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
};

}  // namespace detail

/**
 * @brief Read side of a cancellation flag
 *
 * Tokens are cheap to copy and share one state with their source. A
 * default-constructed token can never be cancelled.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_ && state_->cancelled.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for the given duration or until cancelled
     * @return true if cancellation was requested
     */
    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> duration) const -> bool {
        if (!state_) {
            std::this_thread::sleep_for(duration);
            return false;
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, duration, [this] {
            return state_->cancelled.load(std::memory_order_acquire);
        });
    }

private:
    friend class cancellation_source;

    explicit cancellation_token(std::shared_ptr<detail::cancellation_state> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::cancellation_state> state_;
};

/**
 * @brief Write side of a cancellation flag
 */
class cancellation_source {
public:
    cancellation_source() : state_(std::make_shared<detail::cancellation_state>()) {}

    [[nodiscard]] auto token() const -> cancellation_token {
        return cancellation_token{state_};
    }

    /**
     * @brief Request cancellation and wake every waiter
     */
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true, std::memory_order_release);
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_->cancelled.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<detail::cancellation_state> state_;
};

}  // namespace kcenon::object_transfer

#endif  // KCENON_OBJECT_TRANSFER_CORE_CANCELLATION_H
