#pragma once
#include "expire_time.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace tasks {

    /**
     * Cooperative cancellation signal. Long running work checks isCancelled() and sleeps through
     * stall(), which returns early once cancel() is called. Cancellation is one-way.
     */
    class CancelToken {
        mutable std::mutex _mutex;
        mutable std::condition_variable _wake;
        std::atomic_bool _cancelled{false};

    public:
        CancelToken() noexcept = default;
        CancelToken(const CancelToken &) = delete;
        CancelToken(CancelToken &&) = delete;
        CancelToken &operator=(const CancelToken &) = delete;
        CancelToken &operator=(CancelToken &&) = delete;
        ~CancelToken() noexcept = default;

        void cancel() noexcept;

        [[nodiscard]] bool isCancelled() const noexcept {
            return _cancelled.load();
        }

        // Wait until the expire time; returns false if cancelled first
        [[nodiscard]] bool stall(const ExpireTime &end) const noexcept;

        template<class Rep, class Period>
        [[nodiscard]] bool sleepFor(std::chrono::duration<Rep, Period> delta) const noexcept {
            return stall(ExpireTime::fromNow(delta));
        }
    };
} // namespace tasks
