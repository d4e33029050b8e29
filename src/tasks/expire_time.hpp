#pragma once

#include <chrono>
#include <type_traits>

namespace tasks {

    // this class is used for timeouts, which depends on steady_clock rather than
    // epoch
    class ExpireTime {
    public:
        using Clock = std::chrono::steady_clock;
        using TimePoint = std::chrono::time_point<Clock>;
        using Milliseconds = std::chrono::milliseconds;

    private:
        TimePoint _steadyTime;
        auto static constexpr MAX{TimePoint::max()};

    public:
        explicit constexpr ExpireTime(TimePoint time) noexcept : _steadyTime{time} {
        }

        [[nodiscard]] constexpr TimePoint toTimePoint() const noexcept {
            return _steadyTime;
        }

        [[nodiscard]] constexpr bool isInfinite() const noexcept {
            return _steadyTime == MAX;
        }

        [[nodiscard]] static constexpr ExpireTime infinite() noexcept {
            return ExpireTime{MAX};
        }

        [[nodiscard]] static ExpireTime now() noexcept {
            return ExpireTime{Clock::now()};
        }

        // overflows saturate to infinite(), negative deltas mean now
        template<class Rep, class Period>
        [[nodiscard]] static ExpireTime fromNow(std::chrono::duration<Rep, Period> delta) noexcept {
            using SourceDuration = typename std::chrono::duration<Rep, Period>;
            auto start = Clock::now();
            if constexpr(std::is_signed_v<Rep>) {
                if(delta <= SourceDuration::zero()) {
                    return ExpireTime{start};
                }
            }
            if(std::chrono::duration<double, Period>(delta)
               >= std::chrono::duration<double, Clock::period>(MAX - start)) {
                return infinite();
            }
            auto converted = std::chrono::duration_cast<Clock::duration>(
                std::chrono::duration<double, Period>(delta));
            if(converted < Clock::duration::zero()) {
                return infinite();
            }
            return ExpireTime{start + converted};
        }

        [[nodiscard]] bool hasPassed() const noexcept {
            return Clock::now() >= _steadyTime;
        }

        template<class Duration = Milliseconds>
        [[nodiscard]] Duration remaining() const {
            if(isInfinite()) {
                return Duration::max();
            }
            auto delta = _steadyTime - Clock::now();
            if(delta < Clock::duration::zero()) {
                return Duration::zero();
            }
            return std::chrono::duration_cast<Duration>(delta);
        }

        [[nodiscard]] friend constexpr bool operator==(
            const ExpireTime &a, const ExpireTime &b) noexcept {
            return a._steadyTime == b._steadyTime;
        }

        [[nodiscard]] friend constexpr bool operator!=(
            const ExpireTime &a, const ExpireTime &b) noexcept {
            return !(a == b);
        }
    };
} // namespace tasks
