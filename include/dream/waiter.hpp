#ifndef AMT_DREAM_WAITER_HPP
#define AMT_DREAM_WAITER_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace dream::internal {

    struct Waiter {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;

        void notify_all() const {
            std::lock_guard lock(mutex);
            cv.notify_all();
        }

        void notify_all(auto&& fn) const {
            std::lock_guard lock(mutex);
            fn();
            cv.notify_all();
        }

        // INFO: Runs `fn` while holding the lock so state read by the
        // predicate of a waiting thread is never observed half-written.
        template <typename Fn>
        auto locked(Fn&& fn) const -> decltype(auto) {
            std::lock_guard lock(mutex);
            return fn();
        }

        template <typename Fn>
        auto wait(Fn&& cond) const -> bool {
            std::unique_lock lock(mutex);
            cv.wait(lock, std::forward<Fn>(cond));
            return true;
        }

        // Returns the value of the predicate on exit; false means the wait timed out.
        template <typename Clock, typename Duration, typename Fn>
        auto wait_until(std::chrono::time_point<Clock, Duration> const& tp, Fn&& cond) const -> bool {
            std::unique_lock lock(mutex);
            return cv.wait_until(lock, tp, std::forward<Fn>(cond));
        }
    };

    // INFO: Deadline `timeout` from now on the steady clock, or `std::nullopt`
    // when the deadline is not representable. Callers treat that as an
    // unbounded wait instead of letting `now() + timeout` overflow.
    inline auto deadline_after(std::chrono::nanoseconds timeout) -> std::optional<std::chrono::steady_clock::time_point> {
        using clock = std::chrono::steady_clock;
        auto now = clock::now();
        if (timeout <= clock::duration::zero()) return now;
        if (timeout >= clock::time_point::max() - now) return std::nullopt;
        return now + std::chrono::duration_cast<clock::duration>(timeout);
    }

} // namespace dream::internal

#endif // AMT_DREAM_WAITER_HPP
