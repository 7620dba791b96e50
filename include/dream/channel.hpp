#ifndef AMT_DREAM_CHANNEL_HPP
#define AMT_DREAM_CHANNEL_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <utility>
#include "process.hpp"
#include "waiter.hpp"

namespace dream {

    // INFO: Unbounded multi-producer FIFO. Sending never blocks; receiving
    // blocks the calling process until a value arrives, the timeout elapses,
    // or a linked exit is posted to the receiver (which then throws `Crash`).
    // There is no backpressure: a lagging receiver lets the queue grow.
    template <typename T>
    struct Channel {
        using size_type = std::size_t;
        using value_type = T;

        Channel() noexcept = default;
        Channel(Channel const&) noexcept = delete;
        Channel(Channel &&) noexcept = delete;
        Channel& operator=(Channel const&) noexcept = delete;
        Channel& operator=(Channel &&) noexcept = delete;
        ~Channel() = default;

        auto size() const -> size_type {
            return m_waiter.locked([this] { return m_queue.size(); });
        }

        auto empty() const -> bool {
            return size() == 0;
        }

        auto send(value_type const& val) -> void {
            m_waiter.notify_all([&] {
                m_queue.push_back(val);
            });
        }

        auto send(value_type&& val) -> void {
            m_waiter.notify_all([&] {
                m_queue.push_back(std::move(val));
            });
        }

        template <typename... Args>
        auto emplace(Args&&... args) -> void {
            m_waiter.notify_all([&] {
                m_queue.emplace_back(std::forward<Args>(args)...);
            });
        }

        auto try_receive() -> std::optional<value_type> {
            return m_waiter.locked([this] { return pop_front(); });
        }

        auto receive() -> value_type {
            auto& self = Process::current();
            while (true) {
                if (auto val = try_receive()) return std::move(*val);
                self->block_on(m_waiter, [this](auto&& interrupted) {
                    return m_waiter.wait([&] {
                        return !m_queue.empty() || interrupted();
                    });
                });
                self->check();
            }
        }

        auto receive_for(std::chrono::nanoseconds timeout) -> std::optional<value_type> {
            auto deadline = internal::deadline_after(timeout);
            if (!deadline) return receive();
            return receive_until(*deadline);
        }

        template <typename Clock, typename Duration>
        auto receive_until(std::chrono::time_point<Clock, Duration> const& deadline) -> std::optional<value_type> {
            auto& self = Process::current();
            while (true) {
                if (auto val = try_receive()) return val;
                auto ready = self->block_on(m_waiter, [&](auto&& interrupted) {
                    return m_waiter.wait_until(deadline, [&] {
                        return !m_queue.empty() || interrupted();
                    });
                });
                self->check();
                if (!ready) return std::nullopt;
            }
        }

    private:
        auto pop_front() -> std::optional<value_type> {
            if (m_queue.empty()) return std::nullopt;
            auto val = std::move(m_queue.front());
            m_queue.pop_front();
            return { std::move(val) };
        }

    private:
        std::deque<value_type> m_queue;
        internal::Waiter m_waiter;
    };

} // namespace dream

#endif // AMT_DREAM_CHANNEL_HPP
