#ifndef AMT_DREAM_DREAM_HPP
#define AMT_DREAM_DREAM_HPP

#include <chrono>
#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include "error.hpp"
#include "process.hpp"
#include "task.hpp"
#include "waiter.hpp"

namespace dream {

    template <typename T>
    struct Dream;

    template <typename Fn>
    auto make_dream(Fn&& fn, Link link, std::string name)
        -> Dream<std::invoke_result_t<Fn>>;

    // INFO: Handle to the completion state of one asynchronous task.
    // The first successful await moves the value out; any later await on the
    // same handle reports `AwaitError::Kind::consumed`.
    template <typename T>
    struct Dream {
        using value_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;
        using result_type = std::expected<T, AwaitError>;

        Dream(Dream const&) = delete;
        Dream(Dream &&) noexcept = default;
        Dream& operator=(Dream const&) = delete;
        Dream& operator=(Dream &&) noexcept = default;
        ~Dream() = default;

        auto is_ready() const -> bool {
            if (!m_data) return false;
            return m_data->waiter.locked([this] { return m_data->finished; });
        }

        auto try_await() -> result_type {
            return try_await_impl([this](auto&& interrupted) {
                return m_data->waiter.wait([&] {
                    return m_data->finished || interrupted();
                });
            });
        }

        auto try_await_with_timeout(std::chrono::nanoseconds timeout) -> result_type {
            auto bound = internal::deadline_after(timeout);
            if (!bound) return try_await();
            auto deadline = *bound;
            return try_await_impl([this, deadline](auto&& interrupted) {
                return m_data->waiter.wait_until(deadline, [&] {
                    return m_data->finished || interrupted();
                });
            });
        }

        auto await() -> T {
            return unwrap(try_await());
        }

        auto await_with_timeout(std::chrono::nanoseconds timeout) -> T {
            return unwrap(try_await_with_timeout(timeout));
        }

    private:
        template <typename Fn>
        friend auto make_dream(Fn&& fn, Link link, std::string name)
            -> Dream<std::invoke_result_t<Fn>>;

        struct Wrapper {
            internal::Waiter waiter{};
            std::optional<value_type> value;
            std::optional<ExitReason> exit;
            bool finished{false};
            bool consumed{false};

            auto notify_value(value_type val)
                noexcept (std::is_nothrow_move_constructible_v<value_type>)
            {
                waiter.notify_all([&] {
                    value = std::move(val);
                    finished = true;
                });
            }

            auto notify_exit(ExitReason reason) -> void {
                waiter.notify_all([&] {
                    exit = std::move(reason);
                    finished = true;
                });
            }
        };

        explicit Dream(std::shared_ptr<Wrapper> data) noexcept
            : m_data(std::move(data))
        {}

        template <typename WaitFn>
        auto try_await_impl(WaitFn&& wait_fn) -> result_type {
            if (!m_data) return std::unexpected(AwaitError::consumed());
            auto& self = Process::current();
            auto done = self->block_on(m_data->waiter, std::forward<WaitFn>(wait_fn));
            self->check();
            if (!done) return std::unexpected(AwaitError::timeout());
            return take();
        }

        auto take() -> result_type {
            std::lock_guard lock(m_data->waiter.mutex);
            if (m_data->consumed) return std::unexpected(AwaitError::consumed());
            m_data->consumed = true;
            if (m_data->exit) return std::unexpected(AwaitError::exit(*m_data->exit));
            if constexpr (std::is_void_v<T>) {
                return {};
            } else {
                auto val = std::move(*m_data->value);
                m_data->value.reset();
                return { std::move(val) };
            }
        }

        static auto unwrap(result_type res) -> T {
            if (!res) throw Crash(std::move(res.error()));
            if constexpr (std::is_void_v<T>) {
                return;
            } else {
                return std::move(*res);
            }
        }

    private:
        std::shared_ptr<Wrapper> m_data;
    };

    template <typename Fn>
    auto make_dream(Fn&& fn, Link link, std::string name)
        -> Dream<std::invoke_result_t<Fn>>
    {
        using ret_t = std::invoke_result_t<Fn>;
        using dream_t = Dream<ret_t>;
        auto data = std::make_shared<typename dream_t::Wrapper>();

        auto body = [data, fn = std::forward<Fn>(fn)]() mutable {
            if constexpr (std::is_void_v<ret_t>) {
                std::invoke(fn);
                data->notify_value(std::monostate{});
            } else {
                data->notify_value(std::invoke(fn));
            }
        };
        auto handler = ExitHandler([data](std::optional<ExitReason> const& reason) {
            if (reason) data->notify_exit(*reason);
        });

        start(Task(std::move(body), link, std::move(name)).on_exit(std::move(handler)));
        return dream_t(std::move(data));
    }

    // Fire-and-forget; a crash in `fn` crashes the calling process.
    // NOTE: The crash is delivered at the caller's next blocking call (a
    // receive, `next` or an await). A caller that never blocks again, such as
    // `main` returning right after spawning, never observes it.
    template <typename Fn>
        requires (std::invocable<Fn>)
    auto spawn(Fn&& fn, std::string name = "spawn") -> void {
        start(Task(std::forward<Fn>(fn), Link::linked, std::move(name)));
    }

    // Fire-and-forget; a crash in `fn` is logged and otherwise ignored.
    template <typename Fn>
        requires (std::invocable<Fn>)
    auto spawn_unlinked(Fn&& fn, std::string name = "spawn") -> void {
        start(Task(std::forward<Fn>(fn), Link::unlinked, std::move(name)));
    }

    // Joinable; a crash in `fn` crashes the calling process. Like `spawn`, the
    // crash surfaces at the caller's next blocking call, which is the await
    // when the caller goes straight to it.
    template <typename Fn>
        requires (std::invocable<Fn>)
    auto async(Fn&& fn, std::string name = "async") -> Dream<std::invoke_result_t<Fn>> {
        return make_dream(std::forward<Fn>(fn), Link::linked, std::move(name));
    }

    // The crash reason is only observable through the returned handle.
    template <typename Fn>
        requires (std::invocable<Fn>)
    auto async_unlinked(Fn&& fn, std::string name = "async") -> Dream<std::invoke_result_t<Fn>> {
        return make_dream(std::forward<Fn>(fn), Link::unlinked, std::move(name));
    }

} // namespace dream

#endif // AMT_DREAM_DREAM_HPP
