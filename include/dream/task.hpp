#ifndef AMT_DREAM_TASK_HPP
#define AMT_DREAM_TASK_HPP

#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include "error.hpp"
#include "log.hpp"
#include "process.hpp"

namespace dream {

    enum class Link: std::uint8_t {
        linked,
        unlinked
    };

    constexpr auto to_string(Link l) noexcept -> std::string_view {
        switch (l) {
            case Link::linked: return "linked";
            case Link::unlinked: return "unlinked";
        }
        return "unknown";
    }

    // INFO: Observes how a task ended. Receives `std::nullopt` on a normal
    // return and the exit reason otherwise. Runs on the task's own thread
    // after a linked exit has been posted to the spawner, so a spawner blocked
    // on the task's result sees the crash first.
    struct ExitHandler {
        ExitHandler() noexcept = default;
        ExitHandler(ExitHandler const&) = default;
        ExitHandler(ExitHandler &&) noexcept = default;
        ExitHandler& operator=(ExitHandler const&) = default;
        ExitHandler& operator=(ExitHandler &&) noexcept = default;
        ~ExitHandler() = default;

        template <typename Fn>
            requires (std::invocable<Fn, std::optional<ExitReason> const&> && !std::same_as<std::decay_t<Fn>, ExitHandler>)
        explicit ExitHandler(Fn&& fn)
            : m_handler(std::forward<Fn>(fn))
        {}

        explicit operator bool() const noexcept {
            return bool(m_handler);
        }

        auto operator()(std::optional<ExitReason> const& reason) const noexcept -> void {
            if (!m_handler) return;
            try {
                m_handler(reason);
            } catch (std::exception const& e) {
                log::error("exit handler threw: {}", e.what());
            }
        }

    private:
        std::function<void(std::optional<ExitReason> const&)> m_handler{nullptr};
    };

    // NOTE: The body is move-only, so callables capturing move-only state
    // (a `std::unique_ptr`, another `Dream`) can be spawned.
    struct Task {
        using fn_t = std::move_only_function<void()>;

        template <typename Fn>
            requires (std::invocable<Fn> && !std::same_as<std::decay_t<Fn>, Task>)
        explicit Task(Fn&& fn, Link link = Link::linked, std::string name = "task")
            : m_fn(std::forward<Fn>(fn))
            , m_link(link)
            , m_name(std::move(name))
        {}

        Task() noexcept = default;
        Task(Task const&) = delete;
        Task(Task &&) noexcept = default;
        Task& operator=(Task const&) = delete;
        Task& operator=(Task &&) noexcept = default;
        ~Task() = default;

        auto on_exit(ExitHandler handler) && -> Task {
            m_on_exit = std::move(handler);
            return std::move(*this);
        }

        auto link() const noexcept -> Link { return m_link; }
        auto name() const noexcept -> std::string const& { return m_name; }

        // Runs the body on the calling thread and reports how it ended.
        auto operator()() -> std::optional<ExitReason> {
            try {
                m_fn();
            } catch (...) {
                return ExitReason::from_current_exception();
            }
            return std::nullopt;
        }

        auto finish(std::optional<ExitReason> const& reason) const -> void {
            m_on_exit(reason);
        }

    private:
        fn_t m_fn;
        ExitHandler m_on_exit{};
        Link m_link{ Link::linked };
        std::string m_name{"task"};
    };

    // INFO: Starts `task` on a fresh thread inside a new process whose parent
    // is the calling process. The thread is detached: nothing joins it, the
    // only ways to observe it are channels, completion states and links.
    inline auto start(Task task) -> ProcessId {
        auto parent = Process::current();
        auto linked = task.link() == Link::linked;
        auto child = std::make_shared<Process>(task.name(), parent, linked);
        auto id = child->id();

        log::debug(
            "spawn {}<{}> ({}) from {}<{}>",
            child->name(), pid_to_int(id), to_string(task.link()),
            parent->name(), pid_to_int(parent->id())
        );

        auto thread = std::thread([child = std::move(child), task = std::move(task)]() mutable {
            Process::bind(child);
            auto reason = task();
            if (!reason) {
                log::trace("{}<{}> exited normally", child->name(), pid_to_int(child->id()));
                task.finish(reason);
                return;
            }
            if (child->is_linked()) {
                log::debug(
                    "{}<{}> crashed, propagating to {}<{}>: {}",
                    child->name(), pid_to_int(child->id()),
                    child->parent()->name(), pid_to_int(child->parent()->id()),
                    reason->description()
                );
                child->parent()->post_exit(*reason);
            } else {
                log::warn(
                    "unlinked {}<{}> crashed: {}",
                    child->name(), pid_to_int(child->id()), reason->description()
                );
            }
            task.finish(reason);
        });
        thread.detach();
        return id;
    }

} // namespace dream

#endif // AMT_DREAM_TASK_HPP
