#ifndef AMT_DREAM_PROCESS_HPP
#define AMT_DREAM_PROCESS_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include "error.hpp"
#include "log.hpp"
#include "waiter.hpp"

namespace dream {

    enum class ProcessId: std::uint64_t {};

    constexpr auto pid_to_int(ProcessId id) noexcept -> std::uint64_t {
        return static_cast<std::uint64_t>(id);
    }

    // INFO: Execution context of a single thread. Every spawned task runs in
    // its own process; any other thread gets one lazily on first use.
    // A linked child that exits abnormally posts its reason here. The owning
    // thread observes it at its next suspension point and throws `Crash`.
    struct Process {
        explicit Process(std::string name, std::shared_ptr<Process> parent = nullptr, bool linked = false)
            : m_id(next_id())
            , m_name(std::move(name))
            , m_parent(std::move(parent))
            , m_linked(linked && m_parent != nullptr)
        {}

        Process(Process const&) = delete;
        Process(Process &&) = delete;
        Process& operator=(Process const&) = delete;
        Process& operator=(Process &&) = delete;
        ~Process() = default;

        auto id() const noexcept -> ProcessId { return m_id; }
        auto name() const noexcept -> std::string const& { return m_name; }
        auto is_linked() const noexcept -> bool { return m_linked; }
        auto parent() const noexcept -> std::shared_ptr<Process> const& { return m_parent; }

        static auto current() -> std::shared_ptr<Process> const& {
            auto& self = current_slot();
            if (!self) {
                self = std::make_shared<Process>("main");
            }
            return self;
        }

        // Called by a linked child. Only the first pending reason is kept.
        auto post_exit(ExitReason reason) -> void {
            {
                std::lock_guard lock(m_mutex);
                if (!m_pending) m_pending = std::move(reason);
                m_has_pending.store(true, std::memory_order_seq_cst);
            }
            wake();
        }

        auto has_pending_exit() const noexcept -> bool {
            return m_has_pending.load(std::memory_order_seq_cst);
        }

        // Delivers a pending linked exit by throwing `Crash`.
        auto check() -> void {
            if (!has_pending_exit()) return;
            auto reason = take_pending();
            if (!reason) return;
            log::debug("process {}<{}> terminated by linked exit: {}", m_name, pid_to_int(m_id), reason->description());
            throw Crash(std::move(*reason));
        }

        // INFO: Runs a blocking wait on `waiter` that also wakes up when a
        // linked exit is posted. `wait_fn` receives a predicate wrapper and
        // returns whatever the underlying wait returns.
        template <typename WaitFn>
        auto block_on(internal::Waiter const& waiter, WaitFn&& wait_fn) -> decltype(auto) {
            check();
            {
                std::lock_guard lock(m_mutex);
                m_blocked_on = &waiter;
            }
            struct Unblock {
                Process* self;
                ~Unblock() {
                    std::lock_guard lock(self->m_mutex);
                    self->m_blocked_on = nullptr;
                }
            } guard{ this };
            return wait_fn([this] { return has_pending_exit(); });
        }

        // Entry point for spawned tasks; binds `self` to the calling thread.
        static auto bind(std::shared_ptr<Process> self) -> void {
            current_slot() = std::move(self);
        }

    private:
        auto take_pending() -> std::optional<ExitReason> {
            std::lock_guard lock(m_mutex);
            auto tmp = std::move(m_pending);
            m_pending.reset();
            m_has_pending.store(false, std::memory_order_seq_cst);
            return tmp;
        }

        auto wake() -> void {
            std::lock_guard lock(m_mutex);
            if (m_blocked_on) m_blocked_on->notify_all();
        }

        static auto current_slot() -> std::shared_ptr<Process>& {
            thread_local std::shared_ptr<Process> self{};
            return self;
        }

        static auto next_id() noexcept -> ProcessId {
            static std::atomic<std::uint64_t> counter{0};
            return static_cast<ProcessId>(counter.fetch_add(1, std::memory_order_relaxed));
        }

    private:
        ProcessId m_id;
        std::string m_name;
        std::shared_ptr<Process> m_parent;
        bool m_linked{false};
        mutable std::mutex m_mutex;
        std::optional<ExitReason> m_pending{};
        std::atomic<bool> m_has_pending{false};
        internal::Waiter const* m_blocked_on{nullptr};
    };

    inline auto self() -> Process& {
        return *Process::current();
    }

} // namespace dream

#endif // AMT_DREAM_PROCESS_HPP
