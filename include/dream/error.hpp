#ifndef AMT_DREAM_ERROR_HPP
#define AMT_DREAM_ERROR_HPP

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>

namespace dream {

    // INFO: Opaque payload of an abnormal task exit. It keeps the original
    // exception so callers that care can rethrow and inspect it.
    struct ExitReason {
        ExitReason() noexcept = default;
        ExitReason(ExitReason const&) = default;
        ExitReason(ExitReason &&) noexcept = default;
        ExitReason& operator=(ExitReason const&) = default;
        ExitReason& operator=(ExitReason &&) noexcept = default;
        ~ExitReason() = default;

        ExitReason(std::exception_ptr cause, std::string description)
            : m_cause(std::move(cause))
            , m_description(std::move(description))
        {}

        // Must be called from inside a catch block.
        static auto from_current_exception() -> ExitReason {
            auto ptr = std::current_exception();
            try {
                std::rethrow_exception(ptr);
            } catch (std::exception const& e) {
                return { ptr, e.what() };
            } catch (...) {
                return { ptr, "unknown exception" };
            }
        }

        auto cause() const noexcept -> std::exception_ptr const& {
            return m_cause;
        }

        auto description() const noexcept -> std::string_view {
            return m_description;
        }

        [[noreturn]] auto rethrow() const -> void {
            if (m_cause) std::rethrow_exception(m_cause);
            throw std::runtime_error(m_description);
        }

    private:
        std::exception_ptr m_cause{};
        std::string m_description{};
    };

    enum class NextError {
        end_of_stream,
        timeout
    };

    constexpr auto to_string(NextError e) noexcept -> std::string_view {
        switch (e) {
            case NextError::end_of_stream: return "End of stream";
            case NextError::timeout: return "Timed out waiting for the next value";
        }
        return "Unknown";
    }

    struct AwaitError {
        enum class Kind {
            timeout,
            exit,
            consumed
        };

        Kind kind;
        // Only meaningful when kind == Kind::exit.
        ExitReason reason{};

        static auto timeout() -> AwaitError { return { Kind::timeout, {} }; }
        static auto exit(ExitReason r) -> AwaitError { return { Kind::exit, std::move(r) }; }
        static auto consumed() -> AwaitError { return { Kind::consumed, {} }; }

        auto is_timeout() const noexcept -> bool { return kind == Kind::timeout; }
        auto is_exit() const noexcept -> bool { return kind == Kind::exit; }
    };

    constexpr auto to_string(AwaitError::Kind k) noexcept -> std::string_view {
        switch (k) {
            case AwaitError::Kind::timeout: return "Timeout";
            case AwaitError::Kind::exit: return "Exit";
            case AwaitError::Kind::consumed: return "Already awaited";
        }
        return "Unknown";
    }

    inline auto to_string(AwaitError const& e) -> std::string {
        if (e.is_exit()) {
            return fmt::format("{}({})", to_string(e.kind), e.reason.description());
        }
        return std::string(to_string(e.kind));
    }

    // INFO: Thrown into a context that must terminate: either a fatal await
    // failed or a linked task crashed.
    struct Crash: std::runtime_error {
        explicit Crash(AwaitError error)
            : std::runtime_error(fmt::format("crashed: {}", to_string(error)))
            , m_error(std::move(error))
        {}

        explicit Crash(ExitReason reason)
            : Crash(AwaitError::exit(std::move(reason)))
        {}

        auto error() const noexcept -> AwaitError const& {
            return m_error;
        }

        auto reason() const noexcept -> ExitReason const& {
            return m_error.reason;
        }

    private:
        AwaitError m_error;
    };

} // namespace dream

#endif // AMT_DREAM_ERROR_HPP
