#ifndef AMT_DREAM_CONFIG_HPP
#define AMT_DREAM_CONFIG_HPP

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>

#ifndef DREAM_DEFAULT_TIMEOUT_MS
    // 15 minutes
    #define DREAM_DEFAULT_TIMEOUT_MS 900000
#endif

#ifndef DREAM_LOG_LEVEL
    #define DREAM_LOG_LEVEL 3
#endif

namespace dream {

    enum class LogLevel: std::uint8_t {
        trace = 0,
        debug = 1,
        info  = 2,
        warn  = 3,
        error = 4,
        off   = 5
    };

    constexpr auto to_string(LogLevel l) noexcept -> std::string_view {
        switch (l) {
            case LogLevel::trace: return "trace";
            case LogLevel::debug: return "debug";
            case LogLevel::info: return "info";
            case LogLevel::warn: return "warn";
            case LogLevel::error: return "error";
            case LogLevel::off: return "off";
        }
        return "unknown";
    }

    constexpr auto parse_log_level(std::string_view s) noexcept -> std::optional<LogLevel> {
        if (s == "trace") return LogLevel::trace;
        if (s == "debug") return LogLevel::debug;
        if (s == "info") return LogLevel::info;
        if (s == "warn") return LogLevel::warn;
        if (s == "error") return LogLevel::error;
        if (s == "off") return LogLevel::off;
        return std::nullopt;
    }

    // NOTE: Process-wide and thread-safe. Values are read on every blocking call
    // that does not take an explicit timeout, so changes apply to later reads.
    struct Config {
        using duration_t = std::chrono::milliseconds;

        static auto instance() noexcept -> Config& {
            static Config config;
            return config;
        }

        Config(Config const&) = delete;
        Config(Config &&) = delete;
        Config& operator=(Config const&) = delete;
        Config& operator=(Config &&) = delete;
        ~Config() = default;

        auto default_timeout() const noexcept -> duration_t {
            return duration_t(m_timeout_ms.load(std::memory_order_relaxed));
        }

        // Largest timeout that still converts to nanoseconds; waits at this
        // bound never time out.
        static constexpr auto max_timeout() noexcept -> duration_t {
            return std::chrono::duration_cast<duration_t>(std::chrono::nanoseconds::max());
        }

        // Saturates to [0, max_timeout()].
        auto set_default_timeout(duration_t timeout) noexcept -> void {
            if (timeout < duration_t::zero()) timeout = duration_t::zero();
            if (timeout > max_timeout()) timeout = max_timeout();
            m_timeout_ms.store(timeout.count(), std::memory_order_relaxed);
        }

        auto log_level() const noexcept -> LogLevel {
            return m_log_level.load(std::memory_order_relaxed);
        }

        auto set_log_level(LogLevel level) noexcept -> void {
            m_log_level.store(level, std::memory_order_relaxed);
        }

        // Reads `DREAM_TIMEOUT_MS` and `DREAM_LOG_LEVEL`; malformed values are ignored.
        auto load_from_env() -> void {
            if (auto const* ms = std::getenv("DREAM_TIMEOUT_MS"); ms != nullptr) {
                auto sv = std::string_view(ms);
                duration_t::rep value{};
                auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
                if (ec == std::errc{} && ptr == sv.data() + sv.size() && value >= 0) {
                    set_default_timeout(duration_t(value));
                }
            }
            if (auto const* level = std::getenv("DREAM_LOG_LEVEL"); level != nullptr) {
                if (auto l = parse_log_level(level)) set_log_level(*l);
            }
        }

        auto reset() noexcept -> void {
            set_default_timeout(duration_t(DREAM_DEFAULT_TIMEOUT_MS));
            set_log_level(static_cast<LogLevel>(DREAM_LOG_LEVEL));
        }

    private:
        Config() noexcept = default;

    private:
        std::atomic<duration_t::rep> m_timeout_ms{ DREAM_DEFAULT_TIMEOUT_MS };
        std::atomic<LogLevel> m_log_level{ static_cast<LogLevel>(DREAM_LOG_LEVEL) };
    };

    inline auto config() noexcept -> Config& {
        return Config::instance();
    }

} // namespace dream

#endif // AMT_DREAM_CONFIG_HPP
