#ifndef AMT_DREAM_STREAM_HPP
#define AMT_DREAM_STREAM_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <initializer_list>
#include <memory>
#include <utility>
#include <vector>
#include "channel.hpp"
#include "config.hpp"
#include "dream.hpp"
#include "error.hpp"
#include "message.hpp"

namespace dream {

    // INFO: Handle to a channel speaking the value/end protocol. Copies of a
    // handle alias the same channel; reading from any copy consumes the value
    // for all of them.
    //
    // `close` is not idempotent: each call enqueues another end marker, and a
    // single sequential reader only honours the first one.
    template <typename T>
    struct Stream {
        using value_type = T;
        using message_type = Message<T>;
        using channel_type = Channel<message_type>;
        using size_type = typename channel_type::size_type;
        using result_type = std::expected<T, NextError>;

        Stream()
            : m_channel(std::make_shared<channel_type>())
        {}
        Stream(Stream const&) = default;
        Stream(Stream &&) noexcept = default;
        Stream& operator=(Stream const&) = default;
        Stream& operator=(Stream &&) noexcept = default;
        ~Stream() = default;

        static auto make() -> Stream {
            return Stream();
        }

        auto write(T const& val) const -> void {
            m_channel->emplace(std::in_place_type<Value<T>>, Value<T>{ val });
        }

        auto write(T&& val) const -> void {
            m_channel->emplace(std::in_place_type<Value<T>>, Value<T>{ std::move(val) });
        }

        auto close() const -> void {
            m_channel->emplace(std::in_place_type<End>);
        }

        // Waits up to the configured default timeout.
        auto next() const -> result_type {
            return next_with_timeout(config().default_timeout());
        }

        // Blocks until a value, an end marker or the timeout. Both the end
        // marker and the timeout terminate every consuming combinator; they
        // are only distinguished here.
        auto next_with_timeout(std::chrono::nanoseconds timeout) const -> result_type {
            auto msg = m_channel->receive_for(timeout);
            if (!msg) return std::unexpected(NextError::timeout);
            if (is_end<T>(*msg)) return std::unexpected(NextError::end_of_stream);
            return take_payload<T>(*msg);
        }

        // Pending messages, end markers included.
        auto size() const -> size_type {
            return m_channel->size();
        }

        auto empty() const -> bool {
            return m_channel->empty();
        }

        friend auto operator==(Stream const& lhs, Stream const& rhs) noexcept -> bool {
            return lhs.m_channel == rhs.m_channel;
        }

    private:
        std::shared_ptr<channel_type> m_channel;
    };

    template <typename T>
    auto make_stream() -> Stream<T> {
        return Stream<T>::make();
    }

    // Returns immediately; a linked task writes the elements in order, then closes.
    template <typename T>
    auto from_list(std::vector<T> list) -> Stream<T> {
        auto s = Stream<T>::make();
        spawn([s, list = std::move(list)] {
            for (auto const& el: list) s.write(el);
            s.close();
        }, "from_list");
        return s;
    }

    template <typename T>
    auto from_list(std::initializer_list<T> list) -> Stream<T> {
        return from_list(std::vector<T>(list));
    }

} // namespace dream

#endif // AMT_DREAM_STREAM_HPP
