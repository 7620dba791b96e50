#ifndef AMT_DREAM_COMBINATORS_HPP
#define AMT_DREAM_COMBINATORS_HPP

#include <concepts>
#include <cstddef>
#include <expected>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include "dream.hpp"
#include "stream.hpp"

namespace dream {

    namespace internal {
        template <typename T>
        struct is_expected: std::false_type {};

        template <typename T, typename E>
        struct is_expected<std::expected<T, E>>: std::true_type {};

        template <typename T>
        static constexpr auto is_expected_v = is_expected<std::remove_cvref_t<T>>::value;
    } // namespace internal

    // Drives `fn` over every value in the calling process until the stream ends.
    template <typename T, typename Fn>
        requires (std::invocable<Fn&, T>)
    auto each(Stream<T> const& input, Fn&& fn) -> void {
        while (true) {
            auto val = input.next();
            if (!val) return;
            std::invoke(fn, std::move(*val));
        }
    }

    // INFO: `fn` returns `std::expected<void, E>`. Iteration stops at the
    // first error, which is returned; values after it are left unread.
    template <typename T, typename Fn, typename R = std::invoke_result_t<Fn&, T>>
        requires (internal::is_expected_v<R>)
    auto try_each(Stream<T> const& input, Fn&& fn) -> std::expected<void, typename std::remove_cvref_t<R>::error_type> {
        while (true) {
            auto val = input.next();
            if (!val) return {};
            auto res = std::invoke(fn, std::move(*val));
            if (!res) return std::unexpected(std::move(res.error()));
        }
    }

    // Folds sequentially in the calling process: `acc = fn(value, acc)`.
    template <typename T, typename Acc, typename Fn>
        requires (std::is_invocable_r_v<Acc, Fn&, T, Acc>)
    auto reduce(Stream<T> const& input, Acc init, Fn&& fn) -> Acc {
        auto acc = std::move(init);
        each(input, [&acc, &fn](T val) {
            acc = std::invoke(fn, std::move(val), std::move(acc));
        });
        return acc;
    }

    template <typename T>
    auto collect(Stream<T> const& input) -> std::vector<T> {
        std::vector<T> res;
        each(input, [&res](T val) {
            res.push_back(std::move(val));
        });
        return res;
    }

    // INFO: Single-pass view over a stream. Each advance blocks for one
    // element; the view cannot be restarted, and calling `begin` again
    // resumes at the first element not yet stepped over.
    template <typename T>
    struct LazySequence {
        struct sentinel {};

        struct iterator {
            using iterator_concept = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;

            iterator() noexcept = default;
            explicit iterator(LazySequence* parent) noexcept
                : m_parent(parent)
            {}

            auto operator*() const -> T& {
                return *m_parent->m_current;
            }

            auto operator++() -> iterator& {
                m_parent->advance();
                return *this;
            }

            auto operator++(int) -> void {
                ++*this;
            }

            friend auto operator==(iterator const& it, sentinel) -> bool {
                return it.m_parent == nullptr || !it.m_parent->m_current.has_value();
            }

        private:
            LazySequence* m_parent{nullptr};
        };

        explicit LazySequence(Stream<T> input)
            : m_input(std::move(input))
        {}
        LazySequence(LazySequence const&) = delete;
        LazySequence(LazySequence &&) noexcept = default;
        LazySequence& operator=(LazySequence const&) = delete;
        LazySequence& operator=(LazySequence &&) noexcept = default;
        ~LazySequence() = default;

        auto begin() -> iterator {
            if (!m_current) advance();
            return iterator(this);
        }

        auto end() const noexcept -> sentinel {
            return {};
        }

        // Pull interface; `std::nullopt` once the stream has ended.
        auto next() -> std::optional<T> {
            if (!m_current) advance();
            auto tmp = std::move(m_current);
            m_current.reset();
            return tmp;
        }

    private:
        friend auto operator==(iterator const& it, sentinel) -> bool;

        auto advance() -> void {
            m_current.reset();
            if (m_finished) return;
            auto val = m_input.next();
            if (val) {
                m_current = std::move(*val);
            } else {
                m_finished = true;
            }
        }

    private:
        Stream<T> m_input;
        // Head of the sequence, pulled on demand.
        std::optional<T> m_current{};
        bool m_finished{false};
    };

    template <typename T>
    auto to_lazy_sequence(Stream<T> input) -> LazySequence<T> {
        return LazySequence<T>(std::move(input));
    }

    // INFO: Runs `fn` and closes `stream` afterwards. The stream is closed on
    // every exit path, including when `fn` throws.
    template <typename T, typename Fn>
        requires (std::invocable<Fn, Stream<T>&> || std::invocable<Fn>)
    auto with(Stream<T> stream, Fn&& fn) -> decltype(auto) {
        struct CloseOnExit {
            Stream<T>& s;
            ~CloseOnExit() { s.close(); }
        } guard{ stream };

        if constexpr (std::invocable<Fn, Stream<T>&>) {
            return std::invoke(std::forward<Fn>(fn), stream);
        } else {
            return std::invoke(std::forward<Fn>(fn));
        }
    }

    template <typename T>
    using Yield = std::function<void(T)>;
    using Stop = std::function<void()>;

    // INFO: Inversion of control only. `fn(yield, stop)` runs synchronously in
    // the calling process and the stream is returned once it returns; wrap the
    // call in `spawn`/`async` to produce concurrently.
    template <typename T, typename Fn>
        requires (std::invocable<Fn, Yield<T>, Stop>)
    auto generator(Fn&& fn) -> Stream<T> {
        auto output = Stream<T>::make();
        auto yield = Yield<T>([output](T val) { output.write(std::move(val)); });
        auto stop = Stop([output] { output.close(); });
        std::invoke(std::forward<Fn>(fn), std::move(yield), std::move(stop));
        return output;
    }

    template <typename T, typename Fn, typename U = std::remove_cvref_t<std::invoke_result_t<Fn&, T>>>
    auto map(Stream<T> input, Fn fn) -> Stream<U> {
        auto output = Stream<U>::make();
        spawn([input, output, fn = std::move(fn)]() mutable {
            each(input, [&](T val) {
                output.write(std::invoke(fn, std::move(val)));
            });
            output.close();
        }, "map");
        return output;
    }

    template <typename T, typename Fn>
        requires (std::predicate<Fn&, T const&>)
    auto filter(Stream<T> input, Fn fn) -> Stream<T> {
        auto output = Stream<T>::make();
        spawn([input, output, fn = std::move(fn)]() mutable {
            each(input, [&](T val) {
                if (std::invoke(fn, std::as_const(val))) output.write(std::move(val));
            });
            output.close();
        }, "filter");
        return output;
    }

    // Both outputs see the same values in the same order; the first output
    // is always written before the second.
    template <typename T>
        requires (std::copy_constructible<T>)
    auto duplicate(Stream<T> input) -> std::pair<Stream<T>, Stream<T>> {
        auto first = Stream<T>::make();
        auto second = Stream<T>::make();
        spawn([input, first, second] {
            each(input, [&](T val) {
                first.write(val);
                second.write(std::move(val));
            });
            first.close();
            second.close();
        }, "duplicate");
        return { std::move(first), std::move(second) };
    }

} // namespace dream

#endif // AMT_DREAM_COMBINATORS_HPP
