#ifndef AMT_DREAM_MESSAGE_HPP
#define AMT_DREAM_MESSAGE_HPP

#include <utility>
#include <variant>

namespace dream {

    // INFO: Wire format of a stream's channel. Every logical sequence is zero
    // or more `Value`s followed by exactly one `End`.
    template <typename T>
    struct Value {
        T payload;
    };

    struct End {};

    template <typename T>
    using Message = std::variant<Value<T>, End>;

    template <typename T>
    constexpr auto is_end(Message<T> const& m) noexcept -> bool {
        return std::holds_alternative<End>(m);
    }

    template <typename T>
    constexpr auto take_payload(Message<T>& m) -> T {
        return std::move(std::get<Value<T>>(m).payload);
    }

} // namespace dream

#endif // AMT_DREAM_MESSAGE_HPP
