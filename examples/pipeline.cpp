#include <chrono>
#include <cstdlib>
#include <expected>
#include <numeric>
#include <string>
#include <vector>
#include <fmt/core.h>

#include "dream.hpp"

using namespace dream;

int main() {
    config().load_from_env();

    std::vector<int> v(20);
    std::iota(v.begin(), v.end(), 1);

    //   from_list
    //       |
    //      map (x * x)
    //       |
    //    filter (odd)
    //       |
    //   duplicate
    //    |       |
    //   sum    print
    auto squares = map(from_list(v), [](int x) { return x * x; });
    auto odd = filter(squares, [](int x) { return x % 2 == 1; });
    auto copies = duplicate(odd);
    auto left = copies.first;
    auto right = copies.second;

    auto sum = async([left] {
        return reduce(left, 0, [](int x, int acc) { return acc + x; });
    }, "sum");

    for (auto x: to_lazy_sequence(right)) {
        fmt::print("odd square: {}\n", x);
    }

    auto total = sum.try_await_with_timeout(std::chrono::seconds(5));
    if (!total) {
        fmt::print("Error: {}\n", to_string(total.error()));
        return 1;
    }
    fmt::print("Res: {} == {}\n", 1330, *total);

    auto words = generator<std::string>([](Yield<std::string> const& yield, Stop const& stop) {
        for (auto w: { "lazy", "streams", "over", "mailboxes" }) yield(w);
        stop();
    });
    auto res = try_each(words, [](std::string const& w) -> std::expected<void, std::string> {
        if (w.size() > 7) return std::unexpected(fmt::format("word too long: {}", w));
        fmt::print("word: {}\n", w);
        return {};
    });
    if (!res) fmt::print("Stopped: {}\n", res.error());
}
