#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <fmt/core.h>

#include "dream.hpp"

using namespace dream;
using namespace std::chrono_literals;

int main() {
    config().load_from_env();

    // task 0: computes sum upto 50
    auto t0 = async([] {
        auto sum = 0ul;
        for (auto i = 0ul; i < 50; ++i) sum += i;
        return sum;
    }, "lower");

    // task 1: computes sum from 50 upto 101
    auto t1 = async([] {
        auto sum = 0ul;
        for (auto i = 50ul; i < 101ul; ++i) sum += i;
        return sum;
    }, "upper");

    auto l = t0.await();
    auto r = t1.await();
    fmt::print("Lower: {}, Upper: {}\n", l, r);
    if ((100 * 101) / 2 != l + r) {
        fmt::print("Something went wrong\n");
    }

    auto slow = async([] {
        std::this_thread::sleep_for(200ms);
        return 1;
    }, "slow");
    if (auto res = slow.try_await_with_timeout(10ms); !res) {
        fmt::print("Error: {}\n", to_string(res.error()));
    }
    fmt::print("Slow: {}\n", slow.await());

    auto failing = async_unlinked([]() -> int {
        throw std::runtime_error("unlinked failure");
    }, "failing");
    if (auto res = failing.try_await(); !res) {
        fmt::print("Error: {}\n", to_string(res.error()));
    }

    auto linked = async([]() -> int {
        throw std::runtime_error("linked failure");
    }, "linked");
    try {
        linked.await();
    } catch (Crash const& e) {
        fmt::print("Caught: {}\n", e.what());
    }
}
