#include <catch2/catch.hpp>

#include <chrono>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <fmt/core.h>

#include "dream/combinators.hpp"

using namespace dream;
using namespace std::chrono_literals;

TEST_CASE("Each", "[combinators][each]" ) {
    GIVEN("A stream from a list") {
        auto input = from_list({ 1, 2, 3, 4, 5 });
        auto output = make_stream<int>();

        WHEN("Each value is doubled into another stream") {
            each(input, [&output](int i) {
                output.write(i * 2);
            });
            output.close();
            REQUIRE(collect(output) == std::vector<int>{ 2, 4, 6, 8, 10 });
        }
    }
}

TEST_CASE("Try each", "[combinators][try_each]" ) {
    GIVEN("A stream with negative values") {
        auto input = from_list({ 2, 1, 0, -1, -2 });
        auto seen = std::vector<int>{};

        auto res = try_each(input, [&seen](int i) -> std::expected<void, std::string> {
            seen.push_back(i);
            if (i < 0) return std::unexpected(fmt::format("negative: {}", i));
            return {};
        });

        THEN("It stops at the first negative value") {
            REQUIRE(!res.has_value());
            REQUIRE(res.error() == "negative: -1");
            REQUIRE(seen == std::vector<int>{ 2, 1, 0, -1 });
            REQUIRE(input.next_with_timeout(5s).value() == -2);
        }
    }

    GIVEN("A stream without errors") {
        auto input = from_list({ 1, 2, 3 });
        auto sum = 0;
        auto res = try_each(input, [&sum](int i) -> std::expected<void, int> {
            sum += i;
            return {};
        });
        REQUIRE(res.has_value());
        REQUIRE(sum == 6);
    }
}

TEST_CASE("Map and filter", "[combinators][map][filter]" ) {
    WHEN("Two maps are chained") {
        auto s = map(map(from_list({ 1, 2, 3 }), [](int i) { return i + 1; }), [](int i) { return i * 2; });
        REQUIRE(collect(s) == std::vector<int>{ 4, 6, 8 });
    }

    WHEN("Map changes the element type") {
        auto s = map(from_list({ 1, 2 }), [](int i) { return fmt::format("#{}", i); });
        REQUIRE(collect(s) == std::vector<std::string>{ "#1", "#2" });
    }

    WHEN("Filter keeps even values") {
        auto s = filter(from_list({ 1, 2, 3, 4, 5, 6 }), [](int i) { return i % 2 == 0; });
        REQUIRE(collect(s) == std::vector<int>{ 2, 4, 6 });
    }

    WHEN("Filter drops everything") {
        auto s = filter(from_list({ 1, 3 }), [](int i) { return i % 2 == 0; });
        REQUIRE(collect(s).empty());
    }

    WHEN("A map callback throws") {
        auto s = map(from_list({ 1, 2, 3 }), [](int i) {
            if (i == 2) throw std::runtime_error("bad element");
            return i;
        });

        THEN("The spawner crashes instead of seeing an error value") {
            try {
                (void)collect(s);
                FAIL("collect returned");
            } catch (Crash const& e) {
                REQUIRE(e.reason().description() == "bad element");
            }
        }
    }
}

TEST_CASE("Crashing stages", "[combinators][link]" ) {
    WHEN("A filter predicate throws") {
        auto s = filter(from_list({ 1, 2, 3 }), [](int i) {
            if (i == 3) throw std::runtime_error("bad predicate");
            return true;
        });

        THEN("The consumer crashes") {
            try {
                (void)collect(s);
                FAIL("collect returned");
            } catch (Crash const& e) {
                REQUIRE(e.error().is_exit());
                REQUIRE(e.reason().description() == "bad predicate");
            }
            REQUIRE(self().has_pending_exit() == false);
        }
    }

    WHEN("The first stage of a chain throws") {
        auto first = map(from_list({ 1, 2, 3 }), [](int i) {
            if (i == 1) throw std::runtime_error("first stage");
            return i;
        });
        auto last = map(first, [](int i) { return i * 10; });

        THEN("The consumer of the last stage crashes") {
            try {
                (void)collect(last);
                FAIL("collect returned");
            } catch (Crash const& e) {
                REQUIRE(e.reason().description() == "first stage");
            }
        }
    }

    WHEN("A map callback is move-only") {
        auto offset = std::make_unique<int>(100);
        auto s = map(from_list({ 1, 2 }), [offset = std::move(offset)](int i) { return i + *offset; });
        REQUIRE(collect(s) == std::vector<int>{ 101, 102 });
    }
}

TEST_CASE("Reduce and collect", "[combinators][reduce]" ) {
    WHEN("Summing") {
        auto sum = reduce(from_list({ 1, 2, 3 }), 0, [](int v, int acc) { return acc + v; });
        REQUIRE(sum == 6);
    }

    WHEN("The fold order matters") {
        auto res = reduce(from_list({ 'a', 'b', 'c' }), std::string{}, [](char c, std::string acc) {
            acc.push_back(c);
            return acc;
        });
        REQUIRE(res == "abc");
    }

    WHEN("The stream is empty") {
        auto s = make_stream<int>();
        s.close();
        REQUIRE(reduce(s, 10, [](int v, int acc) { return acc + v; }) == 10);
    }
}

TEST_CASE("Duplicate", "[combinators][duplicate]" ) {
    auto list = std::vector<int>{};
    for (auto i = 0; i < 50; ++i) list.push_back(i * i);

    auto [a, b] = duplicate(from_list(list));
    auto ra = collect(a);
    auto rb = collect(b);
    REQUIRE(ra == list);
    REQUIRE(rb == list);
}

TEST_CASE("Lazy sequence", "[combinators][lazy]" ) {
    GIVEN("A lazy view over a stream") {
        auto seq = to_lazy_sequence(from_list({ 1, 2, 3 }));

        WHEN("Iterated with range-for") {
            auto res = std::vector<int>{};
            for (auto v: seq) res.push_back(v);
            REQUIRE(res == std::vector<int>{ 1, 2, 3 });

            THEN("It cannot be restarted") {
                REQUIRE((seq.begin() == seq.end()));
                REQUIRE(!seq.next().has_value());
            }
        }

        WHEN("Pulled one by one") {
            REQUIRE(seq.next() == 1);
            REQUIRE(seq.next() == 2);
            REQUIRE(seq.next() == 3);
            REQUIRE(!seq.next().has_value());
        }

        WHEN("Iteration stops early") {
            for (auto v: seq) {
                if (v == 2) break;
            }
            THEN("It resumes at the element it stopped on") {
                REQUIRE(seq.next() == 2);
                REQUIRE(seq.next() == 3);
            }
        }
    }

    GIVEN("A producer that writes slowly") {
        auto s = make_stream<int>();
        spawn([s] {
            for (auto i = 0; i < 3; ++i) {
                std::this_thread::sleep_for(5ms);
                s.write(i);
            }
            s.close();
        });
        auto res = std::vector<int>{};
        for (auto v: to_lazy_sequence(s)) res.push_back(v);
        REQUIRE(res == std::vector<int>{ 0, 1, 2 });
    }
}

TEST_CASE("With", "[combinators][with]" ) {
    WHEN("The body returns normally") {
        auto s = make_stream<std::string>();
        auto n = with(s, [](Stream<std::string>& out) {
            out.write("hi");
            return 1;
        });
        REQUIRE(n == 1);
        REQUIRE(collect(s) == std::vector<std::string>{ "hi" });
    }

    WHEN("The body ignores the stream") {
        auto s = make_stream<int>();
        with(s, [] {});
        REQUIRE(collect(s).empty());
    }

    WHEN("The body throws") {
        auto s = make_stream<int>();
        REQUIRE_THROWS_AS(with(s, [](Stream<int>& out) {
            out.write(1);
            throw std::runtime_error("body failed");
        }), std::runtime_error);

        THEN("The stream is still closed") {
            REQUIRE(collect(s) == std::vector<int>{ 1 });
        }
    }
}

TEST_CASE("Generator", "[combinators][generator]" ) {
    WHEN("The generator yields and stops") {
        auto s = generator<int>([](Yield<int> const& yield, Stop const& stop) {
            for (auto i = 0; i < 4; ++i) yield(i);
            stop();
        });
        REQUIRE(s.size() == 5u);
        REQUIRE(collect(s) == std::vector<int>{ 0, 1, 2, 3 });
    }

    WHEN("The generator runs inside a task") {
        auto d = async([] {
            return generator<std::string>([](auto yield, auto stop) {
                yield("x");
                yield("y");
                stop();
            });
        });
        auto s = d.await();
        REQUIRE(collect(map(s, [](std::string v) { return v + v; })) == std::vector<std::string>{ "xx", "yy" });
    }
}
