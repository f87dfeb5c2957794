#if !defined(SK_NO_TESTS)
#include "catch.hpp"
#include "random.hpp"

#include <array>
#include <vector>
#include <cstdint>

TEST_CASE("random seeded states repeat") {
    using namespace skirmish;

    auto const a = make_random_state(1234);
    auto const b = make_random_state(1234);

    std::vector<int32_t> xs;
    std::vector<int32_t> ys;

    for (int i = 0; i < 100; ++i) {
        xs.push_back(random_uniform_int(*a, 0, 100));
        ys.push_back(random_uniform_int(*b, 0, 100));
    }

    REQUIRE(xs == ys);
}

TEST_CASE("random_uniform_int") {
    using namespace skirmish;

    auto const state = make_random_state(42);
    auto& rng = *state;

    std::array<int, 101> seen {};

    for (int i = 0; i < 100000; ++i) {
        auto const n = random_uniform_int(rng, 0, 100);
        REQUIRE(n >= 0);
        REQUIRE(n <= 100);
        ++seen[static_cast<size_t>(n)];
    }

    // both ends are reachable
    REQUIRE(seen.front() > 0);
    REQUIRE(seen.back() > 0);

    SECTION("64 bit") {
        for (int i = 0; i < 1000; ++i) {
            auto const n = random_uniform_int(rng, int64_t {1}, INT64_MAX);
            REQUIRE(n >= 1);
        }
    }

    SECTION("degenerate range") {
        REQUIRE(random_uniform_int(rng, 7, 7) == 7);
    }
}

TEST_CASE("random_chance_in_x") {
    using namespace skirmish;

    auto const state = make_random_state(7);
    auto& rng = *state;

    constexpr int n = 10000;

    int heads  = 0;
    int always = 0;
    int never  = 0;

    for (int i = 0; i < n; ++i) {
        heads  += random_coin_flip(rng) ? 1 : 0;
        always += random_chance_in_x(rng, 1, 1) ? 1 : 0;
        never  += random_chance_in_x(rng, 0, 1) ? 1 : 0;
    }

    REQUIRE(always == n);
    REQUIRE(never == 0);
    REQUIRE(heads > n / 3);
    REQUIRE(heads < 2 * n / 3);
}

#endif // !defined(SK_NO_TESTS)
