#pragma once

#include <cstdint>

namespace skirmish {

template <typename T> inline constexpr
T clamp(T const n, T const lo, T const hi) noexcept {
    return n < lo ? lo
         : n > hi ? hi
                  : n;
}

//! Trial division; fine for the magnitudes hit points and armor serial
//! numbers take.
constexpr bool is_prime(int64_t const n) noexcept {
    if (n < 2) {
        return false;
    }

    if (n % 2 == 0) {
        return n == 2;
    }

    for (int64_t d = 3; d <= n / d; d += 2) {
        if (n % d == 0) {
            return false;
        }
    }

    return true;
}

//! The largest prime <= n, or 0 if there is none.
constexpr int32_t closest_lower_prime(int32_t const n) noexcept {
    for (int32_t i = n; i >= 2; --i) {
        if (is_prime(i)) {
            return i;
        }
    }

    return 0;
}

//! Hit points of an entity at rest are either 0 or prime.
constexpr bool is_valid_resting_hit_points(int32_t const n) noexcept {
    return n == 0 || is_prime(n);
}

} //namespace skirmish
