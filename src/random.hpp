#pragma once

#include <memory>
#include <cstdint>

namespace skirmish {

//! The single source of randomness; every random decision takes one of these
//! explicitly so that a seeded state reproduces a whole simulation.
class random_state {
public:
    using result_type = uint32_t;

    virtual ~random_state();

    static result_type min() noexcept;
    static result_type max() noexcept;
    virtual result_type generate() noexcept = 0;

    result_type operator()() noexcept {
        return generate();
    }
};

//! A state seeded from the system's entropy source.
std::unique_ptr<random_state> make_random_state();

//! A deterministic state.
std::unique_ptr<random_state> make_random_state(uint64_t seed);

//===------------------------------------------------------------------------===
//                          Primitive algorithms
//===------------------------------------------------------------------------===

bool random_coin_flip(random_state& rng) noexcept;
bool random_chance_in_x(random_state& rng, int32_t num, int32_t den) noexcept;

//! Uniform in the closed range [lo, hi].
int32_t random_uniform_int(random_state& rng, int32_t lo, int32_t hi) noexcept;
int64_t random_uniform_int(random_state& rng, int64_t lo, int64_t hi) noexcept;

} //namespace skirmish
