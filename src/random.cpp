#include "random.hpp"

#include <boost/predef/other/endian.h>

#if defined (BOOST_ENDIAN_LITTLE_BYTE_AVAILABLE)
#   define PCG_LITTLE_ENDIAN 1
#endif

#include <pcg_random.hpp>
#include <pcg_extras.hpp>

#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_smallint.hpp>

#include <random>

namespace skirmish {

random_state::~random_state() = default;
uint32_t random_state::min() noexcept { return pcg32::min(); }
uint32_t random_state::max() noexcept { return pcg32::max(); }

class random_state_impl final : public random_state {
public:
    explicit random_state_impl(uint64_t const seed)
      : state {seed}
    {
    }

    template <typename SeedSeq>
    explicit random_state_impl(SeedSeq&& seq)
      : state {std::forward<SeedSeq>(seq)}
    {
    }

    result_type generate() noexcept final override;

    boost::random::uniform_smallint<int32_t>         dist_coin     {0, 1};
    boost::random::uniform_int_distribution<int32_t> dist_uniform  {};
    boost::random::uniform_int_distribution<int64_t> dist_uniform64 {};

    pcg32 state {};
};

random_state::result_type random_state_impl::generate() noexcept {
    return state();
}

std::unique_ptr<random_state> make_random_state() {
    return std::make_unique<random_state_impl>(
        pcg_extras::seed_seq_from<std::random_device> {});
}

std::unique_ptr<random_state> make_random_state(uint64_t const seed) {
    return std::make_unique<random_state_impl>(seed);
}

bool random_coin_flip(random_state& rng) noexcept {
    auto& r = static_cast<random_state_impl&>(rng);
    return !!r.dist_coin(r.state);
}

int32_t random_uniform_int(random_state& rng, int32_t const lo, int32_t const hi) noexcept {
    auto& r = static_cast<random_state_impl&>(rng);

    using param_t = decltype(r.dist_uniform)::param_type;

    r.dist_uniform.param(param_t {lo, hi});

    return r.dist_uniform(r.state);
}

int64_t random_uniform_int(random_state& rng, int64_t const lo, int64_t const hi) noexcept {
    auto& r = static_cast<random_state_impl&>(rng);

    using param_t = decltype(r.dist_uniform64)::param_type;

    r.dist_uniform64.param(param_t {lo, hi});

    return r.dist_uniform64(r.state);
}

bool random_chance_in_x(random_state& rng, int32_t const num, int32_t const den) noexcept {
    return random_uniform_int(rng, 0, den - 1) < num;
}

} //namespace skirmish
