#include "identity.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "math.hpp"
#include "random.hpp"

#include <limits>

namespace skirmish {

bool is_valid_identification(
    equipment_category const type
  , identification     const id
) noexcept {
    auto const n = value_cast(id);
    if (n <= 0) {
        return false;
    }

    switch (type) {
    case equipment_category::weapon:
        return (n % 2 == 0) && (n % 3 == 0);
    case equipment_category::armor:
        return is_prime(n);
    case equipment_category::purse:    SK_ATTRIBUTE_FALLTHROUGH;
    case equipment_category::backpack:
        return true;
    }

    return false;
}

bool identity_registry::is_unique(
    equipment_category const type
  , identification     const id
) const noexcept {
    auto const& used = used_(type);
    return used.find(id) == used.end();
}

identification identity_registry::generate(
    equipment_category const type
  , random_state&            rng
) const {
    constexpr auto max_id = std::numeric_limits<int64_t>::max();

    auto const draw = [&]() noexcept -> int64_t {
        switch (type) {
        case equipment_category::weapon:
            return 6 * random_uniform_int(rng, int64_t {1}, max_id / 6);
        case equipment_category::armor:
            return random_uniform_int(rng, int64_t {2}, armor_identification_bound - 1);
        case equipment_category::purse:    SK_ATTRIBUTE_FALLTHROUGH;
        case equipment_category::backpack:
            break;
        }

        return random_uniform_int(rng, int64_t {1}, max_id);
    };

    if (type == equipment_category::armor
     && size(type) >= armor_identification_count
    ) {
        throw construction_error {"no armor identifications are left"};
    }

    for (;;) {
        auto const id = identification {draw()};
        if (is_valid_identification(type, id) && is_unique(type, id)) {
            return id;
        }
    }
}

bool identity_registry::add(
    equipment_category const type
  , identification     const id
) {
    return is_valid_identification(type, id)
        && used_(type).insert(id).second;
}

size_t identity_registry::size(equipment_category const type) const noexcept {
    return used_(type).size();
}

identity_registry::set_t const&
identity_registry::used_(equipment_category const type) const noexcept {
    return used_ids_[static_cast<size_t>(type)];
}

identity_registry::set_t&
identity_registry::used_(equipment_category const type) noexcept {
    return used_ids_[static_cast<size_t>(type)];
}

} //namespace skirmish
