#pragma once

#include "types.hpp"

#include <array>
#include <unordered_set>
#include <cstdint>
#include <cstddef>

namespace skirmish { class random_state; }

namespace skirmish {

//! Armor identifications are primes drawn below this bound.
constexpr int64_t armor_identification_bound = 1000000;

//! The number of primes below armor_identification_bound; once this many
//! armors exist no new armor can be identified.
constexpr size_t armor_identification_count = 78498;

//! The structural rule an identification must satisfy for its category,
//! irrespective of whether it has been used already.
bool is_valid_identification(equipment_category type, identification id) noexcept;

//=====--------------------------------------------------------------------=====
// Every identification ever issued, per category. Identifications are never
// released, not even once the equipment carrying them is destroyed.
//=====--------------------------------------------------------------------=====
class identity_registry {
public:
    bool is_unique(equipment_category type, identification id) const noexcept;

    //! @returns A valid identification that has not been issued for @p type.
    //! @throws construction_error if @p type has run out of identifications.
    identification generate(equipment_category type, random_state& rng) const;

    //! Record @p id as used.
    //! @returns false, and records nothing, if @p id is invalid for @p type or
    //! was already used.
    bool add(equipment_category type, identification id);

    size_t size(equipment_category type) const noexcept;
private:
    using set_t = std::unordered_set<identification, identity_hash>;

    set_t const& used_(equipment_category type) const noexcept;
    set_t&       used_(equipment_category type) noexcept;

    std::array<set_t, equipment_category_count> used_ids_;
};

} //namespace skirmish
