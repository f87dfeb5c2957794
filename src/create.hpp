#pragma once

#include "types.hpp"

#include <vector>
#include <cstdint>

namespace skirmish { class world; }
namespace skirmish { class random_state; }
namespace skirmish { struct equipment_data; }
namespace skirmish { struct hero_params; }
namespace skirmish { struct monster_params; }

namespace skirmish {

//@{
//! Create a new item with a freshly issued identification.
//! @throws construction_error if the arguments are invalid; nothing is created
//! or registered in that case.

equipment_instance_id create_equipment(world& w, random_state& rng, equipment_data const& data);

equipment_instance_id create_weapon(world& w, random_state& rng
    , int32_t weight, int32_t value, int32_t damage);

equipment_instance_id create_armor(world& w, random_state& rng
    , int32_t weight, int32_t value, armor_type type);

equipment_instance_id create_purse(world& w, random_state& rng
    , int32_t weight, int32_t capacity, int32_t contents = 0);

equipment_instance_id create_backpack(world& w, random_state& rng
    , int32_t weight, int32_t value, int32_t capacity);

//@}

//@{
//! Create a new entity holding the items in @p loadout, none of which may be
//! held or contained by anything yet. A hero places each item at the first
//! anchor accepting it; a monster places item i at anchor i and can carry the
//! weight of its loadout plus its spare capacity.
//! @throws construction_error if the arguments are invalid or the loadout
//! can't be carried; nothing is created and the loadout is left as it was.

entity_instance_id create_hero(world& w, hero_params const& params
    , std::vector<equipment_instance_id> const& loadout = {});

entity_instance_id create_monster(world& w, monster_params const& params
    , std::vector<equipment_instance_id> const& loadout = {});

//@}

} //namespace skirmish
