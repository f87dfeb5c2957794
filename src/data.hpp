#pragma once

#include "types.hpp"
#include "config.hpp"

#include <memory>
#include <vector>
#include <cstddef>

namespace skirmish { struct equipment_definition; }
namespace skirmish { struct entity_definition; }
namespace skirmish { struct equipment_data; }
namespace skirmish { struct hero_params; }
namespace skirmish { struct monster_params; }
namespace skirmish { class world; }
namespace skirmish { class random_state; }

namespace skirmish {

//=====--------------------------------------------------------------------=====
// The database of all current game data.
//=====--------------------------------------------------------------------=====
class game_database {
public:
    virtual ~game_database();

    //! @returns The definition associated with a given id. Otherwise, a nullptr
    //! if no such definition exists.
    virtual equipment_definition const* find(equipment_id id) const noexcept = 0;
    virtual entity_definition const* find(entity_id id) const noexcept = 0;

    //! @returns The name of a property as it appeared in the data files.
    virtual string_view find(equipment_property_id id) const noexcept = 0;
    virtual string_view find(entity_property_id id) const noexcept = 0;

    virtual size_t equipment_definition_count() const noexcept = 0;
    virtual size_t entity_definition_count() const noexcept = 0;
};

//! Load "equipment.dat" and "entities.dat" from the directory @p data_dir.
//! @throws data_error if either is missing or malformed, or an id is defined
//! twice.
std::unique_ptr<game_database> make_game_database(string_view data_dir);

//! As above, but from the text of the two files.
std::unique_ptr<game_database> make_game_database(
    string_view equipment_json, string_view entity_json);

//@{
//! Translate a definition into construction arguments.
//! @throws data_error if the category or a type name is unknown.

equipment_data to_equipment_data(equipment_definition const& def);
entity_category category_of(entity_definition const& def);
hero_params to_hero_params(entity_definition const& def);
monster_params to_monster_params(entity_definition const& def);

//! The equipment ids named by "equip_0" .. "equip_<equip_n - 1>".
std::vector<equipment_id> loadout_of(entity_definition const& def);

//@}

//@{
//! Create an instance of the definition @p id together with everything it is
//! defined to carry.
//! @throws data_error if @p id or a loadout item is not defined.
//! @throws construction_error if the definition can't be built.

equipment_instance_id create_equipment(world& w, random_state& rng
    , game_database const& db, equipment_id id);

entity_instance_id create_entity(world& w, random_state& rng
    , game_database const& db, entity_id id);

//@}

} //namespace skirmish
