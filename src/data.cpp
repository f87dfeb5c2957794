#include "data.hpp"
#include "create.hpp"
#include "definition.hpp"
#include "entity.hpp"
#include "equipment.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "hash.hpp"
#include "serialize.hpp"

#include "bkassert/assert.hpp"

#include <unordered_map>
#include <type_traits>
#include <string>
#include <cstdio>

namespace skirmish {

namespace {

constexpr int32_t max_loadout_size = 10;

template <typename Definition>
[[noreturn]] void fail_(Definition const& def, char const* const what) {
    throw data_error {"\"" + def.id_string + "\": " + what};
}

template <typename Definition>
uint32_t get_(Definition const& def, uint32_t const hash, uint32_t const fallback) noexcept {
    using property_t = typename Definition::property_t;
    return def.properties.value_or(property_t {hash}, fallback);
}

template <typename Definition>
int32_t get_int_(Definition const& def, uint32_t const hash, int32_t const fallback) noexcept {
    using property_t = typename Definition::property_t;
    return def.properties.template value_as_or<int32_t>(property_t {hash}, fallback);
}

template <typename Definition>
bool has_(Definition const& def, uint32_t const hash) noexcept {
    using property_t = typename Definition::property_t;
    return def.properties.has_property(property_t {hash});
}

uint32_t equip_slot_hash(int32_t const i) noexcept {
    static_string_buffer<16> buffer;
    buffer.append("equip_%d", i);
    auto const s = buffer.to_string_view();
    return djb2_hash_32(s.begin(), s.end());
}

bool is_integer(serialize_data_type const type) noexcept {
    return type == serialize_data_type::i32
        || type == serialize_data_type::u32;
}

// Properties this program understands must have a value of the right kind;
// anything else is kept as is.
bool is_expected_type(
    string_view         const name
  , uint32_t            const hash
  , serialize_data_type const type
) noexcept {
    using st = serialize_data_type;

    switch (hash) {
    case djb2_hash_32c("category"):   SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("armor_type"): SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("skin"):
        return type == st::string;
    case djb2_hash_32c("strength"):
        return type == st::float_p;
    case djb2_hash_32c("shiny"):
        return type == st::boolean;
    case djb2_hash_32c("weight"):         SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("value"):          SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("damage"):         SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("protection"):     SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("capacity"):       SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("contents"):       SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("max_hit_points"): SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("anchors"):        SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("spare_capacity"): SK_ATTRIBUTE_FALLTHROUGH;
    case djb2_hash_32c("equip_n"):
        return is_integer(type);
    default:
        break;
    }

    if (name.substr(0, 6) == string_view {"equip_"}) {
        return type == st::string;
    }

    return true;
}

} // namespace

game_database::~game_database() = default;

class game_database_impl final : public game_database {
public:
    game_database_impl(string_view const equipment_source
                     , string_view const entity_source
                     , bool        const from_files);

    equipment_definition const* find(equipment_id const id) const noexcept final override {
        return find_or_nullptr_(equipment_defs_, id);
    }

    entity_definition const* find(entity_id const id) const noexcept final override {
        return find_or_nullptr_(entity_defs_, id);
    }

    string_view find(equipment_property_id const id) const noexcept final override {
        return find_(equipment_properties_, id);
    }

    string_view find(entity_property_id const id) const noexcept final override {
        return find_(entity_properties_, id);
    }

    size_t equipment_definition_count() const noexcept final override {
        return equipment_defs_.size();
    }

    size_t entity_definition_count() const noexcept final override {
        return entity_defs_.size();
    }
private:
    template <typename Id, typename Container>
    static auto find_or_nullptr_(Container const& c, Id const id) noexcept
        -> typename Container::mapped_type const*
    {
        auto const it = c.find(id);
        return it != end(c) ? &it->second : nullptr;
    }

    template <typename Id, typename Container>
    string_view find_(Container const& c, Id const id) const noexcept {
        auto const it = c.find(id);
        return it != end(c)
          ? string_view {it->second.name}
          : string_view {"{none such}"};
    }

    void check_loadouts_() const;

    std::unordered_map<entity_id,    entity_definition,    identity_hash> entity_defs_;
    std::unordered_map<equipment_id, equipment_definition, identity_hash> equipment_defs_;

    struct property_data {
        serialize_data_type type;
        std::string         name;
        int32_t             count;
    };

    std::unordered_map<entity_property_id,    property_data, identity_hash> entity_properties_;
    std::unordered_map<equipment_property_id, property_data, identity_hash> equipment_properties_;
};

namespace {

template <typename Container>
auto load_definition_(Container& c) {
    using def_t = typename std::decay_t<Container>::mapped_type;

    return [&](def_t const& def) {
        auto const result = c.insert({def.id, def});
        if (!result.second) {
            if (result.first->second.id_string == def.id_string) {
                fail_(def, "defined more than once");
            }

            fail_(def, ("has the same hash as \"" + result.first->second.id_string + "\"").c_str());
        }
    };
}

template <typename Container>
auto load_property_(Container& c) {
    return [&](string_view         const string
             , uint32_t            const hash
             , serialize_data_type const type
             , uint32_t            const //value
        ) {
            using id_t = typename std::decay_t<Container>::key_type;

            if (!is_expected_type(string, hash, type)) {
                return false;
            }

            auto const id = id_t {hash};
            auto const it = c.find(id);

            if (it == end(c)) {
                c.insert({id, {type, std::string {string.data(), string.size()}, 1}});
                return true;
            }

            if (it->second.name != string) {
                throw data_error {"the properties \"" + it->second.name + "\" and \""
                  + std::string {string.data(), string.size()} + "\" have the same hash"};
            }

            ++it->second.count;

            return true;
        };
}

} // namespace

game_database_impl::game_database_impl(
    string_view const equipment_source
  , string_view const entity_source
  , bool        const from_files
) {
    auto const on_equipment = load_definition_(equipment_defs_);
    auto const on_entity    = load_definition_(entity_defs_);

    if (from_files) {
        load_equipment_definitions(equipment_source, on_equipment
                                 , load_property_(equipment_properties_));
        load_entity_definitions(entity_source, on_entity
                              , load_property_(entity_properties_));
    } else {
        parse_equipment_definitions(equipment_source, on_equipment
                                  , load_property_(equipment_properties_));
        parse_entity_definitions(entity_source, on_entity
                               , load_property_(entity_properties_));
    }

    check_loadouts_();
}

void game_database_impl::check_loadouts_() const {
    for (auto const& p : entity_defs_) {
        auto const& def = p.second;
        category_of(def);

        for (auto const id : loadout_of(def)) {
            if (!find(id)) {
                fail_(def, "carries equipment that isn't defined");
            }
        }
    }

    for (auto const& p : equipment_defs_) {
        to_equipment_data(p.second);
    }
}

std::unique_ptr<game_database> make_game_database(string_view const data_dir) {
    std::string dir {data_dir.data(), data_dir.size()};
    if (!dir.empty() && dir.back() != '/') {
        dir.push_back('/');
    }

    auto const equipment_file = dir + "equipment.dat";
    auto const entity_file    = dir + "entities.dat";

    return std::make_unique<game_database_impl>(
        equipment_file, entity_file, true);
}

std::unique_ptr<game_database> make_game_database(
    string_view const equipment_json
  , string_view const entity_json
) {
    return std::make_unique<game_database_impl>(
        equipment_json, entity_json, false);
}

equipment_data to_equipment_data(equipment_definition const& def) {
    equipment_data result;

    switch (get_(def, djb2_hash_32c("category"), 0u)) {
    case djb2_hash_32c("weapon"):   result.category = equipment_category::weapon;   break;
    case djb2_hash_32c("armor"):    result.category = equipment_category::armor;    break;
    case djb2_hash_32c("purse"):    result.category = equipment_category::purse;    break;
    case djb2_hash_32c("backpack"): result.category = equipment_category::backpack; break;
    default:
        fail_(def, "has no known category");
    }

    switch (get_(def, djb2_hash_32c("armor_type"), djb2_hash_32c("tin"))) {
    case djb2_hash_32c("tin"):    result.armor = armor_type::tin;    break;
    case djb2_hash_32c("bronze"): result.armor = armor_type::bronze; break;
    default:
        fail_(def, "has an unknown armor_type");
    }

    result.weight     = get_int_(def, djb2_hash_32c("weight"),     0);
    result.value      = get_int_(def, djb2_hash_32c("value"),      0);
    result.shiny      = get_(def, djb2_hash_32c("shiny"), 1u) != 0u;
    result.damage     = get_int_(def, djb2_hash_32c("damage"),     0);
    result.protection = get_int_(def, djb2_hash_32c("protection"), -1);
    result.capacity   = get_int_(def, djb2_hash_32c("capacity"),   0);
    result.contents   = get_int_(def, djb2_hash_32c("contents"),   0);

    return result;
}

entity_category category_of(entity_definition const& def) {
    switch (get_(def, djb2_hash_32c("category"), 0u)) {
    case djb2_hash_32c("hero"):    return entity_category::hero;
    case djb2_hash_32c("monster"): return entity_category::monster;
    default:
        break;
    }

    fail_(def, "has no known category");
}

hero_params to_hero_params(entity_definition const& def) {
    if (category_of(def) != entity_category::hero) {
        fail_(def, "is not a hero");
    }

    hero_params result;
    result.name           = def.name;
    result.max_hit_points = get_int_(def, djb2_hash_32c("max_hit_points"), 0);
    result.strength       = from_fixed_point(get_(def, djb2_hash_32c("strength"), 0u));
    result.protection     = get_int_(def, djb2_hash_32c("protection"), hero_base_protection);

    return result;
}

monster_params to_monster_params(entity_definition const& def) {
    if (category_of(def) != entity_category::monster) {
        fail_(def, "is not a monster");
    }

    monster_params result;
    result.name           = def.name;
    result.max_hit_points = get_int_(def, djb2_hash_32c("max_hit_points"), 0);
    result.damage         = get_int_(def, djb2_hash_32c("damage"), 0);
    result.protection     = get_int_(def, djb2_hash_32c("protection"), -1);
    result.anchors        = get_int_(def, djb2_hash_32c("anchors"), 0);
    result.spare_capacity = get_int_(def, djb2_hash_32c("spare_capacity"), 0);

    switch (get_(def, djb2_hash_32c("skin"), djb2_hash_32c("tough"))) {
    case djb2_hash_32c("tough"): result.skin = skin_type::tough; break;
    case djb2_hash_32c("thick"): result.skin = skin_type::thick; break;
    case djb2_hash_32c("scaly"): result.skin = skin_type::scaly; break;
    default:
        fail_(def, "has an unknown skin");
    }

    return result;
}

std::vector<equipment_id> loadout_of(entity_definition const& def) {
    auto const n = get_int_(def, djb2_hash_32c("equip_n"), 0);
    if (n < 0 || n > max_loadout_size) {
        fail_(def, "has an equip_n outside of [0, 10]");
    }

    std::vector<equipment_id> result;
    result.reserve(static_cast<size_t>(n));

    for (int32_t i = 0; i < n; ++i) {
        auto const slot = equip_slot_hash(i);
        if (!has_(def, slot)) {
            fail_(def, "is missing an equip_<i> for i below equip_n");
        }

        result.push_back(equipment_id {get_(def, slot, 0u)});
    }

    return result;
}

equipment_instance_id create_equipment(
    world&                     w
  , random_state&              rng
  , game_database const&       db
  , equipment_id         const id
) {
    auto const def = db.find(id);
    if (!def) {
        throw data_error {"no such equipment definition"};
    }

    return create_equipment(w, rng, to_equipment_data(*def));
}

entity_instance_id create_entity(
    world&                  w
  , random_state&           rng
  , game_database const&    db
  , entity_id         const id
) {
    auto const def = db.find(id);
    if (!def) {
        throw data_error {"no such entity definition"};
    }

    static_string_buffer<256> reason;

    // Check the entity itself before creating any of its equipment.
    auto const category = category_of(*def);
    hero_params    hero;
    monster_params monster;

    if (category == entity_category::hero) {
        hero = to_hero_params(*def);
        if (!can_create(hero, reason)) {
            throw construction_error {reason.to_string()};
        }
    } else {
        monster = to_monster_params(*def);
        if (!can_create(monster, reason)) {
            throw construction_error {reason.to_string()};
        }
    }

    std::vector<equipment_instance_id> loadout;
    for (auto const itm : loadout_of(*def)) {
        loadout.push_back(create_equipment(w, rng, db, itm));
    }

    return category == entity_category::hero
      ? create_hero(w, hero, loadout)
      : create_monster(w, monster, loadout);
}

} //namespace skirmish
