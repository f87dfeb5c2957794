#include "create.hpp"
#include "context.hpp"
#include "entity.hpp"
#include "equipment.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "identity.hpp"
#include "inventory.hpp"
#include "ownership.hpp"
#include "scope_guard.hpp"
#include "world.hpp"

#include "bkassert/assert.hpp"

#include <algorithm>
#include <limits>
#include <cinttypes>

namespace skirmish {

namespace {

[[noreturn]] void fail(string_buffer_base const& reason) {
    throw construction_error {reason.to_string()};
}

void check_loadout(
    world                              const& w
  , std::vector<equipment_instance_id> const& loadout
  , string_buffer_base&                       reason
) {
    for (auto it = begin(loadout); it != end(loadout); ++it) {
        auto const id = *it;

        if (!w.exists(id)) {
            reason.append("there is no item with instance id %" PRIu32, value_cast(id));
            fail(reason);
        }

        auto const& itm = w.find(id);
        if (itm.owner() != nullptr || itm.container() != nullptr) {
            name_of(itm, reason);
            reason.append(" already belongs to something else");
            fail(reason);
        }

        if (std::find(begin(loadout), it, id) != it) {
            name_of(itm, reason);
            reason.append(" is listed twice");
            fail(reason);
        }
    }
}

// Release everything the new entity picked up and remove it again.
template <typename Loadout>
auto make_rollback(world& w, entity_instance_id const id, Loadout const& loadout) {
    return detail::scope_guard_tag {} + [&w, id, &loadout]() noexcept {
        static_string_buffer<128> ignored;
        for (auto const itm : loadout) {
            if (w.find(itm).owner() == id) {
                auto const ok = try_set_owner(w, itm, entity_instance_id {}, ignored);
                BK_ASSERT(ok);
            }
        }

        w.free_object(id);
    };
}

} // namespace

equipment_instance_id create_equipment(
    world&                w
  , random_state&         rng
  , equipment_data const& data
) {
    static_string_buffer<128> reason;
    if (!can_create(data, reason)) {
        fail(reason);
    }

    auto& ids = w.identities();
    auto const id = ids.generate(data.category, rng);

    auto const result = w.create_object([&](equipment_instance_id const instance) {
        return equipment {instance, id, data};
    });

    auto const ok = ids.add(data.category, id);
    BK_ASSERT(ok);

    return result;
}

equipment_instance_id create_weapon(
    world&        w
  , random_state& rng
  , int32_t const weight
  , int32_t const value
  , int32_t const damage
) {
    return create_equipment(w, rng, weapon_data(weight, value, damage));
}

equipment_instance_id create_armor(
    world&           w
  , random_state&    rng
  , int32_t    const weight
  , int32_t    const value
  , armor_type const type
) {
    return create_equipment(w, rng, armor_data(weight, value, type));
}

equipment_instance_id create_purse(
    world&        w
  , random_state& rng
  , int32_t const weight
  , int32_t const capacity
  , int32_t const contents
) {
    return create_equipment(w, rng, purse_data(weight, capacity, contents));
}

equipment_instance_id create_backpack(
    world&        w
  , random_state& rng
  , int32_t const weight
  , int32_t const value
  , int32_t const capacity
) {
    return create_equipment(w, rng, backpack_data(weight, value, capacity));
}

entity_instance_id create_hero(
    world&                                    w
  , hero_params                        const& params
  , std::vector<equipment_instance_id> const& loadout
) {
    static_string_buffer<256> reason;
    if (!can_create(params, reason)) {
        fail(reason);
    }

    check_loadout(w, loadout, reason);

    auto const hero = w.create_object([&](entity_instance_id const instance) {
        return entity {instance, params};
    });

    auto on_fail = make_rollback(w, hero, loadout);

    for (auto const itm : loadout) {
        if (!try_set_owner(w, itm, hero, reason)) {
            fail(reason);
        }
    }

    on_fail.dismiss();

    return hero;
}

entity_instance_id create_monster(
    world&                                    w
  , monster_params                     const& params
  , std::vector<equipment_instance_id> const& loadout
) {
    static_string_buffer<256> reason;
    if (!can_create(params, reason)) {
        fail(reason);
    }

    if (loadout.size() > static_cast<size_t>(params.anchors)) {
        reason.append("%s has %d anchor points for %zu items"
          , params.name.c_str(), params.anchors, loadout.size());
        fail(reason);
    }

    check_loadout(w, loadout, reason);

    int64_t capacity = params.spare_capacity;
    for (auto const itm : loadout) {
        capacity += total_weight(w, w.find(itm));
    }

    if (capacity > std::numeric_limits<int32_t>::max()) {
        reason.append("%s's loadout is too heavy to carry", params.name.c_str());
        fail(reason);
    }

    auto const monster = w.create_object([&](entity_instance_id const instance) {
        return entity {instance, params, static_cast<int32_t>(capacity)};
    });

    auto on_fail = make_rollback(w, monster, loadout);

    for (size_t i = 0; i < loadout.size(); ++i) {
        if (!try_equip(w, loadout[i], monster, i, reason)) {
            fail(reason);
        }
    }

    on_fail.dismiss();

    return monster;
}

} //namespace skirmish
