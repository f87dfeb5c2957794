#include "inventory.hpp"
#include "entity.hpp"
#include "equipment.hpp"
#include "format.hpp"

#include <cinttypes>

namespace skirmish {

int64_t total_weight(const_context const ctx, equipment const& itm) noexcept {
    switch (itm.category()) {
    case equipment_category::weapon: SK_ATTRIBUTE_FALLTHROUGH;
    case equipment_category::armor:
        break;
    case equipment_category::purse:
        return itm.weight()
             + static_cast<int64_t>(itm.contents()) * purse_weight_per_dukat;
    case equipment_category::backpack:
        return itm.weight() + contained_weight(ctx, itm);
    }

    return itm.weight();
}

int64_t contained_weight(const_context const ctx, equipment const& backpack) noexcept {
    int64_t result = 0;

    backpack.items().for_each([&](equipment_instance_id const id) noexcept {
        result += total_weight(ctx, ctx.w.find(id));
    });

    return result;
}

int64_t total_weight(const_context const ctx, entity const& e) noexcept {
    int64_t result = 0;

    for (auto const& a : e.anchors()) {
        if (!a.is_free()) {
            result += total_weight(ctx, ctx.w.find(a.item));
        }
    }

    return result;
}

int64_t current_value(const_context const ctx, equipment const& itm) noexcept {
    switch (itm.category()) {
    case equipment_category::weapon:
        return static_cast<int64_t>(itm.damage()) * weapon_value_per_damage;
    case equipment_category::armor:
        return static_cast<int64_t>(itm.base_value()) * itm.protection()
             / itm.max_protection();
    case equipment_category::purse:
        return itm.contents();
    case equipment_category::backpack: {
        int64_t result = itm.base_value();
        itm.items().for_each([&](equipment_instance_id const id) noexcept {
            result += current_value(ctx, ctx.w.find(id));
        });
        return result;
    }
    }

    return itm.base_value();
}

entity_instance_id effective_owner(const_context const ctx, equipment const& itm) noexcept {
    auto const* p = &itm;
    while (p->container() != nullptr) {
        p = &ctx.w.find(p->container());
    }

    return p->owner();
}

bool is_inside(
    const_context         const  ctx
  , equipment             const& itm
  , equipment_instance_id const  backpack
) noexcept {
    for (auto id = itm.container(); id != nullptr; id = ctx.w.find(id).container()) {
        if (id == backpack) {
            return true;
        }
    }

    return false;
}

bool can_carry(const_context const ctx, entity const& e, equipment const& itm) noexcept {
    return total_weight(ctx, e) + total_weight(ctx, itm) <= e.capacity();
}

int32_t count_held(
    const_context      const  ctx
  , entity             const& e
  , equipment_category const  type
) noexcept {
    int32_t result = 0;

    for (auto const& a : e.anchors()) {
        if (!a.is_free() && ctx.w.find(a.item).is_a(type)) {
            ++result;
        }
    }

    return result;
}

void name_of(equipment const& itm, string_buffer_base& result) {
    auto const id = value_cast(itm.id());

    if (itm.is_a(equipment_category::armor)) {
        result.append("%s armor #%" PRId64, to_string(itm.armor()), id);
    } else {
        result.append("%s #%" PRId64, to_string(itm.category()), id);
    }
}

} //namespace skirmish
