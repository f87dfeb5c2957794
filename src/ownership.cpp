#include "ownership.hpp"
#include "entity.hpp"
#include "equipment.hpp"
#include "format.hpp"
#include "identity.hpp"
#include "inventory.hpp"
#include "scope_guard.hpp"

#include "bkassert/assert.hpp"

#include <cinttypes>

namespace skirmish {

//===------------------------------------------------------------------------===
// The raw references on both sides; no checking beyond the preconditions.
//===------------------------------------------------------------------------===
class ownership_access {
public:
    static void set_owner(equipment& itm, entity_instance_id const id) noexcept {
        itm.owner_ = id;
    }

    static void set_container(equipment& itm, equipment_instance_id const id) noexcept {
        itm.container_ = id;
    }

    static backpack_contents& items(equipment& backpack) noexcept {
        return backpack.items_;
    }

    static void destroy(equipment& itm) noexcept {
        itm.destroy_();
    }

    static void place(entity& e, size_t const i, equipment const& itm) noexcept {
        e.place_(i, itm.instance(), itm.category());
    }

    static void vacate(entity& e, size_t const i) noexcept {
        e.vacate_(i);
    }
};

namespace {

using access = ownership_access;

//
// The add and remove primitives expect the item side of the relationship to
// already be in its final state; anything else is a bug in the caller.
//

void entity_add(entity& e, equipment const& itm, size_t const i) noexcept {
    BK_ASSERT(itm.owner() == e.instance() && itm.container() == nullptr);
    BK_ASSERT(!e.has_item(itm.instance()));
    BK_ASSERT(i < e.anchor_count() && e.anchor(i).is_free());
    BK_ASSERT(can_place_at(e, i, itm));

    access::place(e, i, itm);
}

void entity_remove(entity& e, equipment const& itm) noexcept {
    BK_ASSERT(itm.owner() != e.instance());

    auto const i = e.find_item(itm.instance());
    BK_ASSERT(i != anchor_none);

    access::vacate(e, i);
}

// The capacity of the backpack has been checked by can_set_backpack.
void backpack_add(equipment& backpack, equipment const& itm) {
    BK_ASSERT(itm.container() == backpack.instance() && itm.owner() == nullptr);
    BK_ASSERT(!backpack.is_destroyed());

    auto const ok = access::items(backpack).insert(itm.id(), itm.instance());
    BK_ASSERT(ok);
}

void backpack_remove(equipment& backpack, equipment const& itm) noexcept {
    BK_ASSERT(itm.container() != backpack.instance());

    auto const ok = access::items(backpack).erase(itm.id(), itm.instance());
    BK_ASSERT(ok);
}

void release_from_owner(context const ctx, equipment& itm) noexcept {
    auto const owner = itm.owner();
    if (owner == nullptr) {
        return;
    }

    access::set_owner(itm, entity_instance_id {});
    entity_remove(ctx.w.find(owner), itm);
}

void release_from_container(context const ctx, equipment& itm) noexcept {
    auto const container = itm.container();
    if (container == nullptr) {
        return;
    }

    access::set_container(itm, equipment_instance_id {});
    backpack_remove(ctx.w.find(container), itm);
}

void attach(context const ctx, equipment& itm, entity& e, size_t const i) noexcept {
    release_from_container(ctx, itm);
    release_from_owner(ctx, itm);

    access::set_owner(itm, e.instance());
    entity_add(e, itm, i);
}

// Hero limits and weight; not which anchor.
bool can_take(
    const_context      const  ctx
  , entity             const& e
  , equipment          const& itm
  , string_buffer_base&       result
) {
    static_string_buffer<64> name;
    name_of(itm, name);

    if (e.is_a(entity_category::hero)) {
        if (itm.is_a(equipment_category::armor)
         && count_held(ctx, e, equipment_category::armor) >= hero_max_armors
        ) {
            result.append("%s already carries %d armors", e.name().c_str(), hero_max_armors);
            return false;
        }

        if (itm.is_a(equipment_category::purse)
         && count_held(ctx, e, equipment_category::purse) >= hero_max_purses
        ) {
            result.append("%s already carries a purse", e.name().c_str());
            return false;
        }
    }

    if (effective_owner(ctx, itm) != e.instance() && !can_carry(ctx, e, itm)) {
        result.append("%s can't carry %s; it weighs %" PRId64 " and %" PRId64
                      " of %d is already carried"
          , e.name().c_str(), name.data(), total_weight(ctx, itm)
          , total_weight(ctx, e), e.capacity());
        return false;
    }

    return true;
}

bool check_exists(
    const_context         const ctx
  , equipment_instance_id const itm
  , string_buffer_base&         result
) {
    if (!ctx.w.exists(itm)) {
        result.append("there is no item with instance id %" PRIu32, value_cast(itm));
        return false;
    }

    return true;
}

bool check_exists(
    const_context      const ctx
  , entity_instance_id const e
  , string_buffer_base&      result
) {
    if (!ctx.w.exists(e)) {
        result.append("there is no entity with instance id %" PRIu32, value_cast(e));
        return false;
    }

    return true;
}

} // namespace

bool can_place_at(entity const& e, size_t const i, equipment const& itm) noexcept {
    if (i >= e.anchor_count()) {
        return false;
    }

    if (!e.is_a(entity_category::hero)) {
        return true;
    }

    switch (static_cast<hero_anchor>(i)) {
    case hero_anchor::left_hand:  SK_ATTRIBUTE_FALLTHROUGH;
    case hero_anchor::right_hand: return itm.is_a(equipment_category::weapon);
    case hero_anchor::body:       return itm.is_a(equipment_category::armor);
    case hero_anchor::belt:       return itm.is_a(equipment_category::purse);
    case hero_anchor::back:       return true;
    }

    return false;
}

size_t first_accepting_anchor(entity const& e, equipment const& itm) noexcept {
    for (size_t i = 0; i < e.anchor_count(); ++i) {
        if (e.anchor(i).is_free() && can_place_at(e, i, itm)) {
            return i;
        }
    }

    return anchor_none;
}

bool can_accept(
    const_context      const  ctx
  , entity             const& e
  , equipment          const& itm
  , string_buffer_base&       result
) {
    if (!can_take(ctx, e, itm, result)) {
        return false;
    }

    if (first_accepting_anchor(e, itm) == anchor_none) {
        static_string_buffer<64> name;
        name_of(itm, name);

        result.append("%s has no free anchor point for %s"
          , e.name().c_str(), name.data());
        return false;
    }

    return true;
}

bool can_set_owner(
    const_context         const ctx
  , equipment_instance_id const itm_id
  , entity_instance_id    const owner_id
  , string_buffer_base&         result
) {
    if (!check_exists(ctx, itm_id, result)) {
        return false;
    }

    if (owner_id == nullptr) {
        return true;
    }

    if (!check_exists(ctx, owner_id, result)) {
        return false;
    }

    auto const& itm = ctx.w.find(itm_id);
    if (itm.owner() == owner_id) {
        return true;
    }

    return can_accept(ctx, ctx.w.find(owner_id), itm, result);
}

bool try_set_owner(
    context               const ctx
  , equipment_instance_id const itm_id
  , entity_instance_id    const owner_id
  , string_buffer_base&         result
) {
    if (!can_set_owner(ctx, itm_id, owner_id, result)) {
        return false;
    }

    auto& itm = ctx.w.find(itm_id);

    if (owner_id == nullptr) {
        release_from_container(ctx, itm);
        release_from_owner(ctx, itm);
        return true;
    }

    if (itm.owner() == owner_id) {
        return true;
    }

    auto& e = ctx.w.find(owner_id);
    auto const i = first_accepting_anchor(e, itm);
    BK_ASSERT(i != anchor_none);

    attach(ctx, itm, e, i);

    return true;
}

bool can_equip(
    const_context         const ctx
  , equipment_instance_id const itm_id
  , entity_instance_id    const owner_id
  , size_t                const i
  , string_buffer_base&         result
) {
    if (!check_exists(ctx, itm_id, result) || !check_exists(ctx, owner_id, result)) {
        return false;
    }

    auto const& itm = ctx.w.find(itm_id);
    auto const& e   = ctx.w.find(owner_id);

    if (i >= e.anchor_count()) {
        result.append("%s has no anchor point %zu", e.name().c_str(), i);
        return false;
    }

    auto const& a = e.anchor(i);
    if (a.item == itm_id) {
        return true;
    }

    static_string_buffer<64> name;
    name_of(itm, name);

    if (!a.is_free()) {
        result.append("%s's anchor point %zu (%s) is occupied"
          , e.name().c_str(), i, a.name.c_str());
        return false;
    }

    if (!can_place_at(e, i, itm)) {
        result.append("%s can't be held at %s's anchor point %zu (%s)"
          , name.data(), e.name().c_str(), i, a.name.c_str());
        return false;
    }

    // already held elsewhere by the same entity: only the anchor changes
    if (itm.owner() == owner_id) {
        return true;
    }

    return can_take(ctx, e, itm, result);
}

bool try_equip(
    context               const ctx
  , equipment_instance_id const itm_id
  , entity_instance_id    const owner_id
  , size_t                const i
  , string_buffer_base&         result
) {
    if (!can_equip(ctx, itm_id, owner_id, i, result)) {
        return false;
    }

    auto& itm = ctx.w.find(itm_id);
    auto& e   = ctx.w.find(owner_id);

    if (e.anchor(i).item != itm_id) {
        attach(ctx, itm, e, i);
    }

    return true;
}

bool try_equip_armor(
    context               const ctx
  , entity_instance_id    const hero
  , equipment_instance_id const armor
  , string_buffer_base&         result
) {
    if (!check_exists(ctx, armor, result) || !check_exists(ctx, hero, result)) {
        return false;
    }

    auto const& e = ctx.w.find(hero);
    if (!e.is_a(entity_category::hero)) {
        result.append("%s is not a hero", e.name().c_str());
        return false;
    }

    if (!ctx.w.find(armor).is_a(equipment_category::armor)) {
        result.append("only armor can be worn on the body");
        return false;
    }

    return try_equip(ctx, armor, hero, index_of(hero_anchor::body), result);
}

bool can_set_backpack(
    const_context         const ctx
  , equipment_instance_id const itm_id
  , equipment_instance_id const backpack_id
  , string_buffer_base&         result
) {
    if (!check_exists(ctx, itm_id, result)) {
        return false;
    }

    if (backpack_id == nullptr) {
        return true;
    }

    if (!check_exists(ctx, backpack_id, result)) {
        return false;
    }

    auto const& itm      = ctx.w.find(itm_id);
    auto const& backpack = ctx.w.find(backpack_id);

    static_string_buffer<64> itm_name;
    static_string_buffer<64> backpack_name;
    name_of(itm, itm_name);
    name_of(backpack, backpack_name);

    if (!backpack.is_a(equipment_category::backpack)) {
        result.append("%s is not a backpack", backpack_name.data());
        return false;
    }

    if (itm.container() == backpack_id) {
        return true;
    }

    if (itm_id == backpack_id || is_inside(ctx, backpack, itm_id)) {
        result.append("%s can't be put inside itself", itm_name.data());
        return false;
    }

    if (backpack.is_destroyed()) {
        result.append("%s is destroyed", backpack_name.data());
        return false;
    }

    // every backpack the item is not already inside of gains its weight
    auto const weight = total_weight(ctx, itm);
    for (auto const* p = &backpack; p; ) {
        if (!is_inside(ctx, itm, p->instance())
         && contained_weight(ctx, *p) + weight > p->capacity()
        ) {
            static_string_buffer<64> name;
            name_of(*p, name);

            result.append("%s can't hold %s; it weighs %" PRId64
                          " and %" PRId64 " of %d is already used"
              , name.data(), itm_name.data(), weight
              , contained_weight(ctx, *p), p->capacity());
            return false;
        }

        p = p->container() != nullptr ? &ctx.w.find(p->container()) : nullptr;
    }

    auto const new_owner = effective_owner(ctx, backpack);
    if (new_owner != nullptr && new_owner != effective_owner(ctx, itm)) {
        auto const& e = ctx.w.find(new_owner);
        if (!can_carry(ctx, e, itm)) {
            result.append("%s can't carry the extra weight of %s"
              , e.name().c_str(), itm_name.data());
            return false;
        }
    }

    return true;
}

bool try_set_backpack(
    context               const ctx
  , equipment_instance_id const itm_id
  , equipment_instance_id const backpack_id
  , string_buffer_base&         result
) {
    if (!can_set_backpack(ctx, itm_id, backpack_id, result)) {
        return false;
    }

    auto& itm = ctx.w.find(itm_id);

    if (backpack_id == nullptr) {
        release_from_container(ctx, itm);
        return true;
    }

    auto const previous = itm.container();
    if (previous == backpack_id) {
        return true;
    }

    auto const owner = itm.owner();

    access::set_container(itm, backpack_id);
    access::set_owner(itm, entity_instance_id {});

    auto on_fail = SK_SCOPE_EXIT {
        access::set_container(itm, previous);
        access::set_owner(itm, owner);
    };

    backpack_add(ctx.w.find(backpack_id), itm);

    on_fail.dismiss();

    if (previous != nullptr) {
        backpack_remove(ctx.w.find(previous), itm);
    }

    if (owner != nullptr) {
        entity_remove(ctx.w.find(owner), itm);
    }

    return true;
}

void destroy(context const ctx, equipment_instance_id const itm_id) {
    auto& itm = ctx.w.find(itm_id);
    if (itm.is_destroyed()) {
        return;
    }

    if (itm.is_a(equipment_category::backpack)) {
        for (auto const id : itm.items().items()) {
            auto& content = ctx.w.find(id);
            access::set_container(content, equipment_instance_id {});
            backpack_remove(itm, content);
        }
    }

    access::destroy(itm);
}

bool is_consistent(const_context const ctx, equipment const& itm) noexcept {
    auto const& ids = ctx.w.identities();
    if (!is_valid_identification(itm.category(), itm.id())
     || ids.is_unique(itm.category(), itm.id())
    ) {
        return false;
    }

    if (itm.owner() != nullptr) {
        if (itm.container() != nullptr
         || !ctx.w.exists(itm.owner())
         || !ctx.w.find(itm.owner()).has_item(itm.instance())
        ) {
            return false;
        }
    }

    if (itm.container() != nullptr) {
        if (!ctx.w.exists(itm.container())) {
            return false;
        }

        auto const& backpack = ctx.w.find(itm.container());
        if (!backpack.is_a(equipment_category::backpack)
         || !backpack.items().contains(itm.instance())
        ) {
            return false;
        }
    }

    if (!itm.is_a(equipment_category::backpack)) {
        return true;
    }

    bool ok = true;
    itm.items().for_each([&](equipment_instance_id const id) noexcept {
        ok = ok && ctx.w.exists(id) && ctx.w.find(id).container() == itm.instance();
    });

    return ok;
}

bool is_consistent(const_context const ctx, entity const& e) noexcept {
    for (size_t i = 0; i < e.anchor_count(); ++i) {
        auto const id = e.anchor(i).item;
        if (id == nullptr) {
            continue;
        }

        if (!ctx.w.exists(id)) {
            return false;
        }

        auto const& itm = ctx.w.find(id);
        if (itm.owner() != e.instance() || !can_place_at(e, i, itm)) {
            return false;
        }
    }

    if (!e.is_a(entity_category::hero)) {
        return true;
    }

    auto const mirrors = [&](equipment_instance_id const ref, hero_anchor const a
                           , equipment_category const type) noexcept {
        auto const held = e.anchor(index_of(a)).item;
        auto const expected = (held != nullptr && ctx.w.find(held).is_a(type))
          ? held
          : equipment_instance_id {};
        return ref == expected;
    };

    return mirrors(e.left_hand(),  hero_anchor::left_hand,  equipment_category::weapon)
        && mirrors(e.right_hand(), hero_anchor::right_hand, equipment_category::weapon)
        && mirrors(e.armor(),      hero_anchor::body,       equipment_category::armor);
}

} //namespace skirmish
