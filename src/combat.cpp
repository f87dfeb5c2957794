#include "combat.hpp"
#include "entity.hpp"
#include "equipment.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "inventory.hpp"
#include "math.hpp"
#include "message_log.hpp"
#include "ownership.hpp"
#include "random.hpp"
#include "scope_guard.hpp"

#include "bkassert/assert.hpp"

#include <algorithm>
#include <vector>

namespace skirmish {

namespace {

constexpr int32_t hero_damage_threshold = 10;

entity& find_participant(context const ctx, entity_instance_id const id) {
    if (id == nullptr || !ctx.w.exists(id)) {
        throw null_target_error {"combat needs an entity on both sides"};
    }

    return ctx.w.find(id);
}

[[noreturn]] void fail(string_buffer_base const& reason) {
    throw combat_error {reason.to_string()};
}

// Damage from weapons held in the hands of a hero.
int32_t weapon_damage(const_context const ctx, entity const& hero) noexcept {
    int32_t result = 0;

    for (auto const id : {hero.left_hand(), hero.right_hand()}) {
        if (id != nullptr) {
            result += ctx.w.find(id).damage();
        }
    }

    return result;
}

bool can_ever_hurt(const_context const ctx, entity const& attacker, entity const& defender) noexcept {
    return effective_protection(ctx, defender) <= 100
        && attack_damage(ctx, attacker, defender) > 0;
}

} // namespace

int32_t effective_protection(const_context const ctx, entity const& e) noexcept {
    auto result = e.protection();

    if (e.is_a(entity_category::hero) && e.armor() != nullptr) {
        result += ctx.w.find(e.armor()).protection();
    }

    return result;
}

double attack_power(const_context const ctx, entity const& hero) noexcept {
    return hero.strength() + weapon_damage(ctx, hero);
}

int32_t attack_damage(
    const_context const  ctx
  , entity        const& attacker
  , entity        const& defender
) noexcept {
    if (attacker.is_a(entity_category::monster)) {
        return std::max(0, attacker.damage() - defender.protection());
    }

    // in hundredths
    auto const power = static_cast<int64_t>(attacker.strength_hundredths())
                     + 100 * static_cast<int64_t>(weapon_damage(ctx, attacker))
                     - 100 * hero_damage_threshold;

    return power <= 0 ? 0 : static_cast<int32_t>(power / 200);
}

hit_result hit(
    context            const ctx
  , random_state&            rng
  , message_log&             log
  , entity_instance_id const attacker_id
  , entity_instance_id const defender_id
) {
    auto& attacker = find_participant(ctx, attacker_id);
    auto& defender = find_participant(ctx, defender_id);

    static_string_buffer<256> buffer;

    if (attacker_id == defender_id) {
        buffer.append("%s can't attack itself", attacker.name().c_str());
        fail(buffer);
    } else if (!attacker.is_alive() || !defender.is_alive()) {
        buffer.append("%s and %s aren't both alive"
          , attacker.name().c_str(), defender.name().c_str());
        fail(buffer);
    }

    auto const was_attacker_fighting = attacker.is_fighting();
    auto const was_defender_fighting = defender.is_fighting();

    attacker.set_fighting(true);
    defender.set_fighting(true);

    auto const on_exit = SK_SCOPE_EXIT {
        attacker.set_fighting(was_attacker_fighting);
        defender.set_fighting(was_defender_fighting);
    };

    hit_result result;
    result.roll       = random_uniform_int(rng, 0, 100);
    result.protection = effective_protection(ctx, defender);

    if (result.roll < result.protection) {
        buffer.append("%s misses %s (rolled %d against %d)."
          , attacker.name().c_str(), defender.name().c_str()
          , result.roll, result.protection);
        println(log, buffer);
        return result;
    }

    result.connected = true;
    result.damage    = attack_damage(ctx, attacker, defender);

    // a defender left with no prime to rest on dies once the hit is over
    auto const before = defender.hit_points();
    auto const kills  = result.damage >= before
                     || (!was_defender_fighting
                      && closest_lower_prime(before - result.damage) == 0);

    if (!kills) {
        defender.remove_hit_points(result.damage);

        buffer.append("%s hits %s for %d damage; %d hit points remain."
          , attacker.name().c_str(), defender.name().c_str()
          , result.damage, defender.hit_points());
        println(log, buffer);
        return result;
    }

    result.fatal = true;
    defender.remove_hit_points(before);

    buffer.append("%s kills %s with a blow of %d damage."
      , attacker.name().c_str(), defender.name().c_str(), result.damage);
    println(log, buffer);

    if (attacker.is_a(entity_category::hero)) {
        heal_after_kill(ctx, rng, log, attacker_id);
    }

    loot(ctx, log, attacker_id, defender_id);

    return result;
}

int32_t heal_after_kill(
    context            const ctx
  , random_state&            rng
  , message_log&             log
  , entity_instance_id const hero_id
) {
    auto& hero = find_participant(ctx, hero_id);

    static_string_buffer<128> buffer;

    if (!hero.is_a(entity_category::hero)) {
        buffer.append("%s is not a hero", hero.name().c_str());
        fail(buffer);
    }

    auto const missing = hero.max_hit_points() - hero.hit_points();
    if (missing <= 0) {
        return 0;
    }

    auto const roll   = random_uniform_int(rng, 0, 100);
    auto const amount = static_cast<int32_t>(static_cast<int64_t>(missing) * roll / 100);

    hero.add_hit_points(amount);

    buffer.append("%s recovers %d hit points."
      , hero.name().c_str(), amount);
    println(log, buffer);

    return amount;
}

void loot(
    context            const ctx
  , message_log&             log
  , entity_instance_id const looter_id
  , entity_instance_id const defeated_id
) {
    auto const& looter   = find_participant(ctx, looter_id);
    auto const& defeated = find_participant(ctx, defeated_id);

    if (looter_id == defeated_id) {
        static_string_buffer<128> buffer;
        buffer.append("%s can't loot itself", looter.name().c_str());
        fail(buffer);
    }

    std::vector<equipment_instance_id> items;
    items.reserve(defeated.anchor_count());

    for (auto const& a : defeated.anchors()) {
        if (!a.is_free()) {
            items.push_back(a.item);
        }
    }

    std::stable_partition(begin(items), end(items)
      , [&](equipment_instance_id const id) noexcept {
            return ctx.w.find(id).is_shiny();
        });

    for (auto const id : items) {
        auto const& itm = ctx.w.find(id);

        static_string_buffer<64>  name;
        static_string_buffer<256> buffer;
        name_of(itm, name);

        if (first_accepting_anchor(looter, itm) != anchor_none) {
            static_string_buffer<256> reason;
            if (try_set_owner(ctx, id, looter_id, reason)) {
                buffer.append("%s takes %s from %s."
                  , looter.name().c_str(), name.data(), defeated.name().c_str());
            } else {
                buffer.append("%s leaves %s behind: %s."
                  , looter.name().c_str(), name.data(), reason.data());
            }
        } else if (itm.is_a(equipment_category::weapon)
                || itm.is_a(equipment_category::armor)
        ) {
            destroy(ctx, id);
            buffer.append("%s has no room for %s, which shatters."
              , looter.name().c_str(), name.data());
        } else {
            buffer.append("%s has no room for %s and leaves it on %s."
              , looter.name().c_str(), name.data(), defeated.name().c_str());
        }

        println(log, buffer);
    }
}

battle::battle(
    context            const ctx
  , entity_instance_id const a
  , entity_instance_id const b
)
  : ctx_    {ctx}
  , first_  {a}
  , second_ {b}
{
    auto const& e0 = find_participant(ctx_, first_);
    auto const& e1 = find_participant(ctx_, second_);

    static_string_buffer<256> buffer;

    if (first_ == second_) {
        buffer.append("%s can't fight itself", e0.name().c_str());
        fail(buffer);
    } else if (!e0.is_alive() || !e1.is_alive()) {
        buffer.append("%s and %s aren't both alive"
          , e0.name().c_str(), e1.name().c_str());
        fail(buffer);
    } else if (!can_ever_hurt(ctx_, e0, e1) && !can_ever_hurt(ctx_, e1, e0)) {
        buffer.append("neither %s nor %s can ever hurt the other"
          , e0.name().c_str(), e1.name().c_str());
        fail(buffer);
    }
}

entity_instance_id battle::fight(random_state& rng, message_log& log) {
    if (state_ == state::resolved) {
        return winner_;
    }

    state_ = state::in_progress;

    auto attacker = first_;
    auto defender = second_;
    if (!random_coin_flip(rng)) {
        std::swap(attacker, defender);
    }

    static_string_buffer<128> buffer;
    buffer.append("%s strikes first.", ctx_.w.find(attacker).name().c_str());
    println(log, buffer);

    auto const is_alive = [&](entity_instance_id const id) noexcept {
        return ctx_.w.find(id).is_alive();
    };

    while (is_alive(attacker) && is_alive(defender)) {
        hit(ctx_, rng, log, attacker, defender);
        ++turns_;
        std::swap(attacker, defender);
    }

    winner_ = is_alive(first_) ? first_ : second_;
    state_  = state::resolved;

    buffer.clear();
    buffer.append("%s wins after %d turns.", ctx_.w.find(winner_).name().c_str(), turns_);
    println(log, buffer);

    return winner_;
}

} //namespace skirmish
