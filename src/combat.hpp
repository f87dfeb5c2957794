#pragma once

#include "context.hpp"

#include <cstdint>

namespace skirmish { class entity; }
namespace skirmish { class random_state; }
namespace skirmish { class message_log; }

namespace skirmish {

//! A hero's base protection plus the current protection of the armor on its
//! body; a monster's current skin protection.
int32_t effective_protection(const_context ctx, entity const& e) noexcept;

//! A hero's strength plus the damage of the weapons in its hands.
double attack_power(const_context ctx, entity const& hero) noexcept;

//! The damage @p attacker does to @p defender once a hit connects. A hero does
//! half of its attack power beyond 10; a monster its damage less the
//! defender's own protection. Never negative.
int32_t attack_damage(const_context ctx, entity const& attacker
                    , entity const& defender) noexcept;

struct hit_result {
    int32_t roll       {};
    int32_t protection {};
    int32_t damage     {};
    bool    connected  {false};
    bool    fatal      {false};
};

//! A single attack. A roll in [0, 100] at least equal to the defender's
//! effective protection connects. A blow that takes all the defender's hit
//! points, or leaves fewer than the smallest prime outside of a fight, kills
//! it; a hero that kills heals, and then the attacker loots.
//! Both sides are fighting for the duration of the attack.
//! @throws null_target_error if either side is missing.
//! @throws combat_error if the two are the same or either is dead.
hit_result hit(context ctx, random_state& rng, message_log& log
             , entity_instance_id attacker, entity_instance_id defender);

//! Heal a hero by a random share of its missing hit points.
//! @returns The number of hit points restored before rounding to a prime.
int32_t heal_after_kill(context ctx, random_state& rng, message_log& log
                      , entity_instance_id hero);

//! @p looter takes what it can from the anchors of @p defeated, shiny items
//! first. Weapons and armor it has no free anchor for shatter; purses and
//! backpacks are left behind.
void loot(context ctx, message_log& log
        , entity_instance_id looter, entity_instance_id defeated);

//=====--------------------------------------------------------------------=====
// A fight to the death between two entities taking alternate turns.
//=====--------------------------------------------------------------------=====
class battle {
public:
    enum class state : uint8_t {
        not_started, in_progress, resolved
    };

    //! @throws null_target_error if either side is missing.
    //! @throws combat_error if the two are the same, either is dead, or
    //! neither could ever hurt the other.
    battle(context ctx, entity_instance_id a, entity_instance_id b);

    //! Fight until one side is dead; a coin flip decides who attacks first.
    //! @returns The winner.
    entity_instance_id fight(random_state& rng, message_log& log);

    state              current_state() const noexcept { return state_; }
    entity_instance_id winner()        const noexcept { return winner_; }
    int32_t            turns()         const noexcept { return turns_; }
private:
    context            ctx_;
    entity_instance_id first_;
    entity_instance_id second_;
    entity_instance_id winner_ {};
    state              state_  {state::not_started};
    int32_t            turns_  {0};
};

} //namespace skirmish
