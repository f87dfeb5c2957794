#pragma once

#include "config.hpp"
#include "types.hpp"

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace skirmish { class string_buffer_base; }

namespace skirmish {

//! A slot on an entity holding at most one item. Monster slots are anonymous.
struct anchor_point {
    std::string           name;
    equipment_instance_id item;

    bool is_free() const noexcept { return item == nullptr; }
};

constexpr size_t anchor_none = static_cast<size_t>(-1);

//! The fixed anchors of a hero, in the order they are tried.
enum class hero_anchor : uint8_t {
    left_hand, right_hand, body, belt, back
};

constexpr size_t hero_anchor_count = 5;

constexpr size_t index_of(hero_anchor const a) noexcept {
    return static_cast<size_t>(a);
}

char const* anchor_name(hero_anchor a) noexcept;

constexpr int32_t hero_base_protection       = 10;
constexpr int32_t hero_capacity_per_strength = 20;
constexpr int32_t hero_max_armors            = 2;
constexpr int32_t hero_max_purses            = 1;

constexpr int32_t monster_max_anchors = 10;

//! Starts with an uppercase letter and contains only letters, spaces,
//! apostrophes (at most two) and colons (each followed by a space).
bool is_valid_hero_name(string_view name) noexcept;

//! Starts with an uppercase letter and contains only letters, spaces and
//! apostrophes.
bool is_valid_monster_name(string_view name) noexcept;

struct hero_params {
    std::string name;
    int32_t     max_hit_points {0};
    double      strength       {0.0};
    int32_t     protection     {hero_base_protection};
};

struct monster_params {
    std::string name;
    int32_t     max_hit_points {0};
    int32_t     damage         {0};
    skin_type   skin           {skin_type::tough};
    int32_t     protection     {-1}; // negative means the skin's maximum
    int32_t     anchors        {0};
    int32_t     spare_capacity {0};  // added to the weight of the loadout
};

bool can_create(hero_params const& params, string_buffer_base& result);
bool can_create(monster_params const& params, string_buffer_base& result);

//=====--------------------------------------------------------------------=====
// A hero or a monster. Items enter and leave the anchor points only through
// the functions in ownership.hpp.
//=====--------------------------------------------------------------------=====
class entity {
    friend class ownership_access;
public:
    entity(entity_instance_id instance, hero_params const& params);

    //! @param capacity The carrying capacity; for a monster this is derived
    //! from its loadout.
    entity(entity_instance_id instance, monster_params const& params, int32_t capacity);

    entity_instance_id instance() const noexcept { return instance_; }
    entity_category    category() const noexcept { return category_; }
    std::string const& name()     const noexcept { return name_; }

    bool is_a(entity_category const type) const noexcept {
        return category_ == type;
    }

    //--------------------------------------------------------------------------
    // hit points
    //--------------------------------------------------------------------------
    int32_t hit_points()     const noexcept { return hit_points_; }
    int32_t max_hit_points() const noexcept { return max_hit_points_; }
    bool    is_alive()       const noexcept { return hit_points_ > 0; }

    bool is_fighting() const noexcept { return fighting_; }

    //! Leaving a fight rounds the hit points down to a prime.
    void set_fighting(bool fighting) noexcept;

    //! @returns false, changing nothing, if @p n is outside of
    //! [0, max_hit_points()].
    bool set_hit_points(int32_t n) noexcept;

    //! Clamped to [0, max_hit_points()].
    void add_hit_points(int32_t n) noexcept;
    void remove_hit_points(int32_t n) noexcept;

    //--------------------------------------------------------------------------
    // protection and capacity
    //--------------------------------------------------------------------------

    //! The protection of the entity itself: a hero's base protection, or a
    //! monster's current skin protection.
    int32_t protection() const noexcept { return protection_; }
    bool set_protection(int32_t n) noexcept;

    //! The largest total weight the entity can carry.
    int32_t capacity() const noexcept;

    //--------------------------------------------------------------------------
    // anchors
    //--------------------------------------------------------------------------
    size_t anchor_count() const noexcept { return anchors_.size(); }
    anchor_point const& anchor(size_t i) const noexcept;
    std::vector<anchor_point> const& anchors() const noexcept { return anchors_; }

    size_t find_anchor(string_view name) const noexcept;
    size_t find_item(equipment_instance_id itm) const noexcept;

    bool has_item(equipment_instance_id const itm) const noexcept {
        return find_item(itm) != anchor_none;
    }

    size_t free_anchor_count() const noexcept;

    //--------------------------------------------------------------------------
    // hero
    //--------------------------------------------------------------------------
    double  strength() const noexcept;
    int32_t strength_hundredths() const noexcept;

    //! Rounded to two decimals. @returns false, changing nothing, if
    //! @p factor is not positive or the result would not be positive.
    bool multiply_strength(double factor) noexcept;
    bool divide_strength(double divisor) noexcept;

    equipment_instance_id left_hand()  const noexcept;
    equipment_instance_id right_hand() const noexcept;
    equipment_instance_id armor()      const noexcept;

    //--------------------------------------------------------------------------
    // monster
    //--------------------------------------------------------------------------
    int32_t   damage() const noexcept;
    skin_type skin() const noexcept;
    int32_t   max_protection() const noexcept;
private:
    void place_(size_t i, equipment_instance_id itm, equipment_category type) noexcept;
    void vacate_(size_t i) noexcept;
    void normalize_hit_points_() noexcept;
    bool set_strength_(double hundredths) noexcept;

    entity_instance_id        instance_;
    entity_category           category_;
    std::string               name_;
    int32_t                   max_hit_points_;
    int32_t                   hit_points_ {};
    int32_t                   protection_ {};
    bool                      fighting_   {false};
    std::vector<anchor_point> anchors_;

    int32_t                   strength_   {};  // hundredths
    equipment_instance_id     left_hand_  {};
    equipment_instance_id     right_hand_ {};
    equipment_instance_id     armor_      {};

    int32_t                   damage_     {};
    skin_type                 skin_       {skin_type::tough};
    int32_t                   capacity_   {};
};

} //namespace skirmish
