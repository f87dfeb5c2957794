#pragma once

#include "types.hpp"
#include "backpack_contents.hpp"

#include <cstdint>

namespace skirmish { class string_buffer_base; }

namespace skirmish {

//! Each dukat in a purse weighs this much.
constexpr int32_t purse_weight_per_dukat = 50;

//! A weapon's value per point of damage.
constexpr int32_t weapon_value_per_damage = 2;

//! The largest base value an item of the given category may have.
constexpr int32_t max_value(equipment_category const type) noexcept {
    return type == equipment_category::backpack ? 500
         : type == equipment_category::purse    ? 0
                                                : 1000;
}

//! A positive multiple of 7 no greater than 100.
constexpr bool is_valid_damage(int32_t const n) noexcept {
    return n > 0 && n <= 100 && n % 7 == 0;
}

//=====--------------------------------------------------------------------=====
// Everything needed to build a piece of equipment, apart from its identity.
// Members that do not apply to the category are ignored.
//=====--------------------------------------------------------------------=====
struct equipment_data {
    equipment_category category   {equipment_category::weapon};
    int32_t            weight     {0};
    int32_t            value      {0};
    bool               shiny      {true};

    int32_t            damage     {0};   // weapon
    armor_type         armor      {armor_type::tin};
    int32_t            protection {-1};  // armor; negative means the maximum
    int32_t            capacity   {0};   // purse and backpack
    int32_t            contents   {0};   // purse
};

equipment_data weapon_data(int32_t weight, int32_t value, int32_t damage) noexcept;
equipment_data armor_data(int32_t weight, int32_t value, armor_type type) noexcept;
equipment_data purse_data(int32_t weight, int32_t capacity, int32_t contents = 0) noexcept;
equipment_data backpack_data(int32_t weight, int32_t value, int32_t capacity) noexcept;

//! @returns true if @p data describes a valid piece of equipment. Otherwise
//! false with the reason appended to @p result.
bool can_create(equipment_data const& data, string_buffer_base& result);

//=====--------------------------------------------------------------------=====
// A weapon, armor, purse or backpack. The owner and container references are
// changed only by the functions in ownership.hpp, which keep both sides of
// each relationship in step.
//=====--------------------------------------------------------------------=====
class equipment {
    friend class ownership_access;
public:
    equipment(equipment_instance_id instance
            , identification        id
            , equipment_data const& data);

    equipment_instance_id instance() const noexcept { return instance_; }
    equipment_category    category() const noexcept { return category_; }
    identification        id()       const noexcept { return id_; }

    bool is_a(equipment_category const type) const noexcept {
        return category_ == type;
    }

    int32_t weight()     const noexcept { return weight_; }
    int32_t base_value() const noexcept { return base_value_; }

    equipment_condition condition() const noexcept { return condition_; }
    bool is_destroyed() const noexcept {
        return condition_ == equipment_condition::destroyed;
    }

    bool is_shiny() const noexcept { return shiny_; }
    void set_shiny(bool const shiny) noexcept { shiny_ = shiny; }

    //! The entity holding this at one of its anchor points, if any.
    entity_instance_id owner() const noexcept { return owner_; }

    //! The backpack this is inside of, if any.
    equipment_instance_id container() const noexcept { return container_; }

    //--------------------------------------------------------------------------
    // weapon
    //--------------------------------------------------------------------------
    int32_t damage() const noexcept;
    bool set_damage(int32_t n) noexcept;

    //--------------------------------------------------------------------------
    // armor
    //--------------------------------------------------------------------------
    armor_type armor() const noexcept;
    int32_t max_protection() const noexcept;
    int32_t protection() const noexcept;

    //! @returns false, leaving the protection unchanged, if @p n is outside of
    //! [0, max_protection()].
    bool set_protection(int32_t n) noexcept;

    //--------------------------------------------------------------------------
    // purse and backpack
    //--------------------------------------------------------------------------
    int32_t capacity() const noexcept;

    //--------------------------------------------------------------------------
    // purse; none of these have any effect once the purse is destroyed.
    //--------------------------------------------------------------------------
    int32_t contents() const noexcept;
    int32_t free_space() const noexcept;

    //! More than capacity rips the purse; less than 0 empties it.
    void set_contents(int32_t n) noexcept;
    void add_to_contents(int32_t n) noexcept;
    void remove_from_contents(int32_t n) noexcept;
    void empty_contents() noexcept;
    void fill_to_capacity() noexcept;

    //! Move the contents of @p other into this purse. If they do not fit,
    //! @p other gives up as much as this purse had room for and this purse
    //! rips.
    void transfer_from(equipment& other) noexcept;

    //--------------------------------------------------------------------------
    // backpack
    //--------------------------------------------------------------------------
    backpack_contents const& items() const noexcept;
private:
    void destroy_() noexcept;

    equipment_instance_id instance_;
    identification        id_;
    equipment_category    category_;
    equipment_condition   condition_ {equipment_condition::good};
    bool                  shiny_;
    int32_t               weight_;
    int32_t               base_value_;

    entity_instance_id    owner_     {};
    equipment_instance_id container_ {};

    int32_t               damage_         {};
    armor_type            armor_          {armor_type::tin};
    int32_t               max_protection_ {};
    int32_t               protection_     {};
    int32_t               capacity_       {};
    int32_t               contents_       {};
    backpack_contents     items_          {};
};

} //namespace skirmish
