#include "equipment.hpp"
#include "format.hpp"
#include "math.hpp"

#include "bkassert/assert.hpp"

namespace skirmish {

equipment_data weapon_data(
    int32_t const weight
  , int32_t const value
  , int32_t const damage
) noexcept {
    equipment_data result;
    result.category = equipment_category::weapon;
    result.weight   = weight;
    result.value    = value;
    result.damage   = damage;
    return result;
}

equipment_data armor_data(
    int32_t    const weight
  , int32_t    const value
  , armor_type const type
) noexcept {
    equipment_data result;
    result.category = equipment_category::armor;
    result.weight   = weight;
    result.value    = value;
    result.armor    = type;
    return result;
}

equipment_data purse_data(
    int32_t const weight
  , int32_t const capacity
  , int32_t const contents
) noexcept {
    equipment_data result;
    result.category = equipment_category::purse;
    result.weight   = weight;
    result.capacity = capacity;
    result.contents = contents;
    return result;
}

equipment_data backpack_data(
    int32_t const weight
  , int32_t const value
  , int32_t const capacity
) noexcept {
    equipment_data result;
    result.category = equipment_category::backpack;
    result.weight   = weight;
    result.value    = value;
    result.capacity = capacity;
    return result;
}

bool can_create(equipment_data const& data, string_buffer_base& result) {
    auto const type = to_string(data.category);

    if (data.weight < 0) {
        result.append("a %s can't have a negative weight (%d)", type, data.weight);
        return false;
    }

    auto const max = max_value(data.category);
    if (data.value < 0 || data.value > max) {
        result.append("a %s's value must be in [0, %d], not %d", type, max, data.value);
        return false;
    }

    switch (data.category) {
    case equipment_category::weapon:
        if (!is_valid_damage(data.damage)) {
            result.append("%d is not a positive multiple of 7 up to 100", data.damage);
            return false;
        }
        break;
    case equipment_category::armor:
        if (data.protection > max_protection(data.armor)) {
            result.append("%s armor protects at most %d, not %d"
              , to_string(data.armor), max_protection(data.armor), data.protection);
            return false;
        }
        break;
    case equipment_category::purse:
        if (data.capacity < 0) {
            result.append("a purse can't have a negative capacity (%d)", data.capacity);
            return false;
        } else if (data.contents < 0 || data.contents > data.capacity) {
            result.append("a purse of capacity %d can't hold %d dukaten"
              , data.capacity, data.contents);
            return false;
        }
        break;
    case equipment_category::backpack:
        if (data.capacity < 0) {
            result.append("a backpack can't have a negative capacity (%d)", data.capacity);
            return false;
        }
        break;
    }

    return true;
}

equipment::equipment(
    equipment_instance_id const instance
  , identification        const id
  , equipment_data        const& data
)
  : instance_   {instance}
  , id_         {id}
  , category_   {data.category}
  , shiny_      {data.shiny}
  , weight_     {data.weight}
  , base_value_ {data.value}
{
    switch (category_) {
    case equipment_category::weapon:
        damage_ = data.damage;
        break;
    case equipment_category::armor:
        armor_          = data.armor;
        max_protection_ = skirmish::max_protection(data.armor);
        protection_     = data.protection < 0 ? max_protection_ : data.protection;
        break;
    case equipment_category::purse:
        capacity_ = data.capacity;
        contents_ = data.contents;
        break;
    case equipment_category::backpack:
        capacity_ = data.capacity;
        break;
    }
}

int32_t equipment::damage() const noexcept {
    BK_ASSERT(is_a(equipment_category::weapon));
    return damage_;
}

bool equipment::set_damage(int32_t const n) noexcept {
    BK_ASSERT(is_a(equipment_category::weapon));
    if (!is_valid_damage(n)) {
        return false;
    }

    damage_ = n;
    return true;
}

armor_type equipment::armor() const noexcept {
    BK_ASSERT(is_a(equipment_category::armor));
    return armor_;
}

int32_t equipment::max_protection() const noexcept {
    BK_ASSERT(is_a(equipment_category::armor));
    return max_protection_;
}

int32_t equipment::protection() const noexcept {
    BK_ASSERT(is_a(equipment_category::armor));
    return protection_;
}

bool equipment::set_protection(int32_t const n) noexcept {
    BK_ASSERT(is_a(equipment_category::armor));
    if (n < 0 || n > max_protection_) {
        return false;
    }

    protection_ = n;
    return true;
}

int32_t equipment::capacity() const noexcept {
    BK_ASSERT(is_a(equipment_category::purse) || is_a(equipment_category::backpack));
    return capacity_;
}

int32_t equipment::contents() const noexcept {
    BK_ASSERT(is_a(equipment_category::purse));
    return contents_;
}

int32_t equipment::free_space() const noexcept {
    BK_ASSERT(is_a(equipment_category::purse));
    return capacity_ - contents_;
}

void equipment::set_contents(int32_t const n) noexcept {
    BK_ASSERT(is_a(equipment_category::purse));
    if (is_destroyed()) {
        return;
    }

    if (n > capacity_) {
        destroy_();
    } else {
        contents_ = n < 0 ? 0 : n;
    }
}

void equipment::add_to_contents(int32_t const n) noexcept {
    if (n <= 0 || is_destroyed()) {
        return;
    }

    if (n > free_space()) {
        destroy_();
    } else {
        contents_ += n;
    }
}

void equipment::remove_from_contents(int32_t const n) noexcept {
    if (n > 0 && !is_destroyed()) {
        set_contents(contents_ - clamp(n, 0, contents_));
    }
}

void equipment::empty_contents() noexcept {
    set_contents(0);
}

void equipment::fill_to_capacity() noexcept {
    set_contents(capacity_);
}

void equipment::transfer_from(equipment& other) noexcept {
    BK_ASSERT(is_a(equipment_category::purse)
           && other.is_a(equipment_category::purse));

    if (&other == this || is_destroyed() || other.is_destroyed()) {
        return;
    }

    auto const amount = other.contents();
    auto const room   = free_space();

    if (amount <= room) {
        add_to_contents(amount);
        other.empty_contents();
    } else {
        other.remove_from_contents(room);
        destroy_();
    }
}

backpack_contents const& equipment::items() const noexcept {
    BK_ASSERT(is_a(equipment_category::backpack));
    return items_;
}

void equipment::destroy_() noexcept {
    if (is_a(equipment_category::purse)) {
        contents_ = 0;
    }

    condition_ = equipment_condition::destroyed;
}

} //namespace skirmish
