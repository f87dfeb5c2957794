#pragma once

#include "id_fwd.hpp"
#include "tagged_value.hpp"

#include <cstdint>
#include <cstddef>

namespace skirmish {
//===------------------------------------------------------------------------===
//                                  Tags
//===------------------------------------------------------------------------===
struct tag_id_equipment          {};
struct tag_id_instance_equipment {};
struct tag_id_property_equipment {};
struct tag_id_entity             {};
struct tag_id_instance_entity    {};
struct tag_id_property_entity    {};
struct tag_id_identification     {};

using equipment_property_value = uint32_t;
using entity_property_value    = uint32_t;

//===------------------------------------------------------------------------===
//                               Categories
//===------------------------------------------------------------------------===
enum class equipment_category : uint8_t {
    weapon, armor, purse, backpack
};

constexpr size_t equipment_category_count = 4;

enum class entity_category : uint8_t {
    hero, monster
};

//! Once destroyed, an item never returns to good.
enum class equipment_condition : uint8_t {
    good, destroyed
};

enum class armor_type : uint8_t {
    tin, bronze
};

enum class skin_type : uint8_t {
    tough, thick, scaly
};

constexpr int32_t max_protection(armor_type const type) noexcept {
    return type == armor_type::bronze ? 90 : 70;
}

constexpr int32_t max_protection(skin_type const type) noexcept {
    return type == skin_type::scaly ? 30
         : type == skin_type::thick ? 20
                                    : 10;
}

char const* to_string(equipment_category type) noexcept;
char const* to_string(entity_category type) noexcept;
char const* to_string(armor_type type) noexcept;
char const* to_string(skin_type type) noexcept;

} //namespace skirmish
