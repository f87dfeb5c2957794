#include "types.hpp"

namespace skirmish {

char const* to_string(equipment_category const type) noexcept {
    switch (type) {
    case equipment_category::weapon:   return "weapon";
    case equipment_category::armor:    return "armor";
    case equipment_category::purse:    return "purse";
    case equipment_category::backpack: return "backpack";
    }

    return "{unknown}";
}

char const* to_string(entity_category const type) noexcept {
    switch (type) {
    case entity_category::hero:    return "hero";
    case entity_category::monster: return "monster";
    }

    return "{unknown}";
}

char const* to_string(armor_type const type) noexcept {
    switch (type) {
    case armor_type::tin:    return "tin";
    case armor_type::bronze: return "bronze";
    }

    return "{unknown}";
}

char const* to_string(skin_type const type) noexcept {
    switch (type) {
    case skin_type::tough: return "tough";
    case skin_type::thick: return "thick";
    case skin_type::scaly: return "scaly";
    }

    return "{unknown}";
}

} //namespace skirmish
