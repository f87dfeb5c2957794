#pragma once

#include <cstdint>

namespace skirmish {

template <typename, typename> class tagged_value;

struct tag_id_equipment;
struct tag_id_instance_equipment;
struct tag_id_property_equipment;
struct tag_id_entity;
struct tag_id_instance_entity;
struct tag_id_property_entity;
struct tag_id_identification;

using equipment_id          = tagged_value<uint32_t, tag_id_equipment>;
using equipment_instance_id = tagged_value<uint32_t, tag_id_instance_equipment>;
using equipment_property_id = tagged_value<uint32_t, tag_id_property_equipment>;
using entity_id             = tagged_value<uint32_t, tag_id_entity>;
using entity_instance_id    = tagged_value<uint32_t, tag_id_instance_entity>;
using entity_property_id    = tagged_value<uint32_t, tag_id_property_entity>;

//! The category unique serial number stamped on every piece of equipment.
using identification        = tagged_value<int64_t, tag_id_identification>;

} // namespace skirmish
