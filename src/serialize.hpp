#pragma once

#include "config.hpp"

#include <functional>
#include <cstdint>
#include <cstddef>

namespace skirmish { struct equipment_definition; }
namespace skirmish { struct entity_definition; }

namespace skirmish {

enum class serialize_data_type : uint32_t {
  null, boolean, i32, u32, float_p, string
};

using on_finish_equipment_definition = std::function<
    void (equipment_definition const& definition)>;

using on_finish_entity_definition = std::function<
    void (entity_definition const& definition)>;

//! Called for every property read; returning false rejects the file.
using on_add_new_property = std::function<
    bool (string_view         string
        , uint32_t            hash
        , serialize_data_type type
        , uint32_t            value
    )>;

//@{
//! Read the definitions in the file @p filename, a JSON object of the form
//! {"type": "equipment", "data": {"<id>": {"name": "...", "properties": {...}}}}
//! (or "entities" for entity definitions).
//! @throws data_error if the file can't be read or isn't of that form.

void load_equipment_definitions(
    string_view                    filename
  , on_finish_equipment_definition const& on_finish
  , on_add_new_property            const& on_property);

void load_entity_definitions(
    string_view                 filename
  , on_finish_entity_definition const& on_finish
  , on_add_new_property         const& on_property);

//@}

//@{
//! As above, but reading from the text @p json.

void parse_equipment_definitions(
    string_view                    json
  , on_finish_equipment_definition const& on_finish
  , on_add_new_property            const& on_property);

void parse_entity_definitions(
    string_view                 json
  , on_finish_entity_definition const& on_finish
  , on_add_new_property         const& on_property);

//@}

uint32_t to_property(std::nullptr_t n) noexcept;
uint32_t to_property(bool n) noexcept;
uint32_t to_property(int32_t n) noexcept;
uint32_t to_property(uint32_t n) noexcept;
uint32_t to_property(double n) noexcept;      // 16.16 fixed point
uint32_t to_property(string_view n) noexcept; // djb2 hash

//! The inverse of to_property(double).
double from_fixed_point(uint32_t n) noexcept;

} //namespace skirmish
