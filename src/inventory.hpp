#pragma once

#include "context.hpp"

#include <cstdint>

namespace skirmish { class equipment; }
namespace skirmish { class entity; }
namespace skirmish { class string_buffer_base; }

namespace skirmish {

//! The weight of @p itm and everything in it; a purse also weighs its coins.
int64_t total_weight(const_context ctx, equipment const& itm) noexcept;

//! The weight of everything inside @p backpack, excluding its own.
int64_t contained_weight(const_context ctx, equipment const& backpack) noexcept;

//! The weight of everything held at the anchors of @p e, recursively.
int64_t total_weight(const_context ctx, entity const& e) noexcept;

//! Weapon: twice its damage; armor: base value scaled by the remaining
//! protection; purse: its coins; backpack: base value plus the value of its
//! contents.
int64_t current_value(const_context ctx, equipment const& itm) noexcept;

//! The entity ultimately carrying @p itm, through any number of backpacks.
entity_instance_id effective_owner(const_context ctx, equipment const& itm) noexcept;

//! true if @p itm is inside @p backpack, directly or through nested backpacks.
bool is_inside(const_context ctx, equipment const& itm, equipment_instance_id backpack) noexcept;

//! true if @p e can carry the additional weight of @p itm.
bool can_carry(const_context ctx, entity const& e, equipment const& itm) noexcept;

//! The number of items of @p type held directly at the anchors of @p e.
int32_t count_held(const_context ctx, entity const& e, equipment_category type) noexcept;

//! e.g. "bronze armor #7919".
void name_of(equipment const& itm, string_buffer_base& result);

} //namespace skirmish
