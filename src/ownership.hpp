#pragma once

#include "context.hpp"

#include <cstddef>

namespace skirmish { class equipment; }
namespace skirmish { class entity; }
namespace skirmish { class string_buffer_base; }

//
// The two relationships an item takes part in, with an entity holding it at
// an anchor point and with a backpack containing it, are changed only here.
// Every change updates both sides. The can_xxx functions report whether a
// change is allowed and, if not, why; the try_xxx functions make the change
// only if it is allowed and leave everything untouched otherwise.
//
// An item is never both held at an anchor and inside a backpack.
//

namespace skirmish {

//! true if anchor @p i of @p e may hold @p itm, ignoring whether it is free.
//! A hero's hands take weapons, its body armor, its belt a purse and its back
//! anything but a purse; a monster's anchors take anything.
bool can_place_at(entity const& e, size_t i, equipment const& itm) noexcept;

//! @returns The first free anchor of @p e that may hold @p itm, otherwise
//! anchor_none.
size_t first_accepting_anchor(entity const& e, equipment const& itm) noexcept;

//! true if @p e could take @p itm at one of its anchors.
bool can_accept(const_context ctx, entity const& e, equipment const& itm
              , string_buffer_base& result);

//@{
//! Make @p owner hold @p itm at the first anchor that accepts it, or, for a
//! null @p owner, release @p itm from its owner and its backpack.

bool can_set_owner(const_context ctx, equipment_instance_id itm
                 , entity_instance_id owner, string_buffer_base& result);

bool try_set_owner(context ctx, equipment_instance_id itm
                 , entity_instance_id owner, string_buffer_base& result);

//@}

//@{
//! Make @p owner hold @p itm at the anchor @p i specifically.

bool can_equip(const_context ctx, equipment_instance_id itm
             , entity_instance_id owner, size_t i, string_buffer_base& result);

bool try_equip(context ctx, equipment_instance_id itm
             , entity_instance_id owner, size_t i, string_buffer_base& result);

//@}

//! Put an armor on the body of a hero.
bool try_equip_armor(context ctx, entity_instance_id hero
                   , equipment_instance_id armor, string_buffer_base& result);

//@{
//! Put @p itm inside @p backpack, or for a null @p backpack take it out of
//! whatever backpack it is in. An item put into a backpack leaves the anchor
//! it was held at.

bool can_set_backpack(const_context ctx, equipment_instance_id itm
                    , equipment_instance_id backpack, string_buffer_base& result);

bool try_set_backpack(context ctx, equipment_instance_id itm
                    , equipment_instance_id backpack, string_buffer_base& result);

//@}

//! Destroy @p itm. A backpack first releases its contents, which keep their
//! own condition; a purse loses its coins. Destroying twice has no effect.
void destroy(context ctx, equipment_instance_id itm);

//@{
//! true if every reference from and to the object is matched by the other
//! side.

bool is_consistent(const_context ctx, equipment const& itm) noexcept;
bool is_consistent(const_context ctx, entity const& e) noexcept;

//@}

} //namespace skirmish
