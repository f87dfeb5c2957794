#pragma once

#include "types.hpp"

#include <memory>
#include <functional>
#include <cstddef>

namespace skirmish { class equipment; }
namespace skirmish { class entity; }
namespace skirmish { class identity_registry; }

namespace skirmish {

//=====--------------------------------------------------------------------=====
// Owner of every entity and item in a simulation, addressed by instance id,
// and of the registry of identifications issued so far.
//=====--------------------------------------------------------------------=====
class world {
public:
    virtual ~world();

    virtual bool exists(equipment_instance_id id) const noexcept = 0;
    virtual bool exists(entity_instance_id    id) const noexcept = 0;

    //@{
    //! @returns The instance associated with a given @p id.
    //! @pre     The @p id must be valid.
    //! @note    References stay valid until the object is freed.

    virtual equipment const& find(equipment_instance_id id) const noexcept = 0;
    virtual entity    const& find(entity_instance_id    id) const noexcept = 0;
    virtual equipment&       find(equipment_instance_id id)       noexcept = 0;
    virtual entity&          find(entity_instance_id    id)       noexcept = 0;

    //@}

    //@{
    //! @returns The id of a new object created by the functor @p f.

    virtual equipment_instance_id create_object(
        std::function<equipment (equipment_instance_id)> const& f) = 0;
    virtual entity_instance_id create_object(
        std::function<entity (entity_instance_id)> const& f) = 0;

    //@}

    //! Release an entity that holds nothing; used to undo a failed creation.
    virtual void free_object(entity_instance_id id) noexcept = 0;

    virtual identity_registry&       identities()       noexcept = 0;
    virtual identity_registry const& identities() const noexcept = 0;

    virtual size_t equipment_count() const noexcept = 0;
    virtual size_t entity_count() const noexcept = 0;

    virtual void for_each_equipment(
        std::function<void (equipment const&)> const& f) const = 0;
    virtual void for_each_entity(
        std::function<void (entity const&)> const& f) const = 0;
};

std::unique_ptr<world> make_world();

} //namespace skirmish
