#include "world.hpp"
#include "allocator.hpp"
#include "entity.hpp"
#include "equipment.hpp"
#include "identity.hpp"

#include "bkassert/assert.hpp"

namespace skirmish {

world::~world() = default;

class world_impl final : public world {
public:
    bool exists(equipment_instance_id const id) const noexcept final override {
        return equipment_.is_allocated(value_cast<size_t>(id));
    }

    bool exists(entity_instance_id const id) const noexcept final override {
        return entities_.is_allocated(value_cast<size_t>(id));
    }

    equipment const& find(equipment_instance_id const id) const noexcept final override {
        BK_ASSERT(exists(id));
        return equipment_[value_cast<size_t>(id)];
    }

    entity const& find(entity_instance_id const id) const noexcept final override {
        BK_ASSERT(exists(id));
        return entities_[value_cast<size_t>(id)];
    }

    equipment& find(equipment_instance_id const id) noexcept final override {
        BK_ASSERT(exists(id));
        return equipment_[value_cast<size_t>(id)];
    }

    entity& find(entity_instance_id const id) noexcept final override {
        BK_ASSERT(exists(id));
        return entities_[value_cast<size_t>(id)];
    }

    equipment_instance_id create_object(
        std::function<equipment (equipment_instance_id)> const& f
    ) final override {
        return create_(equipment_, f);
    }

    entity_instance_id create_object(
        std::function<entity (entity_instance_id)> const& f
    ) final override {
        return create_(entities_, f);
    }

    void free_object(entity_instance_id const id) noexcept final override {
        BK_ASSERT(exists(id) && find(id).free_anchor_count() == find(id).anchor_count());
        entities_.deallocate(value_cast<size_t>(id));
    }

    identity_registry& identities() noexcept final override {
        return identities_;
    }

    identity_registry const& identities() const noexcept final override {
        return identities_;
    }

    size_t equipment_count() const noexcept final override {
        return equipment_.size();
    }

    size_t entity_count() const noexcept final override {
        return entities_.size();
    }

    void for_each_equipment(
        std::function<void (equipment const&)> const& f
    ) const final override {
        equipment_.for_each(f);
    }

    void for_each_entity(
        std::function<void (entity const&)> const& f
    ) const final override {
        entities_.for_each(f);
    }
private:
    template <typename T, typename Id>
    static Id create_(
        stable_block_storage<T>&           storage
      , std::function<T (Id)>       const& f
    ) {
        auto const id = Id {static_cast<uint32_t>(storage.next_block_id())};
        auto const result = storage.allocate(f(id));

        BK_ASSERT(result.second == value_cast<size_t>(id));
        return id;
    }

    stable_block_storage<equipment> equipment_;
    stable_block_storage<entity>    entities_;
    identity_registry               identities_;
};

std::unique_ptr<world> make_world() {
    return std::make_unique<world_impl>();
}

} //namespace skirmish
