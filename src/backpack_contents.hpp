#pragma once

#include "types.hpp"

#include <map>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace skirmish {

//=====--------------------------------------------------------------------=====
// The items inside a backpack, grouped by identification. Items sharing an
// identification (possible across categories) cluster in one group, kept in
// insertion order.
//=====--------------------------------------------------------------------=====
class backpack_contents {
public:
    size_t size()  const noexcept { return size_; }
    bool   empty() const noexcept { return size_ == 0; }

    bool contains(equipment_instance_id itm) const noexcept;
    bool contains(identification id) const noexcept;

    //! The number of items with identification @p id.
    size_t count(identification id) const noexcept;

    //! The @p i-th item with identification @p id, or a null id.
    equipment_instance_id at(identification id, size_t i) const noexcept;

    //! Every contained item; ordered by identification, then insertion.
    std::vector<equipment_instance_id> items() const;

    template <typename F>
    void for_each(F&& f) const {
        for (auto const& group : groups_) {
            for (auto const itm : group.second) {
                f(itm);
            }
        }
    }

    //! @returns false if @p itm is already present.
    bool insert(identification id, equipment_instance_id itm);

    //! @returns false if @p itm is not present under @p id.
    bool erase(identification id, equipment_instance_id itm) noexcept;
private:
    using group_t = std::vector<equipment_instance_id>;

    std::map<identification, group_t> groups_;
    size_t                            size_ {};
};

} //namespace skirmish
