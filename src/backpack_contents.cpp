#include "backpack_contents.hpp"

#include <algorithm>

namespace skirmish {

bool backpack_contents::contains(equipment_instance_id const itm) const noexcept {
    return std::any_of(begin(groups_), end(groups_)
      , [&](auto const& group) noexcept {
            auto const& items = group.second;
            return std::find(begin(items), end(items), itm) != end(items);
        });
}

bool backpack_contents::contains(identification const id) const noexcept {
    return groups_.find(id) != end(groups_);
}

size_t backpack_contents::count(identification const id) const noexcept {
    auto const it = groups_.find(id);
    return it == end(groups_) ? 0u : it->second.size();
}

equipment_instance_id backpack_contents::at(
    identification const id
  , size_t         const i
) const noexcept {
    auto const it = groups_.find(id);
    if (it == end(groups_) || i >= it->second.size()) {
        return equipment_instance_id {};
    }

    return it->second[i];
}

std::vector<equipment_instance_id> backpack_contents::items() const {
    std::vector<equipment_instance_id> result;
    result.reserve(size_);

    for_each([&](equipment_instance_id const itm) {
        result.push_back(itm);
    });

    return result;
}

bool backpack_contents::insert(
    identification        const id
  , equipment_instance_id const itm
) {
    if (contains(itm)) {
        return false;
    }

    groups_[id].push_back(itm);
    ++size_;

    return true;
}

bool backpack_contents::erase(
    identification        const id
  , equipment_instance_id const itm
) noexcept {
    auto const it = groups_.find(id);
    if (it == end(groups_)) {
        return false;
    }

    auto& items = it->second;
    auto const where = std::find(begin(items), end(items), itm);
    if (where == end(items)) {
        return false;
    }

    items.erase(where);
    if (items.empty()) {
        groups_.erase(it);
    }

    --size_;

    return true;
}

} //namespace skirmish
