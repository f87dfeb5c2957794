#pragma once

#include <type_traits>
#include <algorithm>
#include <vector>
#include <iterator>
#include <utility>

#include <cstddef>

namespace skirmish {

//=====--------------------------------------------------------------------=====
// A small sorted map from property ids to raw 32 bit values, as read from a
// definition file.
//=====--------------------------------------------------------------------=====
template <typename Property, typename Value>
class property_set {
    static_assert(std::is_standard_layout<Property>::value, "");
    static_assert(std::is_standard_layout<Value>::value, "");

    auto find_(Property const property) noexcept {
        return std::lower_bound(
            std::begin(values_), std::end(values_), property, compare_);
    }

    auto has_property_(Property const property) noexcept {
        auto const it = find_(property);
        bool const ok = (it != std::end(values_)) && (it->first == property);
        return std::make_pair(it, ok);
    }

    auto has_property_(Property const property) const noexcept {
        return const_cast<property_set*>(this)->has_property_(property);
    }
public:
    using property_type = Property;
    using value_type    = Value;
    using pair_t        = std::pair<property_type, value_type>;

    size_t size()  const noexcept { return values_.size(); }
    bool   empty() const noexcept { return values_.empty(); }
    auto   begin() const noexcept { return values_.begin(); }
    auto   end()   const noexcept { return values_.end(); }

    bool has_property(Property const property) const noexcept {
        return has_property_(property).second;
    }

    Value value_or(Property const property, Value const value) const noexcept {
        auto const pair = has_property_(property);
        return pair.second ? pair.first->second : value;
    }

    //! Interpret the stored bits as a signed value.
    template <typename T>
    T value_as_or(Property const property, T const value) const noexcept {
        static_assert(sizeof(T) == sizeof(Value), "");
        auto const pair = has_property_(property);
        return pair.second ? static_cast<T>(pair.first->second) : value;
    }

    // true if new
    // false if updated
    bool add_or_update_property(Property const property, Value const value) {
        auto const pair = has_property_(property);
        if (!pair.second) {
            values_.insert(pair.first, {property, value});
        } else {
            pair.first->second = value;
        }

        return !pair.second;
    }

    void clear() {
        values_.clear();
    }
private:
    static bool compare_(pair_t const& a, Property const b) noexcept {
        return a.first < b;
    }

    std::vector<pair_t> values_;
};

} //namespace skirmish
