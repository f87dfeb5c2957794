#include "entity.hpp"
#include "equipment.hpp"
#include "format.hpp"
#include "math.hpp"

#include "bkassert/assert.hpp"

#include <algorithm>
#include <limits>
#include <cctype>
#include <cmath>

namespace skirmish {

namespace {

bool is_upper(char const c) noexcept {
    return !!std::isupper(static_cast<unsigned char>(c));
}

bool is_alpha(char const c) noexcept {
    return !!std::isalpha(static_cast<unsigned char>(c));
}

// hundredths of a point of strength
double to_hundredths(double const strength) noexcept {
    return std::round(strength * 100.0);
}

bool is_valid_hundredths(double const n) noexcept {
    return std::isfinite(n)
        && n >= 1.0
        && n <= static_cast<double>(std::numeric_limits<int32_t>::max());
}

} // namespace

char const* anchor_name(hero_anchor const a) noexcept {
    switch (a) {
    case hero_anchor::left_hand:  return "left_hand";
    case hero_anchor::right_hand: return "right_hand";
    case hero_anchor::body:       return "body";
    case hero_anchor::belt:       return "belt";
    case hero_anchor::back:       return "back";
    }

    return "{unknown}";
}

bool is_valid_hero_name(string_view const name) noexcept {
    if (name.empty() || !is_upper(name[0])) {
        return false;
    }

    int apostrophes = 0;

    for (size_t i = 0; i < name.size(); ++i) {
        auto const c = name[i];
        if (is_alpha(c) || c == ' ') {
            continue;
        } else if (c == '\'') {
            if (++apostrophes > 2) {
                return false;
            }
        } else if (c == ':') {
            if (i + 1 >= name.size() || name[i + 1] != ' ') {
                return false;
            }
        } else {
            return false;
        }
    }

    return true;
}

bool is_valid_monster_name(string_view const name) noexcept {
    if (name.empty() || !is_upper(name[0])) {
        return false;
    }

    return std::all_of(name.begin(), name.end(), [](char const c) noexcept {
        return is_alpha(c) || c == ' ' || c == '\'';
    });
}

bool can_create(hero_params const& params, string_buffer_base& result) {
    if (!is_valid_hero_name(params.name)) {
        result.append("\"%s\" is not a valid name for a hero", params.name.c_str());
        return false;
    } else if (params.max_hit_points <= 0) {
        result.append("%s needs positive maximum hit points, not %d"
          , params.name.c_str(), params.max_hit_points);
        return false;
    } else if (!is_valid_hundredths(to_hundredths(params.strength))) {
        result.append("%s needs positive strength, not %.2f"
          , params.name.c_str(), params.strength);
        return false;
    } else if (params.protection < 0) {
        result.append("%s can't have negative protection (%d)"
          , params.name.c_str(), params.protection);
        return false;
    }

    return true;
}

bool can_create(monster_params const& params, string_buffer_base& result) {
    auto const max = max_protection(params.skin);

    if (!is_valid_monster_name(params.name)) {
        result.append("\"%s\" is not a valid name for a monster", params.name.c_str());
        return false;
    } else if (params.max_hit_points <= 0) {
        result.append("%s needs positive maximum hit points, not %d"
          , params.name.c_str(), params.max_hit_points);
        return false;
    } else if (!is_valid_damage(params.damage)) {
        result.append("%s's damage %d is not a positive multiple of 7 up to 100"
          , params.name.c_str(), params.damage);
        return false;
    } else if (params.protection > max) {
        result.append("%s's %s skin protects at most %d, not %d"
          , params.name.c_str(), to_string(params.skin), max, params.protection);
        return false;
    } else if (params.anchors < 0 || params.anchors > monster_max_anchors) {
        result.append("%s can't have %d anchor points"
          , params.name.c_str(), params.anchors);
        return false;
    } else if (params.spare_capacity < 0) {
        result.append("%s can't have negative spare capacity (%d)"
          , params.name.c_str(), params.spare_capacity);
        return false;
    }

    return true;
}

entity::entity(entity_instance_id const instance, hero_params const& params)
  : instance_       {instance}
  , category_       {entity_category::hero}
  , name_           {params.name}
  , max_hit_points_ {params.max_hit_points}
  , hit_points_     {params.max_hit_points}
  , protection_     {params.protection}
  , strength_       {static_cast<int32_t>(to_hundredths(params.strength))}
{
    anchors_.reserve(hero_anchor_count);
    for (size_t i = 0; i < hero_anchor_count; ++i) {
        anchors_.push_back({anchor_name(static_cast<hero_anchor>(i)), {}});
    }

    normalize_hit_points_();
}

entity::entity(
    entity_instance_id const  instance
  , monster_params     const& params
  , int32_t            const  capacity
)
  : instance_       {instance}
  , category_       {entity_category::monster}
  , name_           {params.name}
  , max_hit_points_ {params.max_hit_points}
  , hit_points_     {params.max_hit_points}
  , protection_     {params.protection < 0 ? skirmish::max_protection(params.skin) : params.protection}
  , anchors_        (static_cast<size_t>(params.anchors))
  , damage_         {params.damage}
  , skin_           {params.skin}
  , capacity_       {capacity}
{
    normalize_hit_points_();
}

void entity::set_fighting(bool const fighting) noexcept {
    fighting_ = fighting;
    normalize_hit_points_();
}

bool entity::set_hit_points(int32_t const n) noexcept {
    if (n < 0 || n > max_hit_points_) {
        return false;
    }

    hit_points_ = n;
    normalize_hit_points_();

    return true;
}

void entity::add_hit_points(int32_t const n) noexcept {
    auto const hp = static_cast<int64_t>(hit_points_) + n;
    hit_points_ = static_cast<int32_t>(
        clamp<int64_t>(hp, 0, max_hit_points_));

    normalize_hit_points_();
}

void entity::remove_hit_points(int32_t const n) noexcept {
    auto const hp = static_cast<int64_t>(hit_points_) - n;
    hit_points_ = static_cast<int32_t>(
        clamp<int64_t>(hp, 0, max_hit_points_));

    normalize_hit_points_();
}

bool entity::set_protection(int32_t const n) noexcept {
    auto const max = is_a(entity_category::monster)
      ? max_protection()
      : std::numeric_limits<int32_t>::max();

    if (n < 0 || n > max) {
        return false;
    }

    protection_ = n;
    return true;
}

int32_t entity::capacity() const noexcept {
    if (is_a(entity_category::monster)) {
        return capacity_;
    }

    return static_cast<int32_t>(
        static_cast<int64_t>(strength_) * hero_capacity_per_strength / 100);
}

anchor_point const& entity::anchor(size_t const i) const noexcept {
    BK_ASSERT(i < anchors_.size());
    return anchors_[i];
}

size_t entity::find_anchor(string_view const name) const noexcept {
    auto const it = std::find_if(begin(anchors_), end(anchors_)
      , [&](anchor_point const& a) noexcept {
            return !a.name.empty() && name == string_view {a.name};
        });

    return it == end(anchors_)
      ? anchor_none
      : static_cast<size_t>(std::distance(begin(anchors_), it));
}

size_t entity::find_item(equipment_instance_id const itm) const noexcept {
    if (itm == nullptr) {
        return anchor_none;
    }

    auto const it = std::find_if(begin(anchors_), end(anchors_)
      , [&](anchor_point const& a) noexcept { return a.item == itm; });

    return it == end(anchors_)
      ? anchor_none
      : static_cast<size_t>(std::distance(begin(anchors_), it));
}

size_t entity::free_anchor_count() const noexcept {
    return static_cast<size_t>(std::count_if(begin(anchors_), end(anchors_)
      , [](anchor_point const& a) noexcept { return a.is_free(); }));
}

double entity::strength() const noexcept {
    BK_ASSERT(is_a(entity_category::hero));
    return strength_ / 100.0;
}

int32_t entity::strength_hundredths() const noexcept {
    BK_ASSERT(is_a(entity_category::hero));
    return strength_;
}

bool entity::multiply_strength(double const factor) noexcept {
    BK_ASSERT(is_a(entity_category::hero));
    return factor > 0.0 && set_strength_(strength_ * factor);
}

bool entity::divide_strength(double const divisor) noexcept {
    BK_ASSERT(is_a(entity_category::hero));
    return divisor > 0.0 && set_strength_(strength_ / divisor);
}

equipment_instance_id entity::left_hand() const noexcept {
    BK_ASSERT(is_a(entity_category::hero));
    return left_hand_;
}

equipment_instance_id entity::right_hand() const noexcept {
    BK_ASSERT(is_a(entity_category::hero));
    return right_hand_;
}

equipment_instance_id entity::armor() const noexcept {
    BK_ASSERT(is_a(entity_category::hero));
    return armor_;
}

int32_t entity::damage() const noexcept {
    BK_ASSERT(is_a(entity_category::monster));
    return damage_;
}

skin_type entity::skin() const noexcept {
    BK_ASSERT(is_a(entity_category::monster));
    return skin_;
}

int32_t entity::max_protection() const noexcept {
    BK_ASSERT(is_a(entity_category::monster));
    return skirmish::max_protection(skin_);
}

void entity::place_(
    size_t                const i
  , equipment_instance_id const itm
  , equipment_category    const type
) noexcept {
    BK_ASSERT(i < anchors_.size() && anchors_[i].is_free() && itm != nullptr);
    anchors_[i].item = itm;

    if (!is_a(entity_category::hero)) {
        return;
    }

    if (type == equipment_category::weapon) {
        if (i == index_of(hero_anchor::left_hand)) {
            left_hand_ = itm;
        } else if (i == index_of(hero_anchor::right_hand)) {
            right_hand_ = itm;
        }
    } else if (type == equipment_category::armor
            && i == index_of(hero_anchor::body)
    ) {
        armor_ = itm;
    }
}

void entity::vacate_(size_t const i) noexcept {
    BK_ASSERT(i < anchors_.size() && !anchors_[i].is_free());

    auto const itm = anchors_[i].item;
    anchors_[i].item = equipment_instance_id {};

    if (left_hand_  == itm) { left_hand_  = equipment_instance_id {}; }
    if (right_hand_ == itm) { right_hand_ = equipment_instance_id {}; }
    if (armor_      == itm) { armor_      = equipment_instance_id {}; }
}

void entity::normalize_hit_points_() noexcept {
    if (!fighting_) {
        hit_points_ = closest_lower_prime(hit_points_);
    }
}

bool entity::set_strength_(double const hundredths) noexcept {
    auto const n = std::round(hundredths);
    if (!is_valid_hundredths(n)) {
        return false;
    }

    strength_ = static_cast<int32_t>(n);
    return true;
}

} //namespace skirmish
