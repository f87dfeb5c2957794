#pragma once

//
// Strongly typed wrappers around fundamental types used for ids.
//

#include <type_traits>
#include <functional>
#include <limits>
#include <cstdint>
#include <cstddef>

namespace skirmish {

//=====--------------------------------------------------------------------=====
//                              Type traits
//=====--------------------------------------------------------------------=====

//! true if every value of From is representable as a To.
template <typename From, typename To>
struct is_safe_integer_conversion : std::integral_constant<bool,
    std::is_integral<From>::value && std::is_integral<To>::value
    && (std::is_signed<From>::value == std::is_signed<To>::value
          ? std::numeric_limits<From>::digits <= std::numeric_limits<To>::digits
          : std::is_signed<To>::value
              && std::numeric_limits<From>::digits < std::numeric_limits<To>::digits)
>
{
};

template <typename From, typename To>
using choose_result_t = std::conditional_t<std::is_void<To>::value, From, To>;

template <typename T, typename Tag>
class tagged_value;

namespace detail {

template <typename T, typename Tag>
constexpr T get_value(tagged_value<T, Tag> n) noexcept;

} //namespace detail

//------------------------------------------------------------------------------
// value_cast
//------------------------------------------------------------------------------
//! Return the underlying value of @p n, safely widened to @p To if @p To is
//! not void.
template <typename To = void
        , typename From
        , typename Tag
        , typename Result = choose_result_t<From, To>>
constexpr Result value_cast(tagged_value<From, Tag> const n) noexcept {
    static_assert(is_safe_integer_conversion<From, Result>::value, "");
    return static_cast<Result>(detail::get_value(n));
}

//=====--------------------------------------------------------------------=====
//                                Types
//=====--------------------------------------------------------------------=====
//! A tagged wrapper around a fundamental type.
template <typename T, typename Tag>
class tagged_value {
    static_assert(std::is_integral<T>::value, "");

    template <typename T0, typename Tag0>
    friend constexpr T0 detail::get_value(tagged_value<T0, Tag0>) noexcept;
public:
    using type = T;
    using tag  = Tag;

    constexpr tagged_value() = default;

    constexpr tagged_value(T const n) noexcept
      : value_ {n}
    {
    }
private:
    T value_ {};
};

struct identity_hash {
    template <typename T, typename Tag>
    size_t operator()(tagged_value<T, Tag> const id) const noexcept {
        return std::hash<T> {}(value_cast(id));
    }
};

namespace detail {

template <typename T, typename Tag>
constexpr T get_value(tagged_value<T, Tag> const n) noexcept {
    return n.value_;
}

} //namespace detail

//=====--------------------------------------------------------------------=====
//                           Comparison Operations
//=====--------------------------------------------------------------------=====

template <typename T, typename Tag> inline constexpr
bool operator==(tagged_value<T, Tag> const x, tagged_value<T, Tag> const y) noexcept {
    return value_cast(x) == value_cast(y);
}

template <typename T, typename Tag> inline constexpr
bool operator!=(tagged_value<T, Tag> const x, tagged_value<T, Tag> const y) noexcept {
    return !(x == y);
}

template <typename T, typename Tag> inline constexpr
bool operator<(tagged_value<T, Tag> const x, tagged_value<T, Tag> const y) noexcept {
    return value_cast(x) < value_cast(y);
}

template <typename T, typename Tag> inline constexpr
bool operator==(tagged_value<T, Tag> const a, std::nullptr_t) noexcept {
    return value_cast(a) == T {0};
}

template <typename T, typename Tag> inline constexpr
bool operator==(std::nullptr_t, tagged_value<T, Tag> const a) noexcept {
    return a == nullptr;
}

template <typename T, typename Tag> inline constexpr
bool operator!=(tagged_value<T, Tag> const a, std::nullptr_t) noexcept {
    return !(a == nullptr);
}

template <typename T, typename Tag> inline constexpr
bool operator!=(std::nullptr_t, tagged_value<T, Tag> const a) noexcept {
    return !(a == nullptr);
}

} //namespace skirmish
