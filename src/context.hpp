#pragma once

#include "types.hpp"
#include "world.hpp"

#include <type_traits>

namespace skirmish {

//===------------------------------------------------------------------------===
//! Convenience wrapper around the world state, which is passed to nearly every
//! operation that follows references between objects.
//===------------------------------------------------------------------------===
template <bool Const>
struct context_base {
    using world_t = std::conditional_t<Const, world const, world>;

    template <bool C, typename = std::enable_if_t<!C || Const>>
    context_base(context_base<C> const other) noexcept
      : w {other.w}
    {
    }

    context_base(world_t& w_) noexcept
      : w {w_}
    {
    }

    world_t& w;
};

using context       = context_base<false>;
using const_context = context_base<true>;

} //namespace skirmish
