#pragma once

#include <type_traits>
#include <utility>
#include <cstddef>

namespace skirmish {

namespace detail {
struct scope_guard_tag {};
} // namespace detail

//! Runs a function when it goes out of scope unless it has been dismissed.
template <typename F>
class scope_guard {
public:
    scope_guard(scope_guard const&) = delete;
    scope_guard& operator=(scope_guard const&) = delete;
    void* operator new(size_t) = delete;

    scope_guard(scope_guard&& other)
      : function_  {std::move(other.function_)}
      , dismissed_ {other.dismissed_}
    {
        other.dismissed_ = true;
    }

    template <typename Fn>
    explicit scope_guard(Fn&& fn)
      : function_ {std::forward<Fn>(fn)}
    {
    }

    ~scope_guard() {
        if (!dismissed_) {
            function_();
        }
    }

    //! The operation being guarded has committed.
    void dismiss() noexcept {
        dismissed_ = true;
    }
private:
    F    function_;
    bool dismissed_ {false};
};

template <typename F>
auto operator+(detail::scope_guard_tag, F&& f) {
    return scope_guard<std::decay_t<F>> {std::forward<F>(f)};
}

} //namespace skirmish

#define SK_SCOPE_EXIT ::skirmish::detail::scope_guard_tag {} + [&]() noexcept
