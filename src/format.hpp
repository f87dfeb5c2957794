#pragma once

#include "config.hpp"

#include <array>
#include <string>

#include <cstdint>
#include <cstddef>
#include <cstdarg>

namespace skirmish {

namespace detail {

bool static_string_buffer_append(
    char const* fmt
  , char*       buffer
  , ptrdiff_t&  offset
  , size_t      size
  , va_list     args) noexcept;

} // namespace detail

//! A non-owning view of a fixed capacity character buffer that is appended to
//! with printf-style formatting. Used to report why an operation was refused.
class string_buffer_base {
public:
    string_buffer_base(char* const data, size_t const capacity) noexcept
      : first_    {0}
      , data_     {data}
      , capacity_ {static_cast<ptrdiff_t>(capacity)}
    {
        data_[0] = '\0';
    }

    bool append(char const* fmt, ...) noexcept SK_PRINTF_ATTRIBUTE(2, 3);

    void clear() noexcept {
        first_   = 0;
        data_[0] = '\0';
    }

    bool full()  const noexcept { return first_ >= capacity_ - 1; }
    bool empty() const noexcept { return first_ == 0; }
    size_t capacity() const noexcept { return static_cast<size_t>(capacity_); }
    size_t size() const noexcept { return static_cast<size_t>(first_); }

    char const* begin() const noexcept { return data_; }
    char const* end()   const noexcept { return data_ + first_; }

    //! Always null terminated.
    char const* data() const noexcept { return data_; }

    string_view to_string_view() const noexcept {
        return string_view {data_, static_cast<size_t>(first_)};
    }

    std::string to_string() const {
        return std::string {data_, static_cast<size_t>(first_)};
    }
private:
    ptrdiff_t first_;
    char*     data_;
    ptrdiff_t capacity_;
};

namespace detail {

template <size_t N>
struct static_string_buffer_base {
    std::array<char, N> buffer_;
};

} // namespace detail

template <size_t N>
class static_string_buffer
  : private detail::static_string_buffer_base<N>
  , public  string_buffer_base
{
    static_assert(N > 1, "");
public:
    static_string_buffer(static_string_buffer const&) = delete;
    static_string_buffer& operator=(static_string_buffer const&) = delete;

    static_string_buffer() noexcept
      : string_buffer_base {detail::static_string_buffer_base<N>::buffer_.data(), N}
    {
    }
};

} // namespace skirmish
