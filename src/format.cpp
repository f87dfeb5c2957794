#include "format.hpp"

#include <cstdio>

namespace skirmish {

bool detail::static_string_buffer_append(
    char const* const fmt
  , char*       const buffer
  , ptrdiff_t&        offset
  , size_t      const size
  , va_list           args
) noexcept {
    auto const last = static_cast<ptrdiff_t>(size) - 1;

    if (offset < 0 || offset >= last) {
        return false;
    }

    auto const n = vsnprintf(
        buffer + offset
      , size - static_cast<size_t>(offset)
      , fmt
      , args);

    if (n < 0) {
        buffer[offset] = '\0';
        return false;
    } else if (offset + n > last) {
        offset = last; // truncated
        return false;
    }

    offset += n;
    return true;
}

bool string_buffer_base::append(char const* const fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);

    auto const result = detail::static_string_buffer_append(
        fmt, data_, first_, static_cast<size_t>(capacity_), args);

    va_end(args);

    return result;
}

} //namespace skirmish
