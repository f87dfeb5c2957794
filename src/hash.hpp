#pragma once

#include <cstdint>
#include <cstddef>

namespace skirmish {

//! Compile time djb2 over the first @p i characters of @p s.
constexpr inline uint32_t djb2_hash_32c(
    uint32_t    const hash
  , char const* const s
  , ptrdiff_t   const i
) noexcept {
    return i <= 0
        ? hash
        : djb2_hash_32c(
            static_cast<uint32_t>(
                ((static_cast<uint64_t>(hash) << 5) + hash
                    + static_cast<uint8_t>(*s)) & 0xFFFFFFFFu)
          , s + 1
          , i - 1);
}

template <size_t N>
constexpr inline uint32_t djb2_hash_32c(char const (&s)[N]) noexcept {
    return djb2_hash_32c(5381u, s, static_cast<ptrdiff_t>(N) - 1);
}

template <typename It>
inline uint32_t djb2_hash_32(It first, It const last) noexcept {
    uint32_t hash = 5381u;
    for (; first != last; ++first) {
        hash = (hash << 5) + hash + static_cast<uint8_t>(*first);
    }

    return hash;
}

inline uint32_t djb2_hash_32(char const* s) noexcept {
    uint32_t hash = 5381u;
    for (; *s; ++s) {
        hash = (hash << 5) + hash + static_cast<uint8_t>(*s);
    }

    return hash;
}

} //namespace skirmish
