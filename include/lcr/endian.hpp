#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>


// -------------------------------------------------------------
// Little-endian encoding helpers for on-disk records
// -------------------------------------------------------------
// Canonical on-disk format: LITTLE-ENDIAN.
// to_leXX()/from_leXX() convert fixed-width fields in place,
// put_le()/get_le() append to or read from a byte buffer.
// -------------------------------------------------------------

#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__)
#  define LCR_HOST_IS_LITTLE_ENDIAN (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__)
#else
#  error "Cannot determine host endianness"
#endif


namespace lcr {

inline constexpr uint16_t to_le16(uint16_t x) noexcept {
#if LCR_HOST_IS_LITTLE_ENDIAN
    return x;
#else
    return __builtin_bswap16(x);
#endif
}

inline constexpr uint32_t to_le32(uint32_t x) noexcept {
#if LCR_HOST_IS_LITTLE_ENDIAN
    return x;
#else
    return __builtin_bswap32(x);
#endif
}

inline constexpr uint64_t to_le64(uint64_t x) noexcept {
#if LCR_HOST_IS_LITTLE_ENDIAN
    return x;
#else
    return __builtin_bswap64(x);
#endif
}

// Symmetric functions for reading back from disk
inline constexpr uint16_t from_le16(uint16_t x) noexcept { return to_le16(x); }
inline constexpr uint32_t from_le32(uint32_t x) noexcept { return to_le32(x); }
inline constexpr uint64_t from_le64(uint64_t x) noexcept { return to_le64(x); }

template <typename T>
inline constexpr T to_le(T value) noexcept {
    static_assert(std::is_unsigned_v<T>, "to_le requires an unsigned type");
    if constexpr (sizeof(T) == 1)
        return value;
    else if constexpr (sizeof(T) == 2)
        return static_cast<T>(to_le16(static_cast<uint16_t>(value)));
    else if constexpr (sizeof(T) == 4)
        return static_cast<T>(to_le32(static_cast<uint32_t>(value)));
    else
        return static_cast<T>(to_le64(static_cast<uint64_t>(value)));
}

// Append `value` to `buf` in little-endian order
template <typename T>
inline void put_le(std::string& buf, T value) {
    const T le = to_le(value);
    char raw[sizeof(T)];
    std::memcpy(raw, &le, sizeof(T));
    buf.append(raw, sizeof(T));
}

// Read a little-endian `T` from `src` (no bounds check)
template <typename T>
[[nodiscard]] inline T get_le(const char* src) noexcept {
    T le;
    std::memcpy(&le, src, sizeof(T));
    return to_le(le);
}

} // namespace lcr
